#include "sortlab/core.hpp"
#include "sortlab/capi.h"

#include <cstdlib>
#include <cstring>
#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

using namespace sortlab;

static char* dup_cstr(const std::string& s) {
  char* p = (char*)std::malloc(s.size() + 1);
  if (!p) return nullptr;
  std::memcpy(p, s.c_str(), s.size() + 1);
  return p;
}

static ExperimentConfig to_config(const sl_experiment_config* c) {
  if (!c) throw std::invalid_argument("null config");
  ExperimentConfig cfg;
  for (int i = 0; i < c->sizes_len; ++i) if (c->sizes) cfg.sizes.push_back((std::size_t)c->sizes[i]);
  cfg.trials = c->trials > 0 ? c->trials : 3;
  cfg.seed = c->seed;
  for (int i = 0; i < c->algos_len; ++i) if (c->algos && c->algos[i]) cfg.algos.emplace_back(c->algos[i]);
  if (c->quadratic_cap > 0) cfg.quadratic_cap = (std::size_t)c->quadratic_cap;
  cfg.verify = (c->verify != 0);
  cfg.render_chart = false;
  return cfg;
}

extern "C" char* sl_run_csv(const sl_experiment_config* c, char** err_out) {
  if (err_out) *err_out = nullptr;
  try {
    ExperimentResult r = measure(to_config(c));
    return dup_cstr(to_csv(r, true));
  } catch (const std::exception& e) {
    if (err_out) *err_out = dup_cstr(std::string("error: ") + e.what());
    return nullptr;
  }
}

extern "C" char* sl_run_json(const sl_experiment_config* c, int pretty, char** err_out) {
  if (err_out) *err_out = nullptr;
  try {
    ExperimentResult r = measure(to_config(c));
    return dup_cstr(to_json(r, pretty != 0));
  } catch (const std::exception& e) {
    if (err_out) *err_out = dup_cstr(std::string("error: ") + e.what());
    return nullptr;
  }
}

extern "C" char* sl_list_algos_json(char** err_out) {
  if (err_out) *err_out = nullptr;
  try {
    std::string js = "[";
    const auto& algos = list_algorithms();
    for (std::size_t i = 0; i < algos.size(); ++i) {
      if (i) js += ",";
      js += "{\"name\":\"" + algos[i].name + "\",\"stable\":";
      js += algos[i].stable ? "true" : "false";
      js += "}";
    }
    js += "]";
    return dup_cstr(js);
  } catch (const std::exception& e) {
    if (err_out) *err_out = dup_cstr(std::string("error: ") + e.what());
    return nullptr;
  }
}

extern "C" void sl_free(char* p) {
  if (p) std::free(p);
}
