// Core tests for the sortlab harness
#include "sortlab/core.hpp"
#include "sortlab/capi.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

using namespace sortlab;

static void require(bool cond, const char* msg) {
  if (!cond) {
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
  }
}

static bool near(double a, double b) { return std::abs(a - b) < 1e-12; }

static std::size_t count_rows(const ExperimentResult& r, const std::string& algo) {
  return static_cast<std::size_t>(std::count_if(
      r.rows.begin(), r.rows.end(), [&](const Measurement& m) { return m.algo == algo; }));
}

static void test_list_algorithms() {
  const auto& algos = list_algorithms();
  require(algos.size() == 5, "five registered algorithms");
  const char* names[] = {"bubble_sort", "insertion_sort", "merge_sort", "quick_sort",
                         "builtin_sort"};
  for (std::size_t i = 0; i < 5; ++i)
    require(algos[i].name == names[i], "registry order");
  require(algos[0].quadratic && algos[1].quadratic, "bubble/insertion are quadratic");
  require(!algos[2].quadratic && !algos[3].quadratic && !algos[4].quadratic,
          "n log n algorithms run every size");
  require(!algos[3].stable, "quick_sort flagged unstable");
  require(algos[0].stable && algos[1].stable && algos[2].stable && algos[4].stable,
          "other algorithms flagged stable");
}

static void test_sizes() {
  auto d = default_sizes();
  require(d == std::vector<std::size_t>({128, 256, 512, 1024, 2048, 4096}), "default sizes");
  require(power_of_two_sizes(7, 12) == d, "2^7..2^12 equals default sizes");
  require(power_of_two_sizes(3, 3) == std::vector<std::size_t>({8}), "single power");
  bool threw = false;
  try { (void)power_of_two_sizes(5, 4); } catch (const std::invalid_argument&) { threw = true; }
  require(threw, "reversed power bounds rejected");
  threw = false;
  try { (void)power_of_two_sizes(-1, 4); } catch (const std::invalid_argument&) { threw = true; }
  require(threw, "negative power rejected");
  threw = false;
  try { (void)power_of_two_sizes(1, 31); } catch (const std::invalid_argument&) { threw = true; }
  require(threw, "oversized power rejected");
}

static void test_stats() {
  require(near(mean({}), 0.0), "mean of empty is 0");
  require(near(population_stddev({}), 0.0), "stddev of empty is 0");
  require(near(mean({1.0, 2.0, 3.0, 4.0}), 2.5), "mean");
  // population: sqrt(((1.5^2)*2 + (0.5^2)*2) / 4) = sqrt(1.25)
  require(near(population_stddev({1.0, 2.0, 3.0, 4.0}), std::sqrt(1.25)),
          "population stddev divides by n");
  require(near(population_stddev({2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0}), 2.0),
          "textbook population stddev");
  require(near(population_stddev({0.5}), 0.0), "single sample stddev is 0");
}

static void test_random_ints() {
  std::mt19937_64 a(42), b(42);
  auto x = make_random_ints(500, a);
  auto y = make_random_ints(500, b);
  require(x == y, "same seed, same data");
  require(x.size() == 500, "requested length");
  for (Elem v : x)
    require(v >= 0 && v <= 5000, "values within [0, n*10]");
  auto z = make_random_ints(500, a);
  require(z != x, "generator advances between draws");
  require(make_random_ints(0, a).empty(), "n=0 gives empty input");
}

static void test_measure_quadratic_cap() {
  ExperimentConfig cfg;
  cfg.sizes = {16, 64, 256};
  cfg.trials = 2;
  cfg.quadratic_cap = 64;
  cfg.verify = true;
  auto r = measure(cfg);
  require(count_rows(r, "bubble_sort") == 2, "bubble_sort capped");
  require(count_rows(r, "insertion_sort") == 2, "insertion_sort capped");
  require(count_rows(r, "merge_sort") == 3, "merge_sort runs every size");
  require(count_rows(r, "quick_sort") == 3, "quick_sort runs every size");
  require(count_rows(r, "builtin_sort") == 3, "builtin_sort runs every size");
  require(r.rows.size() == 13, "13 measurements");
  require(r.samples.size() == 26, "trials samples per measurement");
  for (const auto& m : r.rows) {
    require(m.trials == 2, "trial count recorded");
    require(m.mean_s >= 0.0 && m.stddev_s >= 0.0, "non-negative timings");
    require(m.min_s <= m.mean_s + 1e-15 && m.mean_s <= m.max_s + 1e-15,
            "min <= mean <= max");
  }
  require(r.rows.front().algo == "bubble_sort" && r.rows.front().n == 16,
          "rows start with first algorithm, first size");
  require(r.rows.back().algo == "builtin_sort" && r.rows.back().n == 256,
          "rows end with last algorithm, last size");
}

static void test_measure_default_cap() {
  ExperimentConfig cfg;
  cfg.sizes = {512, 1024, 2048};
  cfg.trials = 1;
  cfg.algos = {"Bubble_Sort", "merge_sort"};
  auto r = measure(cfg);
  require(count_rows(r, "bubble_sort") == 2, "default cap keeps n <= 1024");
  require(count_rows(r, "merge_sort") == 3, "merge_sort at all sizes");
  require(count_rows(r, "quick_sort") == 0, "filtered algorithm skipped");
}

static void test_measure_aggregates_samples() {
  ExperimentConfig cfg;
  cfg.sizes = {32};
  cfg.trials = 4;
  cfg.algos = {"quick_sort"};
  auto r = measure(cfg);
  require(r.rows.size() == 1 && r.samples.size() == 4, "one row, four samples");
  std::vector<double> xs;
  for (const auto& s : r.samples) {
    require(s.algo == "quick_sort" && s.n == 32, "sample identity");
    xs.push_back(s.seconds);
  }
  require(near(r.rows[0].mean_s, mean(xs)), "row mean from samples");
  require(near(r.rows[0].stddev_s, population_stddev(xs)), "row stddev from samples");
}

static void test_measure_defaults_and_progress() {
  ExperimentConfig cfg;
  cfg.trials = 1;
  cfg.algos = {"builtin_sort"};
  std::ostringstream progress;
  auto r = measure(cfg, &progress);
  require(r.sizes == default_sizes(), "empty sizes use defaults");
  require(r.rows.size() == 6, "builtin_sort at six default sizes");
  std::string out = progress.str();
  require(out.find("Running builtin_sort...") != std::string::npos, "progress header");
  require(out.find("  size=  128 avg_time=") != std::string::npos, "progress line");
  require(out.find("s stdev=") != std::string::npos, "progress stdev");
}

static void test_measure_reproducible() {
  ExperimentConfig cfg;
  cfg.sizes = {16, 64};
  cfg.trials = 3;
  cfg.seed = 1234;
  cfg.verify = true;
  auto a = measure(cfg);
  auto b = measure(cfg);
  require(a.rows.size() == b.rows.size(), "same row count for same seed");
  require(a.samples.size() == b.samples.size(), "same sample count for same seed");
  for (std::size_t i = 0; i < a.rows.size(); ++i) {
    require(a.rows[i].algo == b.rows[i].algo && a.rows[i].n == b.rows[i].n,
            "same row identity for same seed");
    require(a.rows[i].input_digest == b.rows[i].input_digest,
            "same inputs for same seed");
  }

  // First row: bubble_sort at n=16, drawn first from a freshly seeded generator.
  std::mt19937_64 rng(1234);
  std::uint64_t h = kDigestSeed;
  for (int t = 0; t < 3; ++t)
    h = fold_digest(h, make_random_ints(16, rng));
  require(a.rows[0].algo == "bubble_sort" && a.rows[0].input_digest == h,
          "generator seeded once per run, inputs drawn in run order");

  cfg.seed = 1235;
  auto c = measure(cfg);
  require(c.rows[0].input_digest != a.rows[0].input_digest,
          "different seed, different inputs");
}

static void test_measure_validation() {
  ExperimentConfig cfg;
  cfg.sizes = {8};
  cfg.trials = 0;
  bool threw = false;
  try { (void)measure(cfg); } catch (const std::invalid_argument&) { threw = true; }
  require(threw, "zero trials rejected");

  cfg.trials = 1;
  cfg.sizes = {8, 0};
  threw = false;
  try { (void)measure(cfg); } catch (const std::invalid_argument&) { threw = true; }
  require(threw, "zero size rejected");

  cfg.sizes = {8};
  cfg.algos = {"bogo_sort"};
  threw = false;
  try { (void)measure(cfg); } catch (const std::invalid_argument&) { threw = true; }
  require(threw, "unknown algorithm rejected");
}

static void test_formatting() {
  ExperimentResult r;
  r.trials = 2;
  r.rows.push_back(Measurement{"merge_sort", 128, 0.000123456789, 0.0000015, 0.0001, 0.00015, 2});
  r.rows.push_back(Measurement{"quick_sort", 256, 1.5, 0.25, 1.25, 1.75, 2});

  auto csv = to_csv(r);
  require(csv.rfind("algorithm,n,avg_seconds,stdev_seconds\n", 0) == 0, "csv header");
  require(csv.find("merge_sort,128,0.00012346,0.00000150\n") != std::string::npos,
          "csv row with 8 decimals");
  require(csv.find("quick_sort,256,1.50000000,0.25000000\n") != std::string::npos,
          "second csv row");
  require(to_csv(r, false).find("algorithm,") == std::string::npos, "csv without header");

  auto js = to_json(r, true);
  require(js.find("\"algorithm\":\"merge_sort\"") != std::string::npos, "json algorithm");
  require(js.find("\"n\":256") != std::string::npos, "json n");
  require(js.find("\"stdev_seconds\":0.25000000") != std::string::npos, "json stddev");
  auto jl = to_jsonl(r);
  require(std::count(jl.begin(), jl.end(), '\n') == 2, "one jsonl line per row");

  auto table = to_table(r);
  require(table.find("| algorithm ") != std::string::npos, "table header");
  require(table.find("| quick_sort ") != std::string::npos, "table row");
  require(table.rfind("+", 0) == 0, "table border");
}

static void test_write_artifacts() {
  namespace fs = std::filesystem;
  fs::path dir = fs::temp_directory_path() / "sortlab_core_tests" / "nested";
  std::error_code ec;
  fs::remove_all(dir.parent_path(), ec);

  ExperimentConfig cfg;
  cfg.sizes = {8, 16};
  cfg.trials = 2;
  auto r = measure(cfg);
  auto paths = write_artifacts(r, dir.string(), false);
  require(fs::exists(paths.csv), "results.csv written");
  require(fs::path(paths.csv).filename() == "results.csv", "csv file name");
  require(fs::exists(paths.chart_script), "gnuplot script written");
  require(fs::exists(paths.chart_data), "chart data written");
  require(fs::path(paths.chart).filename() == "complexity.png", "chart file name");
  require(!paths.chart_rendered, "chart not rendered when disabled");

  std::ifstream in(paths.csv);
  std::stringstream ss;
  ss << in.rdbuf();
  require(ss.str() == to_csv(r, true), "csv file matches to_csv");

  std::ifstream gp(paths.chart_script);
  std::stringstream gs;
  gs << gp.rdbuf();
  std::string script = gs.str();
  require(script.find("set logscale x 2") != std::string::npos, "base-2 x axis");
  require(script.find("set logscale y") != std::string::npos, "log y axis");
  require(script.find("yerrorlines") != std::string::npos, "error bars");
  require(script.find("title 'quick_sort'") != std::string::npos, "one series per algorithm");
  fs::remove_all(dir.parent_path(), ec);
}

static void test_write_artifacts_quoted_dir() {
  namespace fs = std::filesystem;
  fs::path dir = fs::temp_directory_path() / "sortlab_core_tests_it's";
  std::error_code ec;
  fs::remove_all(dir, ec);

  ExperimentConfig cfg;
  cfg.sizes = {8};
  cfg.trials = 1;
  cfg.algos = {"merge_sort"};
  auto paths = write_artifacts(measure(cfg), dir.string(), false);
  require(fs::exists(paths.csv), "results.csv written under a quoted directory");

  std::ifstream gp(paths.chart_script);
  std::stringstream gs;
  gs << gp.rdbuf();
  std::string script = gs.str();
  require(script.find("sortlab_core_tests_it''s") != std::string::npos,
          "single quote doubled inside gnuplot strings");
  require(script.find("sortlab_core_tests_it's") == std::string::npos,
          "no bare single quote left in gnuplot strings");
  fs::remove_all(dir, ec);
}

static void test_default_outdir(const char* argv0) {
  namespace fs = std::filesystem;
  std::error_code ec;
  fs::path exe_dir = fs::read_symlink("/proc/self/exe", ec).parent_path();
  require(!ec, "/proc/self/exe readable");

  // A bare name, as when the binary is found through PATH.
  fs::path bare(default_outdir("core_tests"));
  require(bare.is_absolute(), "bare command name resolves to an absolute path");
  require(bare == exe_dir / "plots", "bare command name resolves beside the executable");

  fs::path from_path(default_outdir(argv0));
  require(from_path.filename() == "plots", "outdir named plots");
  require(fs::equivalent(from_path.parent_path(), exe_dir, ec),
          "argv[0] path resolves beside the executable");
}

static void test_write_artifacts_bad_dir() {
  namespace fs = std::filesystem;
  fs::path blocker = fs::temp_directory_path() / "sortlab_core_tests_blocker";
  std::error_code ec;
  fs::remove_all(blocker, ec);
  { std::ofstream(blocker) << "file, not a directory"; }
  ExperimentResult r;
  bool threw = false;
  try {
    (void)write_artifacts(r, (blocker / "out").string(), false);
  } catch (const std::exception&) {
    threw = true;
  }
  require(threw, "uncreatable output directory surfaces an error");
  fs::remove_all(blocker, ec);
}

static void test_capi() {
  char* err = nullptr;
  char* algos = sl_list_algos_json(&err);
  require(algos != nullptr && err == nullptr, "list algos ok");
  std::string a(algos);
  require(a.find("{\"name\":\"quick_sort\",\"stable\":false}") != std::string::npos,
          "quick_sort listed as unstable");
  sl_free(algos);

  const uint64_t sizes[] = {16, 32};
  sl_experiment_config cfg{};
  cfg.sizes = sizes;
  cfg.sizes_len = 2;
  cfg.trials = 1;
  cfg.seed = 5;
  cfg.verify = 1;
  char* csv = sl_run_csv(&cfg, &err);
  require(csv != nullptr && err == nullptr, "run csv ok");
  std::string c(csv);
  require(c.rfind("algorithm,n,avg_seconds,stdev_seconds\n", 0) == 0, "capi csv header");
  require(c.find("builtin_sort,32,") != std::string::npos, "capi csv row");
  sl_free(csv);

  const char* bad[] = {"nope_sort"};
  cfg.algos = bad;
  cfg.algos_len = 1;
  char* js = sl_run_json(&cfg, 0, &err);
  require(js == nullptr, "bad algorithm returns NULL");
  require(err != nullptr && std::string(err).rfind("error: ", 0) == 0, "error message set");
  sl_free(err);
}

int main(int argc, char** argv) {
  (void)argc;
  try {
    test_list_algorithms();
    test_sizes();
    test_stats();
    test_random_ints();
    test_measure_quadratic_cap();
    test_measure_default_cap();
    test_measure_aggregates_samples();
    test_measure_defaults_and_progress();
    test_measure_reproducible();
    test_measure_validation();
    test_formatting();
    test_write_artifacts();
    test_write_artifacts_quoted_dir();
    test_write_artifacts_bad_dir();
    test_default_outdir(argv[0]);
    test_capi();
  } catch (const std::exception& e) {
    std::cerr << "Unhandled exception: " << e.what() << "\n";
    return 2;
  }
  std::cout << "OK\n";
  return 0;
}
