// sortlab measurement core
// Generates inputs, times each registered algorithm and aggregates trials.

#include "sortlab/core.hpp"
#include "sortlab/algorithms.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <functional>
#include <iomanip>
#include <ostream>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace sortlab {

using Clock = std::chrono::steady_clock;
using seconds_d = std::chrono::duration<double>;

static inline std::string to_lower(std::string s) {
  for (char &c : s)
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

// Registry
struct AlgoEntry {
  AlgoInfo info;
  std::function<std::vector<Elem>(const std::vector<Elem> &)> run;
};

static std::vector<AlgoEntry> build_registry() {
  std::vector<AlgoEntry> regs;
  regs.push_back({{"bubble_sort", true, true},
                  [](const auto &v) { return algos::bubble_sort(v); }});
  regs.push_back({{"insertion_sort", true, true},
                  [](const auto &v) { return algos::insertion_sort(v); }});
  regs.push_back({{"merge_sort", true, false},
                  [](const auto &v) { return algos::merge_sort(v); }});
  regs.push_back({{"quick_sort", false, false},
                  [](const auto &v) { return algos::quick_sort(v); }});
  regs.push_back({{"builtin_sort", true, false},
                  [](const auto &v) { return algos::builtin_sort(v); }});
  return regs;
}

static const std::vector<AlgoEntry> &registry() {
  static const std::vector<AlgoEntry> regs = build_registry();
  return regs;
}

const std::vector<AlgoInfo> &list_algorithms() {
  static const std::vector<AlgoInfo> infos = [] {
    std::vector<AlgoInfo> v;
    for (const auto &e : registry())
      v.push_back(e.info);
    return v;
  }();
  return infos;
}

std::vector<std::size_t> default_sizes() {
  return {128, 256, 512, 1024, 2048, 4096};
}

std::vector<std::size_t> power_of_two_sizes(int min_power, int max_power) {
  constexpr int kMaxPower = 30;
  if (min_power < 0 || max_power > kMaxPower)
    throw std::invalid_argument("power bounds must lie in [0, " +
                                std::to_string(kMaxPower) + "]");
  if (min_power > max_power)
    throw std::invalid_argument("min power " + std::to_string(min_power) +
                                " exceeds max power " +
                                std::to_string(max_power));
  std::vector<std::size_t> sizes;
  for (int p = min_power; p <= max_power; ++p)
    sizes.push_back(std::size_t{1} << p);
  return sizes;
}

std::vector<Elem> make_random_ints(std::size_t n, std::mt19937_64 &rng) {
  std::uniform_int_distribution<Elem> d(0, static_cast<Elem>(n) * 10);
  std::vector<Elem> v;
  v.resize(n);
  for (std::size_t i = 0; i < n; ++i)
    v[i] = d(rng);
  return v;
}

std::uint64_t fold_digest(std::uint64_t h, const std::vector<Elem> &v) {
  constexpr std::uint64_t kPrime = 1099511628211ULL;
  for (Elem x : v) {
    auto u = static_cast<std::uint64_t>(x);
    for (int b = 0; b < 8; ++b) {
      h ^= (u >> (8 * b)) & 0xFFu;
      h *= kPrime;
    }
  }
  return h;
}

double mean(const std::vector<double> &xs) {
  if (xs.empty())
    return 0.0;
  double sum = 0.0;
  for (double x : xs)
    sum += x;
  return sum / static_cast<double>(xs.size());
}

double population_stddev(const std::vector<double> &xs) {
  if (xs.empty())
    return 0.0;
  const double m = mean(xs);
  double var = 0.0;
  for (double x : xs) {
    double d = x - m;
    var += d * d;
  }
  var /= static_cast<double>(xs.size());
  return std::sqrt(var);
}

static bool name_selected(const std::vector<std::string> &selected,
                          const std::string &name) {
  if (selected.empty())
    return true;
  std::string ln = to_lower(name);
  for (const auto &s : selected)
    if (to_lower(s) == ln)
      return true;
  return false;
}

static void validate(const ExperimentConfig &cfg) {
  if (cfg.trials < 1)
    throw std::invalid_argument("trials must be positive (got " +
                                std::to_string(cfg.trials) + ")");
  for (std::size_t n : cfg.sizes)
    if (n == 0)
      throw std::invalid_argument("input sizes must be positive");
  for (const auto &s : cfg.algos) {
    bool known = false;
    for (const auto &e : registry())
      if (to_lower(s) == e.info.name)
        known = true;
    if (!known)
      throw std::invalid_argument("unknown algorithm: " + s);
  }
}

static double time_once(const AlgoEntry &algo, const std::vector<Elem> &input,
                        bool verify) {
  auto t0 = Clock::now();
  std::vector<Elem> out = algo.run(input);
  auto t1 = Clock::now();
  if (out.size() != input.size())
    throw std::runtime_error("output length mismatch (algo=" +
                             algo.info.name + ")");
  if (verify) {
    std::vector<Elem> ref(input);
    std::stable_sort(ref.begin(), ref.end());
    if (out != ref)
      throw std::runtime_error("Verification mismatch vs std::stable_sort: " +
                               algo.info.name +
                               " (n=" + std::to_string(input.size()) + ")");
  }
  return std::chrono::duration_cast<seconds_d>(t1 - t0).count();
}

ExperimentResult measure(const ExperimentConfig &cfg, std::ostream *progress) {
  validate(cfg);

  ExperimentResult out;
  out.sizes = cfg.sizes.empty() ? default_sizes() : cfg.sizes;
  out.trials = cfg.trials;
  out.seed = cfg.seed;

  std::mt19937_64 rng(cfg.seed);

  for (const auto &algo : registry()) {
    if (!name_selected(cfg.algos, algo.info.name))
      continue;
    if (progress)
      *progress << "Running " << algo.info.name << "...\n";

    for (std::size_t n : out.sizes) {
      if (algo.info.quadratic && n > cfg.quadratic_cap)
        continue;
      std::vector<double> times;
      times.reserve(static_cast<std::size_t>(cfg.trials));
      std::uint64_t digest = kDigestSeed;
      for (int t = 0; t < cfg.trials; ++t) {
        std::vector<Elem> input = make_random_ints(n, rng);
        digest = fold_digest(digest, input);
        double s = time_once(algo, input, cfg.verify);
        times.push_back(s);
        out.samples.push_back(TimingSample{algo.info.name, n, s});
      }
      auto mm = std::minmax_element(times.begin(), times.end());
      Measurement m;
      m.algo = algo.info.name;
      m.n = n;
      m.mean_s = mean(times);
      m.stddev_s = population_stddev(times);
      m.min_s = *mm.first;
      m.max_s = *mm.second;
      m.trials = cfg.trials;
      m.input_digest = digest;
      if (progress) {
        std::ostream &os = *progress;
        auto flags = os.flags();
        auto prec = os.precision();
        os << "  size=" << std::setw(5) << n << std::fixed
           << std::setprecision(6) << " avg_time=" << m.mean_s
           << "s stdev=" << m.stddev_s << "s\n";
        os.flags(flags);
        os.precision(prec);
      }
      out.rows.push_back(std::move(m));
    }
  }
  return out;
}

} // namespace sortlab
