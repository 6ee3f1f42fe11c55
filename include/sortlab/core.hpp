// Public API for the sortlab measurement harness.
// Runs every registered algorithm over a sweep of input sizes and aggregates
// the per-trial timings. Measurement itself does no file I/O; artifacts are
// written by write_artifacts / run_experiments.

#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <random>
#include <string>
#include <vector>

namespace sortlab {

// Element type used by the harness
using Elem = long long;

struct AlgoInfo {
  std::string name;
  bool stable = true;
  bool quadratic = false; // only measured up to ExperimentConfig::quadratic_cap
};

struct ExperimentConfig {
  std::vector<std::size_t> sizes;   // empty = default_sizes()
  int trials = 3;                   // timed runs per (algorithm, size)
  std::uint64_t seed = 0;           // seeds the generator once per run
  std::string outdir = "plots";     // artifact directory
  std::vector<std::string> algos;   // exact names, case-insensitive (empty = all)
  std::size_t quadratic_cap = 1024; // largest n for O(n^2) algorithms
  bool verify = false;              // compare each output with std::stable_sort
  bool render_chart = true;         // run gnuplot after writing the script
};

struct TimingSample {
  std::string algo;
  std::size_t n = 0;
  double seconds = 0.0;
};

struct Measurement {
  std::string algo;
  std::size_t n = 0;
  double mean_s = 0.0;
  double stddev_s = 0.0; // population (divisor = trials)
  double min_s = 0.0;
  double max_s = 0.0;
  int trials = 0;
  std::uint64_t input_digest = 0; // fold_digest over every trial's input
};

struct ExperimentResult {
  std::vector<std::size_t> sizes;
  int trials = 0;
  std::uint64_t seed = 0;
  std::vector<Measurement> rows;     // grouped by algorithm, registry order
  std::vector<TimingSample> samples; // every trial, in run order
};

struct ArtifactPaths {
  std::string csv;
  std::string chart_data;
  std::string chart_script;
  std::string chart;
  bool chart_rendered = false;
};

// Registered algorithms in measurement order.
const std::vector<AlgoInfo> &list_algorithms();

// {128, 256, 512, 1024, 2048, 4096}
std::vector<std::size_t> default_sizes();

// 2^min_power .. 2^max_power inclusive. Throws std::invalid_argument when the
// bounds are reversed or outside [0, 30].
std::vector<std::size_t> power_of_two_sizes(int min_power, int max_power);

// n values drawn uniformly from [0, n*10].
std::vector<Elem> make_random_ints(std::size_t n, std::mt19937_64 &rng);

// FNV-1a fold of the values into h. Start from kDigestSeed.
constexpr std::uint64_t kDigestSeed = 14695981039346656037ULL;
std::uint64_t fold_digest(std::uint64_t h, const std::vector<Elem> &v);

double mean(const std::vector<double> &xs);
double population_stddev(const std::vector<double> &xs);

// Time every selected algorithm at every applicable size. Progress lines go
// to *progress when it is non-null. Throws std::invalid_argument on a bad
// config and std::runtime_error when verification fails.
ExperimentResult measure(const ExperimentConfig &cfg,
                         std::ostream *progress = nullptr);

// Write results.csv and the chart under outdir, rendering it with gnuplot
// when render_chart is set. Directory and file errors propagate as
// exceptions; a gnuplot failure is reported through chart_rendered.
ArtifactPaths write_artifacts(const ExperimentResult &r,
                              const std::string &outdir, bool render_chart);

// "plots" beside the running executable. argv0 is resolved when it names a
// path; a bare command name found through PATH falls back to
// /proc/self/exe. Returns "plots" when neither can be resolved.
std::string default_outdir(const char *argv0);

// measure() with progress on stdout, then write_artifacts().
ExperimentResult run_experiments(const ExperimentConfig &cfg,
                                 ArtifactPaths *paths = nullptr);

// Formatting helpers (pure; no file I/O)
std::string to_csv(const ExperimentResult &r, bool with_header = true);

std::string to_json(const ExperimentResult &r, bool pretty = true);

std::string to_jsonl(const ExperimentResult &r);

std::string to_table(const ExperimentResult &r);

} // namespace sortlab
