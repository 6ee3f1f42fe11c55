#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "sortlab/core.hpp"

enum class OutFmt : int { csv = 0, table = 1, json = 2, jsonl = 3 };

// Command-line options
struct Options {
  int min_power = 7;                    // smallest n = 2^min_power
  int max_power = 12;                   // largest n = 2^max_power
  int trials = 3;                       // timed runs per (algo, n)
  std::uint64_t seed = 0;               // generator seed
  std::optional<std::string> outdir;    // artifact directory
  std::vector<std::string> algos;       // selected algorithms; empty = all
  std::size_t quadratic_cap = 1024;     // size cap for O(n^2) algorithms
  OutFmt format = OutFmt::table;        // summary printed after the run
  bool verify = false;                  // check outputs vs std::stable_sort
  bool plot = true;                     // invoke gnuplot
  bool list = false;                    // list algorithms and exit
};

// Raised for malformed command lines; main prints usage and exits 2.
struct UsageError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

static inline std::string to_lower(std::string s) {
  for (char &c : s)
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

static long long parse_int(std::string_view flag, const std::string &v) {
  std::size_t pos = 0;
  long long x = 0;
  try {
    x = std::stoll(v, &pos, 10);
  } catch (const std::exception &) {
    throw UsageError(std::string(flag) + " expects an integer, got '" + v +
                     "'");
  }
  if (pos != v.size())
    throw UsageError(std::string(flag) + " expects an integer, got '" + v +
                     "'");
  return x;
}

// Range-checked before narrowing so huge values cannot wrap into [0, 30].
static int parse_power(std::string_view flag, const std::string &v) {
  long long p = parse_int(flag, v);
  if (p < 0 || p > 30)
    throw UsageError(std::string(flag) + " must lie in [0, 30], got " + v);
  return static_cast<int>(p);
}

static void print_usage(const char *argv0) {
  std::cerr << "Usage: " << argv0
            << " [--min-power P] [--max-power P] [--trials K] [--seed S]"
               " [--outdir DIR] [--algo name[,name...]] [--quadratic-cap N]"
               " [--format csv|table|json|jsonl] [--verify] [--no-plot]"
               " [--list]\n";
  std::cerr << "       sizes are 2^min-power .. 2^max-power (default 7..12 -> "
               "128..4096)\n";
  std::cerr << "       --trials K (runs per algorithm and size, default 3)\n";
  std::cerr << "       --seed S (generator seed, default 0)\n";
  std::cerr << "       --outdir DIR (results.csv and complexity.png; default "
               "'plots' next to the executable)\n";
  std::cerr << "       --quadratic-cap N (largest n for bubble_sort and "
               "insertion_sort, default 1024)\n";
  std::cerr << "       --verify (compare every output with std::stable_sort)\n";
  std::cerr << "       --no-plot (write the gnuplot script but do not run it)\n";
}

static Options parse_args(int argc, char **argv) {
  Options opt;
  for (int i = 1; i < argc; ++i) {
    std::string_view a = argv[i];
    auto get_value_inline =
        [&](std::string_view arg,
            std::string_view key) -> std::optional<std::string> {
      if (arg.size() > key.size() + 1 && arg.substr(0, key.size()) == key &&
          arg[key.size()] == '=') {
        return std::string(arg.substr(key.size() + 1));
      }
      return std::nullopt;
    };
    auto need_value = [&](std::string_view flag) {
      if (i + 1 >= argc) {
        throw UsageError(std::string("Missing value for ") +
                         std::string(flag));
      }
      return std::string(argv[++i]);
    };
    auto value_of = [&](std::string_view key) {
      if (auto iv = get_value_inline(a, key))
        return *iv;
      return need_value(key);
    };
    auto is_flag = [&](std::string_view key) {
      return a == key || get_value_inline(a, key).has_value();
    };
    if (is_flag("--min-power")) {
      opt.min_power = parse_power("--min-power", value_of("--min-power"));
    } else if (is_flag("--max-power")) {
      opt.max_power = parse_power("--max-power", value_of("--max-power"));
    } else if (is_flag("--trials")) {
      long long k = parse_int("--trials", value_of("--trials"));
      if (k <= 0 || k > 1000000)
        throw UsageError("--trials must be a positive integer");
      opt.trials = static_cast<int>(k);
    } else if (is_flag("--seed")) {
      long long s = parse_int("--seed", value_of("--seed"));
      opt.seed = static_cast<std::uint64_t>(s);
    } else if (is_flag("--outdir")) {
      opt.outdir = value_of("--outdir");
    } else if (is_flag("--algo")) {
      std::string v = value_of("--algo");
      // Allow comma-separated list
      std::string cur;
      for (char c : v) {
        if (c == ',') {
          if (!cur.empty()) {
            opt.algos.push_back(to_lower(cur));
            cur.clear();
          }
        } else
          cur.push_back(c);
      }
      if (!cur.empty())
        opt.algos.push_back(to_lower(cur));
    } else if (is_flag("--quadratic-cap")) {
      long long c = parse_int("--quadratic-cap", value_of("--quadratic-cap"));
      if (c < 0)
        throw UsageError("--quadratic-cap must not be negative");
      opt.quadratic_cap = static_cast<std::size_t>(c);
    } else if (is_flag("--format")) {
      std::string v = to_lower(value_of("--format"));
      if (v == "csv")
        opt.format = OutFmt::csv;
      else if (v == "table")
        opt.format = OutFmt::table;
      else if (v == "json")
        opt.format = OutFmt::json;
      else if (v == "jsonl")
        opt.format = OutFmt::jsonl;
      else
        throw UsageError("Invalid --format (csv|table|json|jsonl): " + v);
    } else if (a == "--verify") {
      opt.verify = true;
    } else if (a == "--no-plot") {
      opt.plot = false;
    } else if (a == "--list") {
      opt.list = true;
    } else if (a == "--help" || a == "-h") {
      print_usage(argv[0]);
      std::exit(0);
    } else {
      throw UsageError("Unknown argument: " + std::string(a));
    }
  }
  if (opt.min_power > opt.max_power)
    throw UsageError("--min-power must not exceed --max-power");
  return opt;
}

static void print_summary(const sortlab::ExperimentResult &r, OutFmt fmt) {
  switch (fmt) {
  case OutFmt::csv:
    std::cout << sortlab::to_csv(r, true);
    break;
  case OutFmt::table:
    std::cout << sortlab::to_table(r);
    break;
  case OutFmt::json:
    std::cout << sortlab::to_json(r, true);
    break;
  case OutFmt::jsonl:
    std::cout << sortlab::to_jsonl(r);
    break;
  }
}

int main(int argc, char **argv) {
  Options opt;
  try {
    opt = parse_args(argc, argv);
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << "\n";
    print_usage(argv[0]);
    return 2;
  }

  if (opt.list) {
    for (const auto &a : sortlab::list_algorithms())
      std::cout << a.name << (a.stable ? "\tstable" : "\tunstable")
                << (a.quadratic ? "\tquadratic" : "") << "\n";
    return 0;
  }

  try {
    sortlab::ExperimentConfig cfg;
    cfg.sizes = sortlab::power_of_two_sizes(opt.min_power, opt.max_power);
    cfg.trials = opt.trials;
    cfg.seed = opt.seed;
    cfg.outdir = opt.outdir.value_or(sortlab::default_outdir(argv[0]));
    cfg.algos = opt.algos;
    cfg.quadratic_cap = opt.quadratic_cap;
    cfg.verify = opt.verify;
    cfg.render_chart = opt.plot;

    sortlab::ArtifactPaths paths;
    sortlab::ExperimentResult r = sortlab::run_experiments(cfg, &paths);
    print_summary(r, opt.format);
    if (opt.plot && !paths.chart_rendered)
      return 3;
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
