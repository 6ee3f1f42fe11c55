// Pure formatting helpers for ExperimentResult
#include "sortlab/core.hpp"

#include <algorithm>
#include <cstdio>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

namespace sortlab {

static inline std::string esc_json(const std::string &s) {
  std::string o;
  o.reserve(s.size() + 8);
  for (char c : s) {
    switch (c) {
    case '"': o += "\\\""; break;
    case '\\': o += "\\\\"; break;
    case '\n': o += "\\n"; break;
    case '\r': o += "\\r"; break;
    case '\t': o += "\\t"; break;
    default:
      if (static_cast<unsigned char>(c) < 0x20) {
        char buf[7];
        std::snprintf(buf, sizeof(buf), "\\u%04x", (int)(unsigned char)c);
        o += buf;
      } else {
        o += c;
      }
    }
  }
  return o;
}

static void json_fields(std::ostream &os, const Measurement &m) {
  os << "\"algorithm\":\"" << esc_json(m.algo) << "\",";
  os << "\"n\":" << m.n << ",";
  os << "\"avg_seconds\":" << m.mean_s << ",";
  os << "\"stdev_seconds\":" << m.stddev_s << ",";
  os << "\"min_seconds\":" << m.min_s << ",";
  os << "\"max_seconds\":" << m.max_s << ",";
  os << "\"trials\":" << m.trials;
}

std::string to_csv(const ExperimentResult &r, bool with_header) {
  std::ostringstream os;
  if (with_header)
    os << "algorithm,n,avg_seconds,stdev_seconds\n";
  os.setf(std::ios::fixed);
  os << std::setprecision(8);
  for (const auto &row : r.rows)
    os << row.algo << ',' << row.n << ',' << row.mean_s << ',' << row.stddev_s
       << '\n';
  return os.str();
}

std::string to_json(const ExperimentResult &r, bool pretty) {
  std::ostringstream os;
  const char *nl = pretty ? "\n" : "";
  os.setf(std::ios::fixed);
  os << std::setprecision(8);
  os << "[" << nl;
  for (std::size_t i = 0; i < r.rows.size(); ++i) {
    os << (pretty ? "  {" : "{");
    json_fields(os, r.rows[i]);
    os << "}";
    if (i + 1 != r.rows.size())
      os << ",";
    os << nl;
  }
  os << "]" << nl;
  return os.str();
}

std::string to_jsonl(const ExperimentResult &r) {
  std::ostringstream os;
  os.setf(std::ios::fixed);
  os << std::setprecision(8);
  for (const auto &row : r.rows) {
    os << '{';
    json_fields(os, row);
    os << "}" << '\n';
  }
  return os.str();
}

std::string to_table(const ExperimentResult &r) {
  auto fmt = [](double v) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(8) << v;
    return os.str();
  };
  std::size_t w_algo = std::string("algorithm").size();
  std::size_t w_n = std::string("n").size();
  std::size_t w_avg = std::string("avg_seconds").size();
  std::size_t w_std = std::string("stdev_seconds").size();
  for (const auto &row : r.rows) {
    w_algo = std::max(w_algo, row.algo.size());
    w_n = std::max(w_n, std::to_string(row.n).size());
    w_avg = std::max(w_avg, fmt(row.mean_s).size());
    w_std = std::max(w_std, fmt(row.stddev_s).size());
  }

  std::ostringstream os;
  auto print_sep = [&]() {
    os << '+' << std::string(w_algo + 2, '-') << '+'
       << std::string(w_n + 2, '-') << '+' << std::string(w_avg + 2, '-')
       << '+' << std::string(w_std + 2, '-') << "+\n";
  };
  auto print_row = [&](const std::string &a, const std::string &n,
                       const std::string &avg, const std::string &sd) {
    os << "| " << std::left << std::setw(static_cast<int>(w_algo)) << a
       << " | " << std::right << std::setw(static_cast<int>(w_n)) << n
       << " | " << std::right << std::setw(static_cast<int>(w_avg)) << avg
       << " | " << std::right << std::setw(static_cast<int>(w_std)) << sd
       << " |\n";
  };
  print_sep();
  print_row("algorithm", "n", "avg_seconds", "stdev_seconds");
  print_sep();
  for (const auto &row : r.rows)
    print_row(row.algo, std::to_string(row.n), fmt(row.mean_s),
              fmt(row.stddev_s));
  print_sep();
  return os.str();
}

} // namespace sortlab
