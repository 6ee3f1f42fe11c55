// Result artifacts: results.csv plus a gnuplot-rendered log-log chart.
#include "sortlab/core.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace sortlab {

namespace fs = std::filesystem;

static void write_text_file(const fs::path &p, const std::string &text) {
  std::ofstream f(p);
  if (!f)
    throw std::runtime_error("Failed to open " + p.string() + " for writing");
  f << text;
  f.close();
  if (!f)
    throw std::runtime_error("Failed to write " + p.string());
}

// Single-quoted gnuplot string literal: an embedded ' is written as ''.
static std::string gp_quote(const std::string &s) {
  std::string out = "'";
  for (char c : s) {
    if (c == '\'')
      out += "''";
    else
      out += c;
  }
  return out + "'";
}

// Single-quoted POSIX shell word: an embedded ' closes, escapes and reopens.
static std::string sh_quote(const std::string &s) {
  std::string out = "'";
  for (char c : s) {
    if (c == '\'')
      out += "'\\''";
    else
      out += c;
  }
  return out + "'";
}

// One gnuplot index block per algorithm: "n mean stddev" lines, blocks
// separated by two blank lines.
static std::vector<std::string> write_chart_data(const ExperimentResult &r,
                                                 const fs::path &dat_path) {
  std::vector<std::string> series;
  std::ofstream df(dat_path);
  if (!df)
    throw std::runtime_error("Failed to open data file: " + dat_path.string());
  df.precision(10);
  for (const auto &row : r.rows) {
    if (series.empty() || series.back() != row.algo) {
      if (!series.empty())
        df << "\n\n";
      series.push_back(row.algo);
      df << "# " << row.algo << "\n";
    }
    df << row.n << '\t' << row.mean_s << '\t' << row.stddev_s << '\n';
  }
  df.close();
  if (!df)
    throw std::runtime_error("Failed to write data file: " + dat_path.string());
  return series;
}

static std::string chart_script(const std::vector<std::string> &series,
                                const fs::path &dat_path,
                                const fs::path &png_path) {
  std::string gp;
  gp += "set terminal pngcairo size 1000,600\n";
  gp += "set output " + gp_quote(png_path.string()) + "\n";
  gp += "set title 'Sorting algorithms: execution time vs input size'\n";
  gp += "set xlabel 'Input size (n)'\n";
  gp += "set ylabel 'Time (seconds)'\n";
  gp += "set logscale x 2\n";
  gp += "set logscale y 10\n";
  gp += "set grid\n";
  gp += "set key top left\n";
  gp += "set datafile separator '\t'\n";
  if (series.empty()) {
    gp += "set label 'no measurements' at graph 0.5,0.5 center\n";
    gp += "plot NaN notitle\n";
    return gp;
  }
  gp += "plot ";
  for (std::size_t i = 0; i < series.size(); ++i) {
    if (i)
      gp += ", \\\n     ";
    gp += (i == 0 ? gp_quote(dat_path.string()) : std::string("''"));
    gp += " index " + std::to_string(i) +
          " using 1:2:3 with yerrorlines pointtype 7 title " +
          gp_quote(series[i]);
  }
  gp += "\n";
  return gp;
}

ArtifactPaths write_artifacts(const ExperimentResult &r,
                              const std::string &outdir, bool render_chart) {
  fs::path dir(outdir);
  fs::create_directories(dir);

  ArtifactPaths paths;
  fs::path csv_path = dir / "results.csv";
  write_text_file(csv_path, to_csv(r, true));
  paths.csv = csv_path.string();
  std::cout << "Results saved to " << paths.csv << "\n";

  fs::path dat_path = dir / "complexity.dat";
  fs::path gp_path = dir / "complexity.gp";
  fs::path png_path = dir / "complexity.png";
  auto series = write_chart_data(r, dat_path);
  write_text_file(gp_path, chart_script(series, dat_path, png_path));
  paths.chart_data = dat_path.string();
  paths.chart_script = gp_path.string();
  paths.chart = png_path.string();

  if (!render_chart)
    return paths;

  std::string cmd = "gnuplot " + sh_quote(gp_path.string());
  int rc = std::system(cmd.c_str());
  if (rc != 0) {
    std::cerr << "gnuplot failed (rc=" << rc
              << "); ensure gnuplot is installed. Script: " << gp_path << "\n";
    return paths;
  }
  paths.chart_rendered = true;
  std::cout << "Plot saved to " << paths.chart << "\n";
  return paths;
}

std::string default_outdir(const char *argv0) {
  std::error_code ec;
  fs::path exe;
  if (argv0 && std::string(argv0).find('/') != std::string::npos)
    exe = fs::canonical(argv0, ec);
  if (exe.empty() || ec) {
    ec.clear();
    exe = fs::read_symlink("/proc/self/exe", ec);
  }
  if (ec || exe.empty())
    return "plots";
  return (exe.parent_path() / "plots").string();
}

ExperimentResult run_experiments(const ExperimentConfig &cfg,
                                 ArtifactPaths *paths) {
  ExperimentResult r = measure(cfg, &std::cout);
  ArtifactPaths p = write_artifacts(r, cfg.outdir, cfg.render_chart);
  if (paths)
    *paths = std::move(p);
  return r;
}

} // namespace sortlab
