/*
================================================================================
Engine: CSV Exporter Implementation
FILE: cpp/engine/exports/frequency_csv.cpp
================================================================================
*/

#include "frequency_csv.hpp"

#include "engine/core/errors.hpp"

#include <cmath>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace floodfreq {

// Helper: escape CSV string (quote if contains delimiter/quote/newline)
static std::string csv_escape(const std::string& s, char delim) {
  bool needs_quote = false;
  for (char c : s) {
    if (c == delim || c == '"' || c == '\n' || c == '\r') {
      needs_quote = true;
      break;
    }
  }

  if (!needs_quote) return s;

  std::string out = "\"";
  for (char c : s) {
    if (c == '"') out += "\"\"";
    else out += c;
  }
  out += "\"";
  return out;
}

// Helper: format double, or empty string if NaN/Inf
static std::string csv_double(double x, int precision) {
  if (!std::isfinite(x)) return "";
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(precision) << x;
  return oss.str();
}

std::string records_to_csv(const freq::RecordSet& records, const CsvExportOptions& opt) {
  std::ostringstream out;
  const char d = opt.delimiter;

  if (opt.include_header) {
    out << "rank" << d << "value" << d << "exceedance_pct" << d << "partition" << "\n";
  }

  const std::vector<double>& values = records.values();
  const std::vector<double> probs = records.empirical_probabilities();
  for (std::size_t i = 0; i < values.size(); ++i) {
    out << (i + 1) << d
        << csv_double(values[i], opt.precision) << d
        << csv_double(probs[i] * 100.0, opt.precision) << d
        << (i < records.extreme_count() ? "extreme" : "ordinary") << "\n";
  }
  return out.str();
}

std::string curves_to_csv(const std::vector<double>& grid_pct,
                          const std::vector<NamedCurve>& curves,
                          const CsvExportOptions& opt) {
  std::ostringstream out;
  const char d = opt.delimiter;

  if (opt.include_header) {
    out << "exceedance_pct";
    for (const auto& c : curves) out << d << csv_escape(c.label, d);
    out << "\n";
  }

  for (double pct : grid_pct) {
    out << csv_double(pct, opt.precision);
    for (const auto& c : curves) {
      out << d << csv_double(c.curve.value_from_prob(pct / 100.0), opt.precision);
    }
    out << "\n";
  }
  return out.str();
}

std::string moments_to_csv(const std::vector<NamedMoments>& rows, const CsvExportOptions& opt) {
  std::ostringstream out;
  const char d = opt.delimiter;

  if (opt.include_header) {
    out << "label" << d << "ex" << d << "cv" << d << "cs" << d << "cs_over_cv" << "\n";
  }

  for (const auto& r : rows) {
    out << csv_escape(r.label, d) << d
        << csv_double(r.moments.ex, opt.precision) << d
        << csv_double(r.moments.cv, opt.precision) << d
        << csv_double(r.moments.cs, opt.precision) << d
        << csv_double(r.moments.skew_ratio(), opt.precision) << "\n";
  }
  return out.str();
}

void write_text_file(const std::string& file_path, const std::string& text) {
  std::ofstream f(file_path, std::ios::out | std::ios::trunc);
  if (!f) {
    throw IOError("write_text_file: cannot open " + file_path);
  }
  f << text;
  f.flush();
  if (!f) {
    throw IOError("write_text_file: write failed for " + file_path);
  }
}

}  // namespace floodfreq
