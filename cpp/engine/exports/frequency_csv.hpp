#pragma once
/*
================================================================================
Engine: CSV Exporter (Frequency Records, Curves, Moments)
FILE: cpp/engine/exports/frequency_csv.hpp

Purpose:
  - Export the engine's outputs in a form any plotting tool can consume:
      * records : rank, value, empirical exceedance (%), partition
      * curves  : exceedance (%) grid with one value column per curve
      * moments : one row per parameter set (moment-based, fitted, ...)
  - Deterministic column ordering for diff-friendly output.

Hardening:
  - Explicit CSV escaping for labels with commas/quotes
  - NaN/unset values export as empty string (not "nan")
  - write_text_file throws IOError instead of returning silently
================================================================================
*/

#include "engine/freq/moments.hpp"
#include "engine/freq/pearson3_curve.hpp"
#include "engine/freq/record_set.hpp"

#include <string>
#include <vector>

namespace floodfreq {

struct CsvExportOptions {
  bool include_header = true;
  char delimiter = ',';
  int precision = 6;
};

struct NamedCurve {
  std::string label;
  freq::Pearson3Curve curve;
};

struct NamedMoments {
  std::string label;
  freq::Moments moments;
};

// rank,value,exceedance_pct,partition
std::string records_to_csv(const freq::RecordSet& records,
                           const CsvExportOptions& opt = CsvExportOptions());

// exceedance_pct,<label 1>,<label 2>,...
std::string curves_to_csv(const std::vector<double>& grid_pct,
                          const std::vector<NamedCurve>& curves,
                          const CsvExportOptions& opt = CsvExportOptions());

// label,ex,cv,cs,cs_over_cv
std::string moments_to_csv(const std::vector<NamedMoments>& rows,
                           const CsvExportOptions& opt = CsvExportOptions());

// Throws IOError if the file cannot be written.
void write_text_file(const std::string& file_path, const std::string& text);

}  // namespace floodfreq
