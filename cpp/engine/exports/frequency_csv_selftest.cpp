/*
================================================================================
Engine: CSV Exporter Selftest
FILE: cpp/engine/exports/frequency_csv_selftest.cpp

Checks:
  - headers and row counts of the records/curves/moments tables
  - partition labels and percent scaling of the records table
  - label escaping, NaN -> empty cell
  - write_text_file round trip and IOError on an unwritable path
================================================================================
*/

#include "engine/core/errors.hpp"
#include "engine/core/selftest.hpp"
#include "engine/exports/frequency_csv.hpp"

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using namespace floodfreq;
using namespace floodfreq::selftest;

static std::vector<std::string> split_lines(const std::string& text) {
  std::vector<std::string> lines;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) lines.push_back(line);
  return lines;
}

static void test_records_table() {
  freq::RecordSet rs({1.0, 2.0, 3.0});
  rs.attach_historical({10.0}, 9);

  const auto lines = split_lines(records_to_csv(rs));
  expect_true(lines.size() == 5, "header + one row per record");
  expect_true(lines[0] == "rank,value,exceedance_pct,partition", "records header");
  expect_true(lines[1] == "1,10.000000,10.000000,extreme", "historical flood row");
  expect_true(lines[2] == "2,3.000000,32.500000,ordinary", "first ordinary row");

  CsvExportOptions opt;
  opt.include_header = false;
  opt.delimiter = ';';
  opt.precision = 2;
  const auto bare = split_lines(records_to_csv(rs, opt));
  expect_true(bare.size() == 4, "no header when disabled");
  expect_true(bare[3] == "4;1.00;77.50;ordinary", "custom delimiter and precision");
}

static void test_curves_table() {
  const std::vector<NamedCurve> curves{
      {"moment_based", freq::Pearson3Curve(100.0, 1.0, 2.0)},
      {"fit, refined", freq::Pearson3Curve(100.0, 1.0, 2.0)},
  };
  const auto lines = split_lines(curves_to_csv({1.0, 50.0, 150.0}, curves));

  expect_true(lines.size() == 4, "header + one row per grid point");
  expect_true(lines[0] == "exceedance_pct,moment_based,\"fit, refined\"", "label with comma quoted");
  expect_true(lines[1] == "1.000000,460.517019,460.517019", "1% row");
  expect_true(lines[3] == "150.000000,,", "NaN values export as empty cells");
}

static void test_moments_table() {
  const std::vector<NamedMoments> rows{
      {"moment_based", freq::Moments{1000.0, 0.5, 1.5}},
      {"flat", freq::Moments{1.0, 0.0, 0.5}},
  };
  const auto lines = split_lines(moments_to_csv(rows));

  expect_true(lines.size() == 3, "header + one row per parameter set");
  expect_true(lines[0] == "label,ex,cv,cs,cs_over_cv", "moments header");
  expect_true(lines[1] == "moment_based,1000.000000,0.500000,1.500000,3.000000", "moments row");
  expect_true(lines[2] == "flat,1.000000,0.000000,0.500000,", "undefined ratio is empty");
}

static void test_write_text_file() {
  namespace fs = std::filesystem;
  const fs::path path = fs::temp_directory_path() / "floodfreq_csv_selftest.csv";

  expect_no_throw([&] { write_text_file(path.string(), "a,b\n1,2\n"); }, "write to temp dir");
  std::ifstream in(path);
  std::stringstream buf;
  buf << in.rdbuf();
  expect_true(buf.str() == "a,b\n1,2\n", "written text reads back");
  in.close();
  std::error_code ec;
  fs::remove(path, ec);

  const fs::path missing = fs::temp_directory_path() / "floodfreq_no_such_dir" / "x" / "out.csv";
  expect_throws<IOError>([&] { write_text_file(missing.string(), "x"); }, "missing directory throws IOError");
}

int main() {
  test_records_table();
  test_curves_table();
  test_moments_table();
  test_write_text_file();

  return finish("frequency_csv");
}
