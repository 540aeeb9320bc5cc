#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "data.hpp"

enum ExportStatus {
  Export_OK = 0,
  Export_NothingToExport,
  Export_NoDestination,
  Export_OpenFailure,
  Export_WriteFailure,
};

struct ExportReport {
  ExportStatus status = Export_OK;
  // Data rows written, the header not included
  size_t numRecords = 0;
  std::string path;
  std::string message;
};

struct ExportSink {
  virtual ~ExportSink() = default;
  // Writes and flushes one row; false when the destination failed
  virtual bool WriteRow(const std::vector<std::string> &fields) = 0;
};

struct CsvSink : ExportSink {
  std::ostream &out;
  char delimiter;

  CsvSink(std::ostream &out, char delimiter = ',')
      : out(out), delimiter(delimiter) {}

  bool WriteRow(const std::vector<std::string> &fields) override;
};

std::string Csv_FormatRow(const std::vector<std::string> &fields,
                          char delimiter = ',');

// ',' unless the path ends in ".tsv"
char Export_DelimiterFor(const std::string &path);

// Groups that captured on at least one matched line, by group number
std::vector<GroupInfo> Export_Columns(const MatchResultSet &results);

// "source", "line", then one name per column. Labels that would repeat an
// earlier header fall back to group_N, then get a numeric suffix.
std::vector<std::string> Export_HeaderRow(
    const std::vector<GroupInfo> &columns);

ExportReport Export_Write(const MatchResultSet &results, ExportSink &sink);

ExportReport Export_ToFile(const MatchResultSet &results,
                           const std::string &path);

// Checks that `path` can be opened for writing without truncating it
bool Export_CheckDestination(const std::string &path, std::string &error);
