#include "export.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <set>

#include <fmt/core.h>

#include <Tracy.hpp>

static void AppendField(std::string &out,
                        const std::string &field,
                        char delimiter) {
  const char special[] = {delimiter, '"', '\r', '\n', 0};
  bool needsQuotes = field.find_first_of(special) != std::string::npos;
  if (!needsQuotes) {
    out += field;
    return;
  }

  out += '"';
  for (auto ch : field) {
    if (ch == '"') {
      out += '"';
    }
    out += ch;
  }
  out += '"';
}

std::string Csv_FormatRow(const std::vector<std::string> &fields,
                          char delimiter) {
  std::string ret;
  for (size_t i = 0; i < fields.size(); i++) {
    if (i != 0) {
      ret += delimiter;
    }
    AppendField(ret, fields[i], delimiter);
  }
  ret += '\n';
  return ret;
}

bool CsvSink::WriteRow(const std::vector<std::string> &fields) {
  out << Csv_FormatRow(fields, delimiter);
  out.flush();
  return out.good();
}

char Export_DelimiterFor(const std::string &path) {
  auto extension = std::filesystem::path(path).extension().string();
  return extension == ".tsv" || extension == ".TSV" ? '\t' : ',';
}

std::vector<GroupInfo> Export_Columns(const MatchResultSet &results) {
  std::set<uint32_t> present;
  for (auto &line : results.lines) {
    if (!line.matched) {
      continue;
    }
    for (auto &capture : line.captures) {
      present.insert(capture.idxGroup);
    }
  }

  std::vector<GroupInfo> ret;
  for (auto &group : results.groups) {
    if (present.count(group.idxGroup) != 0) {
      ret.push_back(group);
    }
  }
  return ret;
}

std::vector<std::string> Export_HeaderRow(
    const std::vector<GroupInfo> &columns) {
  std::vector<std::string> ret = {"source", "line"};
  std::set<std::string> used(ret.begin(), ret.end());

  for (auto &column : columns) {
    auto name = GroupLabel_ToString(column.label);
    if (used.count(name) != 0) {
      name = GroupLabel_ToString(PositionalLabel{column.idxGroup});
    }
    auto base = name;
    for (uint32_t suffix = 2; used.count(name) != 0; suffix++) {
      name = fmt::format("{}_{}", base, suffix);
    }
    used.insert(name);
    ret.push_back(std::move(name));
  }
  return ret;
}

ExportReport Export_Write(const MatchResultSet &results, ExportSink &sink) {
  ZoneScoped;
  ExportReport report;
  auto columns = Export_Columns(results);

  auto row = Export_HeaderRow(columns);

  if (!sink.WriteRow(row)) {
    report.status = Export_WriteFailure;
    report.message = "failed to write the header row";
    return report;
  }

  for (auto &line : results.lines) {
    if (!line.matched) {
      continue;
    }

    row.clear();
    row.push_back(results.documents[line.idxDocument]->path);
    row.push_back(std::to_string(line.idxLine + 1));

    // Both lists are ordered by group number
    auto itCapture = line.captures.begin();
    for (auto &column : columns) {
      while (itCapture != line.captures.end() &&
             itCapture->idxGroup < column.idxGroup) {
        ++itCapture;
      }
      if (itCapture != line.captures.end() &&
          itCapture->idxGroup == column.idxGroup) {
        row.push_back(itCapture->text);
      } else {
        row.emplace_back();
      }
    }

    if (!sink.WriteRow(row)) {
      report.status = Export_WriteFailure;
      report.message = fmt::format("write failed after {} record(s)",
                                   report.numRecords);
      return report;
    }
    report.numRecords++;
  }

  report.status = Export_OK;
  report.message = fmt::format("{} record(s) written", report.numRecords);
  return report;
}

ExportReport Export_ToFile(const MatchResultSet &results,
                           const std::string &path) {
  std::ofstream file(path, std::ios::out | std::ios::trunc | std::ios::binary);
  if (!file.is_open()) {
    ExportReport report;
    report.status = Export_OpenFailure;
    report.path = path;
    report.message =
        fmt::format("cannot open '{}' for writing: {}", path, strerror(errno));
    return report;
  }

  CsvSink sink(file, Export_DelimiterFor(path));
  auto report = Export_Write(results, sink);
  report.path = path;
  if (report.status == Export_WriteFailure) {
    report.message = fmt::format("'{}': {}", path, report.message);
  }
  return report;
}

bool Export_CheckDestination(const std::string &path, std::string &error) {
  std::error_code ec;
  bool existed = std::filesystem::exists(path, ec);

  if (existed && std::filesystem::is_directory(path, ec)) {
    error = fmt::format("output '{}' is a directory", path);
    return false;
  }

  {
    std::ofstream probe(path, std::ios::out | std::ios::app);
    if (!probe.is_open()) {
      error = fmt::format("output '{}' is not writable: {}", path,
                          strerror(errno));
      return false;
    }
  }

  if (!existed) {
    std::filesystem::remove(path, ec);
  }
  return true;
}
