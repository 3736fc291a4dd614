#pragma once

#include "report_fields.hpp"

#include <ctime>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

// Reads all lines of a report, dropping a UTF-8 BOM and trailing '\r'.
// Throws std::runtime_error if the file cannot be opened.
std::vector<std::string> readReportLines(const std::string& path);

std::vector<std::string> readReportLines(std::istream& in);

// Writes a header row with the column names, then one CSV row per record.
void writeRowsAsCsv(const std::vector<OutputRow>& rows, std::ostream& out);

// Creates parent directories as needed. Throws std::runtime_error on failure.
void writeRowsAsCsv(const std::vector<OutputRow>& rows, const std::string& path);

// Previous weekday: Monday -> Friday, Sunday -> Friday, otherwise yesterday.
std::tm lastBusinessDay(std::time_t now);

// "BASE 1 PENDIENTES DE CONCILIAR LINEALIZADO (DD-MM-YYYY).csv", optionally under outDir.
std::string defaultOutputFilename(std::time_t now, const std::string& outDir = "");
