#include "Dataset.h"
#include "CSVUtils.h"
#include "CommonUtils.h"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <string_view>
#include <utility>

namespace {
bool parseDouble(std::string_view input, double& out) {
    // from_chars does not accept a leading '+'.
    if (!input.empty() && input.front() == '+') input.remove_prefix(1);
    double parsed = 0.0;
    const char* begin = input.data();
    const char* end = begin + input.size();
    auto [ptr, ec] = std::from_chars(begin, end, parsed, std::chars_format::general);
    if (ec != std::errc{} || ptr != end) {
        return false;
    }
    out = parsed;
    return true;
}

bool isBlankRow(const std::vector<std::string>& row) {
    return std::all_of(row.begin(), row.end(), [](const std::string& v) { return v.empty(); });
}
}

Dataset::Dataset(std::string filename) : filename_(std::move(filename)) {}

Dataset Dataset::fromString(const std::string& content, char delimiter, bool skipMalformed) {
    Dataset dataset("<memory>");
    dataset.setDelimiter(delimiter);
    std::istringstream in(content);
    dataset.load(in, skipMalformed);
    return dataset;
}

void Dataset::setDelimiter(char delimiter) {
    if (delimiter == '"' || delimiter == '\n' || delimiter == '\r' || delimiter == '\0') {
        throw Sandy::DatasetException("Invalid delimiter character");
    }
    delimiter_ = delimiter;
}

std::vector<std::string> Dataset::readHeader(std::istream& is) {
    bool malformed = false;
    std::vector<std::string> header;
    while (header.empty() && is.peek() != EOF) {
        header = CSVUtils::parseCSVLine(is, delimiter_, &malformed);
    }
    if (header.empty() || malformed || isBlankRow(header)) {
        throw Sandy::DatasetException("Empty or malformed header in " + filename_);
    }
    return CSVUtils::normalizeHeader(header);
}

void Dataset::ingestRows(std::istream& is, const std::vector<std::string>& header, bool skipMalformed) {
    const size_t expectedCols = header.size();
    std::vector<std::vector<std::string>> cells(expectedCols);
    rowCount = 0;
    skippedRows = 0;

    size_t recordNumber = 1; // header
    while (is.peek() != EOF) {
        bool malformed = false;
        bool limitExceeded = false;
        auto row = CSVUtils::parseCSVLine(is, delimiter_, &malformed, &limitExceeded);
        ++recordNumber;
        if (row.empty() || (!malformed && isBlankRow(row))) continue;

        if (limitExceeded) {
            throw Sandy::DatasetException("Field or column limit exceeded at record " + std::to_string(recordNumber));
        }
        if (malformed) {
            ++skippedRows;
            if (!skipMalformed) {
                throw Sandy::DatasetException("Malformed quoted field at record " + std::to_string(recordNumber));
            }
            continue;
        }

        if (row.size() > expectedCols) {
            size_t tail = row.size();
            while (tail > expectedCols && row[tail - 1].empty()) --tail;
            if (tail == expectedCols) row.resize(expectedCols);
        }
        if (row.size() != expectedCols) {
            ++skippedRows;
            if (!skipMalformed) {
                throw Sandy::DatasetException("Column mismatch at record " + std::to_string(recordNumber) +
                                              ": expected " + std::to_string(expectedCols) +
                                              " fields, found " + std::to_string(row.size()));
            }
            continue;
        }

        for (size_t c = 0; c < expectedCols; ++c) cells[c].push_back(std::move(row[c]));
        ++rowCount;
    }

    columns.clear();
    columnNames.clear();
    textColumnNames.clear();
    for (size_t c = 0; c < expectedCols; ++c) {
        std::vector<double> values;
        values.reserve(rowCount);
        bool numeric = true;
        for (const auto& cell : cells[c]) {
            if (cell.empty()) {
                values.push_back(std::numeric_limits<double>::quiet_NaN());
                continue;
            }
            double parsed = 0.0;
            if (!parseDouble(cell, parsed)) {
                numeric = false;
                break;
            }
            values.push_back(parsed);
        }
        if (numeric) {
            columnNames.push_back(header[c]);
            columns.push_back(std::move(values));
        } else {
            textColumnNames.push_back(header[c]);
        }
    }
}

void Dataset::load(std::istream& is, bool skipMalformed) {
    CSVUtils::skipBOM(is);
    const auto header = readHeader(is);
    ingestRows(is, header, skipMalformed);

    if (skippedRows > 0) {
        std::cout << "[Sandy Warning] Skipped " << skippedRows << " malformed row(s) in " << filename_ << "\n";
    }
}

void Dataset::load(bool skipMalformed) {
    std::ifstream file(filename_, std::ios::binary);
    if (!file.is_open()) throw Sandy::IOException("Could not open file " + filename_);
    load(file, skipMalformed);
}

bool Dataset::hasColumn(const std::string& name) const {
    return isNumericColumn(name) ||
           std::find(textColumnNames.begin(), textColumnNames.end(), name) != textColumnNames.end();
}

bool Dataset::isNumericColumn(const std::string& name) const {
    return std::find(columnNames.begin(), columnNames.end(), name) != columnNames.end();
}

ColumnMap Dataset::columnMap(const std::vector<std::string>& mustBeNumeric) const {
    std::vector<std::string> textual;
    for (const auto& name : mustBeNumeric) {
        if (hasColumn(name) && !isNumericColumn(name)) textual.push_back(name);
    }
    if (!textual.empty()) {
        throw Sandy::DatasetException("Non-numeric values in column(s): " + CommonUtils::joinNames(textual));
    }

    ColumnMap out;
    for (size_t i = 0; i < columnNames.size(); ++i) {
        out.emplace(columnNames[i], columns[i]);
    }
    return out;
}

void Dataset::printSummary() const {
    std::cout << "Dataset Loaded: " << filename_ << "\n";
    std::cout << "Rows: " << getRowCount() << ", Numeric Columns: " << getColCount();
    if (!textColumnNames.empty()) std::cout << ", Text Columns: " << textColumnNames.size();
    std::cout << "\n";
}
