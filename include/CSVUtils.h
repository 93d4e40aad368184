#pragma once

#include <istream>
#include <string>
#include <vector>

namespace CSVUtils {
// Low-level CSV tokenization and header normalization utilities.
// This module does not infer semantic types.
struct ParseLimits {
    size_t maxFieldBytes = 1024 * 1024;
    size_t maxColumns = 4096;
};

std::string trimUnquotedField(const std::string& value);
void skipBOM(std::istream& is);

/**
 * @brief Reads one RFC-4180 record; quoted fields may span lines.
 * @post Returns an empty vector for a blank line or at end of input.
 */
std::vector<std::string> parseCSVLine(std::istream& is,
                                      char delimiter,
                                      bool* malformed = nullptr,
                                      bool* limitExceeded = nullptr,
                                      const ParseLimits& limits = ParseLimits{});

std::vector<std::string> normalizeHeader(const std::vector<std::string>& header);
}
