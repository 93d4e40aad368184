#pragma once
#include "Batch.h"
#include "SandyExceptions.h"

#include <cstddef>
#include <istream>
#include <string>
#include <vector>

/**
 * Delimited text table loaded column-wise. A column is numeric when every non-empty cell parses
 * as a number (nan/inf literals included); empty cells become NaN.
 */
class Dataset {
public:
    explicit Dataset(std::string filename);

    /**
     * @brief Builds a dataset from in-memory text (pasted tables, HTTP bodies).
     */
    static Dataset fromString(const std::string& content, char delimiter = ',', bool skipMalformed = true);

    void setDelimiter(char delimiter);

    /**
     * @brief Loads the file named at construction.
     * @param skipMalformed If true, discard rows with unbalanced quotes or a wrong field count.
     * @throws Sandy::IOException if the file cannot be opened.
     * @throws Sandy::DatasetException if the header is empty or a malformed row is not skipped.
     */
    void load(bool skipMalformed = true);
    void load(std::istream& is, bool skipMalformed = true);

    void printSummary() const;

    const std::vector<std::string>& getColumnNames() const { return columnNames; }
    const std::vector<std::string>& getTextColumnNames() const { return textColumnNames; }
    size_t getRowCount() const { return rowCount; }
    size_t getColCount() const { return columnNames.size(); }
    size_t getSkippedRowCount() const { return skippedRows; }

    bool hasColumn(const std::string& name) const;
    bool isNumericColumn(const std::string& name) const;

    /**
     * @brief Numeric columns keyed by exact header name.
     * @throws Sandy::DatasetException if any of `mustBeNumeric` exists but holds text.
     */
    ColumnMap columnMap(const std::vector<std::string>& mustBeNumeric = {}) const;

private:
    std::string filename_;
    char delimiter_ = ',';
    size_t rowCount = 0;
    size_t skippedRows = 0;
    std::vector<std::vector<double>> columns;
    std::vector<std::string> columnNames;
    std::vector<std::string> textColumnNames;

    std::vector<std::string> readHeader(std::istream& is);
    void ingestRows(std::istream& is, const std::vector<std::string>& header, bool skipMalformed);
};
