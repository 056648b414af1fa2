#ifndef TABLEOCR_TABLE_WRITER_HPP
#define TABLEOCR_TABLE_WRITER_HPP

#include "tableocr/Table.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace tableocr {

/// Widest column a spreadsheet export will use, in characters
constexpr std::size_t kMaxColumnWidth = 50;

/**
 * @brief Display width of each column in characters
 *
 * Longest rendered value in the column (header label included) plus 2,
 * capped at kMaxColumnWidth.
 */
std::vector<std::size_t> columnWidths(const Table &table);

/**
 * @brief Write the table as CSV, header first
 * @throws std::runtime_error if the file cannot be written
 */
void writeCsv(const Table &table, const std::string &path);

/**
 * @brief Write a single-sheet SpreadsheetML 2003 workbook
 *
 * Numeric cells are typed as numbers, missing cells are left empty and each
 * column width comes from columnWidths().
 * @throws std::runtime_error if the file cannot be written
 */
void writeSpreadsheetXml(const Table &table, const std::string &path,
                         const std::string &sheetName = "Laporan");

/**
 * @brief Write to CSV or SpreadsheetML depending on the file extension
 *
 * ".xml" selects SpreadsheetML, anything else CSV.
 */
void writeTable(const Table &table, const std::string &path);

/**
 * @brief Fixed-width rendering of the header and the first rows
 * @return "No data" when the table has no data rows
 */
std::string formatPreview(const Table &table, std::size_t maxRows = 5);

} // namespace tableocr

#endif // TABLEOCR_TABLE_WRITER_HPP
