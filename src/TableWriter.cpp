#include "tableocr/TableWriter.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace tableocr {

namespace {

// Characters rather than bytes, so UTF-8 text is measured correctly
std::size_t displayLength(const std::string &text) {
  std::size_t length = 0;
  for (unsigned char c : text) {
    if ((c & 0xC0) != 0x80) {
      length++;
    }
  }
  return length;
}

std::string csvField(const std::string &cell) {
  bool needQuotes = cell.find(',') != std::string::npos ||
                    cell.find('"') != std::string::npos ||
                    cell.find('\n') != std::string::npos;
  if (!needQuotes) {
    return cell;
  }
  std::string escaped = "\"";
  for (char ch : cell) {
    if (ch == '"') {
      escaped += '"';
    }
    escaped += ch;
  }
  escaped += '"';
  return escaped;
}

std::string xmlEscape(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  for (char ch : text) {
    switch (ch) {
    case '&':
      out += "&amp;";
      break;
    case '<':
      out += "&lt;";
      break;
    case '>':
      out += "&gt;";
      break;
    case '"':
      out += "&quot;";
      break;
    case '\n':
      out += "&#10;";
      break;
    default:
      out += ch;
    }
  }
  return out;
}

std::ofstream openForWriting(const std::string &path) {
  std::ofstream ofs(path);
  if (!ofs) {
    throw std::runtime_error("Failed to open output file: " + path);
  }
  return ofs;
}

void finishWriting(std::ofstream &ofs, const std::string &path) {
  ofs.flush();
  if (!ofs) {
    throw std::runtime_error("Failed to write output file: " + path);
  }
}

} // namespace

std::vector<std::size_t> columnWidths(const Table &table) {
  std::vector<std::size_t> widths;
  widths.reserve(table.width());
  for (std::size_t c = 0; c < table.width(); c++) {
    std::size_t longest = displayLength(table.columnLabel(c));
    for (const auto &row : table.rows) {
      longest = std::max(longest, displayLength(row[c].toString()));
    }
    widths.push_back(std::min(longest + 2, kMaxColumnWidth));
  }
  return widths;
}

void writeCsv(const Table &table, const std::string &path) {
  std::ofstream ofs = openForWriting(path);

  for (std::size_t c = 0; c < table.width(); c++) {
    ofs << csvField(table.columnLabel(c));
    if (c + 1 < table.width()) {
      ofs << ',';
    }
  }
  ofs << "\n";

  for (const auto &row : table.rows) {
    for (std::size_t c = 0; c < row.size(); c++) {
      ofs << csvField(row[c].toString());
      if (c + 1 < row.size()) {
        ofs << ',';
      }
    }
    ofs << "\n";
  }

  finishWriting(ofs, path);
}

void writeSpreadsheetXml(const Table &table, const std::string &path,
                         const std::string &sheetName) {
  std::ofstream ofs = openForWriting(path);

  ofs << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
      << "<?mso-application progid=\"Excel.Sheet\"?>\n"
      << "<Workbook xmlns=\"urn:schemas-microsoft-com:office:spreadsheet\"\n"
      << "          xmlns:ss=\"urn:schemas-microsoft-com:office:spreadsheet\">"
      << "\n"
      << " <Worksheet ss:Name=\"" << xmlEscape(sheetName) << "\">\n"
      << "  <Table>\n";

  // Excel column width: 7 px per character plus 5 px padding, 0.75 pt per px
  for (std::size_t width : columnWidths(table)) {
    double points = (static_cast<double>(width) * 7.0 + 5.0) * 0.75;
    ofs << "   <Column ss:Width=\"" << points << "\"/>\n";
  }

  ofs << "   <Row>\n";
  for (std::size_t c = 0; c < table.width(); c++) {
    ofs << "    <Cell><Data ss:Type=\"String\">"
        << xmlEscape(table.columnLabel(c)) << "</Data></Cell>\n";
  }
  ofs << "   </Row>\n";

  for (const auto &row : table.rows) {
    ofs << "   <Row>\n";
    for (std::size_t c = 0; c < row.size(); c++) {
      const Cell &cell = row[c];
      if (cell.isMissing()) {
        ofs << "    <Cell ss:Index=\"" << (c + 1) << "\"/>\n";
      } else if (cell.isNumber()) {
        ofs << "    <Cell><Data ss:Type=\"Number\">" << cell.toString()
            << "</Data></Cell>\n";
      } else {
        ofs << "    <Cell><Data ss:Type=\"String\">"
            << xmlEscape(cell.textValue()) << "</Data></Cell>\n";
      }
    }
    ofs << "   </Row>\n";
  }

  ofs << "  </Table>\n"
      << " </Worksheet>\n"
      << "</Workbook>\n";

  finishWriting(ofs, path);
}

void writeTable(const Table &table, const std::string &path) {
  std::string lower = path;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) {
                   return static_cast<char>(std::tolower(c));
                 });
  if (lower.size() >= 4 && lower.compare(lower.size() - 4, 4, ".xml") == 0) {
    writeSpreadsheetXml(table, path);
  } else {
    writeCsv(table, path);
  }
}

std::string formatPreview(const Table &table, std::size_t maxRows) {
  if (table.empty()) {
    return "No data";
  }

  std::size_t shown = std::min(maxRows, table.rowCount());
  std::vector<std::size_t> widths;
  for (std::size_t c = 0; c < table.width(); c++) {
    std::size_t width = displayLength(table.columnLabel(c));
    for (std::size_t r = 0; r < shown; r++) {
      width = std::max(width, displayLength(table.rows[r][c].toString()));
    }
    widths.push_back(width);
  }

  std::ostringstream out;
  auto writeLine = [&](const std::vector<std::string> &values) {
    for (std::size_t c = 0; c < values.size(); c++) {
      out << values[c];
      if (c + 1 < values.size()) {
        std::size_t pad = widths[c] - displayLength(values[c]) + 2;
        out << std::string(pad, ' ');
      }
    }
    out << "\n";
  };

  std::vector<std::string> labels;
  for (std::size_t c = 0; c < table.width(); c++) {
    labels.push_back(table.columnLabel(c));
  }
  writeLine(labels);

  for (std::size_t r = 0; r < shown; r++) {
    std::vector<std::string> values;
    for (const auto &cell : table.rows[r]) {
      values.push_back(cell.isMissing() ? "" : cell.toString());
    }
    writeLine(values);
  }

  return out.str();
}

} // namespace tableocr
