#include "extraction/coordinates.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace foldermind {

namespace {

std::string toUpper(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return value;
}

void requireRange(int start, int end, int minimum, const char *startName,
                  const char *endName)
{
    if (start < minimum) {
        throw std::invalid_argument(std::string(startName) + " must be >= "
                                    + std::to_string(minimum));
    }
    if (end < start) {
        throw std::invalid_argument(std::string(endName) + " must be >= "
                                    + startName);
    }
}

} // namespace

bool ExtractionCoordinates::operator==(const ExtractionCoordinates &other) const
{
    return format == other.format
        && version == other.version
        && startLine == other.startLine
        && endLine == other.endLine
        && section == other.section
        && page == other.page
        && startBlock == other.startBlock
        && endBlock == other.endBlock
        && startParagraph == other.startParagraph
        && endParagraph == other.endParagraph
        && sheet == other.sheet
        && startRow == other.startRow
        && endRow == other.endRow
        && startColumn == other.startColumn
        && endColumn == other.endColumn
        && slide == other.slide
        && includeNotes == other.includeNotes;
}

ExtractionCoordinates textCoordinates(int startLine, int endLine)
{
    requireRange(startLine, endLine, 1, "startLine", "endLine");
    ExtractionCoordinates coordinates;
    coordinates.format = DocumentFormat::Text;
    coordinates.startLine = startLine;
    coordinates.endLine = endLine;
    return coordinates;
}

ExtractionCoordinates markdownCoordinates(int startLine, int endLine,
                                          const std::string &section)
{
    requireRange(startLine, endLine, 1, "startLine", "endLine");
    ExtractionCoordinates coordinates;
    coordinates.format = DocumentFormat::Markdown;
    coordinates.startLine = startLine;
    coordinates.endLine = endLine;
    coordinates.section = section;
    return coordinates;
}

ExtractionCoordinates pdfCoordinates(int page, int startBlock, int endBlock)
{
    if (page < 0) {
        throw std::invalid_argument("page must be >= 0");
    }
    requireRange(startBlock, endBlock, 0, "startBlock", "endBlock");
    ExtractionCoordinates coordinates;
    coordinates.format = DocumentFormat::Pdf;
    coordinates.page = page;
    coordinates.startBlock = startBlock;
    coordinates.endBlock = endBlock;
    return coordinates;
}

ExtractionCoordinates wordCoordinates(int startParagraph, int endParagraph)
{
    requireRange(startParagraph, endParagraph, 0, "startParagraph", "endParagraph");
    ExtractionCoordinates coordinates;
    coordinates.format = DocumentFormat::Word;
    coordinates.startParagraph = startParagraph;
    coordinates.endParagraph = endParagraph;
    return coordinates;
}

ExtractionCoordinates spreadsheetCoordinates(const std::string &sheet,
                                             int startRow, int endRow,
                                             const std::string &startColumn,
                                             const std::string &endColumn)
{
    if (sheet.find_first_not_of(" \t") == std::string::npos) {
        throw std::invalid_argument("sheet name cannot be empty");
    }
    requireRange(startRow, endRow, 1, "startRow", "endRow");
    const int startCol = columnLetterToNumber(startColumn);
    const int endCol = columnLetterToNumber(endColumn);
    if (startCol == 0) {
        throw std::invalid_argument("startColumn must be a column letter (A-ZZZ)");
    }
    if (endCol == 0) {
        throw std::invalid_argument("endColumn must be a column letter (A-ZZZ)");
    }
    if (endCol < startCol) {
        throw std::invalid_argument("endColumn must be >= startColumn");
    }

    ExtractionCoordinates coordinates;
    coordinates.format = DocumentFormat::Spreadsheet;
    coordinates.sheet = sheet;
    coordinates.startRow = startRow;
    coordinates.endRow = endRow;
    coordinates.startColumn = toUpper(startColumn);
    coordinates.endColumn = toUpper(endColumn);
    return coordinates;
}

ExtractionCoordinates presentationCoordinates(int slide, bool includeNotes)
{
    if (slide < 1) {
        throw std::invalid_argument("slide must be >= 1");
    }
    ExtractionCoordinates coordinates;
    coordinates.format = DocumentFormat::Presentation;
    coordinates.slide = slide;
    coordinates.includeNotes = includeNotes;
    return coordinates;
}

int columnLetterToNumber(const std::string &column)
{
    if (column.empty() || column.size() > 3) {
        return 0;
    }
    int result = 0;
    for (char ch : column) {
        const auto upper = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
        if (upper < 'A' || upper > 'Z') {
            return 0;
        }
        result = result * 26 + (upper - 'A' + 1);
    }
    return result;
}

std::string toFormatString(DocumentFormat format)
{
    switch (format) {
    case DocumentFormat::Text:
        return "text";
    case DocumentFormat::Markdown:
        return "markdown";
    case DocumentFormat::Pdf:
        return "pdf";
    case DocumentFormat::Word:
        return "word";
    case DocumentFormat::Spreadsheet:
        return "spreadsheet";
    case DocumentFormat::Presentation:
        return "presentation";
    case DocumentFormat::Unknown:
        return "unknown";
    }
    return "unknown";
}

DocumentFormat parseFormatString(const std::string &value)
{
    if (value == "text") {
        return DocumentFormat::Text;
    }
    if (value == "markdown") {
        return DocumentFormat::Markdown;
    }
    if (value == "pdf") {
        return DocumentFormat::Pdf;
    }
    if (value == "word") {
        return DocumentFormat::Word;
    }
    if (value == "spreadsheet") {
        return DocumentFormat::Spreadsheet;
    }
    if (value == "presentation") {
        return DocumentFormat::Presentation;
    }
    return DocumentFormat::Unknown;
}

void to_json(nlohmann::json &j, const ExtractionCoordinates &coordinates)
{
    j = nlohmann::json{
        {"type", toFormatString(coordinates.format)},
        {"version", coordinates.version}
    };

    switch (coordinates.format) {
    case DocumentFormat::Text:
        j["startLine"] = coordinates.startLine;
        j["endLine"] = coordinates.endLine;
        break;
    case DocumentFormat::Markdown:
        j["startLine"] = coordinates.startLine;
        j["endLine"] = coordinates.endLine;
        if (!coordinates.section.empty()) {
            j["section"] = coordinates.section;
        }
        break;
    case DocumentFormat::Pdf:
        j["page"] = coordinates.page;
        j["startBlock"] = coordinates.startBlock;
        j["endBlock"] = coordinates.endBlock;
        break;
    case DocumentFormat::Word:
        j["startParagraph"] = coordinates.startParagraph;
        j["endParagraph"] = coordinates.endParagraph;
        break;
    case DocumentFormat::Spreadsheet:
        j["sheet"] = coordinates.sheet;
        j["startRow"] = coordinates.startRow;
        j["endRow"] = coordinates.endRow;
        j["startColumn"] = coordinates.startColumn;
        j["endColumn"] = coordinates.endColumn;
        break;
    case DocumentFormat::Presentation:
        j["slide"] = coordinates.slide;
        j["includeNotes"] = coordinates.includeNotes;
        break;
    case DocumentFormat::Unknown:
        break;
    }
}

void from_json(const nlohmann::json &j, ExtractionCoordinates &coordinates)
{
    coordinates = ExtractionCoordinates{};
    coordinates.format = parseFormatString(j.value("type", "unknown"));
    coordinates.version = j.value("version", kCoordinatesVersion);
    coordinates.startLine = j.value("startLine", 0);
    coordinates.endLine = j.value("endLine", 0);
    coordinates.section = j.value("section", "");
    coordinates.page = j.value("page", 0);
    coordinates.startBlock = j.value("startBlock", 0);
    coordinates.endBlock = j.value("endBlock", 0);
    coordinates.startParagraph = j.value("startParagraph", 0);
    coordinates.endParagraph = j.value("endParagraph", 0);
    coordinates.sheet = j.value("sheet", "");
    coordinates.startRow = j.value("startRow", 0);
    coordinates.endRow = j.value("endRow", 0);
    coordinates.startColumn = j.value("startColumn", "");
    coordinates.endColumn = j.value("endColumn", "");
    coordinates.slide = j.value("slide", 0);
    coordinates.includeNotes = j.value("includeNotes", false);
}

} // namespace foldermind
