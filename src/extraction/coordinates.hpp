#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "common/enums.hpp"

namespace foldermind {

constexpr int kCoordinatesVersion = 1;

// Format-specific locator sufficient to re-extract one chunk's exact text.
// Only the fields relevant to `format` are meaningful.
struct ExtractionCoordinates {
    DocumentFormat format = DocumentFormat::Unknown;
    int version = kCoordinatesVersion;

    // Text and markdown: 1-based inclusive line range.
    int startLine = 0;
    int endLine = 0;
    std::string section;

    // PDF: 0-based page and text block range.
    int page = 0;
    int startBlock = 0;
    int endBlock = 0;

    // Word: 0-based paragraph range.
    int startParagraph = 0;
    int endParagraph = 0;

    // Spreadsheet: sheet name, 1-based rows, column letters.
    std::string sheet;
    int startRow = 0;
    int endRow = 0;
    std::string startColumn;
    std::string endColumn;

    // Presentation: 1-based slide.
    int slide = 0;
    bool includeNotes = false;

    bool operator==(const ExtractionCoordinates &other) const;
    bool operator!=(const ExtractionCoordinates &other) const { return !(*this == other); }
};

// Validating constructors. Each throws std::invalid_argument on a bad range.
ExtractionCoordinates textCoordinates(int startLine, int endLine);
ExtractionCoordinates markdownCoordinates(int startLine, int endLine,
                                          const std::string &section = {});
ExtractionCoordinates pdfCoordinates(int page, int startBlock, int endBlock);
ExtractionCoordinates wordCoordinates(int startParagraph, int endParagraph);
ExtractionCoordinates spreadsheetCoordinates(const std::string &sheet,
                                             int startRow, int endRow,
                                             const std::string &startColumn,
                                             const std::string &endColumn);
ExtractionCoordinates presentationCoordinates(int slide, bool includeNotes = false);

// A=1, Z=26, AA=27. Returns 0 for anything that is not 1-3 letters.
int columnLetterToNumber(const std::string &column);

std::string toFormatString(DocumentFormat format);
DocumentFormat parseFormatString(const std::string &value);

void to_json(nlohmann::json &j, const ExtractionCoordinates &coordinates);
void from_json(const nlohmann::json &j, ExtractionCoordinates &coordinates);

} // namespace foldermind
