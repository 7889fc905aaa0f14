#include "extraction/text_extractor.hpp"

#include <algorithm>

#include <QByteArray>
#include <QFile>
#include <QStringDecoder>

#include "common/errors.hpp"

namespace foldermind {

namespace {

QByteArray readWholeFile(const std::string &path, bool *ok)
{
    QFile file(QString::fromStdString(path));
    if (!file.open(QIODevice::ReadOnly)) {
        *ok = false;
        return QByteArray();
    }
    *ok = true;
    return file.readAll();
}

bool isBlank(const std::string &line)
{
    return std::all_of(line.begin(), line.end(), [](unsigned char c) {
        return c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v';
    });
}

// "## Install" -> "Install". Empty when the line is not an ATX heading.
std::string headingText(const std::string &line)
{
    std::size_t level = 0;
    while (level < line.size() && line[level] == '#') {
        ++level;
    }
    if (level == 0 || level > 6 || level >= line.size() || line[level] != ' ') {
        return {};
    }
    std::string text = line.substr(level + 1);
    while (!text.empty() && (text.back() == ' ' || text.back() == '\r' || text.back() == '#')) {
        text.pop_back();
    }
    return text;
}

} // namespace

TextExtractor::TextExtractor(DocumentFormat format)
    : m_format(format)
{
}

DocumentFormat TextExtractor::format() const
{
    return m_format;
}

std::vector<std::string> TextExtractor::splitLines(const std::string &content)
{
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (start < content.size()) {
        const std::size_t end = content.find('\n', start);
        if (end == std::string::npos) {
            lines.push_back(content.substr(start));
            break;
        }
        lines.push_back(content.substr(start, end - start));
        start = end + 1;
    }
    return lines;
}

int TextExtractor::estimateTokens(const std::string &text)
{
    return static_cast<int>((text.size() + 3) / 4);
}

std::vector<ExtractionCoordinates> TextExtractor::plan(const DocumentHandle &document,
                                                       const ChunkingOptions &options) const
{
    bool ok = false;
    const QByteArray bytes = readWholeFile(document.path, &ok);
    if (!ok) {
        throw FolderError(FolderCause::PathMissing, "cannot open " + document.path);
    }
    if (bytes.contains('\0')) {
        throw FolderError(FolderCause::MalformedContent,
                          "binary content in text document " + document.path);
    }
    QStringDecoder decoder(QStringDecoder::Utf8);
    const QString decoded = decoder.decode(bytes);
    Q_UNUSED(decoded);
    if (decoder.hasError()) {
        throw FolderError(FolderCause::MalformedContent,
                          "document is not valid UTF-8: " + document.path);
    }

    const std::vector<std::string> lines = splitLines(bytes.toStdString());
    const bool markdown = m_format == DocumentFormat::Markdown;
    const int target = std::max(1, options.targetTokens);
    const int maximum = std::max(target, options.maxTokens);

    std::vector<ExtractionCoordinates> planned;
    std::string currentSection;
    std::string chunkSection;
    int chunkStart = 1;
    int chunkTokens = 0;
    bool chunkHasContent = false;

    auto closeChunk = [&](int endLine) {
        if (chunkHasContent && endLine >= chunkStart) {
            if (markdown) {
                planned.push_back(markdownCoordinates(chunkStart, endLine, chunkSection));
            } else {
                planned.push_back(textCoordinates(chunkStart, endLine));
            }
        }
        chunkStart = endLine + 1;
        chunkTokens = 0;
        chunkHasContent = false;
        chunkSection = currentSection;
    };

    const int lineCount = static_cast<int>(lines.size());
    for (int lineNo = 1; lineNo <= lineCount; ++lineNo) {
        const std::string &line = lines[static_cast<std::size_t>(lineNo - 1)];

        if (markdown) {
            const std::string heading = headingText(line);
            if (!heading.empty()) {
                if (chunkHasContent && chunkTokens >= std::max(1, target / 4)) {
                    closeChunk(lineNo - 1);
                }
                currentSection = heading;
                if (!chunkHasContent) {
                    chunkSection = heading;
                }
            }
        }

        const bool blank = isBlank(line);
        chunkTokens += estimateTokens(line);
        chunkHasContent = chunkHasContent || !blank;

        if (chunkTokens >= maximum || (chunkTokens >= target && blank)) {
            closeChunk(lineNo);
        }
    }
    closeChunk(lineCount);

    return planned;
}

std::string TextExtractor::extract(const ExtractionCoordinates &coordinates,
                                   const DocumentHandle &document) const
{
    if (coordinates.format != m_format) {
        throw CoordinateMismatchError(document.path,
                                      "coordinates of type " + toFormatString(coordinates.format)
                                          + " cannot address a "
                                          + toFormatString(m_format) + " document");
    }

    bool ok = false;
    const QByteArray bytes = readWholeFile(document.path, &ok);
    if (!ok) {
        throw CoordinateMismatchError(document.path, "document is missing: " + document.path);
    }

    const std::vector<std::string> lines = splitLines(bytes.toStdString());
    const int lineCount = static_cast<int>(lines.size());
    if (coordinates.startLine < 1 || coordinates.endLine < coordinates.startLine
        || coordinates.endLine > lineCount) {
        throw CoordinateMismatchError(
            document.path,
            "lines " + std::to_string(coordinates.startLine) + "-"
                + std::to_string(coordinates.endLine) + " out of range; document has "
                + std::to_string(lineCount) + " lines");
    }

    std::string text;
    for (int lineNo = coordinates.startLine; lineNo <= coordinates.endLine; ++lineNo) {
        if (lineNo > coordinates.startLine) {
            text.push_back('\n');
        }
        text += lines[static_cast<std::size_t>(lineNo - 1)];
    }
    return text;
}

} // namespace foldermind
