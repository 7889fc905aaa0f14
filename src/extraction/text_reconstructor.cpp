#include "extraction/text_reconstructor.hpp"

#include <set>

#include <QCryptographicHash>
#include <QFile>
#include <QFileInfo>
#include <QString>

#include "common/errors.hpp"
#include "extraction/text_extractor.hpp"

namespace foldermind {

namespace {

const std::set<QString> &plainTextSuffixes()
{
    static const std::set<QString> suffixes = {
        QStringLiteral("txt"), QStringLiteral("text"), QStringLiteral("log"),
        QStringLiteral("csv"), QStringLiteral("tsv"), QStringLiteral("rst"),
        QStringLiteral("c"), QStringLiteral("cc"), QStringLiteral("cpp"),
        QStringLiteral("cxx"), QStringLiteral("h"), QStringLiteral("hh"),
        QStringLiteral("hpp"), QStringLiteral("py"), QStringLiteral("js"),
        QStringLiteral("ts"), QStringLiteral("java"), QStringLiteral("go"),
        QStringLiteral("rs"), QStringLiteral("rb"), QStringLiteral("sh"),
        QStringLiteral("json"), QStringLiteral("yaml"), QStringLiteral("yml"),
        QStringLiteral("toml"), QStringLiteral("ini"), QStringLiteral("xml"),
        QStringLiteral("html"), QStringLiteral("css"), QStringLiteral("sql"),
    };
    return suffixes;
}

} // namespace

TextReconstructor::TextReconstructor()
{
    m_extractors[DocumentFormat::Text] = std::make_shared<TextExtractor>(DocumentFormat::Text);
    m_extractors[DocumentFormat::Markdown] =
        std::make_shared<TextExtractor>(DocumentFormat::Markdown);
}

void TextReconstructor::registerExtractor(std::shared_ptr<FormatExtractor> extractor)
{
    if (!extractor) {
        return;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    m_extractors[extractor->format()] = std::move(extractor);
}

bool TextReconstructor::supports(DocumentFormat format) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_extractors.find(format) != m_extractors.end();
}

std::shared_ptr<FormatExtractor> TextReconstructor::extractorFor(DocumentFormat format) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto it = m_extractors.find(format);
    if (it == m_extractors.end()) {
        return nullptr;
    }
    return it->second;
}

std::vector<ExtractionCoordinates> TextReconstructor::plan(const DocumentHandle &document,
                                                           const ChunkingOptions &options) const
{
    const auto extractor = extractorFor(document.format);
    if (!extractor) {
        throw FolderError(FolderCause::MalformedContent,
                          "no extractor for " + toFormatString(document.format)
                              + " documents: " + document.path);
    }
    return extractor->plan(document, options);
}

std::string TextReconstructor::extract(const ExtractionCoordinates &coordinates,
                                       const DocumentHandle &document) const
{
    const auto extractor = extractorFor(document.format);
    if (!extractor) {
        throw CoordinateMismatchError(document.path,
                                      "no extractor for " + toFormatString(document.format)
                                          + " documents");
    }
    verifyContent(document);
    return extractor->extract(coordinates, document);
}

void TextReconstructor::verifyContent(const DocumentHandle &document)
{
    if (document.contentHash.empty()) {
        return;
    }
    const std::string current = contentHash(document.path);
    if (current.empty()) {
        throw CoordinateMismatchError(document.path,
                                      "document is no longer readable: " + document.path);
    }
    if (current != document.contentHash) {
        throw CoordinateMismatchError(document.path,
                                      "document changed since it was indexed: " + document.path);
    }
}

std::string TextReconstructor::contentHash(const std::string &path)
{
    QFile file(QString::fromStdString(path));
    if (!file.open(QIODevice::ReadOnly)) {
        return {};
    }
    QCryptographicHash hash(QCryptographicHash::Sha256);
    if (!hash.addData(&file)) {
        return {};
    }
    return hash.result().toHex().toStdString();
}

DocumentFormat TextReconstructor::formatForPath(const std::string &path)
{
    const QString suffix = QFileInfo(QString::fromStdString(path)).suffix().toLower();
    if (suffix == QLatin1String("md") || suffix == QLatin1String("markdown")) {
        return DocumentFormat::Markdown;
    }
    if (suffix == QLatin1String("pdf")) {
        return DocumentFormat::Pdf;
    }
    if (suffix == QLatin1String("docx") || suffix == QLatin1String("doc")) {
        return DocumentFormat::Word;
    }
    if (suffix == QLatin1String("xlsx") || suffix == QLatin1String("xls")
        || suffix == QLatin1String("ods")) {
        return DocumentFormat::Spreadsheet;
    }
    if (suffix == QLatin1String("pptx") || suffix == QLatin1String("ppt")) {
        return DocumentFormat::Presentation;
    }
    if (plainTextSuffixes().count(suffix) > 0) {
        return DocumentFormat::Text;
    }
    return DocumentFormat::Unknown;
}

} // namespace foldermind
