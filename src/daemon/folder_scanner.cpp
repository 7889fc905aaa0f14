#include "daemon/folder_scanner.hpp"

#include <algorithm>

#include <QDir>
#include <QDirIterator>
#include <QFile>
#include <QFileInfo>
#include <QMimeDatabase>
#include <QRegularExpression>

#include "common/errors.hpp"
#include "common/logging.hpp"
#include "extraction/text_reconstructor.hpp"

namespace foldermind {

namespace {

bool matchesPattern(const QString &candidate, const QString &pattern)
{
    const QRegularExpression expression(
        QRegularExpression::wildcardToRegularExpression(pattern));
    return expression.match(candidate).hasMatch();
}

} // namespace

FolderScanner::FolderScanner(FormatFilter accepts)
    : m_accepts(std::move(accepts))
{
}

bool FolderScanner::isExcluded(const std::string &relativePath,
                               const std::vector<std::string> &exclusionPatterns)
{
    if (exclusionPatterns.empty()) {
        return false;
    }

    const QString path = QString::fromStdString(relativePath);
    const QStringList segments = path.split(QLatin1Char('/'), Qt::SkipEmptyParts);

    for (const std::string &rawPattern : exclusionPatterns) {
        QString pattern = QString::fromStdString(rawPattern).trimmed();
        while (pattern.endsWith(QLatin1Char('/'))) {
            pattern.chop(1);
        }
        if (pattern.isEmpty()) {
            continue;
        }
        if (matchesPattern(path, pattern)) {
            return true;
        }

        QString prefix;
        for (const QString &segment : segments) {
            prefix = prefix.isEmpty() ? segment : prefix + QLatin1Char('/') + segment;
            if (matchesPattern(segment, pattern) || matchesPattern(prefix, pattern)) {
                return true;
            }
        }
    }
    return false;
}

std::vector<Document> FolderScanner::scan(FolderId folderId,
                                          const std::string &rootPath,
                                          const std::vector<std::string> &exclusionPatterns,
                                          const CancelToken &cancel) const
{
    const QString root = QString::fromStdString(rootPath);
    const QFileInfo rootInfo(root);
    if (!rootInfo.exists() || !rootInfo.isDir()) {
        throw FolderError(FolderCause::PathMissing, "folder does not exist: " + rootPath);
    }
    const QDir rootDir(root);
    if (!rootInfo.isReadable() || !rootDir.isReadable()) {
        throw FolderError(FolderCause::PermissionDenied,
                          "permission denied reading folder " + rootPath);
    }

    QMimeDatabase mimeDatabase;
    std::vector<Document> documents;
    QDirIterator it(root, QDir::Files | QDir::NoDotAndDotDot, QDirIterator::Subdirectories);
    while (it.hasNext()) {
        throwIfCancelled(cancel);
        const QString filePath = it.next();
        const QFileInfo info(filePath);
        const std::string relative = rootDir.relativeFilePath(filePath).toStdString();
        if (isExcluded(relative, exclusionPatterns)) {
            continue;
        }

        const DocumentFormat format = TextReconstructor::formatForPath(filePath.toStdString());
        if (format == DocumentFormat::Unknown || (m_accepts && !m_accepts(format))) {
            continue;
        }

        const std::string hash = TextReconstructor::contentHash(filePath.toStdString());
        if (hash.empty()) {
            FMLOG_WARN(QStringLiteral("FolderScanner"),
                       QStringLiteral("FolderScanner::scan"),
                       QStringLiteral("file_unreadable"),
                       QStringLiteral("folder_scan"),
                       QStringLiteral("keep_stored_entry"),
                       QString(),
                       logging::currentCorrelationId(),
                       (nlohmann::json{{"path", filePath.toStdString()}}));
        }

        Document document;
        document.folderId = folderId;
        document.path = info.absoluteFilePath().toStdString();
        document.contentHash = hash;
        document.format = format;
        document.mimeType =
            mimeDatabase.mimeTypeForFile(info, QMimeDatabase::MatchExtension).name().toStdString();
        document.modifiedAt = std::chrono::system_clock::time_point(
            std::chrono::milliseconds(info.lastModified().toMSecsSinceEpoch()));
        document.size = info.size();
        documents.push_back(std::move(document));
    }

    std::sort(documents.begin(), documents.end(),
              [](const Document &a, const Document &b) { return a.path < b.path; });
    return documents;
}

} // namespace foldermind
