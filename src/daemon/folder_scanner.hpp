#pragma once

#include <functional>
#include <string>
#include <vector>

#include "common/models.hpp"
#include "daemon/cancel_token.hpp"

namespace foldermind {

// Walks a monitored folder and describes every indexable file: path, SHA-256
// content hash, format, mime type, size and modification time. Hidden files
// and paths matching an exclusion pattern are skipped. A file that exists but
// cannot be read is still listed, with an empty contentHash.
class FolderScanner {
public:
    using FormatFilter = std::function<bool(DocumentFormat)>;

    explicit FolderScanner(FormatFilter accepts);

    // Throws FolderError(PathMissing) when the root is gone and
    // FolderError(PermissionDenied) when it cannot be listed.
    std::vector<Document> scan(FolderId folderId,
                               const std::string &rootPath,
                               const std::vector<std::string> &exclusionPatterns,
                               const CancelToken &cancel) const;

    // Glob match against the path relative to the root and against the file
    // name ("*.log", "build/*", "node_modules").
    static bool isExcluded(const std::string &relativePath,
                           const std::vector<std::string> &exclusionPatterns);

private:
    FormatFilter m_accepts;
};

} // namespace foldermind
