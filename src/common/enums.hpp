#pragma once

namespace foldermind {

enum class FolderState {
    Pending,
    Scanning,
    Indexing,
    Active,
    Error,
    Removed
};

enum class DocumentFormat {
    Text,
    Markdown,
    Pdf,
    Word,
    Spreadsheet,
    Presentation,
    Unknown
};

enum class TransportMode {
    Stdio,
    Http
};

} // namespace foldermind
