#pragma once

#include <stdexcept>
#include <string>

namespace foldermind {

enum class EnvironmentCause {
    NativeVersionMismatch,
    LibraryLoadFailure,
    RuntimeFailure
};

enum class FolderCause {
    PathMissing,
    PermissionDenied,
    MalformedContent,
    EmptyFolder,
    Other
};

enum class TransportErrorKind {
    ConnectionRefused,
    ConnectionReset,
    HostNotFound,
    Timeout,
    Other
};

// Native or runtime incompatibility. Never justifies deleting indexed data.
class EnvironmentError : public std::runtime_error {
public:
    EnvironmentError(EnvironmentCause cause, const std::string &message)
        : std::runtime_error(message)
        , m_cause(cause)
    {
    }

    EnvironmentCause cause() const { return m_cause; }

private:
    EnvironmentCause m_cause;
};

// Path, permission or content problem owned by one folder.
class FolderError : public std::runtime_error {
public:
    FolderError(FolderCause cause, const std::string &message)
        : std::runtime_error(message)
        , m_cause(cause)
    {
    }

    FolderCause cause() const { return m_cause; }

private:
    FolderCause m_cause;
};

class InvalidPathError : public std::runtime_error {
public:
    explicit InvalidPathError(const std::string &message)
        : std::runtime_error(message)
    {
    }
};

// Stored coordinates no longer resolve against the source document.
class CoordinateMismatchError : public std::runtime_error {
public:
    CoordinateMismatchError(const std::string &documentPath, const std::string &message)
        : std::runtime_error(message)
        , m_documentPath(documentPath)
    {
    }

    const std::string &documentPath() const { return m_documentPath; }

private:
    std::string m_documentPath;
};

// Structured redirect for callers that prefer exceptions over decisions.
class ConnectionConflictError : public std::runtime_error {
public:
    ConnectionConflictError(const std::string &reasonCode,
                            const std::string &fallbackAddress,
                            const std::string &primaryClientId)
        : std::runtime_error("low-latency channel held by " + primaryClientId)
        , m_reasonCode(reasonCode)
        , m_fallbackAddress(fallbackAddress)
        , m_primaryClientId(primaryClientId)
    {
    }

    const std::string &reasonCode() const { return m_reasonCode; }
    const std::string &fallbackAddress() const { return m_fallbackAddress; }
    const std::string &primaryClientId() const { return m_primaryClientId; }

private:
    std::string m_reasonCode;
    std::string m_fallbackAddress;
    std::string m_primaryClientId;
};

class TransportError : public std::runtime_error {
public:
    TransportError(TransportErrorKind kind, const std::string &message)
        : std::runtime_error(message)
        , m_kind(kind)
    {
    }

    TransportErrorKind kind() const { return m_kind; }

private:
    TransportErrorKind m_kind;
};

// Auto-start was attempted and did not produce a healthy daemon.
class DaemonUnavailableError : public std::runtime_error {
public:
    explicit DaemonUnavailableError(const std::string &cause)
        : std::runtime_error("daemon could not be started: " + cause)
        , m_cause(cause)
    {
    }

    const std::string &cause() const { return m_cause; }

private:
    std::string m_cause;
};

class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string &message)
        : std::runtime_error(message)
    {
    }
};

} // namespace foldermind
