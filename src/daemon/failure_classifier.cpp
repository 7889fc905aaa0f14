#include "daemon/failure_classifier.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <filesystem>
#include <vector>

namespace foldermind {

namespace {

struct Signature {
    const char *needle;
    EnvironmentCause cause;
};

// Ordered: the first match wins.
const std::vector<Signature> &environmentSignatures()
{
    static const std::vector<Signature> signatures = {
        {"node_module_version", EnvironmentCause::NativeVersionMismatch},
        {"compiled against a different", EnvironmentCause::NativeVersionMismatch},
        {"version mismatch", EnvironmentCause::NativeVersionMismatch},
        {"abi mismatch", EnvironmentCause::NativeVersionMismatch},
        {"glibc_", EnvironmentCause::NativeVersionMismatch},
        {"cannot open shared object file", EnvironmentCause::LibraryLoadFailure},
        {"dlopen", EnvironmentCause::LibraryLoadFailure},
        {"undefined symbol", EnvironmentCause::LibraryLoadFailure},
        {"wrong elf class", EnvironmentCause::LibraryLoadFailure},
        {"incompatible architecture", EnvironmentCause::LibraryLoadFailure},
        {"failed to load library", EnvironmentCause::LibraryLoadFailure},
        {"modulenotfounderror", EnvironmentCause::RuntimeFailure},
        {"importerror", EnvironmentCause::RuntimeFailure},
        {"python interpreter", EnvironmentCause::RuntimeFailure},
        {"embedding runtime", EnvironmentCause::RuntimeFailure},
        {"cuda error", EnvironmentCause::RuntimeFailure},
    };
    return signatures;
}

struct FolderSignature {
    const char *needle;
    FolderCause cause;
};

const std::vector<FolderSignature> &folderSignatures()
{
    static const std::vector<FolderSignature> signatures = {
        {"no such file or directory", FolderCause::PathMissing},
        {"enoent", FolderCause::PathMissing},
        {"does not exist", FolderCause::PathMissing},
        {"permission denied", FolderCause::PermissionDenied},
        {"eacces", FolderCause::PermissionDenied},
        {"eperm", FolderCause::PermissionDenied},
        {"operation not permitted", FolderCause::PermissionDenied},
        {"malformed", FolderCause::MalformedContent},
        {"not valid utf-8", FolderCause::MalformedContent},
        {"corrupt", FolderCause::MalformedContent},
        {"binary content", FolderCause::MalformedContent},
    };
    return signatures;
}

std::string lower(const std::string &value)
{
    std::string out = value;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

FailureClassification environmentClassification(EnvironmentCause cause)
{
    FailureClassification result;
    result.failureClass = FailureClass::Environment;
    result.environmentCause = cause;
    switch (cause) {
    case EnvironmentCause::NativeVersionMismatch:
        result.kind = "native_version_mismatch";
        result.remediation =
            "Rebuild the native dependency against the current runtime, then retry the folder.";
        break;
    case EnvironmentCause::LibraryLoadFailure:
        result.kind = "library_load_failure";
        result.remediation =
            "Reinstall or re-link the embedding backend library, then retry the folder.";
        break;
    case EnvironmentCause::RuntimeFailure:
        result.kind = "runtime_failure";
        result.remediation =
            "Check that the embedding runtime is installed and running, then retry the folder.";
        break;
    }
    return result;
}

FailureClassification folderClassification(FolderCause cause)
{
    FailureClassification result;
    result.failureClass = FailureClass::Folder;
    result.folderCause = cause;
    switch (cause) {
    case FolderCause::PathMissing:
        result.kind = "path_missing";
        result.remediation = "Restore the folder or remove it from monitoring.";
        break;
    case FolderCause::PermissionDenied:
        result.kind = "permission_denied";
        result.remediation = "Grant read access to the folder, then retry.";
        break;
    case FolderCause::MalformedContent:
        result.kind = "malformed_content";
        result.remediation = "The document could not be parsed and was skipped.";
        break;
    case FolderCause::EmptyFolder:
        result.kind = "empty_folder";
        result.remediation = "Add supported documents to the folder.";
        break;
    case FolderCause::Other:
        result.kind = "folder_failure";
        result.remediation = "Check the folder and retry.";
        break;
    }
    return result;
}

} // namespace

FailureClassification classifyFailure(const RawFailure &failure)
{
    if (failure.environmentCause.has_value()) {
        return environmentClassification(*failure.environmentCause);
    }
    if (failure.folderCause.has_value()) {
        return folderClassification(*failure.folderCause);
    }

    const std::string message = lower(failure.message);
    for (const Signature &signature : environmentSignatures()) {
        if (message.find(signature.needle) != std::string::npos) {
            return environmentClassification(signature.cause);
        }
    }
    for (const FolderSignature &signature : folderSignatures()) {
        if (message.find(signature.needle) != std::string::npos) {
            return folderClassification(signature.cause);
        }
    }
    return folderClassification(FolderCause::Other);
}

RecoveryPlan planRecovery(const FailureClassification &classification,
                          int attempt,
                          bool pathStillExists,
                          const RetryPolicy &policy)
{
    RecoveryPlan plan;
    if (classification.failureClass == FailureClass::Environment) {
        plan.action = RecoveryAction::PreserveAndNotify;
        return plan;
    }

    switch (classification.folderCause) {
    case FolderCause::MalformedContent:
        plan.action = RecoveryAction::SkipDocument;
        return plan;
    case FolderCause::EmptyFolder:
        plan.action = RecoveryAction::AwaitChange;
        return plan;
    case FolderCause::PathMissing:
    case FolderCause::PermissionDenied:
    case FolderCause::Other:
        break;
    }

    if (attempt <= policy.maxAttempts) {
        plan.action = RecoveryAction::RetryWithBackoff;
        plan.delay = policy.delayForAttempt(attempt);
        return plan;
    }

    plan.terminal = true;
    plan.action = pathStillExists ? RecoveryAction::MarkTerminalError
                                  : RecoveryAction::CleanupTerminal;
    return plan;
}

RawFailure rawFailureFromException(const std::exception &error)
{
    RawFailure failure;
    failure.message = error.what();

    if (const auto *environment = dynamic_cast<const EnvironmentError *>(&error)) {
        failure.environmentCause = environment->cause();
    } else if (const auto *folder = dynamic_cast<const FolderError *>(&error)) {
        failure.folderCause = folder->cause();
    } else if (dynamic_cast<const StoreError *>(&error) != nullptr) {
        // The index database failed, not the document. SQLite's own wording
        // ("database disk image is malformed") must not read as bad content.
        failure.folderCause = FolderCause::Other;
    } else if (const auto *filesystem =
                   dynamic_cast<const std::filesystem::filesystem_error *>(&error)) {
        const int code = filesystem->code().value();
        if (code == ENOENT || code == ENOTDIR) {
            failure.folderCause = FolderCause::PathMissing;
        } else if (code == EACCES || code == EPERM) {
            failure.folderCause = FolderCause::PermissionDenied;
        }
    }
    return failure;
}

std::string toFailureClassString(FailureClass failureClass)
{
    return failureClass == FailureClass::Environment ? "environment" : "folder";
}

std::string toRecoveryActionString(RecoveryAction action)
{
    switch (action) {
    case RecoveryAction::PreserveAndNotify:
        return "preserve_and_notify";
    case RecoveryAction::RetryWithBackoff:
        return "retry_with_backoff";
    case RecoveryAction::CleanupTerminal:
        return "cleanup_terminal";
    case RecoveryAction::MarkTerminalError:
        return "mark_terminal_error";
    case RecoveryAction::SkipDocument:
        return "skip_document";
    case RecoveryAction::AwaitChange:
        return "await_change";
    }
    return "mark_terminal_error";
}

} // namespace foldermind
