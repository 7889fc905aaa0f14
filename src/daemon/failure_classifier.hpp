#pragma once

#include <chrono>
#include <exception>
#include <optional>
#include <string>

#include "common/daemon_config.hpp"
#include "common/errors.hpp"

namespace foldermind {

// What was caught at the worker boundary. Typed causes win over the message;
// the message is only matched when no typed cause is available.
struct RawFailure {
    std::string message;
    std::optional<EnvironmentCause> environmentCause;
    std::optional<FolderCause> folderCause;
};

enum class FailureClass {
    Environment,
    Folder
};

struct FailureClassification {
    FailureClass failureClass = FailureClass::Folder;
    EnvironmentCause environmentCause = EnvironmentCause::RuntimeFailure;
    FolderCause folderCause = FolderCause::Other;
    // Stable machine-readable code, e.g. "native_version_mismatch".
    std::string kind;
    std::string remediation;
};

enum class RecoveryAction {
    PreserveAndNotify,
    RetryWithBackoff,
    CleanupTerminal,
    MarkTerminalError,
    SkipDocument,
    AwaitChange
};

struct RecoveryPlan {
    RecoveryAction action = RecoveryAction::MarkTerminalError;
    std::chrono::milliseconds delay{0};
    bool terminal = false;
};

FailureClassification classifyFailure(const RawFailure &failure);

// attempt is the 1-based count of consecutive failures including this one.
// pathStillExists is checked by the caller when the failure happens.
RecoveryPlan planRecovery(const FailureClassification &classification,
                          int attempt,
                          bool pathStillExists,
                          const RetryPolicy &policy);

RawFailure rawFailureFromException(const std::exception &error);

std::string toFailureClassString(FailureClass failureClass);
std::string toRecoveryActionString(RecoveryAction action);

} // namespace foldermind
