#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace foldermind {

// Discovery record for a running daemon, written on start and removed on a
// clean exit.
struct DaemonRegistration {
    std::int64_t pid = 0;
    std::string host;
    int port = 0;
    std::chrono::system_clock::time_point startedAt;
    std::string version;

    std::string baseUrl() const;
};

// Throws std::runtime_error when the file cannot be written.
void writeDaemonRegistration(const std::string &path, const DaemonRegistration &registration);

// nullopt when the file is missing or unreadable.
std::optional<DaemonRegistration> readDaemonRegistration(const std::string &path);

void removeDaemonRegistration(const std::string &path);

} // namespace foldermind
