#include "common/daemon_registry.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"

namespace foldermind {

std::string DaemonRegistration::baseUrl() const
{
    return "http://" + host + ":" + std::to_string(port);
}

void writeDaemonRegistration(const std::string &path, const DaemonRegistration &registration)
{
    const std::filesystem::path target(path);
    std::error_code ec;
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) {
        throw std::runtime_error("cannot create " + target.parent_path().string() + ": "
                                 + ec.message());
    }

    const nlohmann::json j = {
        {"pid", registration.pid},
        {"host", registration.host},
        {"port", registration.port},
        {"startedAt", toIso8601Utc(registration.startedAt)},
        {"version", registration.version}
    };

    const std::filesystem::path temp = target.string() + ".tmp";
    {
        std::ofstream out(temp, std::ios::trunc);
        if (!out) {
            throw std::runtime_error("cannot write daemon registry " + temp.string());
        }
        out << j.dump(2) << "\n";
    }
    std::filesystem::rename(temp, target, ec);
    if (ec) {
        throw std::runtime_error("cannot replace daemon registry " + path + ": " + ec.message());
    }
}

std::optional<DaemonRegistration> readDaemonRegistration(const std::string &path)
{
    std::ifstream in(path);
    if (!in) {
        return std::nullopt;
    }
    const nlohmann::json j = nlohmann::json::parse(in, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return std::nullopt;
    }

    DaemonRegistration registration;
    registration.pid = j.value("pid", static_cast<std::int64_t>(0));
    registration.host = j.value("host", "");
    registration.port = j.value("port", 0);
    registration.startedAt = fromIso8601Utc(j.value("startedAt", ""));
    registration.version = j.value("version", "");
    if (registration.host.empty() || registration.port <= 0) {
        return std::nullopt;
    }
    return registration;
}

void removeDaemonRegistration(const std::string &path)
{
    std::error_code ec;
    std::filesystem::remove(path, ec);
}

} // namespace foldermind
