#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <filesystem>

namespace fs = std::filesystem;

namespace platform {

namespace {

constexpr const char* kAppDir = "whisper-export";

std::string xdg_dir(const char* xdg_var, const char* home_relative) {
    if (const char* xdg = std::getenv(xdg_var); xdg && *xdg) {
        return (fs::path(xdg) / kAppDir).string();
    }
    const char* home = std::getenv("HOME");
    if (!home || !*home) return {};
    return (fs::path(home) / home_relative / kAppDir).string();
}

} // namespace

std::string config_dir() {
    return xdg_dir("XDG_CONFIG_HOME", ".config");
}

std::string data_dir() {
    return xdg_dir("XDG_DATA_HOME", ".local/share");
}

std::string history_db_path() {
    auto data = data_dir();
    std::error_code ec;
    auto dir = data.empty() ? fs::temp_directory_path(ec) / kAppDir : fs::path(data);
    return (dir / "history.db").string();
}

} // namespace platform
