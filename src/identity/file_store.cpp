#include "poslink/identity/file_store.hpp"

#include <cstdlib>
#include <fstream>
#include <system_error>
#include <utility>

#include "poslink/log/logger.hpp"


namespace poslink::identity {

namespace {

std::string_view trim(std::string_view s) noexcept {
    constexpr std::string_view ws = " \t\r\n";
    const auto first = s.find_first_not_of(ws);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

} // namespace


FileStore::FileStore(std::filesystem::path path)
    : path_(std::move(path))
{}

std::optional<std::string> FileStore::load() {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        PL_DEBUG("[IDENTITY] No stored identity at " << path_.string());
        return std::nullopt;
    }
    std::ifstream in(path_);
    if (!in) {
        PL_WARN("[IDENTITY] Unable to open " << path_.string() << " for reading");
        return std::nullopt;
    }
    std::string line;
    std::getline(in, line);
    const auto id = trim(line);
    if (id.empty()) {
        PL_WARN("[IDENTITY] Stored identity at " << path_.string() << " is empty");
        return std::nullopt;
    }
    return std::string(id);
}

bool FileStore::save(std::string_view id) {
    std::error_code ec;
    const auto parent = path_.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            PL_WARN("[IDENTITY] Unable to create " << parent.string() << ": " << ec.message());
            return false;
        }
    }
    auto tmp = path_;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            PL_WARN("[IDENTITY] Unable to open " << tmp.string() << " for writing");
            return false;
        }
        out << id << '\n';
        out.flush();
        if (!out) {
            PL_WARN("[IDENTITY] Write to " << tmp.string() << " failed");
            return false;
        }
    }
    std::filesystem::rename(tmp, path_, ec);
    if (ec) {
        PL_WARN("[IDENTITY] Unable to move identity into place at " << path_.string() << ": " << ec.message());
        std::filesystem::remove(tmp, ec);
        return false;
    }
    PL_DEBUG("[IDENTITY] Identity stored at " << path_.string());
    return true;
}

bool FileStore::clear() {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec) {
        PL_WARN("[IDENTITY] Unable to remove " << path_.string() << ": " << ec.message());
        return false;
    }
    return true;
}

std::filesystem::path FileStore::default_path() {
    const std::filesystem::path leaf = std::filesystem::path("poslink") / "terminal_id";
    if (const char* state = std::getenv("XDG_STATE_HOME"); state && *state) {
        return std::filesystem::path(state) / leaf;
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".local" / "state" / leaf;
    }
    return std::filesystem::path("poslink_terminal_id");
}

} // namespace poslink::identity
