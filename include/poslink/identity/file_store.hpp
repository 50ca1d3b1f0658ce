#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>


namespace poslink::identity {

// Persists the terminal identity as a single line in a text file.
// Parent directories are created on first save; writes go through a
// temporary file and a rename so a crash never leaves a half-written id.
class FileStore {
public:
    explicit FileStore(std::filesystem::path path);

    [[nodiscard]]
    std::optional<std::string> load();

    [[nodiscard]]
    bool save(std::string_view id);

    [[nodiscard]]
    bool clear();

    [[nodiscard]]
    const std::filesystem::path& path() const noexcept {
        return path_;
    }

    // $XDG_STATE_HOME/poslink/terminal_id, falling back to
    // $HOME/.local/state/poslink/terminal_id, then to the working directory
    [[nodiscard]]
    static std::filesystem::path default_path();

private:
    std::filesystem::path path_;
};

} // namespace poslink::identity
