// Crumble Platform Layer
// file_io.hpp - File system helpers used by config, logging and level loading

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace crumble::platform {

namespace fs = std::filesystem;

class FileSystem {
public:
    // Per-user writable directory (logs, default config)
    static fs::path get_user_data_directory();

    static std::optional<std::string> read_text(const fs::path& path);
    static bool write_text(const fs::path& path, std::string_view content);

    static bool exists(const fs::path& path);
    static bool create_directories(const fs::path& path);

private:
    FileSystem() = delete;
};

}  // namespace crumble::platform
