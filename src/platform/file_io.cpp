// Crumble Platform Layer
// file_io.cpp - File system helpers implementation

#include <crumble/platform/file_io.hpp>

#include <spdlog/spdlog.h>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>

#if defined(CRUMBLE_PLATFORM_WINDOWS)
#include <shlobj.h>
#include <windows.h>
#else
#include <pwd.h>
#include <sys/types.h>
#include <unistd.h>
#endif

namespace crumble::platform {

namespace {

#if !defined(CRUMBLE_PLATFORM_WINDOWS)
fs::path home_directory() {
    const char* home = std::getenv("HOME");
    if (home == nullptr) {
        struct passwd* pw = getpwuid(getuid());
        if (pw == nullptr) {
            return fs::temp_directory_path();
        }
        home = pw->pw_dir;
    }
    return fs::path(home);
}
#endif

}  // namespace

fs::path FileSystem::get_user_data_directory() {
#if defined(CRUMBLE_PLATFORM_MACOS)
    return home_directory() / "Library" / "Application Support" / "Crumble";
#elif defined(CRUMBLE_PLATFORM_WINDOWS)
    wchar_t* path = nullptr;
    if (SUCCEEDED(SHGetKnownFolderPath(FOLDERID_LocalAppData, 0, nullptr, &path))) {
        fs::path result = fs::path(path) / "Crumble";
        CoTaskMemFree(path);
        return result;
    }
    return fs::current_path() / "data";
#else
    const char* xdg_data = std::getenv("XDG_DATA_HOME");
    if (xdg_data != nullptr && *xdg_data != '\0') {
        return fs::path(xdg_data) / "crumble";
    }
    return home_directory() / ".local" / "share" / "crumble";
#endif
}

std::optional<std::string> FileSystem::read_text(const fs::path& path) {
    std::ifstream file(path, std::ios::in);
    if (!file) {
        spdlog::debug("read_text: cannot open {}", path.string());
        return std::nullopt;
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        spdlog::debug("read_text: read error on {}", path.string());
        return std::nullopt;
    }
    return buffer.str();
}

bool FileSystem::write_text(const fs::path& path, std::string_view content) {
    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file) {
        spdlog::debug("write_text: cannot open {}", path.string());
        return false;
    }

    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    return file.good();
}

bool FileSystem::exists(const fs::path& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool FileSystem::create_directories(const fs::path& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        spdlog::debug("create_directories: {} ({})", path.string(), ec.message());
        return false;
    }
    return true;
}

}  // namespace crumble::platform
