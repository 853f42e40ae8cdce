// HexForge Platform Layer
// file_io.cpp - File system helpers with logged, non-throwing failures

#include <hexforge/core/logger.hpp>
#include <hexforge/platform/file_io.hpp>

#include <cstdlib>
#include <fstream>
#include <iterator>

#if defined(HEXFORGE_PLATFORM_WINDOWS)
#include <shlobj.h>
#include <windows.h>
#else
#include <pwd.h>
#include <unistd.h>
#endif

namespace hexforge::platform {

namespace {

constexpr const char* APP_DIRECTORY = "HexForge";

// Runs op and converts any filesystem or stream exception into fallback
template<typename T, typename Op>
T guarded(const char* action, const fs::path& path, T fallback, Op&& op) {
    try {
        return op();
    } catch (const std::exception& e) {
        HEXFORGE_LOG_ERROR(core::log_category::IO, "{} '{}' failed: {}", action, path.string(), e.what());
        return fallback;
    }
}

#if !defined(HEXFORGE_PLATFORM_WINDOWS)
fs::path home_directory() {
    if (const char* home = std::getenv("HOME")) {
        return home;
    }
    const passwd* pw = getpwuid(getuid());
    return pw != nullptr ? fs::path(pw->pw_dir) : fs::current_path();
}
#endif

bool write_stream(const fs::path& path, std::ios::openmode mode, const char* data, size_t size) {
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path());
    }

    std::ofstream file(path, mode | std::ios::trunc);
    if (!file.is_open()) {
        HEXFORGE_LOG_WARN(core::log_category::IO, "Cannot open for writing: {}", path.string());
        return false;
    }
    file.write(data, static_cast<std::streamsize>(size));
    file.flush();
    if (!file) {
        HEXFORGE_LOG_WARN(core::log_category::IO, "Short write: {}", path.string());
        return false;
    }
    return true;
}

}  // namespace

// ============================================================================
// Standard Paths
// ============================================================================

fs::path FileSystem::get_user_data_directory() {
#if defined(HEXFORGE_PLATFORM_MACOS)
    return home_directory() / "Library" / "Application Support" / APP_DIRECTORY;
#elif defined(HEXFORGE_PLATFORM_WINDOWS)
    wchar_t* path = nullptr;
    fs::path result = fs::current_path() / APP_DIRECTORY;
    if (SUCCEEDED(SHGetKnownFolderPath(FOLDERID_LocalAppData, 0, nullptr, &path))) {
        result = fs::path(path) / APP_DIRECTORY;
    }
    CoTaskMemFree(path);
    return result;
#else
    if (const char* xdg_data = std::getenv("XDG_DATA_HOME")) {
        return fs::path(xdg_data) / APP_DIRECTORY;
    }
    return home_directory() / ".local" / "share" / APP_DIRECTORY;
#endif
}

fs::path FileSystem::get_temp_directory() {
    return fs::temp_directory_path() / APP_DIRECTORY;
}

// ============================================================================
// Reading and Writing
// ============================================================================

std::optional<std::vector<uint8_t>> FileSystem::read_binary(const fs::path& path) {
    return guarded<std::optional<std::vector<uint8_t>>>("Reading", path, std::nullopt,
                                                        [&]() -> std::optional<std::vector<uint8_t>> {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open()) {
            HEXFORGE_LOG_WARN(core::log_category::IO, "Cannot open for reading: {}", path.string());
            return std::nullopt;
        }
        return std::vector<uint8_t>(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    });
}

std::optional<std::string> FileSystem::read_text(const fs::path& path) {
    return guarded<std::optional<std::string>>("Reading", path, std::nullopt, [&]() -> std::optional<std::string> {
        std::ifstream file(path);
        if (!file.is_open()) {
            HEXFORGE_LOG_WARN(core::log_category::IO, "Cannot open for reading: {}", path.string());
            return std::nullopt;
        }
        return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    });
}

bool FileSystem::write_binary(const fs::path& path, std::span<const uint8_t> data) {
    return guarded("Writing", path, false, [&] {
        return write_stream(path, std::ios::binary, reinterpret_cast<const char*>(data.data()), data.size());
    });
}

bool FileSystem::write_text(const fs::path& path, std::string_view content) {
    return guarded("Writing", path, false,
                   [&] { return write_stream(path, std::ios::out, content.data(), content.size()); });
}

bool FileSystem::write_binary_atomic(const fs::path& path, std::span<const uint8_t> data) {
    fs::path partial = path;
    partial += ".partial";

    const bool moved = write_binary(partial, data) && guarded("Renaming", partial, false, [&] {
        fs::rename(partial, path);
        return true;
    });
    if (!moved) {
        remove(partial);
    }
    return moved;
}

// ============================================================================
// Directories and Queries
// ============================================================================

bool FileSystem::create_directories(const fs::path& path) {
    return guarded("Creating directories", path, false, [&] {
        fs::create_directories(path);
        return fs::is_directory(path);
    });
}

bool FileSystem::exists(const fs::path& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool FileSystem::is_directory(const fs::path& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

bool FileSystem::is_file(const fs::path& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

bool FileSystem::remove(const fs::path& path) {
    return guarded("Removing", path, false, [&] { return fs::remove(path); });
}

bool FileSystem::remove_all(const fs::path& path) {
    return guarded("Removing", path, false, [&] {
        fs::remove_all(path);
        return true;
    });
}

}  // namespace hexforge::platform
