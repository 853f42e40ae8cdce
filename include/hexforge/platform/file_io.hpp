// HexForge Platform Layer
// file_io.hpp - File system helpers used by config, logging and export

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace hexforge::platform {

namespace fs = std::filesystem;

// Static utility class. No member throws; failures are logged and reported
// through the return value.
class FileSystem {
public:
    static fs::path get_user_data_directory();  // ~/.local/share/HexForge on Linux, holds logs/
    static fs::path get_temp_directory();

    static std::optional<std::vector<uint8_t>> read_binary(const fs::path& path);
    static std::optional<std::string> read_text(const fs::path& path);

    // Both create missing parent directories
    static bool write_binary(const fs::path& path, std::span<const uint8_t> data);
    static bool write_text(const fs::path& path, std::string_view content);

    // Writes to "<path>.partial" and renames over path once the data is complete.
    // On failure the previous contents of path (if any) are left untouched.
    static bool write_binary_atomic(const fs::path& path, std::span<const uint8_t> data);

    static bool create_directories(const fs::path& path);
    static bool exists(const fs::path& path);
    static bool is_directory(const fs::path& path);
    static bool is_file(const fs::path& path);
    static bool remove(const fs::path& path);
    static bool remove_all(const fs::path& path);

private:
    FileSystem() = delete;
};

}  // namespace hexforge::platform
