// HexForge Exporter
// glb_exporter.hpp - glTF 2.0 binary export of an assembled scene

#pragma once

#include <hexforge/scene/memory_scene.hpp>

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace hexforge::exporter {

// The scene handed to the exporter cannot be expressed as a single-root asset
class ExportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ExportOptions {
    bool export_lights = false;  // KHR_lights_punctual
    std::string generator = "HexForge";
};

struct ExportStats {
    size_t node_count = 0;
    size_t mesh_count = 0;
    size_t material_count = 0;
    size_t light_count = 0;
    size_t vertex_count = 0;  // After flat-shaded vertex splitting
    size_t byte_size = 0;
};

// GLB container constants
namespace glb {
    inline constexpr uint32_t MAGIC = 0x46546C67;       // "glTF"
    inline constexpr uint32_t VERSION = 2;
    inline constexpr uint32_t CHUNK_JSON = 0x4E4F534A;  // "JSON"
    inline constexpr uint32_t CHUNK_BIN = 0x004E4942;   // "BIN\0"
    inline constexpr uint32_t HEADER_SIZE = 12;
    inline constexpr uint32_t CHUNK_HEADER_SIZE = 8;
}  // namespace glb

class GlbExporter {
public:
    explicit GlbExporter(const ExportOptions& options = {});

    /// Serializes the subtree under root. Throws ExportError when root is
    /// unknown or not top-level. Identical scenes give identical bytes.
    [[nodiscard]] std::vector<uint8_t> serialize(const scene::MemoryScene& scene, scene::NodeHandle root);

    /// Serializes and writes through a temporary sibling file, so a failed
    /// export never leaves a partial asset at path. Returns false on I/O failure.
    bool write(const scene::MemoryScene& scene, scene::NodeHandle root, const std::filesystem::path& path);

    /// Statistics of the last serialize() call
    [[nodiscard]] const ExportStats& get_stats() const { return stats_; }

private:
    ExportOptions options_;
    ExportStats stats_;
};

}  // namespace hexforge::exporter
