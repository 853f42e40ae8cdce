// HexForge Core
// config.hpp - JSON-based generation configuration

#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace hexforge::core {

// Sectioned key/value configuration persisted as JSON.
// Missing keys or keys of the wrong type fall back to the caller's default.
class Config {
public:
    Config();
    ~Config();

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;
    Config(Config&&) noexcept;
    Config& operator=(Config&&) noexcept;

    bool load(const std::filesystem::path& path);
    bool save(const std::filesystem::path& path) const;
    bool load_or_create_default(const std::filesystem::path& path);

    // Parse from an in-memory JSON document (merged over the defaults)
    bool load_from_string(std::string_view json_text);

    [[nodiscard]] std::filesystem::path get_path() const;

    // Integers outside the int range are logged and fall back to the default
    [[nodiscard]] int get_int(std::string_view section, std::string_view key, int default_value = 0) const;
    // Full-width read for callers that range-check themselves. Unsigned values
    // above INT64_MAX saturate.
    [[nodiscard]] int64_t get_int64(std::string_view section, std::string_view key, int64_t default_value = 0) const;
    [[nodiscard]] double get_double(std::string_view section, std::string_view key,
                                    double default_value = 0.0) const;
    [[nodiscard]] bool get_bool(std::string_view section, std::string_view key, bool default_value = false) const;
    [[nodiscard]] std::string get_string(std::string_view section, std::string_view key,
                                         std::string_view default_value = "") const;

    void set_int(std::string_view section, std::string_view key, int value);
    void set_double(std::string_view section, std::string_view key, double value);
    void set_bool(std::string_view section, std::string_view key, bool value);
    void set_string(std::string_view section, std::string_view key, std::string_view value);

    [[nodiscard]] bool has(std::string_view section, std::string_view key) const;
    [[nodiscard]] bool has_section(std::string_view section) const;

    [[nodiscard]] bool is_dirty() const;
    void mark_clean();

    // Reset to the default boss platform configuration
    void set_defaults();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

namespace config_section {
    inline constexpr const char* PLATFORM = "platform";
    inline constexpr const char* RINGS = "rings";
    inline constexpr const char* PILLARS = "pillars";
    inline constexpr const char* DECORATIONS = "decorations";
    inline constexpr const char* FEATURES = "features";
    inline constexpr const char* GENERATION = "generation";
    inline constexpr const char* OUTPUT = "output";
    inline constexpr const char* DEBUG = "debug";
}  // namespace config_section

namespace config_key {
    // Platform / rings / pillars share generic geometric keys
    inline constexpr const char* RADIUS = "radius";
    inline constexpr const char* HEIGHT = "height";
    inline constexpr const char* SIDES = "sides";
    inline constexpr const char* BEVEL_WIDTH = "bevel_width";
    inline constexpr const char* BEVEL_SEGMENTS = "bevel_segments";

    inline constexpr const char* OUTER_RADIUS = "outer_radius";
    inline constexpr const char* MIDDLE_RADIUS = "middle_radius";
    inline constexpr const char* INNER_RADIUS = "inner_radius";
    inline constexpr const char* THICKNESS = "thickness";
    inline constexpr const char* CARVE_EPSILON = "carve_epsilon";
    inline constexpr const char* CIRCLE_SEGMENTS = "circle_segments";

    inline constexpr const char* COUNT = "count";
    inline constexpr const char* INSET = "inset";
    inline constexpr const char* TAPER_END_SCALE = "taper_end_scale";
    inline constexpr const char* FIRE_SPHERES = "fire_spheres";

    inline constexpr const char* RUNES_PER_RING = "runes_per_ring";
    inline constexpr const char* SPIKES_PER_EDGE = "spikes_per_edge";
    inline constexpr const char* SKULL_COUNT = "skull_count";
    inline constexpr const char* SKULL_SCATTER_RADIUS = "skull_scatter_radius";
    inline constexpr const char* HORN_COUNT = "horn_count";
    inline constexpr const char* CRACK_COUNT = "crack_count";
    inline constexpr const char* CHAIN_LINKS = "chain_links";
    inline constexpr const char* CHAIN_SAG = "chain_sag";

    inline constexpr const char* RUNES = "runes";
    inline constexpr const char* CHAINS = "chains";
    inline constexpr const char* LAVA_CRACKS = "lava_cracks";
    inline constexpr const char* RUNE_BEAMS = "rune_beams";

    inline constexpr const char* SEED = "seed";

    inline constexpr const char* PATH = "path";
    inline constexpr const char* EXPORT_LIGHTS = "export_lights";

    inline constexpr const char* LOG_LEVEL = "log_level";
}  // namespace config_key

}  // namespace hexforge::core
