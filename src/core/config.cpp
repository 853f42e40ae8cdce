// HexForge Core
// config.cpp - JSON-based generation configuration implementation

#include <nlohmann/json.hpp>

#include <hexforge/core/config.hpp>
#include <hexforge/core/logger.hpp>
#include <hexforge/platform/file_io.hpp>

#include <limits>
#include <utility>

namespace hexforge::core {

using json = nlohmann::json;

struct Config::Impl {
    json data;
    std::filesystem::path path;
    bool dirty = false;

    [[nodiscard]] const json* find(std::string_view section, std::string_view key) const {
        auto section_it = data.find(std::string(section));
        if (section_it == data.end() || !section_it->is_object()) {
            return nullptr;
        }
        auto key_it = section_it->find(std::string(key));
        if (key_it == section_it->end()) {
            return nullptr;
        }
        return &*key_it;
    }

    // Value at section.key when present and accepted by is_type, else fallback
    template<typename T, typename Pred>
    [[nodiscard]] T read(std::string_view section, std::string_view key, T fallback, Pred is_type) const {
        const json* value = find(section, key);
        return value != nullptr && is_type(*value) ? value->get<T>() : fallback;
    }

    template<typename T>
    void write(std::string_view section, std::string_view key, T&& value) {
        data[std::string(section)][std::string(key)] = std::forward<T>(value);
        dirty = true;
    }

    void apply_document(const json& document) {
        // Overlay on top of the defaults so a partial file stays valid
        data.merge_patch(document);
    }
};

Config::Config() : impl_(std::make_unique<Impl>()) {
    set_defaults();
}

Config::~Config() = default;

Config::Config(Config&&) noexcept = default;
Config& Config::operator=(Config&&) noexcept = default;

bool Config::load(const std::filesystem::path& path) {
    auto content = platform::FileSystem::read_text(path);
    if (!content) {
        HEXFORGE_LOG_ERROR(log_category::CONFIG, "Failed to read config file: {}", path.string());
        return false;
    }

    if (!load_from_string(*content)) {
        HEXFORGE_LOG_ERROR(log_category::CONFIG, "Rejected config file: {}", path.string());
        return false;
    }

    impl_->path = path;
    impl_->dirty = false;
    HEXFORGE_LOG_INFO(log_category::CONFIG, "Loaded config from: {}", path.string());
    return true;
}

bool Config::load_from_string(std::string_view json_text) {
    try {
        auto document = json::parse(json_text);
        if (!document.is_object()) {
            HEXFORGE_LOG_ERROR(log_category::CONFIG, "Config root must be a JSON object");
            return false;
        }
        impl_->apply_document(document);
        impl_->dirty = true;
        return true;
    } catch (const json::parse_error& e) {
        HEXFORGE_LOG_ERROR(log_category::CONFIG, "Failed to parse config: {}", e.what());
        return false;
    }
}

bool Config::save(const std::filesystem::path& path) const {
    std::string content = impl_->data.dump(4);

    if (!platform::FileSystem::write_text(path, content)) {
        HEXFORGE_LOG_ERROR(log_category::CONFIG, "Failed to write config file: {}", path.string());
        return false;
    }

    HEXFORGE_LOG_INFO(log_category::CONFIG, "Saved config to: {}", path.string());
    return true;
}

bool Config::load_or_create_default(const std::filesystem::path& path) {
    if (platform::FileSystem::exists(path)) {
        return load(path);
    }

    set_defaults();
    impl_->path = path;

    if (!save(path)) {
        HEXFORGE_LOG_WARN(log_category::CONFIG, "Failed to save default config, using in-memory defaults");
    }

    return true;
}

std::filesystem::path Config::get_path() const {
    return impl_->path;
}

int Config::get_int(std::string_view section, std::string_view key, int default_value) const {
    const int64_t value = get_int64(section, key, default_value);
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
        HEXFORGE_LOG_WARN(log_category::CONFIG, "{}.{} = {} does not fit an int, using {}", section, key, value,
                          default_value);
        return default_value;
    }
    return static_cast<int>(value);
}

int64_t Config::get_int64(std::string_view section, std::string_view key, int64_t default_value) const {
    const json* value = impl_->find(section, key);
    if (value == nullptr || !value->is_number_integer()) {
        return default_value;
    }
    if (value->is_number_unsigned()) {
        // get<int64_t>() would wrap values above INT64_MAX
        const auto raw = value->get<uint64_t>();
        constexpr auto limit = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
        return raw > limit ? std::numeric_limits<int64_t>::max() : static_cast<int64_t>(raw);
    }
    return value->get<int64_t>();
}

double Config::get_double(std::string_view section, std::string_view key, double default_value) const {
    // Integers written by hand ("radius": 7) are accepted as doubles
    return impl_->read(section, key, default_value, [](const json& v) { return v.is_number(); });
}

bool Config::get_bool(std::string_view section, std::string_view key, bool default_value) const {
    return impl_->read(section, key, default_value, [](const json& v) { return v.is_boolean(); });
}

std::string Config::get_string(std::string_view section, std::string_view key,
                               std::string_view default_value) const {
    return impl_->read(section, key, std::string(default_value), [](const json& v) { return v.is_string(); });
}

void Config::set_int(std::string_view section, std::string_view key, int value) {
    impl_->write(section, key, value);
}

void Config::set_double(std::string_view section, std::string_view key, double value) {
    impl_->write(section, key, value);
}

void Config::set_bool(std::string_view section, std::string_view key, bool value) {
    impl_->write(section, key, value);
}

void Config::set_string(std::string_view section, std::string_view key, std::string_view value) {
    impl_->write(section, key, std::string(value));
}

bool Config::has(std::string_view section, std::string_view key) const {
    return impl_->find(section, key) != nullptr;
}

bool Config::has_section(std::string_view section) const {
    return impl_->data.contains(std::string(section));
}

bool Config::is_dirty() const {
    return impl_->dirty;
}

void Config::mark_clean() {
    impl_->dirty = false;
}

void Config::set_defaults() {
    using namespace config_section;
    using namespace config_key;

    impl_->data = json{
        {PLATFORM, {{RADIUS, 7.0}, {HEIGHT, 0.5}, {SIDES, 6}, {BEVEL_WIDTH, 0.08}, {BEVEL_SEGMENTS, 2}}},
        {RINGS,
         {{OUTER_RADIUS, 5.5},
          {MIDDLE_RADIUS, 3.5},
          {INNER_RADIUS, 1.8},
          {THICKNESS, 0.3},
          {HEIGHT, 0.025},
          {CARVE_EPSILON, 0.08},
          {CIRCLE_SEGMENTS, 48}}},
        {PILLARS,
         {{COUNT, 6}, {HEIGHT, 3.0}, {RADIUS, 0.35}, {INSET, 0.7}, {TAPER_END_SCALE, 0.85}, {FIRE_SPHERES, 3}}},
        {DECORATIONS,
         {{RUNES_PER_RING, 6},
          {SPIKES_PER_EDGE, 3},
          {SKULL_COUNT, 8},
          {SKULL_SCATTER_RADIUS, 4.8},
          {HORN_COUNT, 6},
          {CRACK_COUNT, 8},
          {CHAIN_LINKS, 12},
          {CHAIN_SAG, 0.3}}},
        {FEATURES, {{RUNES, false}, {CHAINS, false}, {LAVA_CRACKS, false}, {RUNE_BEAMS, false}}},
        {GENERATION, {{SEED, 42}}},
        {OUTPUT, {{PATH, "boss_platform.glb"}, {EXPORT_LIGHTS, false}}},
        {DEBUG, {{LOG_LEVEL, "info"}}}};
    impl_->dirty = true;
}

}  // namespace hexforge::core
