// HexForge Generation
// parameter_set.cpp - Parameter validation and config binding

#include <fmt/format.h>
#include <hexforge/core/config.hpp>
#include <hexforge/core/errors.hpp>
#include <hexforge/core/logger.hpp>
#include <hexforge/generation/parameter_set.hpp>

#include <limits>

namespace hexforge::generation {

namespace {

void require(bool condition, std::string_view message) {
    if (!condition) {
        throw core::ParameterError(std::string(message));
    }
}

void require_positive(double value, std::string_view name) {
    if (!(value > 0.0)) {
        throw core::ParameterError(fmt::format("{} must be positive, got {}", name, value));
    }
}

void require_count(uint32_t value, uint32_t minimum, std::string_view name) {
    if (value < minimum) {
        throw core::ParameterError(fmt::format("{} must be at least {}, got {}", name, minimum, value));
    }
}

// Counts and the seed share the range [0, INT_MAX]; anything outside is a
// parameter error rather than a wrap-around
uint32_t read_count(const core::Config& config, std::string_view section, std::string_view key,
                    uint32_t default_value) {
    constexpr int64_t MAX_COUNT = std::numeric_limits<int>::max();
    const int64_t value = config.get_int64(section, key, default_value);
    if (value < 0) {
        throw core::ParameterError(fmt::format("{}.{} must not be negative, got {}", section, key, value));
    }
    if (value > MAX_COUNT) {
        throw core::ParameterError(
            fmt::format("{}.{} must not exceed {}, got {}", section, key, MAX_COUNT, value));
    }
    return static_cast<uint32_t>(value);
}

}  // namespace

void ParameterSet::validate() const {
    // Platform
    require_positive(platform.radius, "platform.radius");
    require_positive(platform.height, "platform.height");
    require_count(platform.sides, 3, "platform.sides");
    require(platform.bevel_width >= 0.0, "platform.bevel_width must not be negative");
    require(platform.bevel_width < platform.height * 0.5, "platform.bevel_width must be below half the height");
    if (platform.bevel_width > 0.0) {
        require_count(platform.bevel_segments, 1, "platform.bevel_segments");
    }

    // Rings
    require_positive(rings.outer_radius, "rings.outer_radius");
    require_positive(rings.middle_radius, "rings.middle_radius");
    require_positive(rings.inner_radius, "rings.inner_radius");
    require_positive(rings.thickness, "rings.thickness");
    require_positive(rings.height, "rings.height");
    require_positive(rings.carve_epsilon, "rings.carve_epsilon");
    require_count(rings.circle_segments, 3, "rings.circle_segments");
    if (!(rings.outer_radius > rings.middle_radius && rings.middle_radius > rings.inner_radius)) {
        throw core::ParameterError(fmt::format("Ring radii must satisfy outer > middle > inner, got {} / {} / {}",
                                               rings.outer_radius, rings.middle_radius, rings.inner_radius));
    }
    if (!(rings.inner_radius - rings.thickness > 0.0)) {
        throw core::ParameterError(fmt::format("rings.thickness {} leaves no hole in the inner ring of radius {}",
                                               rings.thickness, rings.inner_radius));
    }
    if (!(rings.outer_radius < platform.radius)) {
        throw core::ParameterError(fmt::format("rings.outer_radius {} must lie inside the platform radius {}",
                                               rings.outer_radius, platform.radius));
    }

    // Pillars
    require_count(pillars.count, 1, "pillars.count");
    require_positive(pillars.height, "pillars.height");
    require_positive(pillars.radius, "pillars.radius");
    require_positive(pillars.taper_end_scale, "pillars.taper_end_scale");
    require(pillars.inset >= 0.0, "pillars.inset must not be negative");
    require_positive(pillar_ring_radius(), "platform.radius - pillars.inset");
    if (pillars.fire_spheres < 1 || pillars.fire_spheres > 3) {
        throw core::ParameterError(
            fmt::format("pillars.fire_spheres must be between 1 and 3, got {}", pillars.fire_spheres));
    }

    // Decorations
    require_count(decorations.spikes_per_edge, 1, "decorations.spikes_per_edge");
    require_count(decorations.horn_count, 1, "decorations.horn_count");
    require_positive(decorations.skull_scatter_radius, "decorations.skull_scatter_radius");
    require(decorations.skull_scatter_radius < platform.radius,
            "decorations.skull_scatter_radius must lie inside the platform");
    if (features.runes) {
        require_count(decorations.runes_per_ring, 1, "decorations.runes_per_ring");
    }
    if (features.lava_cracks) {
        require_count(decorations.crack_count, 1, "decorations.crack_count");
    }
    if (features.chains) {
        require_count(pillars.count, 2, "pillars.count (chains)");
        require_count(decorations.chain_links, 1, "decorations.chain_links");
        require(decorations.chain_sag >= 0.0, "decorations.chain_sag must not be negative");
    }
}

ParameterSet ParameterSet::from_config(const core::Config& config) {
    namespace section = core::config_section;
    namespace key = core::config_key;

    ParameterSet params;

    params.platform.radius = config.get_double(section::PLATFORM, key::RADIUS, params.platform.radius);
    params.platform.height = config.get_double(section::PLATFORM, key::HEIGHT, params.platform.height);
    params.platform.sides = read_count(config, section::PLATFORM, key::SIDES, params.platform.sides);
    params.platform.bevel_width = config.get_double(section::PLATFORM, key::BEVEL_WIDTH, params.platform.bevel_width);
    params.platform.bevel_segments =
        read_count(config, section::PLATFORM, key::BEVEL_SEGMENTS, params.platform.bevel_segments);

    params.rings.outer_radius = config.get_double(section::RINGS, key::OUTER_RADIUS, params.rings.outer_radius);
    params.rings.middle_radius = config.get_double(section::RINGS, key::MIDDLE_RADIUS, params.rings.middle_radius);
    params.rings.inner_radius = config.get_double(section::RINGS, key::INNER_RADIUS, params.rings.inner_radius);
    params.rings.thickness = config.get_double(section::RINGS, key::THICKNESS, params.rings.thickness);
    params.rings.height = config.get_double(section::RINGS, key::HEIGHT, params.rings.height);
    params.rings.carve_epsilon = config.get_double(section::RINGS, key::CARVE_EPSILON, params.rings.carve_epsilon);
    params.rings.circle_segments =
        read_count(config, section::RINGS, key::CIRCLE_SEGMENTS, params.rings.circle_segments);

    params.pillars.count = read_count(config, section::PILLARS, key::COUNT, params.pillars.count);
    params.pillars.height = config.get_double(section::PILLARS, key::HEIGHT, params.pillars.height);
    params.pillars.radius = config.get_double(section::PILLARS, key::RADIUS, params.pillars.radius);
    params.pillars.inset = config.get_double(section::PILLARS, key::INSET, params.pillars.inset);
    params.pillars.taper_end_scale =
        config.get_double(section::PILLARS, key::TAPER_END_SCALE, params.pillars.taper_end_scale);
    params.pillars.fire_spheres = read_count(config, section::PILLARS, key::FIRE_SPHERES, params.pillars.fire_spheres);

    auto& deco = params.decorations;
    deco.runes_per_ring = read_count(config, section::DECORATIONS, key::RUNES_PER_RING, deco.runes_per_ring);
    deco.spikes_per_edge = read_count(config, section::DECORATIONS, key::SPIKES_PER_EDGE, deco.spikes_per_edge);
    deco.skull_count = read_count(config, section::DECORATIONS, key::SKULL_COUNT, deco.skull_count);
    deco.skull_scatter_radius =
        config.get_double(section::DECORATIONS, key::SKULL_SCATTER_RADIUS, deco.skull_scatter_radius);
    deco.horn_count = read_count(config, section::DECORATIONS, key::HORN_COUNT, deco.horn_count);
    deco.crack_count = read_count(config, section::DECORATIONS, key::CRACK_COUNT, deco.crack_count);
    deco.chain_links = read_count(config, section::DECORATIONS, key::CHAIN_LINKS, deco.chain_links);
    deco.chain_sag = config.get_double(section::DECORATIONS, key::CHAIN_SAG, deco.chain_sag);

    params.features.runes = config.get_bool(section::FEATURES, key::RUNES, params.features.runes);
    params.features.chains = config.get_bool(section::FEATURES, key::CHAINS, params.features.chains);
    params.features.lava_cracks = config.get_bool(section::FEATURES, key::LAVA_CRACKS, params.features.lava_cracks);
    params.features.rune_beams = config.get_bool(section::FEATURES, key::RUNE_BEAMS, params.features.rune_beams);

    params.seed = read_count(config, section::GENERATION, key::SEED, params.seed);

    params.validate();
    HEXFORGE_LOG_DEBUG(core::log_category::CONFIG, "Parameter set loaded (radius {}, {} pillars, seed {})",
                       params.platform.radius, params.pillars.count, params.seed);
    return params;
}

}  // namespace hexforge::generation
