// HexForge Generation
// parameter_set.hpp - Numeric configuration of one generation run

#pragma once

#include <cstdint>

namespace hexforge::core {
class Config;
}

namespace hexforge::generation {

// ============================================================================
// Parameter Set
// ============================================================================

/// Complete numeric input of one deterministic run. Built once, validated, and
/// shared read-only by every builder.
struct ParameterSet {
    struct PlatformParams {
        double radius = 7.0;
        double height = 0.5;
        uint32_t sides = 6;
        double bevel_width = 0.08;  // 0 disables the bevel
        uint32_t bevel_segments = 2;
    } platform;

    struct RingParams {
        double outer_radius = 5.5;
        double middle_radius = 3.5;
        double inner_radius = 1.8;
        double thickness = 0.3;
        double height = 0.025;
        double carve_epsilon = 0.08;   // Extra cutter depth past both caps
        uint32_t circle_segments = 48;  // Inner ring stays circular
    } rings;

    struct PillarParams {
        uint32_t count = 6;
        double height = 3.0;
        double radius = 0.35;
        double inset = 0.7;             // Distance from the platform rim
        double taper_end_scale = 0.85;  // Shaft scale at the top rim
        uint32_t fire_spheres = 3;      // 1 to 3
    } pillars;

    struct DecorationParams {
        uint32_t runes_per_ring = 6;
        uint32_t spikes_per_edge = 3;
        uint32_t skull_count = 8;
        double skull_scatter_radius = 4.8;
        uint32_t horn_count = 6;
        uint32_t crack_count = 8;
        uint32_t chain_links = 12;
        double chain_sag = 0.3;
    } decorations;

    struct FeatureFlags {
        bool runes = false;
        bool chains = false;
        bool lava_cracks = false;
        bool rune_beams = false;
    } features;

    uint32_t seed = 42;

    /// Throws ParameterError naming the first violated constraint
    void validate() const;

    /// Radius of the circle the pillar anchors sit on
    [[nodiscard]] double pillar_ring_radius() const { return platform.radius - pillars.inset; }

    /// Reads every section of the config (missing keys keep their defaults) and validates
    [[nodiscard]] static ParameterSet from_config(const core::Config& config);
};

}  // namespace hexforge::generation
