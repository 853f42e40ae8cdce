// HexForge Scene
// material.hpp - PBR material palette (base color, roughness, metallic, emissive only)

#pragma once

#include <glm/glm.hpp>

#include <array>
#include <cstdint>
#include <string>

namespace hexforge::scene {

enum class MaterialId : uint8_t {
    None = 0,
    FloorStone,
    Obsidian,
    DarkMetal,
    RitualGlow,
    Fire,
    Crystal,
    AltarStone,
    Spike,
    Bone,
    SoulOrb,
    Lava,
    Rune,
    Count
};

// Interchange-safe material: no procedural shader graph, only the channels a
// glTF metallic-roughness material can carry.
struct Material {
    std::string name;
    glm::dvec3 base_color{1.0};
    double roughness = 0.5;
    double metallic = 0.0;
    glm::dvec3 emissive_color{0.0};
    double emissive_strength = 0.0;

    [[nodiscard]] bool is_emissive() const { return emissive_strength > 0.0; }
};

class MaterialLibrary {
public:
    [[nodiscard]] static const Material& get(MaterialId id);
    [[nodiscard]] static const char* name_of(MaterialId id);

private:
    MaterialLibrary() = delete;
};

}  // namespace hexforge::scene
