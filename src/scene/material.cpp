// HexForge Scene
// material.cpp - Dark fantasy palette

#include <hexforge/scene/material.hpp>

#include <utility>

namespace hexforge::scene {

namespace {

std::array<Material, static_cast<size_t>(MaterialId::Count)> build_palette() {
    std::array<Material, static_cast<size_t>(MaterialId::Count)> palette;

    auto set = [&palette](MaterialId id, Material material) {
        palette[static_cast<size_t>(id)] = std::move(material);
    };

    set(MaterialId::None, {.name = "Default", .base_color = {0.8, 0.8, 0.8}, .roughness = 0.5});

    // Stone and metal, bright enough to read against a black background
    set(MaterialId::FloorStone, {.name = "Floor_Stone", .base_color = {0.35, 0.32, 0.38}, .roughness = 0.85});
    set(MaterialId::Obsidian,
        {.name = "Obsidian", .base_color = {0.25, 0.22, 0.30}, .roughness = 0.3, .metallic = 0.1});
    set(MaterialId::DarkMetal,
        {.name = "Dark_Metal", .base_color = {0.45, 0.35, 0.25}, .roughness = 0.4, .metallic = 0.8});
    set(MaterialId::AltarStone, {.name = "Altar_Stone", .base_color = {0.2, 0.15, 0.22}, .roughness = 0.7});
    set(MaterialId::Spike, {.name = "Spike", .base_color = {0.18, 0.15, 0.2}, .roughness = 0.8});
    set(MaterialId::Bone, {.name = "Bone", .base_color = {0.7, 0.65, 0.55}, .roughness = 0.6});

    // Glowing materials keep a low emissive strength so tone mapping preserves the hue
    set(MaterialId::RitualGlow, {.name = "Ritual_Glow",
                                 .base_color = {0.9, 0.2, 0.1},
                                 .roughness = 0.3,
                                 .emissive_color = {1.0, 0.15, 0.05},
                                 .emissive_strength = 2.0});
    set(MaterialId::Fire, {.name = "Fire",
                           .base_color = {1.0, 0.5, 0.15},
                           .roughness = 0.5,
                           .emissive_color = {1.0, 0.4, 0.1},
                           .emissive_strength = 2.5});
    set(MaterialId::Crystal, {.name = "Crystal",
                              .base_color = {0.6, 0.3, 0.9},
                              .roughness = 0.2,
                              .emissive_color = {0.5, 0.2, 1.0},
                              .emissive_strength = 2.0});
    set(MaterialId::SoulOrb, {.name = "Soul_Orb",
                              .base_color = {1.0, 0.4, 0.1},
                              .roughness = 0.2,
                              .emissive_color = {1.0, 0.35, 0.1},
                              .emissive_strength = 3.0});
    set(MaterialId::Lava, {.name = "Lava",
                           .base_color = {1.0, 0.35, 0.1},
                           .roughness = 0.35,
                           .emissive_color = {1.0, 0.35, 0.1},
                           .emissive_strength = 4.0});
    set(MaterialId::Rune, {.name = "Rune",
                           .base_color = {0.8, 0.1, 0.05},
                           .roughness = 0.4,
                           .emissive_color = {1.0, 0.2, 0.05},
                           .emissive_strength = 2.0});

    return palette;
}

}  // namespace

const Material& MaterialLibrary::get(MaterialId id) {
    static const auto palette = build_palette();
    auto index = static_cast<size_t>(id);
    if (index >= palette.size()) {
        index = 0;
    }
    return palette[index];
}

const char* MaterialLibrary::name_of(MaterialId id) {
    return get(id).name.c_str();
}

}  // namespace hexforge::scene
