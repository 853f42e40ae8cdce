// HexForge Generation
// scene_assembler.cpp - Final single-root hierarchy

#include <hexforge/core/logger.hpp>
#include <hexforge/generation/scene_assembler.hpp>

namespace hexforge::generation {

scene::NodeHandle SceneAssembler::assemble(scene::SceneHost& host, const std::string& root_name) {
    for (const auto& mesh : host.mesh_nodes()) {
        host.set_smooth_shading(mesh, true);
    }

    // Collected before the root exists so it is not parented to itself
    const auto top_level = host.top_level_nodes();
    const scene::NodeHandle root = host.create_empty_anchor(scene::Pose3{}, root_name);
    for (const auto& node : top_level) {
        host.set_parent(node, root);
    }

    HEXFORGE_LOG_DEBUG(core::log_category::SCENE, "Assembled '{}' with {} direct children", root_name,
                       top_level.size());
    return root;
}

}  // namespace hexforge::generation
