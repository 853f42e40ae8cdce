// HexForge Generation
// scene_assembler.hpp - Final single-root hierarchy

#pragma once

#include <hexforge/scene/scene_host.hpp>

#include <string>

namespace hexforge::generation {

class SceneAssembler {
public:
    /// Marks every mesh smooth-shaded, creates one root anchor and parents every
    /// parentless node under it. Returns the root.
    static scene::NodeHandle assemble(scene::SceneHost& host, const std::string& root_name = "Boss_Platform");

private:
    SceneAssembler() = delete;
};

}  // namespace hexforge::generation
