// HexForge Generation
// build_context.hpp - Shared state handed to every composite builder

#pragma once

#include "parameter_set.hpp"
#include "primitive_factory.hpp"

#include <hexforge/geometry/types.hpp>

namespace hexforge::generation {

// Everything a builder may touch. The random engine is the only mutable
// input, so builders that draw from it must run in a fixed order.
struct BuildContext {
    scene::SceneHost& host;
    PrimitiveFactory& factory;
    const ParameterSet& params;
    geometry::RandomEngine& rng;

    // Tags a freshly created mesh and passes the handle through
    MeshHandle tagged(MeshHandle mesh, scene::MaterialId material) const {
        host.tag_material(mesh, material);
        return mesh;
    }
};

}  // namespace hexforge::generation
