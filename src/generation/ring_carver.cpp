// HexForge Generation
// ring_carver.cpp - Annular rings cut out of prisms by boolean difference

#include <fmt/format.h>
#include <hexforge/core/errors.hpp>
#include <hexforge/core/logger.hpp>
#include <hexforge/generation/ring_carver.hpp>

namespace hexforge::generation {

RingCarver::RingCarver(PrimitiveFactory& factory) : factory_(factory) {}

MeshHandle RingCarver::carve(const RingSpec& spec) {
    if (!(spec.thickness > 0.0)) {
        throw core::ParameterError(fmt::format("Ring '{}' thickness must be positive, got {}", spec.name,
                                               spec.thickness));
    }
    if (!(spec.inner_radius() > 0.0)) {
        throw core::ParameterError(fmt::format("Ring '{}' thickness {} consumes the whole radius {}", spec.name,
                                               spec.thickness, spec.outer_radius));
    }
    if (!(spec.epsilon > 0.0)) {
        throw core::ParameterError(fmt::format("Ring '{}' cutter overextension must be positive, got {}", spec.name,
                                               spec.epsilon));
    }

    const Pose3 pose{.position = {0.0, 0.0, spec.center_z}, .rotation = {0.0, 0.0, spec.yaw}};

    MeshHandle outer = factory_.cylinder(spec.sides, spec.outer_radius, spec.height, pose, spec.name);
    scene::ScopedNode inner(factory_.host(), factory_.cylinder(spec.sides, spec.inner_radius(),
                                                               spec.height + spec.epsilon, pose, spec.name + "_Cutter"));

    MeshHandle ring = factory_.host().boolean_difference(outer, inner.get());
    inner.reset();

    HEXFORGE_LOG_DEBUG(core::log_category::GEOMETRY, "Carved ring '{}' ({} sides, r {} - {})", spec.name, spec.sides,
                       spec.outer_radius, spec.inner_radius());
    return ring;
}

}  // namespace hexforge::generation
