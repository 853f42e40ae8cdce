// HexForge Generation
// primitive_factory.hpp - Validated primitive creation on a scene host

#pragma once

#include <hexforge/scene/scene_host.hpp>

#include <string_view>

namespace hexforge::generation {

using scene::MeshHandle;
using scene::NodeHandle;
using scene::Pose3;

class PrimitiveFactory {
public:
    explicit PrimitiveFactory(scene::SceneHost& host);

    /// Validates params (radius > 0, segments >= 3, ...) and creates the mesh.
    /// Invalid params raise ParameterError before the host is called.
    MeshHandle create(scene::PrimitiveKind kind, const scene::PrimitiveParams& params, const Pose3& pose,
                      std::string_view name);

    MeshHandle cylinder(uint32_t sides, double radius, double depth, const Pose3& pose, std::string_view name);
    MeshHandle cone(uint32_t sides, double bottom_radius, double top_radius, double depth, const Pose3& pose,
                    std::string_view name);
    MeshHandle icosphere(uint32_t subdivisions, double radius, const Pose3& pose, std::string_view name);
    MeshHandle uv_sphere(uint32_t segments, uint32_t rings, double radius, const Pose3& pose, std::string_view name);
    MeshHandle plane(double size, uint32_t cuts, const Pose3& pose, std::string_view name);

    /// Throws ParameterError when params are invalid for kind
    static void validate(scene::PrimitiveKind kind, const scene::PrimitiveParams& params);

    [[nodiscard]] scene::SceneHost& host() const { return host_; }
    [[nodiscard]] size_t created_count() const { return created_; }

private:
    scene::SceneHost& host_;
    size_t created_ = 0;
};

}  // namespace hexforge::generation
