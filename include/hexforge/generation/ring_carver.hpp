// HexForge Generation
// ring_carver.hpp - Annular rings cut out of prisms by boolean difference

#pragma once

#include "primitive_factory.hpp"

#include <string>

namespace hexforge::generation {

struct RingSpec {
    double outer_radius = 1.0;
    double thickness = 0.1;
    double height = 0.05;
    uint32_t sides = 6;     // 6 for a hexagonal ring, large for a circular one
    double yaw = 0.0;       // Orientation of both polygons
    double epsilon = 0.08;  // Extra cutter depth, split over both caps
    double center_z = 0.0;  // Height of the ring's mid-plane
    std::string name = "Ring";

    [[nodiscard]] double inner_radius() const { return outer_radius - thickness; }
};

class RingCarver {
public:
    explicit RingCarver(PrimitiveFactory& factory);

    /// Builds the outer prism, cuts a coaxial inner prism of radius
    /// outer_radius - thickness and depth height + epsilon out of it, and
    /// destroys the cutter. thickness <= 0 or a non-positive inner radius
    /// raise ParameterError before any host call.
    MeshHandle carve(const RingSpec& spec);

private:
    PrimitiveFactory& factory_;
};

}  // namespace hexforge::generation
