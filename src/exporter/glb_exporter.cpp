// HexForge Exporter
// glb_exporter.cpp - glTF 2.0 binary export of an assembled scene

#include <cmath>
#include <cstring>
#include <fmt/format.h>
#include <glm/gtc/quaternion.hpp>
#include <hexforge/core/logger.hpp>
#include <hexforge/exporter/glb_exporter.hpp>
#include <hexforge/platform/file_io.hpp>
#include <map>
#include <nlohmann/json.hpp>

namespace hexforge::exporter {

using scene::MaterialId;
using scene::NodeHandle;
using scene::NodeKind;
using scene::SceneNode;

namespace {

// glTF enums
constexpr int COMPONENT_UNSIGNED_INT = 5125;
constexpr int COMPONENT_FLOAT = 5126;
constexpr int TARGET_ARRAY_BUFFER = 34962;
constexpr int TARGET_ELEMENT_ARRAY_BUFFER = 34963;
constexpr int MODE_TRIANGLES = 4;

constexpr const char* EXT_EMISSIVE_STRENGTH = "KHR_materials_emissive_strength";
constexpr const char* EXT_LIGHTS = "KHR_lights_punctual";

// Radiant watts to luminous quantities at the photopic peak
constexpr double WATTS_TO_LUMENS = 683.0;

// Vertex streams ready for upload: positions and normals share indices
struct ShadedMesh {
    std::vector<glm::vec3> positions;
    std::vector<glm::vec3> normals;
    std::vector<uint32_t> indices;
};

glm::dvec3 face_normal(const glm::dvec3& a, const glm::dvec3& b, const glm::dvec3& c) {
    // Unnormalized: its length is twice the triangle area
    return glm::cross(b - a, c - a);
}

glm::vec3 safe_normalize(const glm::dvec3& n) {
    const double length = glm::length(n);
    return length > 0.0 ? glm::vec3(n / length) : glm::vec3(0.0f, 0.0f, 1.0f);
}

ShadedMesh shade(const geometry::MeshData& mesh, bool smooth) {
    ShadedMesh out;

    if (smooth) {
        // Area-weighted vertex normals over shared vertices
        std::vector<glm::dvec3> accum(mesh.vertices.size(), glm::dvec3(0.0));
        for (size_t f = 0; f + 2 < mesh.indices.size(); f += 3) {
            const uint32_t a = mesh.indices[f];
            const uint32_t b = mesh.indices[f + 1];
            const uint32_t c = mesh.indices[f + 2];
            const glm::dvec3 n = face_normal(mesh.vertices[a], mesh.vertices[b], mesh.vertices[c]);
            accum[a] += n;
            accum[b] += n;
            accum[c] += n;
        }
        out.positions.reserve(mesh.vertices.size());
        out.normals.reserve(mesh.vertices.size());
        for (size_t i = 0; i < mesh.vertices.size(); ++i) {
            out.positions.emplace_back(mesh.vertices[i]);
            out.normals.push_back(safe_normalize(accum[i]));
        }
        out.indices = mesh.indices;
        return out;
    }

    // Flat: every triangle gets its own three vertices
    out.positions.reserve(mesh.indices.size());
    out.normals.reserve(mesh.indices.size());
    out.indices.reserve(mesh.indices.size());
    for (size_t f = 0; f + 2 < mesh.indices.size(); f += 3) {
        const glm::dvec3& a = mesh.vertices[mesh.indices[f]];
        const glm::dvec3& b = mesh.vertices[mesh.indices[f + 1]];
        const glm::dvec3& c = mesh.vertices[mesh.indices[f + 2]];
        const glm::vec3 n = safe_normalize(face_normal(a, b, c));
        for (const auto* v : {&a, &b, &c}) {
            out.indices.push_back(static_cast<uint32_t>(out.positions.size()));
            out.positions.emplace_back(*v);
            out.normals.push_back(n);
        }
    }
    return out;
}

void append_u32(std::vector<uint8_t>& out, uint32_t value) {
    for (int shift = 0; shift < 32; shift += 8) {
        out.push_back(static_cast<uint8_t>((value >> shift) & 0xFFu));
    }
}

nlohmann::json to_json(const glm::dvec3& v) {
    return nlohmann::json::array({v.x, v.y, v.z});
}

// Walks the scene once and fills the glTF document and the BIN chunk
class DocumentBuilder {
public:
    DocumentBuilder(const scene::MemoryScene& scene, const ExportOptions& options, ExportStats& stats)
        : scene_(scene), options_(options), stats_(stats) {
        gltf_["asset"] = {{"version", "2.0"}, {"generator", options.generator}};
        gltf_["nodes"] = nlohmann::json::array();
        gltf_["meshes"] = nlohmann::json::array();
        gltf_["materials"] = nlohmann::json::array();
        gltf_["accessors"] = nlohmann::json::array();
        gltf_["bufferViews"] = nlohmann::json::array();
    }

    nlohmann::json finish(int root_index) {
        gltf_["scenes"] = nlohmann::json::array({{{"name", "Scene"}, {"nodes", nlohmann::json::array({root_index})}}});
        gltf_["scene"] = 0;
        gltf_["buffers"] = nlohmann::json::array({{{"byteLength", bin_.size()}}});

        nlohmann::json used = nlohmann::json::array();
        if (uses_emissive_strength_) {
            used.push_back(EXT_EMISSIVE_STRENGTH);
        }
        if (!lights_.empty()) {
            used.push_back(EXT_LIGHTS);
            gltf_["extensions"][EXT_LIGHTS]["lights"] = lights_;
        }
        if (!used.empty()) {
            gltf_["extensionsUsed"] = used;
        }

        stats_.material_count = material_indices_.size();
        return std::move(gltf_);
    }

    std::vector<uint8_t>& bin() { return bin_; }

    // Pre-order traversal; returns the node's glTF index, or -1 when skipped
    int add_node(NodeHandle handle) {
        const SceneNode& node = scene_.node(handle);
        if (node.kind == NodeKind::Light && !options_.export_lights) {
            return -1;
        }

        const int index = static_cast<int>(gltf_["nodes"].size());
        gltf_["nodes"].push_back(node_json(node));
        ++stats_.node_count;

        if (node.kind == NodeKind::Mesh) {
            node_at(index)["mesh"] = add_mesh(node);
        } else if (node.kind == NodeKind::Light) {
            node_at(index)["extensions"][EXT_LIGHTS]["light"] = add_light(node);
        }

        nlohmann::json children = nlohmann::json::array();
        for (const auto& child : node.children) {
            const int child_index = add_node(child);
            if (child_index >= 0) {
                children.push_back(child_index);
            }
        }
        if (!children.empty()) {
            node_at(index)["children"] = children;
        }
        return index;
    }

private:
    nlohmann::json& node_at(int index) { return gltf_["nodes"][static_cast<size_t>(index)]; }

    static nlohmann::json node_json(const SceneNode& node) {
        nlohmann::json json;
        json["name"] = node.name;

        const auto& pose = node.pose;
        if (pose.position != glm::dvec3(0.0)) {
            json["translation"] = to_json(pose.position);
        }
        if (pose.rotation != glm::dvec3(0.0)) {
            // XYZ Euler: R = Rz * Ry * Rx
            const glm::dquat q = glm::angleAxis(pose.rotation.z, glm::dvec3(0.0, 0.0, 1.0)) *
                                 glm::angleAxis(pose.rotation.y, glm::dvec3(0.0, 1.0, 0.0)) *
                                 glm::angleAxis(pose.rotation.x, glm::dvec3(1.0, 0.0, 0.0));
            json["rotation"] = {q.x, q.y, q.z, q.w};
        }
        if (pose.scale != glm::dvec3(1.0)) {
            json["scale"] = to_json(pose.scale);
        }
        return json;
    }

    // Appends raw bytes at a 4-byte aligned offset and returns the bufferView index
    int add_buffer_view(const void* data, size_t size, int target) {
        while (bin_.size() % 4 != 0) {
            bin_.push_back(0);
        }
        const size_t offset = bin_.size();
        bin_.resize(offset + size);
        if (size > 0) {
            std::memcpy(bin_.data() + offset, data, size);
        }

        const int index = static_cast<int>(gltf_["bufferViews"].size());
        gltf_["bufferViews"].push_back(
            {{"buffer", 0}, {"byteOffset", offset}, {"byteLength", size}, {"target", target}});
        return index;
    }

    int add_accessor(nlohmann::json accessor) {
        const int index = static_cast<int>(gltf_["accessors"].size());
        gltf_["accessors"].push_back(std::move(accessor));
        return index;
    }

    int add_mesh(const SceneNode& node) {
        const ShadedMesh shaded = shade(node.mesh, node.smooth_shading);
        stats_.vertex_count += shaded.positions.size();
        ++stats_.mesh_count;

        glm::vec3 min(0.0f);
        glm::vec3 max(0.0f);
        if (!shaded.positions.empty()) {
            min = max = shaded.positions.front();
            for (const auto& p : shaded.positions) {
                min = glm::min(min, p);
                max = glm::max(max, p);
            }
        }

        const int indices_view = add_buffer_view(shaded.indices.data(), shaded.indices.size() * sizeof(uint32_t),
                                                 TARGET_ELEMENT_ARRAY_BUFFER);
        const int positions_view = add_buffer_view(shaded.positions.data(),
                                                   shaded.positions.size() * sizeof(glm::vec3), TARGET_ARRAY_BUFFER);
        const int normals_view = add_buffer_view(shaded.normals.data(), shaded.normals.size() * sizeof(glm::vec3),
                                                 TARGET_ARRAY_BUFFER);

        const int indices_accessor = add_accessor({{"bufferView", indices_view},
                                                   {"componentType", COMPONENT_UNSIGNED_INT},
                                                   {"count", shaded.indices.size()},
                                                   {"type", "SCALAR"}});
        const int positions_accessor = add_accessor({{"bufferView", positions_view},
                                                     {"componentType", COMPONENT_FLOAT},
                                                     {"count", shaded.positions.size()},
                                                     {"type", "VEC3"},
                                                     {"min", {min.x, min.y, min.z}},
                                                     {"max", {max.x, max.y, max.z}}});
        const int normals_accessor = add_accessor({{"bufferView", normals_view},
                                                   {"componentType", COMPONENT_FLOAT},
                                                   {"count", shaded.normals.size()},
                                                   {"type", "VEC3"}});

        nlohmann::json primitive;
        primitive["attributes"]["POSITION"] = positions_accessor;
        primitive["attributes"]["NORMAL"] = normals_accessor;
        primitive["indices"] = indices_accessor;
        primitive["material"] = material_index(node.material);
        primitive["mode"] = MODE_TRIANGLES;

        const int index = static_cast<int>(gltf_["meshes"].size());
        gltf_["meshes"].push_back({{"name", node.name}, {"primitives", nlohmann::json::array({primitive})}});
        return index;
    }

    int material_index(MaterialId id) {
        auto it = material_indices_.find(id);
        if (it != material_indices_.end()) {
            return it->second;
        }

        const auto& material = scene::MaterialLibrary::get(id);
        nlohmann::json json;
        json["name"] = material.name;
        json["pbrMetallicRoughness"] = {
            {"baseColorFactor", {material.base_color.r, material.base_color.g, material.base_color.b, 1.0}},
            {"metallicFactor", material.metallic},
            {"roughnessFactor", material.roughness}};
        if (material.is_emissive()) {
            json["emissiveFactor"] = to_json(material.emissive_color);
            json["extensions"][EXT_EMISSIVE_STRENGTH]["emissiveStrength"] = material.emissive_strength;
            uses_emissive_strength_ = true;
        }

        const int index = static_cast<int>(gltf_["materials"].size());
        gltf_["materials"].push_back(std::move(json));
        material_indices_.emplace(id, index);
        return index;
    }

    int add_light(const SceneNode& node) {
        const auto& light = node.light;
        nlohmann::json json;
        json["name"] = node.name;
        json["color"] = to_json(light.color);

        switch (light.kind) {
            case scene::LightKind::Point:
                json["type"] = "point";
                json["intensity"] = light.intensity * WATTS_TO_LUMENS / (4.0 * geometry::PI);  // candela
                break;
            case scene::LightKind::Spot:
                json["type"] = "spot";
                json["intensity"] = light.intensity * WATTS_TO_LUMENS / (4.0 * geometry::PI);
                json["spot"] = nlohmann::json::object();
                break;
            case scene::LightKind::Sun:
                json["type"] = "directional";
                json["intensity"] = light.intensity * WATTS_TO_LUMENS;  // lux
                break;
        }

        const int index = static_cast<int>(lights_.size());
        lights_.push_back(std::move(json));
        ++stats_.light_count;
        return index;
    }

    const scene::MemoryScene& scene_;
    const ExportOptions& options_;
    ExportStats& stats_;

    nlohmann::json gltf_;
    nlohmann::json lights_ = nlohmann::json::array();
    std::vector<uint8_t> bin_;
    std::map<MaterialId, int> material_indices_;
    bool uses_emissive_strength_ = false;
};

}  // namespace

GlbExporter::GlbExporter(const ExportOptions& options) : options_(options) {}

std::vector<uint8_t> GlbExporter::serialize(const scene::MemoryScene& scene, NodeHandle root) {
    const SceneNode* root_node = scene.find(root);
    if (root_node == nullptr) {
        throw ExportError(fmt::format("Export root {} does not exist", root.id));
    }
    if (root_node->has_parent()) {
        throw ExportError(fmt::format("Export root '{}' is not a top-level node", root_node->name));
    }

    stats_ = {};
    DocumentBuilder builder(scene, options_, stats_);
    const int root_index = builder.add_node(root);
    if (root_index < 0) {
        throw ExportError(fmt::format("Export root '{}' is a light and lights are disabled", root_node->name));
    }
    std::vector<uint8_t>& bin = builder.bin();
    while (bin.size() % 4 != 0) {
        bin.push_back(0);
    }

    // JSON chunk is padded with spaces to a 4-byte boundary
    std::string json_text = builder.finish(root_index).dump();
    while (json_text.size() % 4 != 0) {
        json_text += ' ';
    }

    const auto total = static_cast<uint32_t>(glb::HEADER_SIZE + glb::CHUNK_HEADER_SIZE + json_text.size() +
                                             glb::CHUNK_HEADER_SIZE + bin.size());

    std::vector<uint8_t> out;
    out.reserve(total);
    append_u32(out, glb::MAGIC);
    append_u32(out, glb::VERSION);
    append_u32(out, total);

    append_u32(out, static_cast<uint32_t>(json_text.size()));
    append_u32(out, glb::CHUNK_JSON);
    out.insert(out.end(), json_text.begin(), json_text.end());

    append_u32(out, static_cast<uint32_t>(bin.size()));
    append_u32(out, glb::CHUNK_BIN);
    out.insert(out.end(), bin.begin(), bin.end());

    stats_.byte_size = out.size();
    return out;
}

bool GlbExporter::write(const scene::MemoryScene& scene, NodeHandle root, const std::filesystem::path& path) {
    const auto bytes = serialize(scene, root);

    if (path.has_parent_path() && !platform::FileSystem::create_directories(path.parent_path())) {
        HEXFORGE_LOG_ERROR(core::log_category::EXPORT, "Cannot create output directory: {}",
                           path.parent_path().string());
        return false;
    }
    if (!platform::FileSystem::write_binary_atomic(path, bytes)) {
        HEXFORGE_LOG_ERROR(core::log_category::EXPORT, "Failed to write asset: {}", path.string());
        return false;
    }

    HEXFORGE_LOG_INFO(core::log_category::EXPORT, "Exported {} ({} nodes, {} meshes, {} materials, {} bytes)",
                      path.string(), stats_.node_count, stats_.mesh_count, stats_.material_count, stats_.byte_size);
    return true;
}

}  // namespace hexforge::exporter
