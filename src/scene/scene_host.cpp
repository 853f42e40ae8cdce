// HexForge Scene
// scene_host.cpp - Scoped ownership of temporary host nodes

#include <hexforge/core/errors.hpp>
#include <hexforge/core/logger.hpp>
#include <hexforge/scene/scene_host.hpp>

namespace hexforge::scene {

ScopedNode::~ScopedNode() {
    if (!node_.valid()) {
        return;
    }
    try {
        host_.destroy(node_);
    } catch (const core::HostOperationError& e) {
        // Destructors must not throw; the node is already gone or never existed
        HEXFORGE_LOG_WARN(core::log_category::SCENE, "Failed to destroy temporary node {}: {}", node_.id, e.what());
    }
}

NodeHandle ScopedNode::release() {
    NodeHandle node = node_;
    node_ = INVALID_NODE;
    return node;
}

void ScopedNode::reset() {
    if (node_.valid()) {
        NodeHandle node = release();
        host_.destroy(node);
    }
}

}  // namespace hexforge::scene
