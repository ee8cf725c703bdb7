#include "octree.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace splatquery {

Octree::Octree(const Vec3f& center, float half_extent, const OctreeConfig& config)
    : config_(config)
{
    OctreeNode root;
    root.center = center;
    root.half_extent = half_extent;
    const Vec3f h(half_extent, half_extent, half_extent);
    root.box = BBox(center - h, center + h);
    nodes_.push_back(std::move(root));
}

Octree Octree::from_bounds(const BBox& bbox, const OctreeConfig& config) {
    if (!bbox.valid()) {
        throw std::invalid_argument("Cannot build an octree from empty bounds");
    }
    // Slightly enlarged so the max corner survives float rounding
    float half_extent = bbox.largest_side() * 0.5f * (1.0f + 1e-5f);
    half_extent = std::max(half_extent, config.min_half_extent);
    return Octree(bbox.center(), half_extent, config);
}

Octree Octree::from_geometry(const GeometryBuffer& geometry, const OctreeConfig& config) {
    Octree tree = from_bounds(geometry.compute_bbox(), config);
    tree.insert_all(geometry);
    return tree;
}

uint32_t Octree::child_for(const OctreeNode& node, const Vec3f& p) const {
    uint32_t octant = (p.x >= node.center.x ? 1u : 0u) |
                      (p.y >= node.center.y ? 2u : 0u) |
                      (p.z >= node.center.z ? 4u : 0u);
    return node.first_child + octant;
}

bool Octree::can_split(const OctreeNode& node) const {
    if (node.half_extent <= config_.min_half_extent) {
        return false;
    }
    // Far from the origin the float spacing can outgrow the cell; stop once
    // a child centre would collapse onto a face
    for (int axis = 0; axis < 3; ++axis) {
        const float lo = node.box.min[axis];
        const float c = node.center[axis];
        const float hi = node.box.max[axis];
        const float lo_mid = lo + (c - lo) * 0.5f;
        const float hi_mid = c + (hi - c) * 0.5f;
        if (!(lo < lo_mid && lo_mid < c && c < hi_mid && hi_mid < hi)) {
            return false;
        }
    }
    return true;
}

void Octree::split(uint32_t node_id) {
    const uint32_t first = static_cast<uint32_t>(nodes_.size());
    const BBox box = nodes_[node_id].box;
    const Vec3f center = nodes_[node_id].center;
    const float h = nodes_[node_id].half_extent * 0.5f;

    for (uint32_t i = 0; i < 8; ++i) {
        OctreeNode child;
        for (int axis = 0; axis < 3; ++axis) {
            const bool upper = (i >> axis) & 1u;
            child.box.min[axis] = upper ? center[axis] : box.min[axis];
            child.box.max[axis] = upper ? box.max[axis] : center[axis];
            child.center[axis] = child.box.min[axis] + (child.box.max[axis] - child.box.min[axis]) * 0.5f;
        }
        child.half_extent = h;
        nodes_.push_back(std::move(child));
    }

    // nodes_ may have reallocated; index afresh
    std::vector<PointRef> points = std::move(nodes_[node_id].points);
    nodes_[node_id].points = std::vector<PointRef>();
    nodes_[node_id].first_child = first;

    const OctreeNode& parent = nodes_[node_id];
    for (const auto& p : points) {
        nodes_[child_for(parent, p.position)].points.push_back(p);
    }
}

bool Octree::insert(const PointRef& point) {
    if (!nodes_[0].bounds().contains(point.position)) {
        return false;
    }

    uint32_t id = 0;
    while (!nodes_[id].is_leaf()) {
        id = child_for(nodes_[id], point.position);
    }
    nodes_[id].points.push_back(point);
    ++point_count_;

    // A split can leave a child over budget when points cluster; keep splitting
    std::vector<uint32_t> pending{id};
    while (!pending.empty()) {
        uint32_t n = pending.back();
        pending.pop_back();

        const OctreeNode& node = nodes_[n];
        if (node.points.size() <= config_.max_points_per_node || !can_split(node)) {
            continue;
        }
        split(n);
        const uint32_t first = nodes_[n].first_child;
        for (uint32_t c = 0; c < 8; ++c) {
            pending.push_back(first + c);
        }
    }
    return true;
}

size_t Octree::insert_all(const GeometryBuffer& geometry) {
    size_t inserted = 0;
    for (size_t i = 0; i < geometry.vertex_count(); ++i) {
        if (insert(PointRef(geometry.position(i), static_cast<uint32_t>(i)))) {
            ++inserted;
        }
    }
    return inserted;
}

std::vector<PointRef> Octree::query_radius(const Vec3f& position, float radius) const {
    std::vector<PointRef> result;
    if (!(radius >= 0.0f)) {
        return result;
    }
    const float r2 = radius * radius;

    std::vector<uint32_t> stack{0};
    while (!stack.empty()) {
        const OctreeNode& node = nodes_[stack.back()];
        stack.pop_back();

        // Closest point of the cube to the sphere centre
        BBox box = node.bounds();
        Vec3f closest(clamp(position.x, box.min.x, box.max.x),
                      clamp(position.y, box.min.y, box.max.y),
                      clamp(position.z, box.min.z, box.max.z));
        if (distance_squared(position, closest) > r2) {
            continue;
        }

        if (node.is_leaf()) {
            for (const auto& p : node.points) {
                if (distance_squared(position, p.position) <= r2) {
                    result.push_back(p);
                }
            }
        } else {
            for (uint32_t c = 8; c-- > 0;) {
                stack.push_back(node.first_child + c);
            }
        }
    }
    return result;
}

void Octree::collect_lod(uint32_t node_id, size_t stride, std::vector<PointRef>& out) const {
    size_t counter = 0;
    std::vector<uint32_t> stack{node_id};
    while (!stack.empty()) {
        const OctreeNode& node = nodes_[stack.back()];
        stack.pop_back();

        if (node.is_leaf()) {
            for (const auto& p : node.points) {
                if (counter++ % stride == 0) {
                    out.push_back(p);
                }
            }
        } else {
            for (uint32_t c = 8; c-- > 0;) {
                stack.push_back(node.first_child + c);
            }
        }
    }
}

std::vector<PointRef> Octree::query_frustum(const Frustum& frustum, const Vec3f& camera_position) const {
    std::vector<PointRef> result;

    std::vector<uint32_t> stack{0};
    while (!stack.empty()) {
        const uint32_t id = stack.back();
        stack.pop_back();
        const OctreeNode& node = nodes_[id];

        if (!frustum.intersects_box(node.bounds())) {
            continue;
        }

        if (node.is_leaf()) {
            result.insert(result.end(), node.points.begin(), node.points.end());
            continue;
        }

        const float distance = (node.center - camera_position).length();
        const float threshold = node.half_extent * config_.lod_factor;
        if (threshold > 0.0f && distance > threshold) {
            const double ratio = std::floor(static_cast<double>(distance) / threshold);
            const size_t stride = ratio >= 1e15 ? static_cast<size_t>(1e15)
                                                : std::max<size_t>(1, static_cast<size_t>(ratio));
            collect_lod(id, stride, result);
            continue;
        }

        for (uint32_t c = 8; c-- > 0;) {
            stack.push_back(node.first_child + c);
        }
    }
    return result;
}

std::vector<BBox> Octree::leaf_bounds() const {
    std::vector<BBox> boxes;
    for (const auto& node : nodes_) {
        if (node.is_leaf()) {
            boxes.push_back(node.bounds());
        }
    }
    return boxes;
}

OctreeStats Octree::stats() const {
    OctreeStats s;
    s.node_count = nodes_.size();
    s.point_count = point_count_;

    std::vector<std::pair<uint32_t, int>> stack{{0u, 0}};
    while (!stack.empty()) {
        auto [id, depth] = stack.back();
        stack.pop_back();
        const OctreeNode& node = nodes_[id];
        s.depth = std::max(s.depth, depth);

        if (node.is_leaf()) {
            ++s.leaf_count;
            s.max_leaf_points = std::max(s.max_leaf_points, node.points.size());
        } else {
            for (uint32_t c = 0; c < 8; ++c) {
                stack.emplace_back(node.first_child + c, depth + 1);
            }
        }
    }
    return s;
}

} // namespace splatquery
