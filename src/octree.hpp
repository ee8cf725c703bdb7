#ifndef SPLATQUERY_OCTREE_HPP
#define SPLATQUERY_OCTREE_HPP

#include "types.hpp"
#include "frustum.hpp"
#include "geometry_buffer.hpp"
#include <cstdint>
#include <vector>

namespace splatquery {

/// A point and its vertex index in the GeometryBuffer it came from
struct PointRef {
    Vec3f position;
    uint32_t index = 0;

    PointRef() = default;
    PointRef(const Vec3f& p, uint32_t i) : position(p), index(i) {}
};

constexpr uint32_t kNoChildren = static_cast<uint32_t>(-1);

/// Cube cell of the tree. Children are 8 consecutive nodes starting at first_child.
/// Children split the parent box at its centre, so `box` is exact even where
/// center +- half_extent would round.
struct OctreeNode {
    Vec3f center;
    float half_extent = 0.0f;
    BBox box;
    std::vector<PointRef> points;       // Leaf only
    uint32_t first_child = kNoChildren;

    bool is_leaf() const { return first_child == kNoChildren; }

    const BBox& bounds() const { return box; }
};

struct OctreeStats {
    size_t node_count = 0;
    size_t leaf_count = 0;
    size_t point_count = 0;
    size_t max_leaf_points = 0;
    int depth = 0;  // Root alone is depth 0
};

/// Insert-only point octree over a flat node arena.
/// Safe for concurrent queries once loading has finished.
class Octree {
public:
    Octree(const Vec3f& center, float half_extent, const OctreeConfig& config = OctreeConfig());

    /// Root cube enclosing `bbox`: its centre, half of its largest side.
    /// Throws std::invalid_argument for an empty box.
    static Octree from_bounds(const BBox& bbox, const OctreeConfig& config = OctreeConfig());

    /// Root from the position extents, then every vertex inserted.
    static Octree from_geometry(const GeometryBuffer& geometry, const OctreeConfig& config = OctreeConfig());

    /// False when the point lies outside the root cube (closed bounds).
    bool insert(const PointRef& point);

    /// Inserts every vertex; returns how many were inside the root cube.
    size_t insert_all(const GeometryBuffer& geometry);

    /// Points with distance <= radius, in depth-first order.
    std::vector<PointRef> query_radius(const Vec3f& position, float radius) const;

    /// Points of nodes intersecting the frustum. An interior node farther than
    /// half_extent * lod_factor from the camera contributes every stride-th
    /// point of its subtree instead of being descended.
    std::vector<PointRef> query_frustum(const Frustum& frustum, const Vec3f& camera_position) const;

    const OctreeNode& root() const { return nodes_[0]; }
    const std::vector<OctreeNode>& nodes() const { return nodes_; }

    /// Leaf cubes, for debug drawing
    std::vector<BBox> leaf_bounds() const;

    OctreeStats stats() const;

    size_t size() const { return point_count_; }
    const OctreeConfig& config() const { return config_; }

private:
    bool can_split(const OctreeNode& node) const;
    void split(uint32_t node_id);
    uint32_t child_for(const OctreeNode& node, const Vec3f& p) const;
    void collect_lod(uint32_t node_id, size_t stride, std::vector<PointRef>& out) const;

    std::vector<OctreeNode> nodes_;
    OctreeConfig config_;
    size_t point_count_ = 0;
};

} // namespace splatquery

#endif // SPLATQUERY_OCTREE_HPP
