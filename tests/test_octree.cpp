#include <gtest/gtest.h>
#include "octree.hpp"
#include "camera.hpp"
#include "ply_decoder.hpp"
#include "ply_builder.hpp"
#include <algorithm>
#include <cmath>
#include <random>
#include <set>
#include <stdexcept>

using namespace splatquery;
using test::PlyBuilder;

namespace {

std::vector<Vec3f> random_points(size_t n, float extent, unsigned seed) {
    std::mt19937 rng(seed);
    std::uniform_real_distribution<float> dist(-extent, extent);
    std::vector<Vec3f> points;
    points.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        points.emplace_back(dist(rng), dist(rng), dist(rng));
    }
    return points;
}

Octree build_tree(const std::vector<Vec3f>& points, const OctreeConfig& config = OctreeConfig()) {
    BBox bbox;
    for (const auto& p : points) bbox.expand(p);
    Octree tree = Octree::from_bounds(bbox, config);
    for (size_t i = 0; i < points.size(); ++i) {
        EXPECT_TRUE(tree.insert(PointRef(points[i], static_cast<uint32_t>(i))));
    }
    return tree;
}

std::set<uint32_t> indices_of(const std::vector<PointRef>& refs) {
    std::set<uint32_t> out;
    for (const auto& r : refs) out.insert(r.index);
    return out;
}

} // namespace

TEST(OctreeTest, FromBoundsCoversBox) {
    BBox bbox(Vec3f(-1.0f, 0.0f, 2.0f), Vec3f(3.0f, 1.0f, 4.0f));
    Octree tree = Octree::from_bounds(bbox);
    EXPECT_FLOAT_EQ(tree.root().center.x, 1.0f);
    EXPECT_GE(tree.root().half_extent, 2.0f);
    EXPECT_TRUE(tree.root().bounds().contains(bbox.max));
    EXPECT_TRUE(tree.root().bounds().contains(bbox.min));
}

TEST(OctreeTest, FromEmptyBoundsThrows) {
    EXPECT_THROW(Octree::from_bounds(BBox()), std::invalid_argument);
}

TEST(OctreeTest, InsertOutsideRootFails) {
    Octree tree(Vec3f(0.0f, 0.0f, 0.0f), 1.0f);
    EXPECT_FALSE(tree.insert(PointRef(Vec3f(2.0f, 0.0f, 0.0f), 0)));
    EXPECT_TRUE(tree.insert(PointRef(Vec3f(1.0f, 1.0f, 1.0f), 1)));  // Closed bounds
    EXPECT_EQ(tree.size(), 1u);
}

TEST(OctreeTest, SplitsWhenFull) {
    OctreeConfig config;
    config.max_points_per_node = 4;
    Octree tree(Vec3f(0.0f, 0.0f, 0.0f), 1.0f, config);

    const float c = 0.5f;
    const Vec3f corners[] = {{-c, -c, -c}, {c, -c, -c}, {-c, c, -c}, {c, c, -c}, {-c, -c, c}};
    for (uint32_t i = 0; i < 5; ++i) {
        tree.insert(PointRef(corners[i], i));
    }

    ASSERT_FALSE(tree.root().is_leaf());
    EXPECT_EQ(tree.nodes().size(), 9u);

    // Octant bit 0 is x, bit 1 is y, bit 2 is z
    const OctreeNode& child = tree.nodes()[tree.root().first_child + 3];
    EXPECT_FLOAT_EQ(child.center.x, 0.5f);
    EXPECT_FLOAT_EQ(child.center.y, 0.5f);
    EXPECT_FLOAT_EQ(child.center.z, -0.5f);
    EXPECT_FLOAT_EQ(child.half_extent, 0.5f);
    ASSERT_EQ(child.points.size(), 1u);
    EXPECT_EQ(child.points[0].index, 3u);
}

TEST(OctreeTest, LeavesTileTheRoot) {
    OctreeConfig config;
    config.max_points_per_node = 8;
    Octree tree = build_tree(random_points(2000, 10.0f, 7), config);

    const float root_volume = std::pow(tree.root().half_extent * 2.0f, 3.0f);
    double leaf_volume = 0.0;
    for (const auto& box : tree.leaf_bounds()) {
        Vec3f s = box.size();
        leaf_volume += static_cast<double>(s.x) * s.y * s.z;
    }
    EXPECT_NEAR(leaf_volume, root_volume, root_volume * 1e-4);
}

TEST(OctreeTest, EveryPointInsideItsLeaf) {
    OctreeConfig config;
    config.max_points_per_node = 16;
    auto points = random_points(3000, 5.0f, 11);
    Octree tree = build_tree(points, config);

    size_t total = 0;
    for (const auto& node : tree.nodes()) {
        if (!node.is_leaf()) {
            EXPECT_TRUE(node.points.empty());
            continue;
        }
        EXPECT_LE(node.points.size(), config.max_points_per_node);
        BBox box = node.bounds();
        for (const auto& p : node.points) {
            EXPECT_TRUE(box.contains(p.position));
        }
        total += node.points.size();
    }
    EXPECT_EQ(total, points.size());
}

TEST(OctreeTest, CoincidentPointsStopSplitting) {
    OctreeConfig config;
    config.max_points_per_node = 2;
    config.min_half_extent = 0.01f;
    Octree tree(Vec3f(0.0f, 0.0f, 0.0f), 1.0f, config);

    for (uint32_t i = 0; i < 10; ++i) {
        EXPECT_TRUE(tree.insert(PointRef(Vec3f(0.3f, 0.3f, 0.3f), i)));
    }
    OctreeStats stats = tree.stats();
    EXPECT_EQ(stats.point_count, 10u);
    EXPECT_EQ(stats.max_leaf_points, 10u);
    EXPECT_LE(tree.nodes().size(), 8u * 8u + 1u);
}

TEST(OctreeTest, ClusterFarFromOrigin) {
    // Float spacing near these coordinates exceeds the minimum half extent
    for (float c : {1000.3f, 3000.7f}) {
        Octree tree(Vec3f(0.0f, 0.0f, 0.0f), 16384.0f);
        const Vec3f p(c, c, c);
        for (uint32_t i = 0; i < 150; ++i) {
            ASSERT_TRUE(tree.insert(PointRef(p, i)));
        }
        ASSERT_FALSE(tree.root().is_leaf());

        size_t total = 0;
        for (const auto& node : tree.nodes()) {
            if (!node.is_leaf()) continue;
            for (const auto& ref : node.points) {
                EXPECT_TRUE(node.bounds().contains(ref.position)) << "c=" << c;
            }
            total += node.points.size();
        }
        EXPECT_EQ(total, 150u);

        EXPECT_EQ(tree.query_radius(p, 0.0f).size(), 150u) << "c=" << c;
        EXPECT_EQ(tree.query_radius(p, 1e-6f).size(), 150u) << "c=" << c;
    }
}

TEST(OctreeTest, Stats) {
    OctreeConfig config;
    config.max_points_per_node = 4;
    Octree tree(Vec3f(0.0f, 0.0f, 0.0f), 1.0f, config);

    OctreeStats empty = tree.stats();
    EXPECT_EQ(empty.node_count, 1u);
    EXPECT_EQ(empty.leaf_count, 1u);
    EXPECT_EQ(empty.depth, 0);

    for (uint32_t i = 0; i < 5; ++i) {
        tree.insert(PointRef(Vec3f(0.1f * i - 0.9f, -0.5f, -0.5f), i));
    }
    OctreeStats s = tree.stats();
    EXPECT_EQ(s.point_count, 5u);
    EXPECT_EQ(s.node_count, tree.nodes().size());
    EXPECT_GE(s.depth, 1);
    EXPECT_EQ(s.leaf_count, (s.node_count - 1) / 8 * 7 + 1);
}

// Radius queries

TEST(OctreeRadiusTest, MatchesBruteForce) {
    OctreeConfig config;
    config.max_points_per_node = 10;
    auto points = random_points(5000, 20.0f, 3);
    Octree tree = build_tree(points, config);

    const Vec3f centers[] = {{0, 0, 0}, {15, -15, 3}, {-19, 19, -19}, {50, 50, 50}};
    const float radii[] = {0.0f, 1.0f, 4.5f, 12.0f};

    for (const auto& c : centers) {
        for (float r : radii) {
            std::set<uint32_t> expected;
            for (size_t i = 0; i < points.size(); ++i) {
                if (distance_squared(points[i], c) <= r * r) {
                    expected.insert(static_cast<uint32_t>(i));
                }
            }

            std::vector<PointRef> found = tree.query_radius(c, r);
            EXPECT_EQ(found.size(), expected.size());
            EXPECT_EQ(indices_of(found), expected);
            for (const auto& p : found) {
                EXPECT_LE(distance_squared(p.position, c), r * r);
            }
        }
    }
}

TEST(OctreeRadiusTest, BoundaryIsInclusive) {
    Octree tree(Vec3f(0.0f, 0.0f, 0.0f), 4.0f);
    tree.insert(PointRef(Vec3f(2.0f, 0.0f, 0.0f), 0));
    EXPECT_EQ(tree.query_radius(Vec3f(0.0f, 0.0f, 0.0f), 2.0f).size(), 1u);
    EXPECT_EQ(tree.query_radius(Vec3f(2.0f, 0.0f, 0.0f), 0.0f).size(), 1u);
}

TEST(OctreeRadiusTest, NegativeRadiusIsEmpty) {
    Octree tree(Vec3f(0.0f, 0.0f, 0.0f), 1.0f);
    tree.insert(PointRef(Vec3f(0.0f, 0.0f, 0.0f), 0));
    EXPECT_TRUE(tree.query_radius(Vec3f(0.0f, 0.0f, 0.0f), -1.0f).empty());
}

// Frustum queries

namespace {

Frustum make_frustum(const Vec3f& eye, const Vec3f& target, float fov_degrees = 90.0f,
                     float near_plane = 0.1f, float far_plane = 1000.0f) {
    Frustum frustum;
    frustum.update(perspective(radians(fov_degrees), 1.0f, near_plane, far_plane), look_at(eye, target));
    return frustum;
}

} // namespace

TEST(OctreeFrustumTest, SeesPointsInFront) {
    Octree tree(Vec3f(0.0f, 0.0f, 0.0f), 10.0f);
    tree.insert(PointRef(Vec3f(0.0f, 0.0f, -5.0f), 0));  // In front
    tree.insert(PointRef(Vec3f(0.0f, 0.0f, 5.0f), 1));   // Behind, same root leaf

    const Vec3f eye(0.0f, 0.0f, 0.0f);
    Frustum frustum = make_frustum(eye, Vec3f(0.0f, 0.0f, -1.0f));

    // A leaf that intersects contributes all of its points
    EXPECT_EQ(tree.query_frustum(frustum, eye).size(), 2u);
}

TEST(OctreeFrustumTest, CullsNodesOutside) {
    OctreeConfig config;
    config.max_points_per_node = 1;
    Octree tree(Vec3f(0.0f, 0.0f, 0.0f), 10.0f, config);
    tree.insert(PointRef(Vec3f(-5.0f, -5.0f, -5.0f), 0));
    tree.insert(PointRef(Vec3f(5.0f, 5.0f, 5.0f), 1));

    const Vec3f eye(0.0f, 0.0f, 100.0f);
    Frustum frustum = make_frustum(eye, Vec3f(0.0f, 0.0f, 200.0f));  // Looking away
    EXPECT_TRUE(tree.query_frustum(frustum, eye).empty());
}

TEST(OctreeFrustumTest, WideFrustumReturnsEverything) {
    OctreeConfig config;
    config.max_points_per_node = 8;
    auto points = random_points(1000, 1.0f, 5);
    Octree tree = build_tree(points, config);

    const Vec3f eye(0.0f, 0.0f, 50.0f);
    Frustum frustum = make_frustum(eye, Vec3f(0.0f, 0.0f, 0.0f), 60.0f);

    std::vector<PointRef> visible = tree.query_frustum(frustum, eye);
    EXPECT_EQ(indices_of(visible).size(), points.size());
    EXPECT_EQ(visible.size(), points.size());
}

TEST(OctreeFrustumTest, CameraAtTreeCentre) {
    OctreeConfig config;
    config.max_points_per_node = 8;
    auto points = random_points(1000, 1.0f, 11);
    Octree tree = build_tree(points, config);
    const Vec3f eye = tree.root().center;

    // Orthographic box reaching 100 units around the camera on every axis
    Eigen::Matrix4f ortho = Eigen::Matrix4f::Identity();
    ortho(0, 0) = 0.01f;
    ortho(1, 1) = 0.01f;
    ortho(2, 2) = -0.01f;
    Frustum frustum;
    frustum.update(ortho, look_at(eye, eye + Vec3f(0.0f, 0.0f, -1.0f)));

    std::vector<PointRef> visible = tree.query_frustum(frustum, eye);
    EXPECT_EQ(indices_of(visible).size(), points.size());
    EXPECT_EQ(visible.size(), points.size());

    // Without planes every node intersects
    EXPECT_EQ(tree.query_frustum(Frustum(), eye).size(), points.size());
}

TEST(OctreeFrustumTest, DistantNodesAreStrided) {
    OctreeConfig config;
    config.max_points_per_node = 4;
    config.lod_factor = 1.0f;
    Octree tree(Vec3f(0.0f, 0.0f, 0.0f), 1.0f, config);
    for (uint32_t i = 0; i < 40; ++i) {
        tree.insert(PointRef(Vec3f(-0.95f + 0.045f * i, 0.1f, 0.1f), i));
    }
    ASSERT_FALSE(tree.root().is_leaf());

    // Root threshold is 1; at distance 10 every 10th point is kept
    const Vec3f eye(0.0f, 0.0f, 10.0f);
    Frustum frustum = make_frustum(eye, Vec3f(0.0f, 0.0f, 0.0f), 60.0f);
    std::vector<PointRef> visible = tree.query_frustum(frustum, eye);
    EXPECT_EQ(visible.size(), 4u);
}

TEST(OctreeFrustumTest, LodDisabledWithZeroFactor) {
    OctreeConfig config;
    config.max_points_per_node = 4;
    config.lod_factor = 0.0f;
    Octree tree(Vec3f(0.0f, 0.0f, 0.0f), 1.0f, config);
    for (uint32_t i = 0; i < 40; ++i) {
        tree.insert(PointRef(Vec3f(-0.95f + 0.045f * i, 0.1f, 0.1f), i));
    }

    const Vec3f eye(0.0f, 0.0f, 10.0f);
    Frustum frustum = make_frustum(eye, Vec3f(0.0f, 0.0f, 0.0f), 60.0f);
    EXPECT_EQ(tree.query_frustum(frustum, eye).size(), 40u);
}

TEST(OctreeTest, FromGeometry) {
    PlyBuilder ply("ascii");
    ply.element("vertex", 4).properties("float", {"x", "y", "z"});
    ply.line("0 0 0").line("1 0 0").line("0 1 0").line("1 1 1");

    PlyDecoder decoder;
    DecodeResult result = decoder.decode(ply.str());
    ASSERT_TRUE(result) << result.error();

    Octree tree = Octree::from_geometry(*result);
    EXPECT_EQ(tree.size(), 4u);
    EXPECT_FLOAT_EQ(tree.root().center.x, 0.5f);

    std::vector<PointRef> nearby = tree.query_radius(Vec3f(1.0f, 1.0f, 1.0f), 0.1f);
    ASSERT_EQ(nearby.size(), 1u);
    EXPECT_EQ(nearby[0].index, 3u);
}
