#ifndef SPLATQUERY_TYPES_HPP
#define SPLATQUERY_TYPES_HPP

#include <algorithm>
#include <cstdint>
#include <vector>
#include <array>
#include <string>
#include <limits>
#include <cmath>
#include <functional>

namespace splatquery {

struct Vec3f {
    float x, y, z;

    Vec3f() : x(0), y(0), z(0) {}
    Vec3f(float x_, float y_, float z_) : x(x_), y(y_), z(z_) {}
    explicit Vec3f(const float* p) : x(p[0]), y(p[1]), z(p[2]) {}

    float& operator[](int i) { return (&x)[i]; }
    float operator[](int i) const { return (&x)[i]; }

    Vec3f operator+(const Vec3f& o) const { return Vec3f(x + o.x, y + o.y, z + o.z); }
    Vec3f operator-(const Vec3f& o) const { return Vec3f(x - o.x, y - o.y, z - o.z); }
    Vec3f operator*(float s) const { return Vec3f(x * s, y * s, z * s); }

    float dot(const Vec3f& o) const { return x * o.x + y * o.y + z * o.z; }
    float length_squared() const { return dot(*this); }
    float length() const { return std::sqrt(length_squared()); }
};

inline float distance_squared(const Vec3f& a, const Vec3f& b) {
    return (a - b).length_squared();
}

struct BBox {
    Vec3f min{std::numeric_limits<float>::max(),
              std::numeric_limits<float>::max(),
              std::numeric_limits<float>::max()};
    Vec3f max{std::numeric_limits<float>::lowest(),
              std::numeric_limits<float>::lowest(),
              std::numeric_limits<float>::lowest()};

    BBox() = default;
    BBox(const Vec3f& min_, const Vec3f& max_) : min(min_), max(max_) {}

    void expand(const Vec3f& p) {
        for (int i = 0; i < 3; ++i) {
            if (p[i] < min[i]) min[i] = p[i];
            if (p[i] > max[i]) max[i] = p[i];
        }
    }

    void expand(const BBox& other) {
        for (int i = 0; i < 3; ++i) {
            if (other.min[i] < min[i]) min[i] = other.min[i];
            if (other.max[i] > max[i]) max[i] = other.max[i];
        }
    }

    bool valid() const {
        return min.x <= max.x && min.y <= max.y && min.z <= max.z;
    }

    bool contains(const Vec3f& p) const {
        return p.x >= min.x && p.x <= max.x &&
               p.y >= min.y && p.y <= max.y &&
               p.z >= min.z && p.z <= max.z;
    }

    Vec3f center() const {
        return Vec3f((min.x + max.x) * 0.5f, (min.y + max.y) * 0.5f, (min.z + max.z) * 0.5f);
    }

    Vec3f size() const { return max - min; }

    float largest_side() const {
        Vec3f s = size();
        return std::max(s.x, std::max(s.y, s.z));
    }
};

// Octree policy
constexpr size_t kDefaultMaxPointsPerNode = 100;
constexpr float kDefaultLodFactor = 1000.0f;
constexpr float kDefaultMinHalfExtent = 1e-5f;

struct OctreeConfig {
    size_t max_points_per_node = kDefaultMaxPointsPerNode;
    float lod_factor = kDefaultLodFactor;     // LOD threshold = half_extent * lod_factor
    float min_half_extent = kDefaultMinHalfExtent;  // Leaves this small never split
};

struct RadiusQuery {
    Vec3f center;
    float radius = 0.0f;
};

struct QueryConfig {
    std::string input_path;
    OctreeConfig octree;

    // Camera; eye/target are framed from the scene bounds when not given
    bool has_eye = false;
    Vec3f eye;
    bool has_target = false;
    Vec3f target;
    float fov_y_degrees = 60.0f;
    float near_plane = 0.1f;
    float far_plane = 10000.0f;
    float aspect = 16.0f / 9.0f;

    std::vector<RadiusQuery> radius_queries;
    bool quiet = false;
};

// SH coefficient C0 for converting DC to color
constexpr float SH_C0 = 0.28209479177387814f;

// Utility functions
inline float sigmoid(float x) {
    return 1.0f / (1.0f + std::exp(-x));
}

inline float clamp(float x, float lo, float hi) {
    return x < lo ? lo : (x > hi ? hi : x);
}

// Log callback for redirecting console output
using LogCallback = std::function<void(const std::string& message)>;

} // namespace splatquery

#endif // SPLATQUERY_TYPES_HPP
