#ifndef SPLATQUERY_CAMERA_HPP
#define SPLATQUERY_CAMERA_HPP

#include "types.hpp"
#include <Eigen/Dense>

namespace splatquery {

/// Right-handed view matrix looking from `eye` towards `target`.
Eigen::Matrix4f look_at(const Vec3f& eye, const Vec3f& target, const Vec3f& up = Vec3f(0.0f, 1.0f, 0.0f));

/// OpenGL-style perspective projection (clip z in [-w, w]).
Eigen::Matrix4f perspective(float fov_y_radians, float aspect, float near_plane, float far_plane);

/// World-space eye position of a rigid view matrix (-R^T t).
Vec3f camera_position(const Eigen::Matrix4f& view);

struct CameraPose {
    Vec3f eye;
    Vec3f target;
};

/// Default viewpoint for a scene: looks at the box centre from
/// 2x the largest side behind it and 0.5x above.
CameraPose camera_from_bounds(const BBox& bbox);

inline float radians(float degrees) {
    return degrees * 3.14159265358979323846f / 180.0f;
}

} // namespace splatquery

#endif // SPLATQUERY_CAMERA_HPP
