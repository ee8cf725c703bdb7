#include "camera.hpp"
#include <cmath>

namespace splatquery {

namespace {

Eigen::Vector3f to_eigen(const Vec3f& v) {
    return Eigen::Vector3f(v.x, v.y, v.z);
}

} // namespace

Eigen::Matrix4f look_at(const Vec3f& eye, const Vec3f& target, const Vec3f& up) {
    const Eigen::Vector3f e = to_eigen(eye);
    const Eigen::Vector3f f = (to_eigen(target) - e).normalized();
    const Eigen::Vector3f s = f.cross(to_eigen(up)).normalized();
    const Eigen::Vector3f u = s.cross(f);

    Eigen::Matrix4f view = Eigen::Matrix4f::Identity();
    view.block<1, 3>(0, 0) = s.transpose();
    view.block<1, 3>(1, 0) = u.transpose();
    view.block<1, 3>(2, 0) = -f.transpose();
    view(0, 3) = -s.dot(e);
    view(1, 3) = -u.dot(e);
    view(2, 3) = f.dot(e);
    return view;
}

Eigen::Matrix4f perspective(float fov_y_radians, float aspect, float near_plane, float far_plane) {
    const float f = 1.0f / std::tan(fov_y_radians * 0.5f);

    Eigen::Matrix4f proj = Eigen::Matrix4f::Zero();
    proj(0, 0) = f / aspect;
    proj(1, 1) = f;
    proj(2, 2) = (far_plane + near_plane) / (near_plane - far_plane);
    proj(2, 3) = 2.0f * far_plane * near_plane / (near_plane - far_plane);
    proj(3, 2) = -1.0f;
    return proj;
}

Vec3f camera_position(const Eigen::Matrix4f& view) {
    const Eigen::Matrix3f rotation = view.block<3, 3>(0, 0);
    const Eigen::Vector3f translation = view.block<3, 1>(0, 3);
    const Eigen::Vector3f eye = -rotation.transpose() * translation;
    return Vec3f(eye.x(), eye.y(), eye.z());
}

CameraPose camera_from_bounds(const BBox& bbox) {
    CameraPose pose;
    pose.target = bbox.center();

    // A single point still gets a usable distance
    float size = bbox.largest_side();
    if (!(size > 0.0f)) {
        size = 1.0f;
    }
    pose.eye = pose.target + Vec3f(0.0f, size * 0.5f, size * 2.0f);
    return pose;
}

} // namespace splatquery
