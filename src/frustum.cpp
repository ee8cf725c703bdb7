#include "frustum.hpp"

namespace splatquery {

void Frustum::update(const Eigen::Matrix4f& projection, const Eigen::Matrix4f& view) {
    const Eigen::Matrix4f clip = projection * view;

    const Eigen::RowVector4f r0 = clip.row(0);
    const Eigen::RowVector4f r1 = clip.row(1);
    const Eigen::RowVector4f r2 = clip.row(2);
    const Eigen::RowVector4f r3 = clip.row(3);

    const Eigen::RowVector4f rows[6] = {
        r3 + r0,  // Left
        r3 - r0,  // Right
        r3 + r1,  // Bottom
        r3 - r1,  // Top
        r3 + r2,  // Near
        r3 - r2   // Far
    };

    for (int i = 0; i < 6; ++i) {
        Eigen::RowVector4f p = rows[i];
        float len = p.head<3>().norm();
        if (len > 0.0f) {
            p /= len;
        }
        planes_[i].normal = Vec3f(p(0), p(1), p(2));
        planes_[i].offset = p(3);
    }
}

bool Frustum::contains_point(const Vec3f& p) const {
    for (const auto& plane : planes_) {
        if (plane.distance(p) < 0.0f) {
            return false;
        }
    }
    return true;
}

bool Frustum::intersects_box(const BBox& box) const {
    for (const auto& plane : planes_) {
        // Corner furthest along the plane normal
        Vec3f positive(plane.normal.x >= 0.0f ? box.max.x : box.min.x,
                       plane.normal.y >= 0.0f ? box.max.y : box.min.y,
                       plane.normal.z >= 0.0f ? box.max.z : box.min.z);
        if (plane.distance(positive) < 0.0f) {
            return false;
        }
    }
    return true;
}

} // namespace splatquery
