#ifndef SPLATQUERY_FRUSTUM_HPP
#define SPLATQUERY_FRUSTUM_HPP

#include "types.hpp"
#include <Eigen/Dense>
#include <array>

namespace splatquery {

/// Plane n.p + offset = 0; the inside is where the signed distance is >= 0.
struct FrustumPlane {
    Vec3f normal;
    float offset = 0.0f;

    float distance(const Vec3f& p) const { return normal.dot(p) + offset; }
};

class Frustum {
public:
    enum Side { Left = 0, Right, Bottom, Top, Near, Far };

    /// Until the first update() every plane is zero, so every point is inside.
    Frustum() = default;

    /// Rebuild all six planes from column-major projection and view matrices.
    void update(const Eigen::Matrix4f& projection, const Eigen::Matrix4f& view);

    /// Inclusive: points on a plane are inside
    bool contains_point(const Vec3f& p) const;

    /// Positive-vertex test. May report boxes near a corner of the frustum as intersecting.
    bool intersects_box(const BBox& box) const;

    const std::array<FrustumPlane, 6>& planes() const { return planes_; }
    const FrustumPlane& plane(Side side) const { return planes_[side]; }

private:
    std::array<FrustumPlane, 6> planes_{};
};

} // namespace splatquery

#endif // SPLATQUERY_FRUSTUM_HPP
