#ifndef SPLATQUERY_GEOMETRY_BUFFER_HPP
#define SPLATQUERY_GEOMETRY_BUFFER_HPP

#include "types.hpp"
#include "errors.hpp"
#include "format_classifier.hpp"
#include <cstdint>
#include <vector>

namespace splatquery {

/// Value range of the color channel
enum class ColorRange {
    Unit,  // 0..1 (standard red/green/blue/alpha divided by 255)
    Byte   // 0..255 (SH DC, codebook and chunked forms)
};

/// Flat per-channel arrays produced by a schema mapper.
/// An empty vector means the channel is absent.
struct GeometryChannels {
    std::vector<float> positions;        // 3 per vertex
    std::vector<float> normals;          // 3 per vertex
    std::vector<float> colors;           // 4 per vertex (rgba)
    std::vector<float> scales;           // 3 per vertex, exponentiated
    std::vector<float> rotations;        // 4 per vertex, raw quaternion
    std::vector<float> sh_coefficients;  // sh_coefficients_per_vertex per vertex
    size_t sh_coefficients_per_vertex = 0;
    std::vector<uint32_t> indices;       // 3 per triangle
    ColorRange color_range = ColorRange::Unit;
};

/// Canonical decoded geometry. Immutable once returned by the decoder.
class GeometryBuffer {
public:
    GeometryBuffer() = default;

    size_t vertex_count() const { return vertex_count_; }
    size_t triangle_count() const { return indices_.size() / 3; }

    const std::vector<float>& positions() const { return positions_; }
    const std::vector<float>& normals() const { return normals_; }
    const std::vector<float>& colors() const { return colors_; }
    const std::vector<float>& scales() const { return scales_; }
    const std::vector<float>& rotations() const { return rotations_; }
    const std::vector<float>& sh_coefficients() const { return sh_coefficients_; }
    const std::vector<uint32_t>& indices() const { return indices_; }

    bool has_normals() const { return !normals_.empty(); }
    bool has_colors() const { return !colors_.empty(); }
    bool has_scales() const { return !scales_.empty(); }
    bool has_rotations() const { return !rotations_.empty(); }
    bool has_sh() const { return sh_coefficients_per_vertex_ > 0; }
    bool has_faces() const { return !indices_.empty(); }

    Vec3f position(size_t i) const { return Vec3f(&positions_[i * 3]); }

    ColorRange color_range() const { return color_range_; }
    PlyVariant source_variant() const { return source_variant_; }

    /// Higher-order SH coefficients per vertex (f_rest count)
    size_t sh_coefficients_per_vertex() const { return sh_coefficients_per_vertex_; }

    /// SH degree implied by the coefficient count (9 -> 1, 24 -> 2, 45 -> 3), 0 if none
    int sh_degree() const;

    BBox compute_bbox() const;

    /// Normals, or (0, 1, 0) per vertex when the file carried none
    std::vector<float> normals_or_default() const;

private:
    friend class GeometryAssembler;

    size_t vertex_count_ = 0;
    std::vector<float> positions_;
    std::vector<float> normals_;
    std::vector<float> colors_;
    std::vector<float> scales_;
    std::vector<float> rotations_;
    std::vector<float> sh_coefficients_;
    size_t sh_coefficients_per_vertex_ = 0;
    std::vector<uint32_t> indices_;
    ColorRange color_range_ = ColorRange::Unit;
    PlyVariant source_variant_ = PlyVariant::Standard;
};

/// Validates mapped channels and moves them into a GeometryBuffer.
class GeometryAssembler {
public:
    explicit GeometryAssembler(DiagnosticCallback diagnostics = DiagnosticCallback());

    /// Throws EmptyGeometryError when there are no vertices and
    /// UnsupportedFormatError when a channel length disagrees with the vertex count.
    /// Triangles referencing missing vertices are dropped with a diagnostic.
    GeometryBuffer build(GeometryChannels channels, PlyVariant variant) const;

private:
    DiagnosticCallback diagnostics_;
};

} // namespace splatquery

#endif // SPLATQUERY_GEOMETRY_BUFFER_HPP
