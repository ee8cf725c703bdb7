#include "geometry_buffer.hpp"
#include <cmath>

namespace splatquery {

int GeometryBuffer::sh_degree() const {
    if (sh_coefficients_per_vertex_ == 0 || sh_coefficients_per_vertex_ % 3 != 0) {
        return 0;
    }
    // (degree + 1)^2 - 1 bands per color channel
    size_t bands = sh_coefficients_per_vertex_ / 3;
    int degree = static_cast<int>(std::lround(std::sqrt(static_cast<double>(bands + 1)))) - 1;
    if (static_cast<size_t>((degree + 1) * (degree + 1)) != bands + 1) {
        return 0;
    }
    return degree;
}

BBox GeometryBuffer::compute_bbox() const {
    BBox bbox;
    for (size_t i = 0; i < vertex_count_; ++i) {
        bbox.expand(position(i));
    }
    return bbox;
}

std::vector<float> GeometryBuffer::normals_or_default() const {
    if (has_normals()) {
        return normals_;
    }
    std::vector<float> result(vertex_count_ * 3, 0.0f);
    for (size_t i = 0; i < vertex_count_; ++i) {
        result[i * 3 + 1] = 1.0f;
    }
    return result;
}

GeometryAssembler::GeometryAssembler(DiagnosticCallback diagnostics)
    : diagnostics_(std::move(diagnostics))
{
}

namespace {

void check_channel(const std::vector<float>& channel, size_t arity, size_t vertex_count, const char* name) {
    if (!channel.empty() && channel.size() != arity * vertex_count) {
        throw UnsupportedFormatError(std::string("Channel '") + name + "' has " +
                                     std::to_string(channel.size()) + " values, expected " +
                                     std::to_string(arity * vertex_count));
    }
}

} // namespace

GeometryBuffer GeometryAssembler::build(GeometryChannels channels, PlyVariant variant) const {
    if (channels.positions.size() % 3 != 0) {
        throw UnsupportedFormatError("Position channel is not a multiple of 3");
    }
    const size_t vertex_count = channels.positions.size() / 3;
    if (vertex_count == 0) {
        throw EmptyGeometryError("Geometry has no vertices");
    }

    check_channel(channels.normals, 3, vertex_count, "normals");
    check_channel(channels.colors, 4, vertex_count, "colors");
    check_channel(channels.scales, 3, vertex_count, "scales");
    check_channel(channels.rotations, 4, vertex_count, "rotations");
    if (channels.sh_coefficients_per_vertex > 0) {
        check_channel(channels.sh_coefficients, channels.sh_coefficients_per_vertex, vertex_count, "sh");
    } else if (!channels.sh_coefficients.empty()) {
        throw UnsupportedFormatError("SH coefficients present without a per-vertex count");
    }

    GeometryBuffer buffer;

    // Keep only triangles whose three indices are valid
    size_t dropped = 0;
    const size_t index_count = channels.indices.size() - channels.indices.size() % 3;
    buffer.indices_.reserve(index_count);
    for (size_t t = 0; t < index_count; t += 3) {
        const uint32_t* tri = &channels.indices[t];
        if (tri[0] >= vertex_count || tri[1] >= vertex_count || tri[2] >= vertex_count) {
            ++dropped;
            continue;
        }
        buffer.indices_.insert(buffer.indices_.end(), tri, tri + 3);
    }
    if (dropped > 0) {
        Diagnostic d{DiagnosticCode::FaceIndexOutOfRange,
                     "Dropped " + std::to_string(dropped) + " triangle(s) referencing vertices beyond " +
                     std::to_string(vertex_count)};
        if (diagnostics_) {
            diagnostics_(d);
        } else {
            default_diagnostic_sink(d);
        }
    }

    buffer.vertex_count_ = vertex_count;
    buffer.positions_ = std::move(channels.positions);
    buffer.normals_ = std::move(channels.normals);
    buffer.colors_ = std::move(channels.colors);
    buffer.scales_ = std::move(channels.scales);
    buffer.rotations_ = std::move(channels.rotations);
    buffer.sh_coefficients_ = std::move(channels.sh_coefficients);
    buffer.sh_coefficients_per_vertex_ = channels.sh_coefficients_per_vertex;
    buffer.color_range_ = channels.color_range;
    buffer.source_variant_ = variant;
    return buffer;
}

} // namespace splatquery
