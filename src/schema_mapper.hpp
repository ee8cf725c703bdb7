#ifndef SPLATQUERY_SCHEMA_MAPPER_HPP
#define SPLATQUERY_SCHEMA_MAPPER_HPP

#include "errors.hpp"
#include "format_classifier.hpp"
#include "geometry_buffer.hpp"
#include "ply_header.hpp"
#include "record_decoder.hpp"
#include <algorithm>
#include <array>
#include <memory>
#include <vector>

namespace splatquery {

/// Property indices of the well-known vertex attributes within one element.
/// Missing properties are kInvalidIndex.
struct VertexLayout {
    std::array<size_t, 3> position{{kInvalidIndex, kInvalidIndex, kInvalidIndex}};
    std::array<size_t, 3> normal{{kInvalidIndex, kInvalidIndex, kInvalidIndex}};
    std::array<size_t, 4> rgba{{kInvalidIndex, kInvalidIndex, kInvalidIndex, kInvalidIndex}};
    std::array<size_t, 3> f_dc{{kInvalidIndex, kInvalidIndex, kInvalidIndex}};
    size_t opacity = kInvalidIndex;
    std::array<size_t, 3> scale{{kInvalidIndex, kInvalidIndex, kInvalidIndex}};
    std::array<size_t, 4> rotation{{kInvalidIndex, kInvalidIndex, kInvalidIndex, kInvalidIndex}};
    std::vector<size_t> f_rest;  // Ordered by coefficient number

    static VertexLayout resolve(const ElementHeader& element);

    bool has_position() const { return all_present(position); }
    bool has_normal() const { return all_present(normal); }
    bool has_rgb() const { return rgba[0] != kInvalidIndex && rgba[1] != kInvalidIndex && rgba[2] != kInvalidIndex; }
    bool has_alpha() const { return rgba[3] != kInvalidIndex; }
    bool has_dc() const { return all_present(f_dc); }
    bool has_opacity() const { return opacity != kInvalidIndex; }
    bool has_scale() const { return all_present(scale); }
    bool has_rotation() const { return all_present(rotation); }

private:
    template <size_t N>
    static bool all_present(const std::array<size_t, N>& a) {
        for (size_t i : a) {
            if (i == kInvalidIndex) return false;
        }
        return true;
    }
};

/// Turns decoded records into geometry channels. One subclass per layout family.
/// The face element is handled here for every family: its first list
/// property is fan-triangulated into the index channel.
class SchemaMapper {
public:
    explicit SchemaMapper(DiagnosticCallback diagnostics);
    virtual ~SchemaMapper() = default;

    SchemaMapper(const SchemaMapper&) = delete;
    SchemaMapper& operator=(const SchemaMapper&) = delete;

    /// Picks the mapper for a classified header
    static std::unique_ptr<SchemaMapper> create(PlyVariant variant, const PlyHeader& header,
                                                DiagnosticCallback diagnostics);

    /// Elements that are not wanted are skipped by the decoder
    bool wants_element(const ElementHeader& element) const;

    void begin_element(const ElementHeader& element);
    void map_record(const Record& record, size_t row);

    /// Completes deferred work and hands over the channels. Call once, after the last element.
    GeometryChannels finish();

protected:
    virtual bool accepts(const ElementHeader& element) const = 0;
    virtual void begin(const ElementHeader& element) = 0;
    virtual void map(const Record& record, size_t row) = 0;
    virtual void complete() = 0;

    void report(DiagnosticCode code, const std::string& message);

    /// Record count to reserve for; a header count is not trusted beyond this
    static size_t reserve_count(const ElementHeader& element) {
        return std::min<size_t>(element.count, size_t(1) << 22);
    }

    GeometryChannels channels_;

private:
    void map_face(const Record& record);

    DiagnosticCallback diagnostics_;
    bool in_face_ = false;
    size_t face_list_ = kInvalidIndex;
    std::vector<uint32_t> polygon_;
    size_t degenerate_polygons_ = 0;
};

/// Standard point clouds and meshes, and per-vertex SH splats.
class DirectSchemaMapper : public SchemaMapper {
public:
    explicit DirectSchemaMapper(DiagnosticCallback diagnostics = DiagnosticCallback());

protected:
    bool accepts(const ElementHeader& element) const override;
    void begin(const ElementHeader& element) override;
    void map(const Record& record, size_t row) override;
    void complete() override;

private:
    VertexLayout layout_;
    bool seen_vertex_ = false;
    bool sh_color_ = false;
};

/// Splats whose attributes are looked up in a shared codebook_centers element.
/// Lookups are resolved in complete(), so element order in the file does not matter.
class CodebookSchemaMapper : public SchemaMapper {
public:
    explicit CodebookSchemaMapper(DiagnosticCallback diagnostics = DiagnosticCallback());

    // Raw attribute slots of a codebook entry or vertex residual
    static constexpr size_t kDc = 0;
    static constexpr size_t kOpacity = 3;
    static constexpr size_t kScale = 4;
    static constexpr size_t kRotation = 7;
    static constexpr size_t kSlots = 11;

protected:
    bool accepts(const ElementHeader& element) const override;
    void begin(const ElementHeader& element) override;
    void map(const Record& record, size_t row) override;
    void complete() override;

private:
    enum Group { kColorGroup, kOpacityGroup, kScaleGroup, kRotationGroup, kGroupCount };

    void begin_codebook(const ElementHeader& element);
    void begin_vertex(const ElementHeader& element);
    void map_codebook(const Record& record);
    void map_vertex(const Record& record);

    bool in_codebook_ = false;
    bool seen_vertex_ = false;

    VertexLayout codebook_layout_;
    std::array<bool, kGroupCount> codebook_has_{{false, false, false, false}};
    std::vector<float> entries_;  // kSlots per entry

    VertexLayout vertex_layout_;
    size_t shared_index_ = kInvalidIndex;                // codebook_index
    std::array<size_t, kGroupCount> group_index_{{kInvalidIndex, kInvalidIndex, kInvalidIndex, kInvalidIndex}};
    std::array<bool, kGroupCount> residual_has_{{false, false, false, false}};
    std::vector<int64_t> lookups_;    // kGroupCount per vertex, -1 when the vertex has no index
    std::vector<float> residuals_;    // kSlots per vertex
};

/// Chunked quantized splats: 256 vertices share the bounds of one chunk record.
class ChunkSchemaMapper : public SchemaMapper {
public:
    explicit ChunkSchemaMapper(DiagnosticCallback diagnostics = DiagnosticCallback());

    static constexpr size_t kChunkSize = 256;

    struct ChunkBounds {
        std::array<float, 3> min_position{};
        std::array<float, 3> max_position{};
        std::array<float, 3> min_scale{};
        std::array<float, 3> max_scale{};
        std::array<float, 3> min_color{{0.0f, 0.0f, 0.0f}};
        std::array<float, 3> max_color{{1.0f, 1.0f, 1.0f}};
    };

protected:
    bool accepts(const ElementHeader& element) const override;
    void begin(const ElementHeader& element) override;
    void map(const Record& record, size_t row) override;
    void complete() override;

private:
    enum class Section { None, Chunk, Vertex, Sh };

    Section section_ = Section::None;
    bool seen_vertex_ = false;

    std::array<size_t, 18> chunk_props_{};   // min/max position, min/max scale, min/max color
    bool chunk_has_color_ = false;
    std::vector<ChunkBounds> chunks_;

    std::array<size_t, 4> packed_props_{};   // position, rotation, scale, color
    std::vector<uint32_t> packed_;           // 4 per vertex

    std::vector<size_t> sh_props_;
};

// Packed field helpers shared with tests
void unpack_111011(uint32_t value, float& x, float& y, float& z);
void unpack_8888(uint32_t value, float& r, float& g, float& b, float& a);
/// Smallest-three quaternion; output order is w, x, y, z
void unpack_rotation(uint32_t value, float& w, float& x, float& y, float& z);

} // namespace splatquery

#endif // SPLATQUERY_SCHEMA_MAPPER_HPP
