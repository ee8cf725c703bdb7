#include "schema_mapper.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <utility>

namespace splatquery {

namespace {

constexpr int64_t kNoLookup = std::numeric_limits<int64_t>::min();

size_t find_scalar(const ElementHeader& element, const char* name) {
    size_t idx = element.find_property(name);
    if (idx != kInvalidIndex && element.properties[idx].is_list()) {
        return kInvalidIndex;
    }
    return idx;
}

uint32_t to_index(double value) {
    if (value < 0.0 || value > static_cast<double>(std::numeric_limits<uint32_t>::max())) {
        return std::numeric_limits<uint32_t>::max();
    }
    return static_cast<uint32_t>(value);
}

float sh_to_color(float dc) {
    return clamp(0.5f + SH_C0 * dc, 0.0f, 1.0f) * 255.0f;
}

// Raw attribute slots per group: color, opacity, scale, rotation
constexpr size_t kGroupBegin[] = {0, 3, 4, 7};
constexpr size_t kGroupEnd[] = {3, 4, 7, 11};

// Copy the raw attributes the layout carries into their slots; absent groups stay untouched
void read_slots(const VertexLayout& layout, const Record& record, float* slots) {
    const std::vector<double>& v = record.values;
    if (layout.has_dc()) {
        for (int k = 0; k < 3; ++k) slots[kGroupBegin[0] + k] = static_cast<float>(v[layout.f_dc[k]]);
    }
    if (layout.has_opacity()) {
        slots[kGroupBegin[1]] = static_cast<float>(v[layout.opacity]);
    }
    if (layout.has_scale()) {
        for (int k = 0; k < 3; ++k) slots[kGroupBegin[2] + k] = static_cast<float>(v[layout.scale[k]]);
    }
    if (layout.has_rotation()) {
        for (int k = 0; k < 4; ++k) slots[kGroupBegin[3] + k] = static_cast<float>(v[layout.rotation[k]]);
    }
}

float lerp(float a, float b, float t) {
    return a + t * (b - a);
}

} // namespace

// --- VertexLayout ---

VertexLayout VertexLayout::resolve(const ElementHeader& element) {
    VertexLayout layout;

    const char* position_names[] = {"x", "y", "z"};
    const char* normal_names[] = {"nx", "ny", "nz"};
    const char* color_names[] = {"red", "green", "blue", "alpha"};
    const char* short_color_names[] = {"r", "g", "b", "a"};
    const char* dc_names[] = {"f_dc_0", "f_dc_1", "f_dc_2"};
    const char* scale_names[] = {"scale_0", "scale_1", "scale_2"};
    const char* rotation_names[] = {"rot_0", "rot_1", "rot_2", "rot_3"};

    for (int k = 0; k < 3; ++k) {
        layout.position[k] = find_scalar(element, position_names[k]);
        layout.normal[k] = find_scalar(element, normal_names[k]);
        layout.f_dc[k] = find_scalar(element, dc_names[k]);
        layout.scale[k] = find_scalar(element, scale_names[k]);
    }
    for (int k = 0; k < 4; ++k) {
        layout.rgba[k] = find_scalar(element, color_names[k]);
        if (layout.rgba[k] == kInvalidIndex) {
            layout.rgba[k] = find_scalar(element, short_color_names[k]);
        }
        layout.rotation[k] = find_scalar(element, rotation_names[k]);
    }
    layout.opacity = find_scalar(element, "opacity");

    // Single-column codebook attributes apply to every channel
    if (!layout.has_dc()) {
        size_t dc = find_scalar(element, "features_dc");
        if (dc != kInvalidIndex) layout.f_dc = {{dc, dc, dc}};
    }
    if (!layout.has_scale()) {
        size_t s = find_scalar(element, "scaling");
        if (s != kInvalidIndex) layout.scale = {{s, s, s}};
    }

    std::vector<std::pair<unsigned long, size_t>> rest;
    for (size_t i = 0; i < element.properties.size(); ++i) {
        const PropertyDescriptor& p = element.properties[i];
        if (p.is_list() || p.name.compare(0, 7, "f_rest_") != 0) {
            continue;
        }
        char* end = nullptr;
        unsigned long n = std::strtoul(p.name.c_str() + 7, &end, 10);
        if (end != p.name.c_str() + 7 && *end == '\0') {
            rest.emplace_back(n, i);
        }
    }
    std::sort(rest.begin(), rest.end());
    for (const auto& r : rest) {
        layout.f_rest.push_back(r.second);
    }

    return layout;
}

// --- SchemaMapper ---

SchemaMapper::SchemaMapper(DiagnosticCallback diagnostics)
    : diagnostics_(std::move(diagnostics))
{
}

std::unique_ptr<SchemaMapper> SchemaMapper::create(PlyVariant variant, const PlyHeader& header,
                                                   DiagnosticCallback diagnostics) {
    switch (variant) {
        case PlyVariant::VendorVariantB:
            if (header.element("codebook_centers")) {
                return std::make_unique<CodebookSchemaMapper>(std::move(diagnostics));
            }
            break;
        case PlyVariant::VendorVariantC: {
            const ElementHeader* vertex = header.element("vertex");
            if (vertex && vertex->has_property("packed_position")) {
                return std::make_unique<ChunkSchemaMapper>(std::move(diagnostics));
            }
            Diagnostic d{DiagnosticCode::UnsupportedVariantData,
                         "Chunked layout without packed_position, reading plain vertex properties"};
            if (diagnostics) {
                diagnostics(d);
            } else {
                default_diagnostic_sink(d);
            }
            break;
        }
        default:
            break;
    }
    return std::make_unique<DirectSchemaMapper>(std::move(diagnostics));
}

bool SchemaMapper::wants_element(const ElementHeader& element) const {
    if (element.name == "face") {
        for (const auto& p : element.properties) {
            if (p.is_list()) return true;
        }
        return false;
    }
    return accepts(element);
}

void SchemaMapper::begin_element(const ElementHeader& element) {
    in_face_ = element.name == "face";
    if (!in_face_) {
        begin(element);
        return;
    }

    face_list_ = kInvalidIndex;
    for (size_t i = 0; i < element.properties.size(); ++i) {
        if (element.properties[i].is_list()) {
            face_list_ = i;
            break;
        }
    }
    channels_.indices.reserve(channels_.indices.size() + reserve_count(element) * 3);
}

void SchemaMapper::map_record(const Record& record, size_t row) {
    if (in_face_) {
        map_face(record);
    } else {
        map(record, row);
    }
}

void SchemaMapper::map_face(const Record& record) {
    if (face_list_ == kInvalidIndex) {
        return;
    }
    const std::vector<double>& list = record.lists[face_list_];
    polygon_.clear();
    for (double v : list) {
        polygon_.push_back(to_index(v));
    }
    if (!triangulate_fan(polygon_, channels_.indices)) {
        ++degenerate_polygons_;
    }
}

GeometryChannels SchemaMapper::finish() {
    complete();
    if (degenerate_polygons_ > 0) {
        report(DiagnosticCode::DegeneratePolygon,
               "Skipped " + std::to_string(degenerate_polygons_) + " polygon(s) with fewer than 3 indices");
    }
    return std::move(channels_);
}

void SchemaMapper::report(DiagnosticCode code, const std::string& message) {
    Diagnostic d{code, message};
    if (diagnostics_) {
        diagnostics_(d);
    } else {
        default_diagnostic_sink(d);
    }
}

// --- DirectSchemaMapper ---

DirectSchemaMapper::DirectSchemaMapper(DiagnosticCallback diagnostics)
    : SchemaMapper(std::move(diagnostics))
{
}

bool DirectSchemaMapper::accepts(const ElementHeader& element) const {
    return element.name == "vertex";
}

void DirectSchemaMapper::begin(const ElementHeader& element) {
    layout_ = VertexLayout::resolve(element);
    if (!layout_.has_position()) {
        throw UnsupportedFormatError("Element 'vertex' lacks x/y/z properties");
    }
    seen_vertex_ = true;

    // Explicit colors win over SH DC terms
    sh_color_ = !layout_.has_rgb() && layout_.has_dc();
    channels_.color_range = sh_color_ ? ColorRange::Byte : ColorRange::Unit;
    channels_.sh_coefficients_per_vertex = layout_.f_rest.size();

    const size_t n = reserve_count(element);
    channels_.positions.reserve(n * 3);
    if (layout_.has_normal()) channels_.normals.reserve(n * 3);
    if (layout_.has_rgb() || sh_color_) channels_.colors.reserve(n * 4);
    if (layout_.has_scale()) channels_.scales.reserve(n * 3);
    if (layout_.has_rotation()) channels_.rotations.reserve(n * 4);
    channels_.sh_coefficients.reserve(n * layout_.f_rest.size());
}

void DirectSchemaMapper::map(const Record& record, size_t row) {
    (void)row;
    const std::vector<double>& v = record.values;

    for (int k = 0; k < 3; ++k) {
        channels_.positions.push_back(static_cast<float>(v[layout_.position[k]]));
    }

    if (layout_.has_normal()) {
        for (int k = 0; k < 3; ++k) {
            channels_.normals.push_back(static_cast<float>(v[layout_.normal[k]]));
        }
    }

    if (layout_.has_rgb()) {
        for (int k = 0; k < 3; ++k) {
            channels_.colors.push_back(static_cast<float>(v[layout_.rgba[k]] / 255.0));
        }
        channels_.colors.push_back(layout_.has_alpha() ? static_cast<float>(v[layout_.rgba[3]] / 255.0) : 1.0f);
    } else if (sh_color_) {
        for (int k = 0; k < 3; ++k) {
            channels_.colors.push_back(sh_to_color(static_cast<float>(v[layout_.f_dc[k]])));
        }
        channels_.colors.push_back(layout_.has_opacity()
                                   ? sigmoid(static_cast<float>(v[layout_.opacity])) * 255.0f
                                   : 255.0f);
    }

    if (layout_.has_scale()) {
        for (int k = 0; k < 3; ++k) {
            channels_.scales.push_back(std::exp(static_cast<float>(v[layout_.scale[k]])));
        }
    }

    if (layout_.has_rotation()) {
        for (int k = 0; k < 4; ++k) {
            channels_.rotations.push_back(static_cast<float>(v[layout_.rotation[k]]));
        }
    }

    for (size_t idx : layout_.f_rest) {
        channels_.sh_coefficients.push_back(static_cast<float>(v[idx]));
    }
}

void DirectSchemaMapper::complete() {
    if (!seen_vertex_) {
        throw UnsupportedFormatError("No 'vertex' element");
    }
}

// --- CodebookSchemaMapper ---

CodebookSchemaMapper::CodebookSchemaMapper(DiagnosticCallback diagnostics)
    : SchemaMapper(std::move(diagnostics))
{
}

bool CodebookSchemaMapper::accepts(const ElementHeader& element) const {
    return element.name == "vertex" || element.name == "codebook_centers";
}

void CodebookSchemaMapper::begin(const ElementHeader& element) {
    in_codebook_ = element.name == "codebook_centers";
    if (in_codebook_) {
        begin_codebook(element);
    } else {
        begin_vertex(element);
    }
}

void CodebookSchemaMapper::map(const Record& record, size_t row) {
    (void)row;
    if (in_codebook_) {
        map_codebook(record);
    } else {
        map_vertex(record);
    }
}

void CodebookSchemaMapper::begin_codebook(const ElementHeader& element) {
    codebook_layout_ = VertexLayout::resolve(element);
    codebook_has_ = {{codebook_layout_.has_dc(), codebook_layout_.has_opacity(),
                      codebook_layout_.has_scale(), codebook_layout_.has_rotation()}};
    entries_.reserve(reserve_count(element) * kSlots);
}

void CodebookSchemaMapper::map_codebook(const Record& record) {
    float slots[kSlots] = {};
    read_slots(codebook_layout_, record, slots);
    entries_.insert(entries_.end(), slots, slots + kSlots);
}

void CodebookSchemaMapper::begin_vertex(const ElementHeader& element) {
    vertex_layout_ = VertexLayout::resolve(element);
    if (!vertex_layout_.has_position()) {
        throw UnsupportedFormatError("Element 'vertex' lacks x/y/z properties");
    }
    seen_vertex_ = true;

    shared_index_ = find_scalar(element, "codebook_index");
    group_index_ = {{find_scalar(element, "color_index"), find_scalar(element, "opacity_index"),
                     find_scalar(element, "scale_index"), find_scalar(element, "rotation_index")}};
    residual_has_ = {{vertex_layout_.has_dc(), vertex_layout_.has_opacity(),
                      vertex_layout_.has_scale(), vertex_layout_.has_rotation()}};

    channels_.color_range = ColorRange::Byte;
    channels_.sh_coefficients_per_vertex = vertex_layout_.f_rest.size();

    const size_t n = reserve_count(element);
    channels_.positions.reserve(n * 3);
    if (vertex_layout_.has_normal()) channels_.normals.reserve(n * 3);
    channels_.sh_coefficients.reserve(n * vertex_layout_.f_rest.size());
    lookups_.reserve(n * kGroupCount);
    residuals_.reserve(n * kSlots);
}

void CodebookSchemaMapper::map_vertex(const Record& record) {
    const std::vector<double>& v = record.values;

    for (int k = 0; k < 3; ++k) {
        channels_.positions.push_back(static_cast<float>(v[vertex_layout_.position[k]]));
    }
    if (vertex_layout_.has_normal()) {
        for (int k = 0; k < 3; ++k) {
            channels_.normals.push_back(static_cast<float>(v[vertex_layout_.normal[k]]));
        }
    }
    for (size_t idx : vertex_layout_.f_rest) {
        channels_.sh_coefficients.push_back(static_cast<float>(v[idx]));
    }

    for (size_t g = 0; g < kGroupCount; ++g) {
        size_t prop = group_index_[g] != kInvalidIndex ? group_index_[g] : shared_index_;
        lookups_.push_back(prop == kInvalidIndex ? kNoLookup : static_cast<int64_t>(std::floor(v[prop])));
    }

    float slots[kSlots] = {};
    read_slots(vertex_layout_, record, slots);
    residuals_.insert(residuals_.end(), slots, slots + kSlots);
}

void CodebookSchemaMapper::complete() {
    if (!seen_vertex_) {
        throw UnsupportedFormatError("No 'vertex' element");
    }

    const size_t n = channels_.positions.size() / 3;
    const size_t entry_count = entries_.size() / kSlots;

    std::array<bool, kGroupCount> present{};
    for (size_t g = 0; g < kGroupCount; ++g) {
        bool has_lookup = group_index_[g] != kInvalidIndex || shared_index_ != kInvalidIndex;
        present[g] = residual_has_[g] || (codebook_has_[g] && has_lookup);
    }

    if (present[kColorGroup]) channels_.colors.reserve(n * 4);
    if (present[kScaleGroup]) channels_.scales.reserve(n * 3);
    if (present[kRotationGroup]) channels_.rotations.reserve(n * 4);

    size_t out_of_range = 0;
    for (size_t i = 0; i < n; ++i) {
        float raw[kSlots] = {};
        bool zeroed[kGroupCount] = {false, false, false, false};

        for (size_t g = 0; g < kGroupCount; ++g) {
            if (!present[g]) continue;

            int64_t idx = lookups_[i * kGroupCount + g];
            if (idx != kNoLookup && codebook_has_[g]) {
                if (idx < 0 || static_cast<uint64_t>(idx) >= entry_count) {
                    zeroed[g] = true;
                    ++out_of_range;
                    continue;
                }
                const float* entry = &entries_[static_cast<size_t>(idx) * kSlots];
                for (size_t s = kGroupBegin[g]; s < kGroupEnd[g]; ++s) raw[s] = entry[s];
            }
            if (residual_has_[g]) {
                const float* residual = &residuals_[i * kSlots];
                for (size_t s = kGroupBegin[g]; s < kGroupEnd[g]; ++s) raw[s] += residual[s];
            }
        }

        if (present[kColorGroup]) {
            for (int k = 0; k < 3; ++k) {
                channels_.colors.push_back(zeroed[kColorGroup] ? 0.0f : sh_to_color(raw[kDc + k]));
            }
            float alpha = 255.0f;
            if (present[kOpacityGroup]) {
                alpha = zeroed[kOpacityGroup] ? 0.0f : sigmoid(raw[kOpacity]) * 255.0f;
            }
            channels_.colors.push_back(alpha);
        }
        if (present[kScaleGroup]) {
            for (int k = 0; k < 3; ++k) {
                channels_.scales.push_back(zeroed[kScaleGroup] ? 0.0f : std::exp(raw[kScale + k]));
            }
        }
        if (present[kRotationGroup]) {
            for (int k = 0; k < 4; ++k) {
                channels_.rotations.push_back(zeroed[kRotationGroup] ? 0.0f : raw[kRotation + k]);
            }
        }
    }

    if (out_of_range > 0) {
        report(DiagnosticCode::CodebookIndexOutOfRange,
               std::to_string(out_of_range) + " codebook lookup(s) outside " +
               std::to_string(entry_count) + " entries, attributes left at zero");
    }

    lookups_.clear();
    residuals_.clear();
}

// --- ChunkSchemaMapper ---

void unpack_111011(uint32_t value, float& x, float& y, float& z) {
    x = static_cast<float>((value >> 21) & 0x7FF) / 2047.0f;
    y = static_cast<float>((value >> 11) & 0x3FF) / 1023.0f;
    z = static_cast<float>(value & 0x7FF) / 2047.0f;
}

void unpack_8888(uint32_t value, float& r, float& g, float& b, float& a) {
    r = static_cast<float>((value >> 24) & 0xFF) / 255.0f;
    g = static_cast<float>((value >> 16) & 0xFF) / 255.0f;
    b = static_cast<float>((value >> 8) & 0xFF) / 255.0f;
    a = static_cast<float>(value & 0xFF) / 255.0f;
}

void unpack_rotation(uint32_t value, float& w, float& x, float& y, float& z) {
    const float norm = 1.0f / (std::sqrt(2.0f) * 0.5f);
    const float a = (static_cast<float>((value >> 20) & 0x3FF) / 1023.0f - 0.5f) * norm;
    const float b = (static_cast<float>((value >> 10) & 0x3FF) / 1023.0f - 0.5f) * norm;
    const float c = (static_cast<float>(value & 0x3FF) / 1023.0f - 0.5f) * norm;
    const float m = std::sqrt(std::max(0.0f, 1.0f - (a * a + b * b + c * c)));

    // Top two bits name the dropped (largest) component
    switch ((value >> 30) & 0x3) {
        case 0: w = m; x = a; y = b; z = c; break;
        case 1: w = a; x = m; y = b; z = c; break;
        case 2: w = a; x = b; y = m; z = c; break;
        default: w = a; x = b; y = c; z = m; break;
    }
}

ChunkSchemaMapper::ChunkSchemaMapper(DiagnosticCallback diagnostics)
    : SchemaMapper(std::move(diagnostics))
{
}

bool ChunkSchemaMapper::accepts(const ElementHeader& element) const {
    return element.name == "chunk" || element.name == "vertex" || element.name == "sh";
}

void ChunkSchemaMapper::begin(const ElementHeader& element) {
    if (element.name == "chunk") {
        section_ = Section::Chunk;
        static const char* names[18] = {
            "min_x", "min_y", "min_z", "max_x", "max_y", "max_z",
            "min_scale_x", "min_scale_y", "min_scale_z", "max_scale_x", "max_scale_y", "max_scale_z",
            "min_r", "min_g", "min_b", "max_r", "max_g", "max_b"};
        chunk_has_color_ = true;
        for (size_t k = 0; k < 18; ++k) {
            chunk_props_[k] = find_scalar(element, names[k]);
            if (chunk_props_[k] != kInvalidIndex) continue;
            if (k < 12) {
                throw UnsupportedFormatError(std::string("Element 'chunk' lacks property '") + names[k] + "'");
            }
            chunk_has_color_ = false;
        }
        chunks_.reserve(reserve_count(element));
    } else if (element.name == "vertex") {
        section_ = Section::Vertex;
        packed_props_ = {{find_scalar(element, "packed_position"), find_scalar(element, "packed_rotation"),
                          find_scalar(element, "packed_scale"), find_scalar(element, "packed_color")}};
        if (packed_props_[0] == kInvalidIndex) {
            throw UnsupportedFormatError("Element 'vertex' lacks packed_position");
        }
        seen_vertex_ = true;
        packed_.reserve(reserve_count(element) * 4);
    } else {
        section_ = Section::Sh;
        sh_props_ = VertexLayout::resolve(element).f_rest;
        channels_.sh_coefficients_per_vertex = sh_props_.size();
        channels_.sh_coefficients.reserve(reserve_count(element) * sh_props_.size());
    }
}

void ChunkSchemaMapper::map(const Record& record, size_t row) {
    (void)row;
    const std::vector<double>& v = record.values;

    switch (section_) {
        case Section::Chunk: {
            ChunkBounds c;
            for (int k = 0; k < 3; ++k) {
                c.min_position[k] = static_cast<float>(v[chunk_props_[k]]);
                c.max_position[k] = static_cast<float>(v[chunk_props_[3 + k]]);
                c.min_scale[k] = static_cast<float>(v[chunk_props_[6 + k]]);
                c.max_scale[k] = static_cast<float>(v[chunk_props_[9 + k]]);
                if (chunk_has_color_) {
                    c.min_color[k] = static_cast<float>(v[chunk_props_[12 + k]]);
                    c.max_color[k] = static_cast<float>(v[chunk_props_[15 + k]]);
                }
            }
            chunks_.push_back(c);
            break;
        }
        case Section::Vertex:
            for (size_t k = 0; k < 4; ++k) {
                packed_.push_back(packed_props_[k] == kInvalidIndex ? 0u : to_index(v[packed_props_[k]]));
            }
            break;
        case Section::Sh:
            for (size_t idx : sh_props_) {
                double q = v[idx];
                float n = q <= 0.0 ? 0.0f : (q >= 255.0 ? 1.0f : static_cast<float>((q + 0.5) / 256.0));
                channels_.sh_coefficients.push_back((n - 0.5f) * 8.0f);
            }
            break;
        case Section::None:
            break;
    }
}

void ChunkSchemaMapper::complete() {
    if (!seen_vertex_) {
        throw UnsupportedFormatError("No 'vertex' element");
    }

    const size_t n = packed_.size() / 4;
    const bool has_rotation = packed_props_[1] != kInvalidIndex;
    const bool has_scale = packed_props_[2] != kInvalidIndex;
    const bool has_color = packed_props_[3] != kInvalidIndex;

    channels_.color_range = ColorRange::Byte;
    channels_.positions.reserve(n * 3);
    if (has_rotation) channels_.rotations.reserve(n * 4);
    if (has_scale) channels_.scales.reserve(n * 3);
    if (has_color) channels_.colors.reserve(n * 4);

    size_t orphans = 0;
    for (size_t i = 0; i < n; ++i) {
        const uint32_t* packed = &packed_[i * 4];
        const size_t ci = i / kChunkSize;

        if (ci >= chunks_.size()) {
            ++orphans;
            channels_.positions.insert(channels_.positions.end(), 3, 0.0f);
            if (has_rotation) channels_.rotations.insert(channels_.rotations.end(), 4, 0.0f);
            if (has_scale) channels_.scales.insert(channels_.scales.end(), 3, 0.0f);
            if (has_color) channels_.colors.insert(channels_.colors.end(), 4, 0.0f);
            continue;
        }
        const ChunkBounds& c = chunks_[ci];

        float t[3];
        unpack_111011(packed[0], t[0], t[1], t[2]);
        for (int k = 0; k < 3; ++k) {
            channels_.positions.push_back(lerp(c.min_position[k], c.max_position[k], t[k]));
        }

        if (has_rotation) {
            float w, x, y, z;
            unpack_rotation(packed[1], w, x, y, z);
            channels_.rotations.push_back(w);
            channels_.rotations.push_back(x);
            channels_.rotations.push_back(y);
            channels_.rotations.push_back(z);
        }

        if (has_scale) {
            // Bounds are in log space
            unpack_111011(packed[2], t[0], t[1], t[2]);
            for (int k = 0; k < 3; ++k) {
                channels_.scales.push_back(std::exp(lerp(c.min_scale[k], c.max_scale[k], t[k])));
            }
        }

        if (has_color) {
            float rgba[4];
            unpack_8888(packed[3], rgba[0], rgba[1], rgba[2], rgba[3]);
            for (int k = 0; k < 3; ++k) {
                channels_.colors.push_back(clamp(lerp(c.min_color[k], c.max_color[k], rgba[k]), 0.0f, 1.0f) * 255.0f);
            }
            channels_.colors.push_back(rgba[3] * 255.0f);
        }
    }

    if (orphans > 0) {
        report(DiagnosticCode::UnsupportedVariantData,
               std::to_string(orphans) + " vertex(es) beyond the last chunk, decoded as zeros");
    }

    packed_.clear();
}

} // namespace splatquery
