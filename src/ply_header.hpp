#ifndef SPLATQUERY_PLY_HEADER_HPP
#define SPLATQUERY_PLY_HEADER_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace splatquery {

enum class ScalarType : uint8_t {
    Int8,
    UInt8,
    Int16,
    UInt16,
    Int32,
    UInt32,
    Float32,
    Float64,
    Unsupported  // Unknown type name; occupies no bytes, decodes as 0
};

/// Byte size of a scalar type (0 for Unsupported).
size_t type_size(ScalarType type);

/// Maps "uchar"/"uint8", "float"/"float32", ... to a type. Unknown names give Unsupported.
ScalarType parse_type_name(const std::string& name);

const char* to_string(ScalarType type);

enum class PlyEncoding {
    Ascii,
    BinaryLittleEndian,
    BinaryBigEndian
};

enum class PropertyKind {
    Scalar,
    List
};

struct PropertyDescriptor {
    std::string name;
    PropertyKind kind = PropertyKind::Scalar;
    ScalarType type = ScalarType::Float32;       // Scalar type, or list value type
    ScalarType count_type = ScalarType::UInt8;   // List count type (List only)
    std::string type_name;                       // As written in the header
    uint32_t offset = 0;                         // Byte offset within a fixed record (Scalar only)

    bool is_list() const { return kind == PropertyKind::List; }

    static PropertyDescriptor scalar(const std::string& name, ScalarType type);
    static PropertyDescriptor list(const std::string& name, ScalarType count_type, ScalarType value_type);
};

constexpr size_t kInvalidIndex = static_cast<size_t>(-1);

struct ElementHeader {
    std::string name;
    size_t count = 0;
    std::vector<PropertyDescriptor> properties;

    /// Sum of scalar property sizes. List properties are excluded.
    uint32_t stride() const;

    /// True when every property is a scalar, so records have a fixed size.
    bool fixed_size() const;

    /// Index of the named property, or kInvalidIndex.
    size_t find_property(const std::string& property_name) const;

    bool has_property(const std::string& property_name) const {
        return find_property(property_name) != kInvalidIndex;
    }
};

struct PlyHeader {
    PlyEncoding encoding = PlyEncoding::Ascii;
    std::string version;
    std::vector<ElementHeader> elements;
    std::vector<std::string> comments;
    size_t payload_offset = 0;  // First byte after the end_header line

    size_t find_element(const std::string& element_name) const;
    const ElementHeader* element(const std::string& element_name) const;
};

/// Parse the textual header. Throws MalformedHeaderError.
PlyHeader parse_header(const uint8_t* data, size_t size);
PlyHeader parse_header(const std::string& text);

} // namespace splatquery

#endif // SPLATQUERY_PLY_HEADER_HPP
