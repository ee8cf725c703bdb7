#include "ply_header.hpp"
#include "errors.hpp"
#include <cstdlib>
#include <cstring>
#include <sstream>

namespace splatquery {

size_t type_size(ScalarType type) {
    switch (type) {
        case ScalarType::Int8:
        case ScalarType::UInt8: return 1;
        case ScalarType::Int16:
        case ScalarType::UInt16: return 2;
        case ScalarType::Int32:
        case ScalarType::UInt32:
        case ScalarType::Float32: return 4;
        case ScalarType::Float64: return 8;
        case ScalarType::Unsupported: return 0;
    }
    return 0;
}

ScalarType parse_type_name(const std::string& name) {
    if (name == "char" || name == "int8") return ScalarType::Int8;
    if (name == "uchar" || name == "uint8") return ScalarType::UInt8;
    if (name == "short" || name == "int16") return ScalarType::Int16;
    if (name == "ushort" || name == "uint16") return ScalarType::UInt16;
    if (name == "int" || name == "int32") return ScalarType::Int32;
    if (name == "uint" || name == "uint32") return ScalarType::UInt32;
    if (name == "float" || name == "float32") return ScalarType::Float32;
    if (name == "double" || name == "float64") return ScalarType::Float64;
    return ScalarType::Unsupported;
}

const char* to_string(ScalarType type) {
    switch (type) {
        case ScalarType::Int8: return "char";
        case ScalarType::UInt8: return "uchar";
        case ScalarType::Int16: return "short";
        case ScalarType::UInt16: return "ushort";
        case ScalarType::Int32: return "int";
        case ScalarType::UInt32: return "uint";
        case ScalarType::Float32: return "float";
        case ScalarType::Float64: return "double";
        case ScalarType::Unsupported: return "unsupported";
    }
    return "unsupported";
}

PropertyDescriptor PropertyDescriptor::scalar(const std::string& name, ScalarType type) {
    PropertyDescriptor p;
    p.name = name;
    p.kind = PropertyKind::Scalar;
    p.type = type;
    p.type_name = to_string(type);
    return p;
}

PropertyDescriptor PropertyDescriptor::list(const std::string& name, ScalarType count_type,
                                            ScalarType value_type) {
    PropertyDescriptor p;
    p.name = name;
    p.kind = PropertyKind::List;
    p.type = value_type;
    p.count_type = count_type;
    p.type_name = to_string(value_type);
    return p;
}

uint32_t ElementHeader::stride() const {
    uint32_t total = 0;
    for (const auto& p : properties) {
        if (!p.is_list()) {
            total += static_cast<uint32_t>(type_size(p.type));
        }
    }
    return total;
}

bool ElementHeader::fixed_size() const {
    for (const auto& p : properties) {
        if (p.is_list()) return false;
    }
    return true;
}

size_t ElementHeader::find_property(const std::string& property_name) const {
    for (size_t i = 0; i < properties.size(); ++i) {
        if (properties[i].name == property_name) return i;
    }
    return kInvalidIndex;
}

size_t PlyHeader::find_element(const std::string& element_name) const {
    for (size_t i = 0; i < elements.size(); ++i) {
        if (elements[i].name == element_name) return i;
    }
    return kInvalidIndex;
}

const ElementHeader* PlyHeader::element(const std::string& element_name) const {
    size_t idx = find_element(element_name);
    return idx == kInvalidIndex ? nullptr : &elements[idx];
}

namespace {

std::vector<std::string> tokenize(const std::string& line) {
    std::vector<std::string> tokens;
    std::istringstream iss(line);
    std::string token;
    while (iss >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

bool parse_count(const std::string& token, size_t& out) {
    if (token.empty() || token[0] == '-' || token[0] == '+') return false;
    char* end = nullptr;
    unsigned long long value = std::strtoull(token.c_str(), &end, 10);
    if (end == token.c_str() || *end != '\0') return false;
    out = static_cast<size_t>(value);
    return true;
}

std::string line_error(size_t line_no, const std::string& what, const std::string& line) {
    return "Line " + std::to_string(line_no) + ": " + what + ": '" + line + "'";
}

} // namespace

PlyHeader parse_header(const uint8_t* data, size_t size) {
    const char* text = reinterpret_cast<const char*>(data);

    PlyHeader header;
    bool found_format = false;
    bool found_end = false;
    size_t pos = 0;
    size_t line_no = 0;
    uint32_t offset = 0;  // Running scalar offset of the current element

    while (pos < size) {
        const char* nl = static_cast<const char*>(std::memchr(text + pos, '\n', size - pos));
        size_t line_end = nl ? static_cast<size_t>(nl - text) : size;
        std::string line(text + pos, line_end - pos);
        pos = nl ? line_end + 1 : size;
        ++line_no;

        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        if (line_no == 1) {
            // Editors on Windows may prepend a UTF-8 byte order mark
            if (line.compare(0, 3, "\xEF\xBB\xBF") == 0) {
                line.erase(0, 3);
            }
            if (line != "ply") {
                throw MalformedHeaderError("Missing 'ply' magic on first line");
            }
            continue;
        }

        std::vector<std::string> tokens = tokenize(line);
        if (tokens.empty()) continue;
        const std::string& keyword = tokens[0];

        if (keyword == "end_header") {
            found_end = true;
            header.payload_offset = pos;
            break;
        } else if (keyword == "comment" || keyword == "obj_info") {
            header.comments.push_back(line.size() > keyword.size() ? line.substr(keyword.size() + 1) : "");
        } else if (keyword == "format") {
            if (tokens.size() < 2 || tokens.size() > 3) {
                throw MalformedHeaderError(line_error(line_no, "Malformed format line", line));
            }
            if (tokens[1] == "ascii") {
                header.encoding = PlyEncoding::Ascii;
            } else if (tokens[1] == "binary_little_endian") {
                header.encoding = PlyEncoding::BinaryLittleEndian;
            } else if (tokens[1] == "binary_big_endian") {
                header.encoding = PlyEncoding::BinaryBigEndian;
            } else {
                throw MalformedHeaderError(line_error(line_no, "Unknown format", line));
            }
            header.version = tokens.size() == 3 ? tokens[2] : "1.0";
            found_format = true;
        } else if (keyword == "element") {
            ElementHeader element;
            if (tokens.size() != 3 || !parse_count(tokens[2], element.count)) {
                throw MalformedHeaderError(line_error(line_no, "Malformed element line", line));
            }
            element.name = tokens[1];
            header.elements.push_back(std::move(element));
            offset = 0;
        } else if (keyword == "property") {
            if (header.elements.empty()) {
                throw MalformedHeaderError(line_error(line_no, "Property before any element", line));
            }
            ElementHeader& element = header.elements.back();

            if (tokens.size() >= 2 && tokens[1] == "list") {
                if (tokens.size() != 5) {
                    throw MalformedHeaderError(line_error(line_no, "Malformed list property", line));
                }
                PropertyDescriptor p = PropertyDescriptor::list(
                    tokens[4], parse_type_name(tokens[2]), parse_type_name(tokens[3]));
                p.type_name = tokens[3];
                element.properties.push_back(std::move(p));
            } else {
                if (tokens.size() != 3) {
                    throw MalformedHeaderError(line_error(line_no, "Malformed property line", line));
                }
                PropertyDescriptor p = PropertyDescriptor::scalar(tokens[2], parse_type_name(tokens[1]));
                p.type_name = tokens[1];
                p.offset = offset;
                offset += static_cast<uint32_t>(type_size(p.type));
                element.properties.push_back(std::move(p));
            }
        }
        // Other keywords are ignored
    }

    if (!found_end) {
        throw MalformedHeaderError("Header terminator 'end_header' not found");
    }
    if (!found_format) {
        throw MalformedHeaderError("Missing format line");
    }

    return header;
}

PlyHeader parse_header(const std::string& text) {
    return parse_header(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

} // namespace splatquery
