#include "record_decoder.hpp"
#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <string>

namespace splatquery {

namespace {

// Assembles `n` bytes into an integer regardless of host byte order
uint64_t load_bits(const uint8_t* p, size_t n, bool big_endian) {
    uint64_t bits = 0;
    for (size_t i = 0; i < n; ++i) {
        uint64_t b = big_endian ? p[i] : p[n - 1 - i];
        bits = (bits << 8) | b;
    }
    return bits;
}

// List counts arrive as doubles; anything beyond the payload is rejected later
size_t to_count(double count) {
    if (!(count > 0.0)) {
        return 0;
    }
    if (count >= static_cast<double>(std::numeric_limits<size_t>::max())) {
        return std::numeric_limits<size_t>::max();
    }
    return static_cast<size_t>(count);
}

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\v' || c == '\f';
}

} // namespace

double read_scalar(const uint8_t* buffer, size_t length, size_t offset,
                   ScalarType type, bool big_endian) {
    if (offset > length || type_size(type) > length - offset) {
        throw std::out_of_range("Scalar read at " + std::to_string(offset) +
                                " runs past " + std::to_string(length) + " bytes");
    }
    const uint8_t* p = buffer + offset;
    switch (type) {
        case ScalarType::Int8:
            return static_cast<int8_t>(p[0]);
        case ScalarType::UInt8:
            return p[0];
        case ScalarType::Int16:
            return static_cast<int16_t>(static_cast<uint16_t>(load_bits(p, 2, big_endian)));
        case ScalarType::UInt16:
            return static_cast<uint16_t>(load_bits(p, 2, big_endian));
        case ScalarType::Int32:
            return static_cast<int32_t>(static_cast<uint32_t>(load_bits(p, 4, big_endian)));
        case ScalarType::UInt32:
            return static_cast<uint32_t>(load_bits(p, 4, big_endian));
        case ScalarType::Float32: {
            uint32_t bits = static_cast<uint32_t>(load_bits(p, 4, big_endian));
            float f;
            std::memcpy(&f, &bits, sizeof(f));
            return f;
        }
        case ScalarType::Float64: {
            uint64_t bits = load_bits(p, 8, big_endian);
            double d;
            std::memcpy(&d, &bits, sizeof(d));
            return d;
        }
        case ScalarType::Unsupported:
            return 0.0;
    }
    return 0.0;
}

bool triangulate_fan(const std::vector<uint32_t>& polygon, std::vector<uint32_t>& triangles) {
    const size_t n = polygon.size();
    if (n < 3) {
        return false;
    }
    triangles.reserve(triangles.size() + (n - 2) * 3);
    for (size_t j = 1; j + 1 < n; ++j) {
        triangles.push_back(polygon[0]);
        triangles.push_back(polygon[j]);
        triangles.push_back(polygon[j + 1]);
    }
    return true;
}

RecordDecoder::RecordDecoder(const PlyHeader& header, const uint8_t* data, size_t size,
                             DiagnosticCallback diagnostics)
    : header_(header)
    , data_(data)
    , size_(size)
    , diagnostics_(std::move(diagnostics))
    , big_endian_(header.encoding == PlyEncoding::BinaryBigEndian)
    , cursor_(std::min(header.payload_offset, size))
{
}

void RecordDecoder::report(DiagnosticCode code, const std::string& message) {
    Diagnostic d{code, message};
    if (diagnostics_) {
        diagnostics_(d);
    } else {
        default_diagnostic_sink(d);
    }
}

void RecordDecoder::report_unsupported(size_t element_index, const PropertyDescriptor& property) {
    if (!reported_.emplace(element_index, "type:" + property.name).second) {
        return;
    }
    report(DiagnosticCode::UnsupportedPropertyType,
           "Unsupported property type '" + property.type_name + "' for " +
           header_.elements[element_index].name + "." + property.name + ", decoding as 0");
}

void RecordDecoder::seek_to(size_t element_index) {
    if (element_index >= header_.elements.size()) {
        throw std::out_of_range("Element index " + std::to_string(element_index) + " out of range");
    }
    if (element_index < next_element_) {
        throw std::logic_error("Elements must be decoded in declared order");
    }
    while (next_element_ < element_index) {
        skip_element(next_element_);
    }
}

void RecordDecoder::decode_element(size_t element_index, const RecordCallback& callback) {
    seek_to(element_index);
    if (header_.encoding == PlyEncoding::Ascii) {
        decode_ascii(element_index, callback);
    } else {
        decode_binary(element_index, callback);
    }
    next_element_ = element_index + 1;
}

void RecordDecoder::skip_element(size_t element_index) {
    seek_to(element_index);
    const ElementHeader& element = header_.elements[element_index];

    if (header_.encoding != PlyEncoding::Ascii && element.fixed_size()) {
        const size_t stride = element.stride();
        const size_t available = size_ - cursor_;
        if (stride > 0 && element.count > available / stride) {
            // Locate the property the payload ends in
            const size_t remainder = available % stride;
            std::string property = element.properties.empty() ? "" : element.properties.back().name;
            for (const auto& p : element.properties) {
                if (p.offset + type_size(p.type) > remainder) {
                    property = p.name;
                    break;
                }
            }
            throw BufferOverflowError(element_index, property, size_ - remainder);
        }
        cursor_ += stride * element.count;
    } else {
        RecordCallback ignore = [](const Record&, size_t) {};
        if (header_.encoding == PlyEncoding::Ascii) {
            decode_ascii(element_index, ignore);
        } else {
            decode_binary(element_index, ignore);
        }
    }
    next_element_ = element_index + 1;
}

double RecordDecoder::read_binary(size_t element_index, const PropertyDescriptor& property, ScalarType type) {
    if (type == ScalarType::Unsupported) {
        report_unsupported(element_index, property);
        return 0.0;
    }
    const size_t n = type_size(type);
    if (n > size_ - cursor_) {
        throw BufferOverflowError(element_index, property.name, cursor_);
    }
    double value = read_scalar(data_, size_, cursor_, type, big_endian_);
    cursor_ += n;
    return value;
}

void RecordDecoder::decode_binary(size_t element_index, const RecordCallback& callback) {
    const ElementHeader& element = header_.elements[element_index];
    const size_t num_props = element.properties.size();

    Record record;
    record.values.assign(num_props, 0.0);
    record.lists.resize(num_props);

    for (size_t row = 0; row < element.count; ++row) {
        for (size_t i = 0; i < num_props; ++i) {
            const PropertyDescriptor& p = element.properties[i];
            if (!p.is_list()) {
                record.values[i] = read_binary(element_index, p, p.type);
                continue;
            }

            double count = read_binary(element_index, p, p.count_type);
            size_t n = to_count(count);
            size_t value_size = std::max<size_t>(1, type_size(p.type));
            if (n > (size_ - cursor_) / value_size) {
                throw BufferOverflowError(element_index, p.name, cursor_);
            }

            std::vector<double>& list = record.lists[i];
            list.resize(n);
            for (size_t j = 0; j < n; ++j) {
                list[j] = read_binary(element_index, p, p.type);
            }
            record.values[i] = static_cast<double>(n);
        }
        callback(record, row);
    }
}

bool RecordDecoder::next_ascii_line() {
    const char* text = reinterpret_cast<const char*>(data_);

    while (cursor_ < size_) {
        line_start_ = cursor_;
        const void* nl = std::memchr(text + cursor_, '\n', size_ - cursor_);
        size_t line_end = nl ? static_cast<size_t>(static_cast<const char*>(nl) - text) : size_;
        cursor_ = nl ? line_end + 1 : size_;

        tokens_.clear();
        size_t i = line_start_;
        while (i < line_end) {
            while (i < line_end && is_space(text[i])) ++i;
            size_t start = i;
            while (i < line_end && !is_space(text[i])) ++i;
            if (i > start) {
                tokens_.emplace_back(start, i - start);
            }
        }
        if (!tokens_.empty()) {
            return true;
        }
    }
    return false;
}

double RecordDecoder::parse_ascii_token(size_t element_index, const PropertyDescriptor& property,
                                        ScalarType type, size_t token, size_t row) {
    if (type == ScalarType::Unsupported) {
        report_unsupported(element_index, property);
        return 0.0;
    }

    scratch_.assign(reinterpret_cast<const char*>(data_) + tokens_[token].first, tokens_[token].second);
    char* end = nullptr;
    double value = std::strtod(scratch_.c_str(), &end);
    if (end != scratch_.c_str() + scratch_.size()) {
        if (reported_.emplace(element_index, "value:" + property.name).second) {
            report(DiagnosticCode::InvalidAsciiValue,
                   "Invalid value '" + scratch_ + "' for " + header_.elements[element_index].name +
                   "." + property.name + " at row " + std::to_string(row) + ", decoding as 0");
        }
        return 0.0;
    }
    return value;
}

void RecordDecoder::decode_ascii(size_t element_index, const RecordCallback& callback) {
    const ElementHeader& element = header_.elements[element_index];
    const size_t num_props = element.properties.size();
    const std::string first_property = num_props > 0 ? element.properties[0].name : "";

    Record record;
    record.values.assign(num_props, 0.0);
    record.lists.resize(num_props);

    for (size_t row = 0; row < element.count; ++row) {
        if (!next_ascii_line()) {
            throw BufferOverflowError(element_index, first_property, cursor_);
        }

        size_t t = 0;
        for (size_t i = 0; i < num_props; ++i) {
            const PropertyDescriptor& p = element.properties[i];
            if (t >= tokens_.size()) {
                throw BufferOverflowError(element_index, p.name, line_start_);
            }

            if (!p.is_list()) {
                record.values[i] = parse_ascii_token(element_index, p, p.type, t++, row);
                continue;
            }

            double count = parse_ascii_token(element_index, p, p.count_type, t++, row);
            size_t n = to_count(count);
            if (n > tokens_.size() - t) {
                throw BufferOverflowError(element_index, p.name, line_start_);
            }

            std::vector<double>& list = record.lists[i];
            list.resize(n);
            for (size_t j = 0; j < n; ++j) {
                list[j] = parse_ascii_token(element_index, p, p.type, t++, row);
            }
            record.values[i] = static_cast<double>(n);
        }
        callback(record, row);
    }
}

} // namespace splatquery
