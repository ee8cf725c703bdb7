#ifndef SPLATQUERY_RECORD_DECODER_HPP
#define SPLATQUERY_RECORD_DECODER_HPP

#include "ply_header.hpp"
#include "errors.hpp"
#include <cstdint>
#include <functional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace splatquery {

/// One decoded record. The same instance is reused for every row of an element.
struct Record {
    std::vector<double> values;              // Per property; a list property holds its count
    std::vector<std::vector<double>> lists;  // Per property; empty for scalar properties
};

using RecordCallback = std::function<void(const Record& record, size_t row)>;

/// Reads one scalar at `offset`. Unsupported types read as 0.
/// Throws std::out_of_range when offset + type_size(type) exceeds length.
double read_scalar(const uint8_t* buffer, size_t length, size_t offset,
                   ScalarType type, bool big_endian);

/// Fan triangulation from polygon[0]: appends (n-2) triangles.
/// Returns false and appends nothing when the polygon has fewer than 3 indices.
/// Assumes convex, consistently wound polygons.
bool triangulate_fan(const std::vector<uint32_t>& polygon, std::vector<uint32_t>& triangles);

/// Sequential decoder over the payload that follows a parsed header.
/// Elements are visited in declared order; earlier elements are skipped on demand.
class RecordDecoder {
public:
    RecordDecoder(const PlyHeader& header, const uint8_t* data, size_t size,
                  DiagnosticCallback diagnostics = DiagnosticCallback());

    // Non-copyable
    RecordDecoder(const RecordDecoder&) = delete;
    RecordDecoder& operator=(const RecordDecoder&) = delete;

    /// Decode every record of an element, calling `callback` once per row.
    /// Throws BufferOverflowError when the payload ends inside the element.
    void decode_element(size_t element_index, const RecordCallback& callback);

    /// Advance past an element without delivering its records.
    void skip_element(size_t element_index);

    size_t next_element() const { return next_element_; }
    size_t position() const { return cursor_; }

private:
    void seek_to(size_t element_index);
    void decode_binary(size_t element_index, const RecordCallback& callback);
    void decode_ascii(size_t element_index, const RecordCallback& callback);
    double read_binary(size_t element_index, const PropertyDescriptor& property, ScalarType type);
    bool next_ascii_line();
    double parse_ascii_token(size_t element_index, const PropertyDescriptor& property,
                             ScalarType type, size_t token, size_t row);
    void report_unsupported(size_t element_index, const PropertyDescriptor& property);
    void report(DiagnosticCode code, const std::string& message);

    const PlyHeader& header_;
    const uint8_t* data_;
    size_t size_;
    DiagnosticCallback diagnostics_;
    bool big_endian_;
    size_t cursor_;
    size_t next_element_ = 0;

    // Ascii line state
    std::vector<std::pair<size_t, size_t>> tokens_;  // (offset, length) in the payload
    size_t line_start_ = 0;
    std::string scratch_;

    std::set<std::pair<size_t, std::string>> reported_;
};

} // namespace splatquery

#endif // SPLATQUERY_RECORD_DECODER_HPP
