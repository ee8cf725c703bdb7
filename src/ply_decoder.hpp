#ifndef SPLATQUERY_PLY_DECODER_HPP
#define SPLATQUERY_PLY_DECODER_HPP

#include "errors.hpp"
#include "format_classifier.hpp"
#include "geometry_buffer.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace splatquery {

struct DecodeFailure {
    ErrorKind kind;
    std::string message;
};

/// Either a decoded buffer or the reason there is none.
class DecodeResult {
public:
    DecodeResult(GeometryBuffer buffer) : result_(std::move(buffer)) {}
    DecodeResult(DecodeFailure failure) : result_(std::move(failure)) {}

    bool has_value() const { return std::holds_alternative<GeometryBuffer>(result_); }
    explicit operator bool() const { return has_value(); }

    const GeometryBuffer& operator*() const { return std::get<GeometryBuffer>(result_); }
    const GeometryBuffer* operator->() const { return &std::get<GeometryBuffer>(result_); }

    /// Moves the buffer out; the result is left holding an empty buffer
    GeometryBuffer take() { return std::move(std::get<GeometryBuffer>(result_)); }

    const DecodeFailure& failure() const { return std::get<DecodeFailure>(result_); }
    ErrorKind error_kind() const { return failure().kind; }
    std::string error() const { return failure().message; }

private:
    std::variant<GeometryBuffer, DecodeFailure> result_;
};

/// Multi-format PLY decoder. Holds no per-call state; one instance may decode many inputs.
class PlyDecoder {
public:
    PlyDecoder() = default;

    /// Sink for non-fatal anomalies. Unset, they print as warnings on stderr.
    void set_diagnostic_callback(DiagnosticCallback cb);

    DecodeResult decode(const uint8_t* data, size_t size) const;
    DecodeResult decode(const std::vector<uint8_t>& bytes) const;
    DecodeResult decode(const std::string& text) const;

    /// Memory-maps `path` and decodes it. Throws std::runtime_error when the file cannot be opened.
    DecodeResult decode_file(const std::string& path) const;

    /// Same as decode() but structural failures propagate as DecodeError.
    GeometryBuffer decode_or_throw(const uint8_t* data, size_t size) const;

private:
    GeometryBuffer decode_as(PlyVariant layout, PlyVariant reported,
                             const uint8_t* data, size_t size) const;
    void report(DiagnosticCode code, const std::string& message) const;

    DiagnosticCallback diagnostics_;
};

} // namespace splatquery

#endif // SPLATQUERY_PLY_DECODER_HPP
