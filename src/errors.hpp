#ifndef SPLATQUERY_ERRORS_HPP
#define SPLATQUERY_ERRORS_HPP

#include <cstddef>
#include <functional>
#include <stdexcept>
#include <string>

namespace splatquery {

enum class ErrorKind {
    MalformedHeader,
    BufferOverflow,
    UnsupportedPropertyType,
    EmptyGeometry,
    UnsupportedFormat
};

const char* to_string(ErrorKind kind);

/// Base of every structural decode failure.
class DecodeError : public std::runtime_error {
public:
    DecodeError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class MalformedHeaderError : public DecodeError {
public:
    explicit MalformedHeaderError(const std::string& message)
        : DecodeError(ErrorKind::MalformedHeader, message) {}
};

/// A read ran past the end of the payload. Aborts the element being decoded.
class BufferOverflowError : public DecodeError {
public:
    BufferOverflowError(size_t element_index, const std::string& property, size_t offset);

    size_t element_index() const { return element_index_; }
    const std::string& property() const { return property_; }
    size_t offset() const { return offset_; }

private:
    size_t element_index_;
    std::string property_;
    size_t offset_;
};

class EmptyGeometryError : public DecodeError {
public:
    explicit EmptyGeometryError(const std::string& message)
        : DecodeError(ErrorKind::EmptyGeometry, message) {}
};

class UnsupportedFormatError : public DecodeError {
public:
    explicit UnsupportedFormatError(const std::string& message)
        : DecodeError(ErrorKind::UnsupportedFormat, message) {}
};

// Non-fatal anomalies. Reported through the diagnostic sink, never thrown.
enum class DiagnosticCode {
    UnsupportedPropertyType,
    InvalidAsciiValue,
    DegeneratePolygon,
    FaceIndexOutOfRange,
    CodebookIndexOutOfRange,
    UnknownFormat,
    UnsupportedVariantData
};

const char* to_string(DiagnosticCode code);

struct Diagnostic {
    DiagnosticCode code;
    std::string message;
};

using DiagnosticCallback = std::function<void(const Diagnostic& diagnostic)>;

/// Sink used when the caller installs none: prints "Warning: ..." to stderr.
void default_diagnostic_sink(const Diagnostic& diagnostic);

} // namespace splatquery

#endif // SPLATQUERY_ERRORS_HPP
