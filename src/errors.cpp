#include "errors.hpp"
#include <iostream>

namespace splatquery {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MalformedHeader: return "MalformedHeaderError";
        case ErrorKind::BufferOverflow: return "BufferOverflowError";
        case ErrorKind::UnsupportedPropertyType: return "UnsupportedPropertyTypeError";
        case ErrorKind::EmptyGeometry: return "EmptyGeometryError";
        case ErrorKind::UnsupportedFormat: return "UnsupportedFormatError";
    }
    return "DecodeError";
}

const char* to_string(DiagnosticCode code) {
    switch (code) {
        case DiagnosticCode::UnsupportedPropertyType: return "unsupported property type";
        case DiagnosticCode::InvalidAsciiValue: return "invalid ascii value";
        case DiagnosticCode::DegeneratePolygon: return "degenerate polygon";
        case DiagnosticCode::FaceIndexOutOfRange: return "face index out of range";
        case DiagnosticCode::CodebookIndexOutOfRange: return "codebook index out of range";
        case DiagnosticCode::UnknownFormat: return "unknown format";
        case DiagnosticCode::UnsupportedVariantData: return "unsupported variant data";
    }
    return "diagnostic";
}

BufferOverflowError::BufferOverflowError(size_t element_index, const std::string& property, size_t offset)
    : DecodeError(ErrorKind::BufferOverflow,
                  "Buffer overflow in element " + std::to_string(element_index) +
                  ", property '" + property + "' at offset " + std::to_string(offset))
    , element_index_(element_index)
    , property_(property)
    , offset_(offset)
{
}

void default_diagnostic_sink(const Diagnostic& diagnostic) {
    std::cerr << "Warning: " << diagnostic.message << "\n";
}

} // namespace splatquery
