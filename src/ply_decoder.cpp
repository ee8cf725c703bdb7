#include "ply_decoder.hpp"
#include "platform.hpp"
#include "ply_header.hpp"
#include "record_decoder.hpp"
#include "schema_mapper.hpp"
#include <stdexcept>

namespace splatquery {

void PlyDecoder::set_diagnostic_callback(DiagnosticCallback cb) {
    diagnostics_ = std::move(cb);
}

void PlyDecoder::report(DiagnosticCode code, const std::string& message) const {
    Diagnostic d{code, message};
    if (diagnostics_) {
        diagnostics_(d);
    } else {
        default_diagnostic_sink(d);
    }
}

GeometryBuffer PlyDecoder::decode_as(PlyVariant layout, PlyVariant reported,
                                     const uint8_t* data, size_t size) const {
    PlyHeader header = parse_header(data, size);
    std::unique_ptr<SchemaMapper> mapper = SchemaMapper::create(layout, header, diagnostics_);
    RecordDecoder decoder(header, data, size, diagnostics_);

    // Unwanted elements between wanted ones are skipped by the decoder;
    // trailing unwanted elements are never read
    for (size_t i = 0; i < header.elements.size(); ++i) {
        const ElementHeader& element = header.elements[i];
        if (!mapper->wants_element(element)) {
            continue;
        }
        mapper->begin_element(element);
        decoder.decode_element(i, [&mapper](const Record& record, size_t row) {
            mapper->map_record(record, row);
        });
    }

    GeometryAssembler assembler(diagnostics_);
    return assembler.build(mapper->finish(), reported);
}

GeometryBuffer PlyDecoder::decode_or_throw(const uint8_t* data, size_t size) const {
    PlyVariant variant = classify_format(data, size);
    if (variant != PlyVariant::Unknown) {
        return decode_as(variant, variant, data, size);
    }

    report(DiagnosticCode::UnknownFormat, "Unrecognized stream, trying the standard PLY layout");
    try {
        return decode_as(PlyVariant::Standard, PlyVariant::Unknown, data, size);
    } catch (const DecodeError& e) {
        throw UnsupportedFormatError(std::string("Unsupported format: ") + e.what());
    }
}

DecodeResult PlyDecoder::decode(const uint8_t* data, size_t size) const {
    try {
        return DecodeResult(decode_or_throw(data, size));
    } catch (const DecodeError& e) {
        return DecodeResult(DecodeFailure{e.kind(), e.what()});
    }
}

DecodeResult PlyDecoder::decode(const std::vector<uint8_t>& bytes) const {
    static const uint8_t empty = 0;
    return decode(bytes.empty() ? &empty : bytes.data(), bytes.size());
}

DecodeResult PlyDecoder::decode(const std::string& text) const {
    return decode(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

DecodeResult PlyDecoder::decode_file(const std::string& path) const {
    platform::MappedFile file;
    if (!file.open(path)) {
        throw std::runtime_error("Cannot open " + path);
    }
    return decode(file.data(), file.size());
}

} // namespace splatquery
