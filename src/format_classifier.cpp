#include "format_classifier.hpp"
#include <algorithm>

namespace splatquery {

const char* to_string(PlyVariant variant) {
    switch (variant) {
        case PlyVariant::Standard: return "standard";
        case PlyVariant::VendorVariantA: return "sh-per-vertex";
        case PlyVariant::VendorVariantB: return "codebook";
        case PlyVariant::VendorVariantC: return "chunked";
        case PlyVariant::Unknown: return "unknown";
    }
    return "unknown";
}

PlyVariant classify_format(const uint8_t* data, size_t size) {
    size_t n = std::min(size, kClassifierPrefixBytes);
    return classify_format(std::string(reinterpret_cast<const char*>(data), n));
}

PlyVariant classify_format(const std::string& prefix) {
    std::string text = prefix.substr(0, kClassifierPrefixBytes);

    // Only the header matters; payload bytes can contain anything
    size_t end = text.find("end_header");
    if (end != std::string::npos) {
        text.resize(end);
    }

    if (text.compare(0, 3, "ply") != 0) {
        return PlyVariant::Unknown;
    }

    auto has = [&text](const char* needle) {
        return text.find(needle) != std::string::npos;
    };

    if (has("element codebook_centers")) {
        return PlyVariant::VendorVariantB;
    }
    if (has("element chunk") || has("packed_")) {
        return PlyVariant::VendorVariantC;
    }
    if (has("f_dc_") || has("f_rest_") || has("scale_0")) {
        return PlyVariant::VendorVariantA;
    }
    return PlyVariant::Standard;
}

} // namespace splatquery
