#ifndef SPLATQUERY_FORMAT_CLASSIFIER_HPP
#define SPLATQUERY_FORMAT_CLASSIFIER_HPP

#include <cstddef>
#include <cstdint>
#include <string>

namespace splatquery {

// Bytes of the stream inspected by the classifier
constexpr size_t kClassifierPrefixBytes = 1024;

enum class PlyVariant {
    Standard,        // Plain point cloud / mesh
    VendorVariantA,  // Per-vertex SH coefficients (f_dc_*, f_rest_*, scale_*)
    VendorVariantB,  // Shared codebook + per-vertex indices
    VendorVariantC,  // Chunked quantized blocks
    Unknown
};

const char* to_string(PlyVariant variant);

/// Classify a stream from its first kClassifierPrefixBytes bytes (longer input is truncated).
PlyVariant classify_format(const uint8_t* data, size_t size);
PlyVariant classify_format(const std::string& prefix);

} // namespace splatquery

#endif // SPLATQUERY_FORMAT_CLASSIFIER_HPP
