#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace sluice {

// gzip then base64. Throws std::runtime_error when zlib fails.
std::string compress_result(const std::string& data);

// Reverses compress_result. Throws std::runtime_error on corrupt input.
std::string decompress_result(const std::string& compressed);

inline int64_t byte_size(const std::string& data) {
    return static_cast<int64_t>(data.size());
}

inline bool should_compress(const std::string& data, int64_t threshold_bytes) {
    return byte_size(data) > threshold_bytes;
}

// "512 B", "1.5 KB", "2.0 MB"
std::string format_bytes(int64_t bytes);

std::string base64_encode(const uint8_t* data, size_t len);
std::vector<uint8_t> base64_decode(const std::string& encoded);

} // namespace sluice
