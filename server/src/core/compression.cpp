#include "sluice/compression.hpp"
#include <zlib.h>
#include <cstdio>
#include <stdexcept>

namespace sluice {

namespace {

// windowBits 15 + 16 selects the gzip wrapper
constexpr int GZIP_WINDOW_BITS = 15 + 16;

const std::string base64_chars =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
    "abcdefghijklmnopqrstuvwxyz"
    "0123456789+/";

} // anonymous namespace

std::string base64_encode(const uint8_t* data, size_t len) {
    std::string ret;
    ret.reserve(((len + 2) / 3) * 4);
    int i = 0;
    uint8_t char_array_3[3];
    uint8_t char_array_4[4];

    while (len--) {
        char_array_3[i++] = *(data++);
        if (i == 3) {
            char_array_4[0] = (char_array_3[0] & 0xfc) >> 2;
            char_array_4[1] = ((char_array_3[0] & 0x03) << 4) + ((char_array_3[1] & 0xf0) >> 4);
            char_array_4[2] = ((char_array_3[1] & 0x0f) << 2) + ((char_array_3[2] & 0xc0) >> 6);
            char_array_4[3] = char_array_3[2] & 0x3f;

            for (i = 0; i < 4; i++)
                ret += base64_chars[char_array_4[i]];
            i = 0;
        }
    }

    if (i) {
        for (int j = i; j < 3; j++)
            char_array_3[j] = '\0';

        char_array_4[0] = (char_array_3[0] & 0xfc) >> 2;
        char_array_4[1] = ((char_array_3[0] & 0x03) << 4) + ((char_array_3[1] & 0xf0) >> 4);
        char_array_4[2] = ((char_array_3[1] & 0x0f) << 2) + ((char_array_3[2] & 0xc0) >> 6);

        for (int j = 0; j < i + 1; j++)
            ret += base64_chars[char_array_4[j]];

        while (i++ < 3)
            ret += '=';
    }

    return ret;
}

std::vector<uint8_t> base64_decode(const std::string& encoded) {
    std::vector<uint8_t> ret;
    uint32_t buffer = 0;
    int bits = 0;

    for (char c : encoded) {
        if (c == '=') break;
        size_t value = base64_chars.find(c);
        if (value == std::string::npos) {
            if (c == '\n' || c == '\r') continue;
            throw std::runtime_error("Invalid base64 character in compressed result");
        }
        buffer = (buffer << 6) | static_cast<uint32_t>(value);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            ret.push_back(static_cast<uint8_t>((buffer >> bits) & 0xFF));
        }
    }

    return ret;
}

std::string compress_result(const std::string& data) {
    z_stream stream{};
    if (deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, GZIP_WINDOW_BITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        throw std::runtime_error("deflateInit2 failed");
    }

    std::vector<uint8_t> out(deflateBound(&stream, static_cast<uLong>(data.size())));
    stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    stream.avail_in = static_cast<uInt>(data.size());
    stream.next_out = out.data();
    stream.avail_out = static_cast<uInt>(out.size());

    int rc = deflate(&stream, Z_FINISH);
    size_t written = stream.total_out;
    deflateEnd(&stream);

    if (rc != Z_STREAM_END) {
        throw std::runtime_error("gzip compression failed: " + std::to_string(rc));
    }

    return base64_encode(out.data(), written);
}

std::string decompress_result(const std::string& compressed) {
    std::vector<uint8_t> input = base64_decode(compressed);

    z_stream stream{};
    if (inflateInit2(&stream, GZIP_WINDOW_BITS) != Z_OK) {
        throw std::runtime_error("inflateInit2 failed");
    }

    stream.next_in = input.data();
    stream.avail_in = static_cast<uInt>(input.size());

    std::string out;
    char chunk[16384];
    int rc = Z_OK;
    while (rc != Z_STREAM_END) {
        stream.next_out = reinterpret_cast<Bytef*>(chunk);
        stream.avail_out = sizeof(chunk);
        rc = inflate(&stream, Z_NO_FLUSH);
        if (rc != Z_OK && rc != Z_STREAM_END) {
            inflateEnd(&stream);
            throw std::runtime_error("gzip decompression failed: " + std::to_string(rc));
        }
        out.append(chunk, sizeof(chunk) - stream.avail_out);
    }
    inflateEnd(&stream);

    return out;
}

std::string format_bytes(int64_t bytes) {
    char buffer[32];
    if (bytes < 1024) {
        return std::to_string(bytes) + " B";
    }
    if (bytes < 1024 * 1024) {
        std::snprintf(buffer, sizeof(buffer), "%.1f KB", bytes / 1024.0);
    } else {
        std::snprintf(buffer, sizeof(buffer), "%.1f MB", bytes / (1024.0 * 1024.0));
    }
    return buffer;
}

} // namespace sluice
