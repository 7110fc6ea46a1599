#include "sluice/ids.hpp"
#include <array>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>

namespace sluice {

namespace {

std::mutex& generator_mutex() {
    static std::mutex mtx;
    return mtx;
}

std::mt19937_64& generator() {
    static std::random_device rd;
    static std::mt19937_64 gen(rd());
    return gen;
}

uint64_t now_millis() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

} // anonymous namespace

std::string generate_uuid() {
    static uint64_t last_ms = 0;
    static uint16_t sequence = 0;

    std::lock_guard<std::mutex> lock(generator_mutex());

    uint64_t current_ms = now_millis();
    if (current_ms <= last_ms) {
        sequence++;
    } else {
        last_ms = current_ms;
        sequence = 0;
    }

    std::array<uint8_t, 16> bytes;

    // 48-bit unix_ts_ms (big-endian)
    for (int i = 0; i < 6; ++i) {
        bytes[i] = (last_ms >> (40 - 8 * i)) & 0xFF;
    }

    // 4-bit version (0111) and 12-bit sequence
    uint16_t sequence_and_version = sequence & 0x0FFF;
    bytes[6] = 0x70 | (sequence_and_version >> 8);
    bytes[7] = sequence_and_version & 0xFF;

    // 2-bit variant (10) and 62 bits of random data
    uint64_t rand_data = generator()();
    bytes[8] = 0x80 | ((rand_data >> 56) & 0x3F);
    for (int i = 9; i < 16; ++i) {
        bytes[i] = (rand_data >> (8 * (15 - i))) & 0xFF;
    }

    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (int i = 0; i < 16; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) ss << '-';
        ss << std::setw(2) << static_cast<int>(bytes[i]);
    }
    return ss.str();
}

std::string generate_job_id() {
    static const char alphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";

    std::string suffix;
    {
        std::lock_guard<std::mutex> lock(generator_mutex());
        std::uniform_int_distribution<int> dist(0, 35);
        for (int i = 0; i < 9; ++i) {
            suffix += alphabet[dist(generator())];
        }
    }
    return "job_" + std::to_string(now_millis()) + "_" + suffix;
}

} // namespace sluice
