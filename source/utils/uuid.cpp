#include "utils/uuid.hpp"

#include <cstdint>
#include <mutex>
#include <random>

namespace uuid {

static std::mutex generator_mutex;

static std::mt19937_64 &generator() {
    static std::mt19937_64 engine = [] {
        std::random_device device;
        std::seed_seq seed{device(), device(), device(), device(), device(), device()};
        return std::mt19937_64(seed);
    }();
    return engine;
}

std::string generate() {
    uint64_t high = 0;
    uint64_t low = 0;
    {
        std::lock_guard<std::mutex> lock(generator_mutex);
        high = generator()();
        low = generator()();
    }

    // Version 4, variant 10xx.
    high = (high & 0xFFFFFFFFFFFF0FFFull) | 0x0000000000004000ull;
    low = (low & 0x3FFFFFFFFFFFFFFFull) | 0x8000000000000000ull;

    static const char hex_digits[] = "0123456789abcdef";
    std::string text;
    text.reserve(36);
    for (int index = 0; index < 32; ++index) {
        uint64_t word = (index < 16) ? high : low;
        int shift = 60 - 4 * (index % 16);
        text.push_back(hex_digits[(word >> shift) & 0xFu]);
        if (index == 7 || index == 11 || index == 15 || index == 19) {
            text.push_back('-');
        }
    }
    return text;
}

} // namespace uuid
