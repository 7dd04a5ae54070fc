#pragma once
#include <cstdint>
#include <random>
#include <string>

namespace mcpmail::utils {

    /**
     * @brief Lowercase hex string of the given length from a per-thread 64-bit generator.
     * Session ids use 32 digits (128 bits).
     */
    inline std::string random_hex_id(size_t digits = 32) {
        static constexpr char HEX[] = "0123456789abcdef";
        thread_local std::mt19937_64 gen{std::random_device{}()};

        std::string id;
        id.reserve(digits);
        uint64_t bits = 0;
        for (size_t i = 0; i < digits; ++i) {
            if (i % 16 == 0) {
                bits = gen();
            }
            id.push_back(HEX[bits & 0xf]);
            bits >>= 4;
        }
        return id;
    }

}// namespace mcpmail::utils
