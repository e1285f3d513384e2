/**
 * @file transfer_id.cpp
 * @brief Implementation of transfer_id generation and serialization
 */

#include "kcenon/p2p_convert/core/chunk_types.h"

#include <cctype>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>

namespace kcenon::p2p_convert {

namespace {

constexpr std::array<int, 5> group_ends = {4, 6, 8, 10, 16};

auto hex_value(char c) -> uint8_t {
    if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0');
    return static_cast<uint8_t>(std::tolower(static_cast<unsigned char>(c)) - 'a' + 10);
}

}  // namespace

auto transfer_id::generate() -> transfer_id {
    // Seeded once, shared by all callers
    static std::mutex engine_mutex;
    static std::mt19937_64 engine{std::random_device{}()};

    uint64_t high = 0;
    uint64_t low = 0;
    {
        std::lock_guard lock(engine_mutex);
        high = engine();
        low = engine();
    }

    transfer_id id;
    for (int i = 0; i < 8; ++i) {
        id.bytes[i] = static_cast<uint8_t>(high >> (56 - i * 8));
        id.bytes[i + 8] = static_cast<uint8_t>(low >> (56 - i * 8));
    }

    // Version 4, RFC 4122 variant
    id.bytes[6] = static_cast<uint8_t>((id.bytes[6] & 0x0F) | 0x40);
    id.bytes[8] = static_cast<uint8_t>((id.bytes[8] & 0x3F) | 0x80);

    return id;
}

auto transfer_id::to_string() const -> std::string {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    // xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx
    int pos = 0;
    for (std::size_t g = 0; g < group_ends.size(); ++g) {
        if (g > 0) oss << '-';
        for (; pos < group_ends[g]; ++pos) {
            oss << std::setw(2) << static_cast<int>(bytes[pos]);
        }
    }
    return oss.str();
}

auto transfer_id::short_string() const -> std::string {
    return to_string().substr(0, 8);
}

auto transfer_id::from_string(std::string_view str) -> std::optional<transfer_id> {
    std::string digits;
    digits.reserve(32);

    for (char c : str) {
        if (c == '-') continue;
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        digits += c;
    }

    if (digits.size() != 32) {
        return std::nullopt;
    }

    transfer_id id;
    for (std::size_t i = 0; i < 16; ++i) {
        id.bytes[i] = static_cast<uint8_t>((hex_value(digits[i * 2]) << 4) |
                                           hex_value(digits[i * 2 + 1]));
    }
    return id;
}

}  // namespace kcenon::p2p_convert
