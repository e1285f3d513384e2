/**
 * @file format_detector.cpp
 * @brief Implementation of content-based format detection
 */

#include "kcenon/p2p_convert/conversion/format_detector.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>

namespace kcenon::p2p_convert {

namespace {

constexpr std::array<uint8_t, 4> pdf_signature{0x25, 0x50, 0x44, 0x46};  // %PDF
constexpr std::array<uint8_t, 3> utf8_bom{0xEF, 0xBB, 0xBF};

template <std::size_t N>
auto starts_with(std::span<const std::byte> data, const std::array<uint8_t, N>& prefix) -> bool {
    if (data.size() < N) {
        return false;
    }
    for (std::size_t i = 0; i < N; ++i) {
        if (static_cast<uint8_t>(data[i]) != prefix[i]) {
            return false;
        }
    }
    return true;
}

/**
 * @brief Length of the UTF-8 sequence introduced by @p lead, 0 if invalid
 */
auto sequence_length(uint8_t lead) -> std::size_t {
    if (lead < 0x80) return 1;
    if (lead >= 0xC2 && lead <= 0xDF) return 2;
    if (lead >= 0xE0 && lead <= 0xEF) return 3;
    if (lead >= 0xF0 && lead <= 0xF4) return 4;
    return 0;
}

}  // namespace

auto format_detector::detect(std::span<const std::byte> data) -> file_format {
    if (starts_with(data, pdf_signature)) {
        return file_format::pdf;
    }
    if (is_likely_text(data)) {
        return file_format::text;
    }
    return file_format::unknown;
}

auto format_detector::is_likely_text(std::span<const std::byte> data) -> bool {
    if (data.empty()) {
        return false;
    }
    if (starts_with(data, utf8_bom)) {
        return true;
    }

    const auto sample = data.first(std::min(sample_size, data.size()));
    const bool truncated = sample.size() < data.size();

    std::size_t total_chars = 0;
    std::size_t printable = 0;
    std::size_t i = 0;
    while (i < sample.size()) {
        const auto lead = static_cast<uint8_t>(sample[i]);
        if (lead == 0) {
            return false;
        }

        const auto len = sequence_length(lead);
        if (len == 0) {
            return false;
        }
        if (i + len > sample.size()) {
            // A multi-byte character cut by the sample boundary is not an error
            if (truncated) {
                break;
            }
            return false;
        }
        for (std::size_t k = 1; k < len; ++k) {
            const auto cont = static_cast<uint8_t>(sample[i + k]);
            if ((cont & 0xC0) != 0x80) {
                return false;
            }
        }

        ++total_chars;
        if (len == 1 && (std::isgraph(lead) || std::isspace(lead))) {
            ++printable;
        }
        i += len;
    }

    if (total_chars == 0) {
        return false;
    }
    return static_cast<double>(printable) / static_cast<double>(total_chars) >
           printable_threshold;
}

auto format_detector::detect_file(const std::filesystem::path& path) -> result<file_format> {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return unexpected{error{error_code::file_not_found, "File not found: " + path.string()}};
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return unexpected{error{error_code::file_read_error,
                                "Failed to open file: " + path.string()}};
    }

    // One byte past the sample tells is_likely_text whether the sample was cut
    std::array<std::byte, sample_size + 1> buffer{};
    file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
    if (file.bad()) {
        return unexpected{error{error_code::file_read_error,
                                "Failed to read file: " + path.string()}};
    }

    const auto head =
        std::span<const std::byte>(buffer.data(), static_cast<std::size_t>(file.gcount()));
    return detect(head);
}

}  // namespace kcenon::p2p_convert
