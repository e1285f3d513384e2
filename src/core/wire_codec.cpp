/**
 * @file wire_codec.cpp
 * @brief Implementation of protocol frame encoding and decoding
 */

#include <kcenon/p2p_convert/core/wire_codec.h>

#include <kcenon/p2p_convert/core/checksum.h>

#include <algorithm>
#include <cstring>
#include <limits>
#include <optional>
#include <string>

namespace kcenon::p2p_convert {

namespace {

class byte_writer {
public:
    void u8(uint8_t v) { out_.push_back(v); }

    void u16(uint16_t v) {
        out_.push_back(static_cast<uint8_t>(v >> 8));
        out_.push_back(static_cast<uint8_t>(v));
    }

    void u32(uint32_t v) {
        for (int shift = 24; shift >= 0; shift -= 8) {
            out_.push_back(static_cast<uint8_t>(v >> shift));
        }
    }

    void u64(uint64_t v) {
        for (int shift = 56; shift >= 0; shift -= 8) {
            out_.push_back(static_cast<uint8_t>(v >> shift));
        }
    }

    void id(const transfer_id& tid) { out_.insert(out_.end(), tid.bytes.begin(), tid.bytes.end()); }

    // A string longer than 65535 bytes fails the whole encoding
    void str(std::string_view field, std::string_view s) {
        if (s.size() > std::numeric_limits<uint16_t>::max()) {
            if (!failure_) {
                failure_ = error{error_code::malformed_message,
                                 std::string(field) + " is " + std::to_string(s.size()) +
                                     " bytes, limit is " +
                                     std::to_string(std::numeric_limits<uint16_t>::max())};
            }
            return;
        }
        u16(static_cast<uint16_t>(s.size()));
        out_.insert(out_.end(), s.begin(), s.end());
    }

    void blob(const byte_buffer& data) {
        u32(static_cast<uint32_t>(data.size()));
        const auto* p = reinterpret_cast<const uint8_t*>(data.data());
        out_.insert(out_.end(), p, p + data.size());
    }

    void opt_str(std::string_view field, const std::optional<std::string>& s) {
        u8(s ? 1 : 0);
        if (s) str(field, *s);
    }

    [[nodiscard]] auto take() -> std::vector<uint8_t> { return std::move(out_); }

    // Payload wrapped in a frame, or the first field error
    [[nodiscard]] auto finish(message_type type) -> result<std::vector<uint8_t>> {
        if (failure_) {
            return unexpected{*failure_};
        }
        if (out_.size() > frame_layout::max_payload_size) {
            return unexpected{error{error_code::invalid_frame,
                                    "Payload of " + std::to_string(out_.size()) +
                                        " bytes exceeds limit"}};
        }
        return wire_codec::encode_frame(type, out_);
    }

private:
    std::vector<uint8_t> out_;
    std::optional<error> failure_;
};

class byte_reader {
public:
    explicit byte_reader(std::span<const uint8_t> in) : in_(in) {}

    [[nodiscard]] auto u8(uint8_t& v) -> bool {
        if (!has(1)) return false;
        v = in_[pos_++];
        return true;
    }

    [[nodiscard]] auto u16(uint16_t& v) -> bool {
        if (!has(2)) return false;
        v = static_cast<uint16_t>((in_[pos_] << 8) | in_[pos_ + 1]);
        pos_ += 2;
        return true;
    }

    [[nodiscard]] auto u32(uint32_t& v) -> bool {
        if (!has(4)) return false;
        v = 0;
        for (int i = 0; i < 4; ++i) v = (v << 8) | in_[pos_++];
        return true;
    }

    [[nodiscard]] auto u64(uint64_t& v) -> bool {
        if (!has(8)) return false;
        v = 0;
        for (int i = 0; i < 8; ++i) v = (v << 8) | in_[pos_++];
        return true;
    }

    [[nodiscard]] auto boolean(bool& v) -> bool {
        uint8_t b = 0;
        if (!u8(b) || b > 1) return false;
        v = b == 1;
        return true;
    }

    [[nodiscard]] auto id(transfer_id& tid) -> bool {
        if (!has(16)) return false;
        std::copy_n(in_.begin() + static_cast<std::ptrdiff_t>(pos_), 16, tid.bytes.begin());
        pos_ += 16;
        return true;
    }

    [[nodiscard]] auto str(std::string& s) -> bool {
        uint16_t len = 0;
        if (!u16(len) || !has(len)) return false;
        s.assign(reinterpret_cast<const char*>(in_.data() + pos_), len);
        pos_ += len;
        return true;
    }

    [[nodiscard]] auto blob(byte_buffer& data) -> bool {
        uint32_t len = 0;
        if (!u32(len) || !has(len)) return false;
        data.resize(len);
        if (len > 0) std::memcpy(data.data(), in_.data() + pos_, len);
        pos_ += len;
        return true;
    }

    [[nodiscard]] auto opt_str(std::optional<std::string>& s) -> bool {
        bool present = false;
        if (!boolean(present)) return false;
        if (!present) {
            s.reset();
            return true;
        }
        std::string value;
        if (!str(value)) return false;
        s = std::move(value);
        return true;
    }

    [[nodiscard]] auto at_end() const -> bool { return pos_ == in_.size(); }

private:
    [[nodiscard]] auto has(std::size_t n) const -> bool { return in_.size() - pos_ >= n; }

    std::span<const uint8_t> in_;
    std::size_t pos_ = 0;
};

auto read_be32(const uint8_t* p) -> uint32_t {
    return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

auto malformed(message_type type, std::string_view what) -> error {
    return error{error_code::malformed_message,
                 "Malformed " + std::string(to_string(type)) + " payload: " + std::string(what)};
}

auto expect_type(const frame& f, message_type expected) -> result<void> {
    if (f.type != expected) {
        return unexpected{error{error_code::unexpected_message,
                                "Expected " + std::string(to_string(expected)) + ", got " +
                                    std::string(to_string(f.type))}};
    }
    return {};
}

}  // namespace

auto wire_codec::encode_frame(message_type type, std::span<const uint8_t> payload)
    -> std::vector<uint8_t> {
    byte_writer w;
    w.u32(protocol_magic);
    w.u8(static_cast<uint8_t>(type));
    w.u32(static_cast<uint32_t>(payload.size()));
    auto out = w.take();
    out.reserve(out.size() + payload.size() + frame_layout::trailer_size);
    out.insert(out.end(), payload.begin(), payload.end());

    const auto sum = checksum::frame_sum(out);
    out.push_back(static_cast<uint8_t>(sum >> 8));
    out.push_back(static_cast<uint8_t>(sum));
    const auto echo = static_cast<uint16_t>(payload.size() & 0xFFFF);
    out.push_back(static_cast<uint8_t>(echo >> 8));
    out.push_back(static_cast<uint8_t>(echo));
    return out;
}

auto wire_codec::decode_frame(std::span<const uint8_t> bytes) -> result<frame> {
    if (bytes.size() < frame_layout::overhead) {
        return unexpected{error{error_code::invalid_frame,
                                "Frame too short: " + std::to_string(bytes.size()) + " bytes"}};
    }
    if (read_be32(bytes.data()) != protocol_magic) {
        return unexpected{error{error_code::invalid_frame, "Bad frame magic"}};
    }

    const uint8_t raw_type = bytes[4];
    const uint32_t payload_len = read_be32(bytes.data() + 5);
    if (payload_len > frame_layout::max_payload_size) {
        return unexpected{error{error_code::invalid_frame,
                                "Payload length " + std::to_string(payload_len) +
                                    " exceeds limit"}};
    }
    if (bytes.size() != frame_layout::overhead + payload_len) {
        return unexpected{error{error_code::invalid_frame,
                                "Frame length mismatch: declared payload " +
                                    std::to_string(payload_len) + ", frame " +
                                    std::to_string(bytes.size()) + " bytes"}};
    }

    const auto body_len = frame_layout::header_size + payload_len;
    const auto* trailer = bytes.data() + body_len;
    const auto sum = static_cast<uint16_t>((trailer[0] << 8) | trailer[1]);
    const auto echo = static_cast<uint16_t>((trailer[2] << 8) | trailer[3]);

    if (echo != static_cast<uint16_t>(payload_len & 0xFFFF)) {
        return unexpected{error{error_code::invalid_frame, "Frame length echo mismatch"}};
    }
    if (checksum::frame_sum(bytes.first(body_len)) != sum) {
        return unexpected{error{error_code::frame_checksum_mismatch, "Frame checksum mismatch"}};
    }
    if (!is_known_message_type(raw_type)) {
        return unexpected{error{error_code::invalid_frame,
                                "Unknown message type " + std::to_string(raw_type)}};
    }

    frame f;
    f.type = static_cast<message_type>(raw_type);
    f.payload.assign(bytes.begin() + frame_layout::header_size, bytes.begin() + body_len);
    return f;
}

auto wire_codec::encode(const transfer_request& request) -> result<std::vector<uint8_t>> {
    byte_writer w;
    w.id(request.id);
    w.str("filename", request.filename);
    w.u64(request.file_size);
    w.u8(static_cast<uint8_t>(request.source_format));
    w.opt_str("target format", request.target_format);
    w.u8(request.return_result ? 1 : 0);
    w.u64(request.chunk_count);
    return w.finish(message_type::transfer_request);
}

auto wire_codec::encode(const transfer_accept& accept) -> result<std::vector<uint8_t>> {
    byte_writer w;
    w.id(accept.id);
    return w.finish(message_type::transfer_accept);
}

auto wire_codec::encode(const transfer_response& response) -> result<std::vector<uint8_t>> {
    byte_writer w;
    w.id(response.id);
    w.u8(response.success ? 1 : 0);
    w.opt_str("error text", response.error);
    w.u8(response.converted_data ? 1 : 0);
    if (response.converted_data) {
        w.blob(*response.converted_data);
    }
    w.opt_str("converted filename", response.converted_filename);
    w.u64(response.processing_time_ms);
    return w.finish(message_type::transfer_response);
}

auto wire_codec::encode(const chunk& c) -> result<std::vector<uint8_t>> {
    byte_writer w;
    w.id(c.id);
    w.u64(c.index);
    w.u8(c.is_final ? 1 : 0);
    w.u32(c.checksum);
    w.blob(c.data);
    return w.finish(message_type::chunk_data);
}

auto wire_codec::encode(const struct error_message& err) -> result<std::vector<uint8_t>> {
    byte_writer w;
    w.id(err.id);
    w.u32(static_cast<uint32_t>(err.code));
    w.str("error message", err.message);
    return w.finish(message_type::error);
}

auto wire_codec::decode_request(const frame& f) -> result<transfer_request> {
    if (auto ok = expect_type(f, message_type::transfer_request); !ok) {
        return unexpected{ok.error()};
    }

    byte_reader r(f.payload);
    transfer_request request;
    uint8_t format = 0;
    if (!r.id(request.id) || !r.str(request.filename) || !r.u64(request.file_size) ||
        !r.u8(format) || !r.opt_str(request.target_format) ||
        !r.boolean(request.return_result) || !r.u64(request.chunk_count)) {
        return unexpected{malformed(f.type, "truncated")};
    }
    if (!r.at_end()) {
        return unexpected{malformed(f.type, "trailing bytes")};
    }
    if (format > static_cast<uint8_t>(file_format::text)) {
        return unexpected{malformed(f.type, "unknown source format " + std::to_string(format))};
    }
    request.source_format = static_cast<file_format>(format);
    return request;
}

auto wire_codec::decode_accept(const frame& f) -> result<transfer_accept> {
    if (auto ok = expect_type(f, message_type::transfer_accept); !ok) {
        return unexpected{ok.error()};
    }

    byte_reader r(f.payload);
    transfer_accept accept;
    if (!r.id(accept.id)) {
        return unexpected{malformed(f.type, "truncated")};
    }
    if (!r.at_end()) {
        return unexpected{malformed(f.type, "trailing bytes")};
    }
    return accept;
}

auto wire_codec::decode_response(const frame& f) -> result<transfer_response> {
    if (auto ok = expect_type(f, message_type::transfer_response); !ok) {
        return unexpected{ok.error()};
    }

    byte_reader r(f.payload);
    transfer_response response;
    bool has_data = false;
    if (!r.id(response.id) || !r.boolean(response.success) || !r.opt_str(response.error) ||
        !r.boolean(has_data)) {
        return unexpected{malformed(f.type, "truncated")};
    }
    if (has_data) {
        byte_buffer data;
        if (!r.blob(data)) {
            return unexpected{malformed(f.type, "truncated converted data")};
        }
        response.converted_data = std::move(data);
    }
    if (!r.opt_str(response.converted_filename) || !r.u64(response.processing_time_ms)) {
        return unexpected{malformed(f.type, "truncated")};
    }
    if (!r.at_end()) {
        return unexpected{malformed(f.type, "trailing bytes")};
    }
    return response;
}

auto wire_codec::decode_chunk(const frame& f) -> result<chunk> {
    if (auto ok = expect_type(f, message_type::chunk_data); !ok) {
        return unexpected{ok.error()};
    }

    byte_reader r(f.payload);
    chunk c;
    if (!r.id(c.id) || !r.u64(c.index) || !r.boolean(c.is_final) || !r.u32(c.checksum) ||
        !r.blob(c.data)) {
        return unexpected{malformed(f.type, "truncated")};
    }
    if (!r.at_end()) {
        return unexpected{malformed(f.type, "trailing bytes")};
    }
    return c;
}

auto wire_codec::decode_error(const frame& f) -> result<struct error_message> {
    if (auto ok = expect_type(f, message_type::error); !ok) {
        return unexpected{ok.error()};
    }

    byte_reader r(f.payload);
    struct error_message err;
    uint32_t code = 0;
    if (!r.id(err.id) || !r.u32(code) || !r.str(err.message)) {
        return unexpected{malformed(f.type, "truncated")};
    }
    if (!r.at_end()) {
        return unexpected{malformed(f.type, "trailing bytes")};
    }
    err.code = static_cast<int32_t>(code);
    return err;
}

// frame_decoder

void frame_decoder::feed(std::span<const uint8_t> bytes) {
    buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
}

auto frame_decoder::next() -> result<std::optional<frame>> {
    if (buffer_.size() < frame_layout::header_size) {
        return std::optional<frame>{};
    }
    if (read_be32(buffer_.data()) != protocol_magic) {
        buffer_.clear();
        return unexpected{error{error_code::invalid_frame, "Bad frame magic"}};
    }

    const uint32_t payload_len = read_be32(buffer_.data() + 5);
    if (payload_len > frame_layout::max_payload_size) {
        buffer_.clear();
        return unexpected{error{error_code::invalid_frame,
                                "Payload length " + std::to_string(payload_len) +
                                    " exceeds limit"}};
    }

    const auto total = frame_layout::overhead + payload_len;
    if (buffer_.size() < total) {
        return std::optional<frame>{};
    }

    auto decoded = wire_codec::decode_frame(std::span<const uint8_t>(buffer_.data(), total));
    buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(total));
    if (!decoded) {
        return unexpected{decoded.error()};
    }
    return std::optional<frame>{std::move(decoded.value())};
}

}  // namespace kcenon::p2p_convert
