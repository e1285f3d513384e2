/**
 * @file wire_codec.h
 * @brief Encoding and decoding of protocol frames
 */

#ifndef KCENON_P2P_CONVERT_CORE_WIRE_CODEC_H
#define KCENON_P2P_CONVERT_CORE_WIRE_CODEC_H

#include <kcenon/p2p_convert/core/chunk_types.h>
#include <kcenon/p2p_convert/core/protocol_types.h>
#include <kcenon/p2p_convert/core/transfer_types.h>
#include <kcenon/p2p_convert/core/types.h>

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace kcenon::p2p_convert {

/**
 * @brief Serializes protocol messages into checksummed frames
 *
 * Strings carry a 2-byte length prefix, byte blobs a 4-byte one. Optional
 * fields are preceded by a 1-byte presence flag so that an absent value and
 * an empty value stay distinguishable.
 */
class wire_codec {
public:
    /**
     * @brief Encode a message as a complete frame
     * @return malformed_message when a string field exceeds 65535 bytes,
     *         invalid_frame when the payload exceeds the frame size limit
     */
    [[nodiscard]] static auto encode(const transfer_request& request)
        -> result<std::vector<uint8_t>>;
    [[nodiscard]] static auto encode(const transfer_accept& accept)
        -> result<std::vector<uint8_t>>;
    [[nodiscard]] static auto encode(const transfer_response& response)
        -> result<std::vector<uint8_t>>;
    [[nodiscard]] static auto encode(const chunk& c) -> result<std::vector<uint8_t>>;
    [[nodiscard]] static auto encode(const struct error_message& err) -> result<std::vector<uint8_t>>;

    /**
     * @brief Wrap a payload in a frame header and trailer
     */
    [[nodiscard]] static auto encode_frame(message_type type, std::span<const uint8_t> payload)
        -> std::vector<uint8_t>;

    /**
     * @brief Validate and unwrap exactly one frame
     * @return invalid_frame, frame_checksum_mismatch on corruption
     */
    [[nodiscard]] static auto decode_frame(std::span<const uint8_t> bytes) -> result<frame>;

    // Payload decoding; each checks the frame type first
    [[nodiscard]] static auto decode_request(const frame& f) -> result<transfer_request>;
    [[nodiscard]] static auto decode_accept(const frame& f) -> result<transfer_accept>;
    [[nodiscard]] static auto decode_response(const frame& f) -> result<transfer_response>;
    [[nodiscard]] static auto decode_chunk(const frame& f) -> result<chunk>;
    [[nodiscard]] static auto decode_error(const frame& f) -> result<struct error_message>;
};

/**
 * @brief Incremental frame reassembly for byte-stream transports
 *
 * @code
 * frame_decoder decoder;
 * decoder.feed(received_bytes);
 * while (true) {
 *     auto next = decoder.next();
 *     if (!next) { handle(next.error()); break; }
 *     if (!next.value()) break;  // need more bytes
 *     dispatch(*next.value());
 * }
 * @endcode
 */
class frame_decoder {
public:
    void feed(std::span<const uint8_t> bytes);

    /**
     * @brief Extract the next complete frame
     * @return nullopt when more bytes are needed; an error when the buffered
     *         data can never form a valid frame (the buffer is then cleared)
     */
    [[nodiscard]] auto next() -> result<std::optional<frame>>;

    [[nodiscard]] auto buffered() const -> std::size_t { return buffer_.size(); }

    void reset() { buffer_.clear(); }

private:
    std::vector<uint8_t> buffer_;
};

}  // namespace kcenon::p2p_convert

#endif  // KCENON_P2P_CONVERT_CORE_WIRE_CODEC_H
