/**
 * @file transfer_state.cpp
 * @brief Implementation of the transfer state machine
 */

#include <kcenon/p2p_convert/core/transfer_state.h>

#include <algorithm>

namespace kcenon::p2p_convert {

namespace {

constexpr auto forward_rank(transfer_status status) -> int {
    switch (status) {
        case transfer_status::connecting:
            return 0;
        case transfer_status::negotiating:
            return 1;
        case transfer_status::sending:
            return 2;
        case transfer_status::waiting_response:
            return 3;
        case transfer_status::completed:
            return 4;
        default:
            return -1;
    }
}

auto transition_error(transfer_status from, transfer_status to) -> unexpected {
    return unexpected(error{error_code::invalid_transition,
                            "invalid transition from " + std::string(to_string(from)) +
                                " to " + std::string(to_string(to))});
}

}  // namespace

auto transfer_state::create(const transfer_request& request, const peer_address& peer)
    -> transfer_state {
    transfer_state state;
    state.request_ = request;
    state.peer_ = peer;
    state.status_ = transfer_status::connecting;
    state.started_at_ = clock::now();
    state.updated_at_ = state.started_at_;
    return state;
}

auto transfer_state::is_valid_transition(transfer_status from, transfer_status to) -> bool {
    if (is_terminal_status(from)) {
        return false;
    }
    if (to == transfer_status::failed || to == transfer_status::cancelled) {
        return true;
    }
    return forward_rank(to) == forward_rank(from) + 1;
}

void transfer_state::touch(transfer_status next) {
    status_ = next;
    updated_at_ = clock::now();
    if (is_terminal_status(next)) {
        finished_at_ = updated_at_;
    }
}

auto transfer_state::advance(transfer_status next) -> result<void> {
    if (!is_valid_transition(status_, next)) {
        return transition_error(status_, next);
    }
    touch(next);
    return {};
}

auto transfer_state::fail(std::string reason) -> result<void> {
    if (!is_valid_transition(status_, transfer_status::failed)) {
        return transition_error(status_, transfer_status::failed);
    }
    last_error_ = std::move(reason);
    touch(transfer_status::failed);
    return {};
}

auto transfer_state::cancel() -> result<void> {
    return advance(transfer_status::cancelled);
}

auto transfer_state::begin_attempt() -> result<void> {
    if (is_terminal()) {
        return transition_error(status_, transfer_status::connecting);
    }
    ++connection_attempts_;
    touch(transfer_status::connecting);
    return {};
}

auto transfer_state::record_chunk_sent(uint64_t index, uint64_t bytes) -> result<void> {
    if (status_ != transfer_status::sending) {
        return unexpected(error{error_code::invalid_transition,
                                "chunks can only be recorded while sending (status: " +
                                    std::string(to_string(status_)) + ")"});
    }

    if (index < chunks_moved_) {
        // Resent after a retry; already counted
        return {};
    }

    if (index != chunks_moved_ || index >= request_.chunk_count) {
        return unexpected(error{error_code::chunk_sequence_error,
                                "expected chunk " + std::to_string(chunks_moved_) + ", got " +
                                    std::to_string(index)});
    }

    if (bytes_moved_ + bytes > request_.file_size) {
        return unexpected(error{error_code::chunk_size_error,
                                "chunk " + std::to_string(index) +
                                    " exceeds remaining transfer size"});
    }

    bytes_moved_ += bytes;
    ++chunks_moved_;
    updated_at_ = clock::now();
    return {};
}

auto transfer_state::elapsed(clock::time_point now) const -> duration {
    const auto end = finished_at_.value_or(now);
    if (end <= started_at_) {
        return duration{0};
    }
    return std::chrono::duration_cast<duration>(end - started_at_);
}

auto transfer_state::percentage() const -> double {
    if (request_.file_size == 0) {
        return 0.0;
    }
    return std::min(100.0, static_cast<double>(bytes_moved_) /
                               static_cast<double>(request_.file_size) * 100.0);
}

auto transfer_state::throughput_bps(clock::time_point now) const -> double {
    const auto end = finished_at_.value_or(now);
    const auto seconds = std::chrono::duration<double>(end - started_at_).count();
    if (seconds <= 0.0) {
        return 0.0;
    }
    return static_cast<double>(bytes_moved_) / seconds;
}

auto transfer_state::eta_seconds(clock::time_point now) const -> std::optional<double> {
    if (bytes_moved_ >= request_.file_size) {
        return std::nullopt;
    }
    const auto rate = throughput_bps(now);
    if (rate <= 0.0) {
        return std::nullopt;
    }
    return static_cast<double>(request_.file_size - bytes_moved_) / rate;
}

auto transfer_state::status_string() const -> std::string {
    switch (status_) {
        case transfer_status::connecting:
            return "Connecting (attempt " + std::to_string(connection_attempts_) + ")";
        case transfer_status::negotiating:
            return "Negotiating protocol";
        case transfer_status::sending:
            return "Sending chunk " +
                   std::to_string(std::min(chunks_moved_ + 1, request_.chunk_count)) + "/" +
                   std::to_string(request_.chunk_count);
        case transfer_status::waiting_response:
            return "Waiting for response";
        case transfer_status::completed:
            return "Completed successfully";
        case transfer_status::failed:
            return "Failed: " + last_error_.value_or("unknown error");
        case transfer_status::cancelled:
            return "Cancelled";
    }
    return "Unknown";
}

}  // namespace kcenon::p2p_convert
