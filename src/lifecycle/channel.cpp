/**
 * @file channel.cpp
 * @brief BufferedChannel implementation.
 */

#include "lifecycle/channel.hpp"

namespace async_responder {

void BufferedChannel::send(const Response& response) {
    std::lock_guard lock(mutex_);
    responses_.push_back(response);
}

bool BufferedChannel::watch_disconnect(DisconnectCallback on_disconnect) {
    if (!reports_disconnect_) return false;
    std::lock_guard lock(mutex_);
    on_disconnect_ = std::move(on_disconnect);
    return true;
}

void BufferedChannel::disconnect() {
    if (disconnected_.exchange(true)) return;
    DisconnectCallback callback;
    {
        std::lock_guard lock(mutex_);
        callback = std::move(on_disconnect_);
    }
    if (callback) callback();
}

size_t BufferedChannel::send_count() const {
    std::lock_guard lock(mutex_);
    return responses_.size();
}

std::optional<Response> BufferedChannel::last_response() const {
    std::lock_guard lock(mutex_);
    if (responses_.empty()) return std::nullopt;
    return responses_.back();
}

std::vector<Response> BufferedChannel::responses() const {
    std::lock_guard lock(mutex_);
    return responses_;
}

}  // namespace async_responder
