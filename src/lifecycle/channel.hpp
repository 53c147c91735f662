/**
 * @file channel.hpp
 * @brief Transport boundary: where a request's single response is sent.
 */

#pragma once

#include "core/types.hpp"

#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <vector>

namespace async_responder {

/**
 * @brief The connection of one pending client request.
 *
 * Implemented by the HTTP layer. send() is called at most once per request.
 */
class IResponseChannel {
public:
    using DisconnectCallback = std::function<void()>;

    virtual ~IResponseChannel() = default;

    virtual void send(const Response& response) = 0;

    /**
     * @brief Ask to be told when the client goes away.
     * @return false if the transport cannot report disconnects.
     */
    virtual bool watch_disconnect(DisconnectCallback on_disconnect) = 0;
};

/**
 * @brief In-process channel that records transmissions.
 *
 * Used by the CLI driver and tests in place of a socket. disconnect()
 * simulates the client closing the connection.
 */
class BufferedChannel : public IResponseChannel {
public:
    explicit BufferedChannel(bool reports_disconnect = true)
        : reports_disconnect_(reports_disconnect) {}

    void send(const Response& response) override;
    bool watch_disconnect(DisconnectCallback on_disconnect) override;

    /// Fire the registered disconnect callback (once).
    void disconnect();

    [[nodiscard]] size_t send_count() const;
    [[nodiscard]] std::optional<Response> last_response() const;
    [[nodiscard]] std::vector<Response> responses() const;
    [[nodiscard]] bool disconnected() const noexcept { return disconnected_.load(); }

private:
    bool reports_disconnect_;
    std::atomic<bool> disconnected_{false};
    mutable std::mutex mutex_;
    std::vector<Response> responses_;
    DisconnectCallback on_disconnect_;
};

}  // namespace async_responder
