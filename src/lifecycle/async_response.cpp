/**
 * @file async_response.cpp
 * @brief AsyncResponse implementation.
 */

#include "lifecycle/async_response.hpp"

namespace async_responder {

bool AsyncResponse::resume(Payload value) {
    return request_->resolve(Success{std::move(value)});
}

bool AsyncResponse::resume(Error error) {
    return request_->resolve(Failure{std::move(error)});
}

bool AsyncResponse::cancel(std::string reason) {
    return request_->resolve(Cancelled{std::move(reason)});
}

void AsyncResponse::set_timeout(Millis timeout) {
    request_->arm_timeout(*timers_, timeout);
}

void AsyncResponse::on_timeout(PendingRequest::TimeoutHandler handler) {
    request_->set_timeout_handler(std::move(handler));
}

void AsyncResponse::on_disconnect(PendingRequest::DisconnectCallback callback) {
    request_->register_disconnect_observer(std::move(callback));
}

void AsyncResponse::on_completion(PendingRequest::CompletionCallback callback) {
    request_->register_observer(std::move(callback));
}

}  // namespace async_responder
