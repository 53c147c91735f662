/**
 * @file outcome.cpp
 * @brief Outcome helpers.
 */

#include "lifecycle/outcome.hpp"

namespace async_responder {

std::string Outcome::describe() const {
    switch (kind()) {
        case OutcomeKind::Success:   return "ok";
        case OutcomeKind::Failure: {
            const auto& error = as<Failure>().error;
            return std::string(to_string(error.kind)) + ": " + error.message;
        }
        case OutcomeKind::Timeout:   return as<TimedOut>().message;
        case OutcomeKind::Cancelled: return as<Cancelled>().reason;
    }
    return {};
}

Response to_response(const Outcome& outcome) {
    switch (outcome.kind()) {
        case OutcomeKind::Success:
            return Response{StatusCode::Ok, outcome.as<Success>().value};
        case OutcomeKind::Failure:
            return Response{StatusCode::InternalServerError, "Internal Server Error"};
        case OutcomeKind::Timeout:
            return Response{StatusCode::ServiceUnavailable, outcome.as<TimedOut>().message};
        case OutcomeKind::Cancelled:
            return Response{StatusCode::ServiceUnavailable, outcome.as<Cancelled>().reason};
    }
    return Response{StatusCode::InternalServerError, {}};
}

}  // namespace async_responder
