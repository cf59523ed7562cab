#pragma once

#include "app/ApiBackend.hpp"
#include "net/HttpMessage.hpp"
#include "util/Error.hpp"

namespace skynode::app {

// Maps one parsed request onto the backend. Never throws; every failure
// becomes a JSON {"error", "message"} body with a matching status.
[[nodiscard]] net::HttpResponse handle_request(const net::HttpRequest& req, ApiBackend& backend);

[[nodiscard]] int status_for(util::Errc code);
[[nodiscard]] net::HttpResponse error_response(const util::Error& err);

inline constexpr size_t kDefaultHistoryPoints = 60;

} // namespace skynode::app
