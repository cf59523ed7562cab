#pragma once

#include <expected>
#include <string>
#include <utility>

namespace skynode::util {

enum class Errc {
  SensorUnavailable,     // sensor not present on this host; source is skipped for the run
  SensorReadError,       // transient read failure; retried on the next tick
  InvalidRule,
  DuplicateRule,
  RuleNotFound,
  RecordNotFound,
  PeerUnreachable,
  PeerTimeout,
  MalformedNotification,
  BadRequest,
  StorageError,
  NetworkError,          // local socket setup failed
  Internal,
};

[[nodiscard]] constexpr const char* errc_name(Errc c) {
  switch (c) {
    case Errc::SensorUnavailable:     return "sensor_unavailable";
    case Errc::SensorReadError:       return "sensor_read_error";
    case Errc::InvalidRule:           return "invalid_rule";
    case Errc::DuplicateRule:         return "duplicate_rule";
    case Errc::RuleNotFound:          return "rule_not_found";
    case Errc::RecordNotFound:        return "record_not_found";
    case Errc::PeerUnreachable:       return "peer_unreachable";
    case Errc::PeerTimeout:           return "peer_timeout";
    case Errc::MalformedNotification: return "malformed_notification";
    case Errc::BadRequest:            return "bad_request";
    case Errc::StorageError:          return "storage_error";
    case Errc::NetworkError:          return "network_error";
    case Errc::Internal:              return "internal_error";
  }
  return "unknown";
}

struct Error {
  Errc code{};
  std::string message;
};

template <class T>
using Result = std::expected<T, Error>;

[[nodiscard]] inline std::unexpected<Error> fail(Errc code, std::string message) {
  return std::unexpected<Error>(Error{code, std::move(message)});
}

} // namespace skynode::util
