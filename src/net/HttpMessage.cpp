#include "net/HttpMessage.hpp"

#include <charconv>

namespace skynode::net {

static std::string lower(std::string_view s) {
  std::string out(s);
  for (auto& c : out) if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  return out;
}

static std::string_view trim(std::string_view sv) {
  while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t')) sv.remove_prefix(1);
  while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r')) sv.remove_suffix(1);
  return sv;
}

std::string HttpRequest::header(std::string_view name) const {
  auto it = headers.find(lower(name));
  return it != headers.end() ? it->second : std::string();
}

std::optional<std::string> HttpRequest::query_param(std::string_view name) const {
  auto it = query.find(std::string(name));
  if (it == query.end()) return std::nullopt;
  return it->second;
}

std::optional<size_t> header_end(std::string_view raw) {
  auto pos = raw.find("\r\n\r\n");
  if (pos != std::string_view::npos) return pos + 4;
  pos = raw.find("\n\n");
  if (pos != std::string_view::npos) return pos + 2;
  return std::nullopt;
}

util::Result<size_t> content_length(std::string_view headers) {
  size_t start = 0;
  while (start < headers.size()) {
    size_t end = headers.find('\n', start);
    if (end == std::string_view::npos) end = headers.size();
    auto line = headers.substr(start, end - start);
    start = end + 1;
    auto colon = line.find(':');
    if (colon == std::string_view::npos) continue;
    if (lower(trim(line.substr(0, colon))) != "content-length") continue;
    auto val = trim(line.substr(colon + 1));
    size_t n = 0;
    auto [ptr, ec] = std::from_chars(val.data(), val.data() + val.size(), n);
    if (ec != std::errc{} || ptr != val.data() + val.size())
      return util::fail(util::Errc::BadRequest, "malformed Content-Length");
    if (n > kMaxBodyBytes) return util::fail(util::Errc::BadRequest, "request body too large");
    return n;
  }
  return size_t{0};
}

static int hexval(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

std::string url_decode(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size(); ++i) {
    if (s[i] == '+') { out += ' '; continue; }
    if (s[i] == '%' && i + 2 < s.size()) {
      int hi = hexval(s[i + 1]), lo = hexval(s[i + 2]);
      if (hi >= 0 && lo >= 0) { out += static_cast<char>(hi * 16 + lo); i += 2; continue; }
    }
    out += s[i];
  }
  return out;
}

static void parse_query(std::string_view qs, std::map<std::string, std::string>& out) {
  while (!qs.empty()) {
    auto amp = qs.find('&');
    auto pair = qs.substr(0, amp);
    if (!pair.empty()) {
      auto eq = pair.find('=');
      if (eq == std::string_view::npos) out[url_decode(pair)] = "";
      else out[url_decode(pair.substr(0, eq))] = url_decode(pair.substr(eq + 1));
    }
    if (amp == std::string_view::npos) break;
    qs.remove_prefix(amp + 1);
  }
}

util::Result<HttpRequest> parse_request(std::string_view raw) {
  auto hend = header_end(raw);
  if (!hend) return util::fail(util::Errc::BadRequest, "incomplete request headers");
  auto head = raw.substr(0, *hend);

  auto line_end = head.find('\n');
  auto request_line = trim(head.substr(0, line_end));
  auto sp1 = request_line.find(' ');
  auto sp2 = request_line.rfind(' ');
  if (sp1 == std::string_view::npos || sp2 == sp1)
    return util::fail(util::Errc::BadRequest, "malformed request line");
  auto version = request_line.substr(sp2 + 1);
  if (!version.starts_with("HTTP/1.")) return util::fail(util::Errc::BadRequest, "unsupported HTTP version");

  HttpRequest req;
  req.method = std::string(request_line.substr(0, sp1));
  auto target = request_line.substr(sp1 + 1, sp2 - sp1 - 1);
  if (target.empty() || target.front() != '/') return util::fail(util::Errc::BadRequest, "malformed request target");
  auto qmark = target.find('?');
  req.path = url_decode(target.substr(0, qmark));
  if (qmark != std::string_view::npos) parse_query(target.substr(qmark + 1), req.query);

  size_t start = line_end == std::string_view::npos ? head.size() : line_end + 1;
  while (start < head.size()) {
    size_t end = head.find('\n', start);
    if (end == std::string_view::npos) end = head.size();
    auto line = trim(head.substr(start, end - start));
    start = end + 1;
    if (line.empty()) continue;
    auto colon = line.find(':');
    if (colon == std::string_view::npos) return util::fail(util::Errc::BadRequest, "malformed header line");
    req.headers[lower(trim(line.substr(0, colon)))] = std::string(trim(line.substr(colon + 1)));
  }

  auto len = content_length(head);
  if (!len) return std::unexpected(len.error());
  auto body = raw.substr(*hend);
  if (body.size() < *len) return util::fail(util::Errc::BadRequest, "request body shorter than Content-Length");
  req.body = std::string(body.substr(0, *len));
  return req;
}

const char* reason_phrase(int status) {
  switch (status) {
    case 200: return "OK";
    case 201: return "Created";
    case 204: return "No Content";
    case 400: return "Bad Request";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 409: return "Conflict";
    case 413: return "Payload Too Large";
    case 500: return "Internal Server Error";
    case 503: return "Service Unavailable";
  }
  return "Unknown";
}

std::string format_response_head(const HttpResponse& r) {
  std::string out = "HTTP/1.1 ";
  out += std::to_string(r.status);
  out += ' ';
  out += reason_phrase(r.status);
  out += "\r\nContent-Type: ";
  out += r.content_type;
  out += "\r\nAccess-Control-Allow-Origin: *"
         "\r\nAccess-Control-Allow-Methods: GET, POST, DELETE, OPTIONS"
         "\r\nAccess-Control-Allow-Headers: Content-Type"
         "\r\nConnection: close\r\nContent-Length: ";
  char len_buf[24];
  auto [ptr, ec] = std::to_chars(len_buf, len_buf + sizeof(len_buf), r.body.size());
  out.append(len_buf, ptr);
  out += "\r\n\r\n";
  return out;
}

} // namespace skynode::net
