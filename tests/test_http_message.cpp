#include "minitest.hpp"
#include "net/HttpMessage.hpp"

#include <string>

using namespace skynode;

TEST(http_parse_get_with_query) {
  std::string raw = "GET /metrics/cpu_usage?points=10&x=a%20b HTTP/1.1\r\nHost: localhost\r\nX-Thing:  v \r\n\r\n";
  auto req = net::parse_request(raw);
  ASSERT_TRUE(req.has_value());
  ASSERT_EQ(req->method, std::string("GET"));
  ASSERT_EQ(req->path, std::string("/metrics/cpu_usage"));
  ASSERT_EQ(*req->query_param("points"), std::string("10"));
  ASSERT_EQ(*req->query_param("x"), std::string("a b"));
  ASSERT_TRUE(!req->query_param("missing").has_value());
  ASSERT_EQ(req->header("HOST"), std::string("localhost"));
  ASSERT_EQ(req->header("x-thing"), std::string("v"));
  ASSERT_TRUE(req->body.empty());
}

TEST(http_parse_post_body_by_content_length) {
  std::string body = "{\"a\":1}";
  std::string raw = "POST /alerts/notify HTTP/1.1\r\nContent-Type: application/json\r\nContent-Length: " +
                    std::to_string(body.size()) + "\r\n\r\n" + body + "trailing";
  auto req = net::parse_request(raw);
  ASSERT_TRUE(req.has_value());
  ASSERT_EQ(req->body, body);
}

TEST(http_header_end_and_length) {
  ASSERT_TRUE(!net::header_end("GET / HTTP/1.1\r\nHost: x\r\n").has_value());
  std::string head = "GET / HTTP/1.1\r\nContent-Length: 12\r\n\r\n";
  ASSERT_EQ(*net::header_end(head), head.size());
  ASSERT_EQ(*net::content_length(head), 12u);
  ASSERT_EQ(*net::content_length("GET / HTTP/1.1\r\n\r\n"), 0u);
  ASSERT_TRUE(!net::content_length("POST / HTTP/1.1\r\nContent-Length: abc\r\n\r\n"));
  ASSERT_TRUE(!net::content_length("POST / HTTP/1.1\r\nContent-Length: 99999999999\r\n\r\n"));
}

TEST(http_rejects_malformed_requests) {
  ASSERT_TRUE(!net::parse_request("GARBAGE\r\n\r\n"));
  ASSERT_TRUE(!net::parse_request("GET / SPDY/3\r\n\r\n"));
  ASSERT_TRUE(!net::parse_request("GET nopath HTTP/1.1\r\n\r\n"));
  ASSERT_TRUE(!net::parse_request("POST / HTTP/1.1\r\nContent-Length: 10\r\n\r\nshort"));
  auto r = net::parse_request("GET / HTTP/1.1\r\nno colon here\r\n\r\n");
  ASSERT_TRUE(!r);
  ASSERT_TRUE(r.error().code == util::Errc::BadRequest);
}

TEST(http_response_head_carries_cors_and_length) {
  net::HttpResponse resp{201, "application/json", "{\"ok\":true}"};
  auto head = net::format_response_head(resp);
  ASSERT_TRUE(head.starts_with("HTTP/1.1 201 Created\r\n"));
  ASSERT_TRUE(head.find("Content-Type: application/json\r\n") != std::string::npos);
  ASSERT_TRUE(head.find("Access-Control-Allow-Origin: *\r\n") != std::string::npos);
  ASSERT_TRUE(head.find("Content-Length: 11\r\n") != std::string::npos);
  ASSERT_TRUE(head.ends_with("\r\n\r\n"));
}

TEST(http_url_decode) {
  ASSERT_EQ(net::url_decode("a%2Fb+c"), std::string("a/b c"));
  ASSERT_EQ(net::url_decode("bad%zz"), std::string("bad%zz"));
}
