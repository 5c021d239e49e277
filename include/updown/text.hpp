#pragma once

#include <cstddef>
#include <map>
#include <string>

namespace httplib {
struct Request;
}

namespace updown {

// URL encode helper (RFC 3986 unreserved characters pass through)
std::string url_encode(const std::string& value);

std::string html_escape(const std::string& value);

// Body of an HTTP quoted-string: '"' and '\\' are backslash-escaped
std::string quote_header_value(const std::string& value);

// Make first N bytes printable/safe for logs (CR/LF/TAB preserved, others as \xHH)
std::string sanitize_for_log(const std::string& s, std::size_t maxlen = 1024);

// "/" + "?p=..." built from a path and query parameters, values encoded
std::string add_query_to_path(const std::string& path, const std::map<std::string, std::string>& query);

// Raw request target (path plus query string), still percent-encoded
std::string request_target(const httplib::Request& req);

// First value of a query parameter, or `fallback` when missing or empty
std::string query_value_or_default(const httplib::Request& req, const std::string& key, const std::string& fallback);

}  // namespace updown
