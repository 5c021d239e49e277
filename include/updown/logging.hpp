#pragma once

#include <ostream>
#include <string>

namespace httplib {
struct Request;
struct Response;
}

namespace updown {
namespace logging {

// Redirects every log line to `sink`; nullptr restores std::cout.
void set_sink(std::ostream* sink);

// "[19/Oct/2026:14:03:07]" in local time
std::string timestamp();

void info(const std::string& message);
void error(const std::string& message);

// Written before routing: timestamp, method and full target
void request(const httplib::Request& req);

// Written after the response, in combined log form
void access(const httplib::Request& req, const httplib::Response& res);

}  // namespace logging
}  // namespace updown
