#include "updown/logging.hpp"

#include "updown/text.hpp"

#include <httplib.h>

#include <ctime>
#include <iostream>
#include <mutex>

namespace updown {
namespace logging {

namespace {

std::mutex g_sink_mutex;
std::ostream* g_sink = nullptr;

void write_line(const std::string& line) {
    std::lock_guard<std::mutex> lock(g_sink_mutex);
    std::ostream& out = g_sink ? *g_sink : std::cout;
    out << line << "\n";
    out.flush();
}

}  // namespace

void set_sink(std::ostream* sink) {
    std::lock_guard<std::mutex> lock(g_sink_mutex);
    g_sink = sink;
}

std::string timestamp() {
    std::time_t t = std::time(nullptr);
    std::tm tm;
    localtime_r(&t, &tm);
    char time_str[100];
    std::strftime(time_str, sizeof(time_str), "[%d/%b/%Y:%H:%M:%S]", &tm);
    return time_str;
}

void info(const std::string& message) {
    write_line(timestamp() + " " + message);
}

void error(const std::string& message) {
    write_line(timestamp() + " error: " + message);
}

void request(const httplib::Request& req) {
    write_line(timestamp() + " " + req.method + " " + sanitize_for_log(request_target(req)));
}

void access(const httplib::Request& req, const httplib::Response& res) {
    write_line(req.remote_addr + " - - " + timestamp() + " \""
        + req.method + " " + sanitize_for_log(request_target(req)) + " HTTP/1.1\" "
        + std::to_string(res.status) + " -");
}

}  // namespace logging
}  // namespace updown
