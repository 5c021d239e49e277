#include "updown/text.hpp"

#include <httplib.h>

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace updown {

std::string url_encode(const std::string& value) {
    std::ostringstream escaped;
    escaped.fill('0');
    escaped << std::hex << std::uppercase;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            escaped << c;
        }
        else {
            escaped << '%' << std::setw(2) << int(c);
        }
    }
    return escaped.str();
}

std::string html_escape(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        switch (c) {
        case '&': out += "&amp;"; break;
        case '<': out += "&lt;"; break;
        case '>': out += "&gt;"; break;
        case '"': out += "&#34;"; break;
        case '\'': out += "&#39;"; break;
        default: out += c;
        }
    }
    return out;
}

std::string quote_header_value(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        if (c == '"' || c == '\\') out += '\\';
        out += c;
    }
    return out;
}

std::string sanitize_for_log(const std::string& s, std::size_t maxlen) {
    std::ostringstream o;
    o << std::uppercase << std::hex;
    std::size_t n = std::min(s.size(), maxlen);
    for (std::size_t i = 0; i < n; ++i) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if (c == '\r') { o << "\\r"; }
        else if (c == '\n') { o << "\\n"; }
        else if (c == '\t') { o << "\\t"; }
        else if (c >= 32 && c < 127) {
            o << static_cast<char>(c);
        }
        else {
            o << "\\x" << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    if (s.size() > maxlen) o << "...(truncated)";
    return o.str();
}

std::string add_query_to_path(const std::string& path, const std::map<std::string, std::string>& query) {
    std::string out = path;
    bool first = true;
    for (const auto& kv : query) {
        out += first ? "?" : "&";
        out += url_encode(kv.first) + "=" + url_encode(kv.second);
        first = false;
    }
    return out;
}

std::string request_target(const httplib::Request& req) {
    // Requests built by hand carry no raw target
    if (req.target.empty()) return req.path;
    return req.target;
}

std::string query_value_or_default(const httplib::Request& req, const std::string& key, const std::string& fallback) {
    if (!req.has_param(key)) return fallback;
    auto value = req.get_param_value(key);
    if (value.empty()) return fallback;
    return value;
}

}  // namespace updown
