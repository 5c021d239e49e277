#include "updown/console.hpp"

#include "updown/version.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <sstream>

#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <ifaddrs.h>
#include <net/if.h>

namespace updown {

namespace {

const char* const LOGO = R"(
           _
 _ _ ___ _| |___ _ _ _ ___
| | | . | . | . | | | |   |
|___|  _|___|___|_____|_|_|
    |_|
)";

const char* const SHARED_PREFIXES[] = { "eth", "ens", "wl", "tun" };

const char* ansi_code(Color color) {
    switch (color) {
    case Color::green: return "\x1b[32m";
    case Color::blue: return "\x1b[34m";
    case Color::yellow: return "\x1b[33m";
    }
    return "";
}

}  // namespace

bool supports_color() {
    if (std::getenv("NO_COLOR")) return false;
    if (!isatty(STDOUT_FILENO)) return false;
    const char* term = std::getenv("TERM");
    if (!term || std::string(term) == "dumb") return false;
    return true;
}

std::string colorize(const std::string& s, Color color) {
    return std::string(ansi_code(color)) + s + "\x1b[0m";
}

bool is_shared_interface(const std::string& name) {
    for (const char* prefix : SHARED_PREFIXES) {
        if (name.rfind(prefix, 0) == 0) return true;
    }
    return false;
}

std::vector<InterfaceAddress> list_ipv4_addresses() {
    std::vector<InterfaceAddress> entries;

    ifaddrs* ifaddr = nullptr;
    if (getifaddrs(&ifaddr) != 0 || !ifaddr) return entries;

    for (ifaddrs* ifa = ifaddr; ifa; ifa = ifa->ifa_next) {
        if (!ifa->ifa_name || !ifa->ifa_addr) continue;
        if (!(ifa->ifa_flags & IFF_UP)) continue;
        if (ifa->ifa_addr->sa_family != AF_INET) continue;
        if (!is_shared_interface(ifa->ifa_name)) continue;

        char buf[INET_ADDRSTRLEN] = { 0 };
        auto* sin = reinterpret_cast<sockaddr_in*>(ifa->ifa_addr);
        if (inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf))) {
            entries.push_back(InterfaceAddress{ ifa->ifa_name, buf });
        }
    }
    freeifaddrs(ifaddr);

    std::sort(entries.begin(), entries.end(), [](const InterfaceAddress& a, const InterfaceAddress& b) {
        return a.name != b.name ? a.name < b.name : a.address < b.address;
    });
    return entries;
}

std::string format_share_urls(const Options& opts, const std::vector<InterfaceAddress>& addresses) {
    std::ostringstream oss;
    std::string port = std::to_string(opts.port);

    // A specific bind address is the only one peers can reach
    if (opts.bind_address != "0.0.0.0" || addresses.empty()) {
        oss << "Share with: http://" << opts.bind_address << ":" << port << "/\n";
        return oss.str();
    }

    oss << "Share with:\n";
    for (const auto& entry : addresses) {
        oss << "  " << entry.name << ": http://" << entry.address << ":" << port << "/\n";
    }
    return oss.str();
}

void print_banner(const Options& opts, const Directories& dirs) {
    std::string version = UPDOWN_VERSION;
    if (!version.empty() && version[0] == 'v') version.erase(0, 1);

    std::string logo = LOGO;
    std::string footer = "updown - ad-hoc file sharing      ver " + version + "\n\n";
    std::string urls = format_share_urls(opts, list_ipv4_addresses());

    if (supports_color()) {
        logo = colorize(logo, Color::green);
        footer = colorize(footer, Color::blue);
        urls = colorize(urls, Color::yellow);
    }
    std::cout << logo << footer << urls
        << "Serving files from: " << dirs.serve_root.u8string() << "\n"
        << "Writing uploads to: " << dirs.output_dir.u8string() << "\n";
}

void print_usage(std::ostream& out, const char* progname) {
    out << "Usage: " << progname << " [options]\n"
        << "Options:\n"
        << "  -h, --help               Print this help message\n"
        << "  -p, --port PORT          Set the port (default: 6600)\n"
        << "  -b, --bind ADDRESS       Address to listen on (default: 0.0.0.0)\n"
        << "  -s, --serve DIR          Directory to serve (default: .)\n"
        << "  -o, --output DIR         Directory receiving uploads (default: .)\n"
        << "  -m, --max-upload BYTES   Largest accepted request body (default: unlimited)\n"
        << "  -q, --quiet              Do not print the banner\n";
}

bool is_port_free(const std::string& address, int port) {
    int sockfd = socket(AF_INET, SOCK_STREAM, 0);
    if (sockfd < 0) return false;

    sockaddr_in addr = {};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    if (inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1) {
        addr.sin_addr.s_addr = htonl(INADDR_ANY);
    }
    int result = bind(sockfd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    close(sockfd);
    return result == 0;
}

}  // namespace updown
