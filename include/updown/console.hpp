#pragma once

#include "updown/handlers.hpp"
#include "updown/options.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace updown {

enum class Color {
    green,
    blue,
    yellow
};

// stdout is a terminal that takes ANSI colors and NO_COLOR is unset
bool supports_color();

std::string colorize(const std::string& s, Color color);

struct InterfaceAddress {
    std::string name;
    std::string address;
};

// Wired, wireless and tunnel interfaces (eth*, ens*, wl*, tun*)
bool is_shared_interface(const std::string& name);

// IPv4 addresses of the up interfaces passing is_shared_interface, sorted
std::vector<InterfaceAddress> list_ipv4_addresses();

// Lines telling peers where to point a browser. Falls back to the bind
// address when no shared interface is up.
std::string format_share_urls(const Options& opts, const std::vector<InterfaceAddress>& addresses);

void print_banner(const Options& opts, const Directories& dirs);

void print_usage(std::ostream& out, const char* progname);

// Check if a port is free by attempting to bind
bool is_port_free(const std::string& address, int port);

}  // namespace updown
