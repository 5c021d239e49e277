#pragma once

#include "updown/server.hpp"

#include <cstddef>
#include <string>

namespace updown {

struct Options {
    int port = 6600;
    std::string bind_address = "0.0.0.0";
    std::string output_dir = ".";
    std::string serve_dir = ".";
    std::size_t max_upload_size = DEFAULT_MAX_UPLOAD_SIZE;
    bool quiet = false;
    bool show_help = false;
};

enum class ParseResult {
    ok,
    help,
    error
};

// Fills `opts` from argv. On ParseResult::error, `error` says what was wrong.
ParseResult parse_options(int argc, const char* const argv[], Options& opts, std::string& error);

// Checks that both directories exist and turns them into absolute paths.
bool resolve_directories(const Options& opts, Directories& dirs, std::string& error);

}  // namespace updown
