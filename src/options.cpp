#include "updown/options.hpp"

#include <stdexcept>
#include <system_error>
#include <utility>

namespace updown {

namespace {

bool parse_port(const std::string& value, int& port) {
    try {
        std::size_t used = 0;
        int parsed = std::stoi(value, &used);
        if (used != value.size() || parsed < 1 || parsed > 65535) return false;
        port = parsed;
        return true;
    }
    catch (const std::exception&) {
        return false;
    }
}

bool parse_size(const std::string& value, std::size_t& size) {
    try {
        std::size_t used = 0;
        unsigned long long parsed = std::stoull(value, &used);
        if (used != value.size() || parsed == 0 || value[0] == '-') return false;
        size = static_cast<std::size_t>(parsed);
        return true;
    }
    catch (const std::exception&) {
        return false;
    }
}

}  // namespace

ParseResult parse_options(int argc, const char* const argv[], Options& opts, std::string& error) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;

        if (arg == "-h" || arg == "--help") { opts.show_help = true; return ParseResult::help; }
        else if (arg == "-q" || arg == "--quiet") { opts.quiet = true; }
        else if (arg == "-p" || arg == "--port") {
            if (!has_value || !parse_port(argv[++i], opts.port)) { error = "Invalid port value."; return ParseResult::error; }
        }
        else if (arg == "-b" || arg == "--bind") {
            if (!has_value) { error = "Missing value for " + arg + "."; return ParseResult::error; }
            opts.bind_address = argv[++i];
        }
        else if (arg == "-o" || arg == "--output") {
            if (!has_value) { error = "Missing value for " + arg + "."; return ParseResult::error; }
            opts.output_dir = argv[++i];
        }
        else if (arg == "-s" || arg == "--serve") {
            if (!has_value) { error = "Missing value for " + arg + "."; return ParseResult::error; }
            opts.serve_dir = argv[++i];
        }
        else if (arg == "-m" || arg == "--max-upload") {
            if (!has_value || !parse_size(argv[++i], opts.max_upload_size)) { error = "Invalid upload size."; return ParseResult::error; }
        }
        else {
            error = "Unknown option: " + arg;
            return ParseResult::error;
        }
    }
    return ParseResult::ok;
}

bool resolve_directories(const Options& opts, Directories& dirs, std::string& error) {
    const std::pair<const char*, std::string> checks[] = {
        { "serve", opts.serve_dir },
        { "output", opts.output_dir },
    };
    for (const auto& check : checks) {
        std::error_code ec;
        fs::path p = fs::u8path(check.second);
        if (!fs::exists(p, ec)) {
            error = std::string("Error: ") + check.first + " directory not found: " + check.second;
            return false;
        }
        if (!fs::is_directory(p, ec)) {
            error = std::string("Error: ") + check.first + " path is not a directory: " + check.second;
            return false;
        }
    }

    std::error_code ec;
    dirs.serve_root = fs::absolute(fs::u8path(opts.serve_dir), ec).lexically_normal();
    if (ec) { error = "Error: cannot resolve " + opts.serve_dir + ": " + ec.message(); return false; }
    dirs.output_dir = fs::absolute(fs::u8path(opts.output_dir), ec).lexically_normal();
    if (ec) { error = "Error: cannot resolve " + opts.output_dir + ": " + ec.message(); return false; }
    return true;
}

}  // namespace updown
