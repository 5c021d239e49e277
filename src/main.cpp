#include "updown/console.hpp"
#include "updown/logging.hpp"
#include "updown/options.hpp"
#include "updown/server.hpp"

#include <httplib.h>

#include <clocale>
#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    std::setlocale(LC_ALL, "");

    updown::Options opts;
    std::string error;
    switch (updown::parse_options(argc, argv, opts, error)) {
    case updown::ParseResult::help:
        updown::print_usage(std::cout, argv[0]);
        return 0;
    case updown::ParseResult::error:
        std::cerr << error << "\n";
        updown::print_usage(std::cerr, argv[0]);
        return 1;
    case updown::ParseResult::ok:
        break;
    }

    updown::Directories dirs;
    if (!updown::resolve_directories(opts, dirs, error)) {
        std::cerr << error << std::endl;
        return 1;
    }

    if (!opts.quiet) {
        updown::print_banner(opts, dirs);
    }

    if (!updown::is_port_free(opts.bind_address, opts.port)) {
        std::cerr << "Error: Port " << opts.port << " is already in use." << std::endl;
        return 1;
    }

    httplib::Server svr;
    updown::configure_server(svr, dirs, opts.max_upload_size);

    updown::logging::info("Listening to port " + std::to_string(opts.port));

    if (!svr.listen(opts.bind_address.c_str(), opts.port)) {
        std::cerr << "Error: Failed to start HTTP server on port " << opts.port
            << ". It might be busy." << std::endl;
        return 1;
    }

    return 0;
}
