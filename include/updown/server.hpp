#pragma once

#include "updown/handlers.hpp"

#include <httplib.h>

#include <cstddef>
#include <limits>

namespace updown {

// No payload limit unless one is configured with -m
const std::size_t DEFAULT_MAX_UPLOAD_SIZE = std::numeric_limits<std::size_t>::max();

// Installs the routes, the request logger and the access logger on `svr`.
void configure_server(httplib::Server& svr, const Directories& dirs,
    std::size_t max_upload_size = DEFAULT_MAX_UPLOAD_SIZE);

}  // namespace updown
