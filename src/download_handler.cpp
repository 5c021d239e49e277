#include "updown/handlers.hpp"

#include "updown/logging.hpp"
#include "updown/paths.hpp"
#include "updown/text.hpp"

#include <algorithm>
#include <fstream>
#include <memory>
#include <system_error>
#include <vector>

namespace updown {

namespace {

const std::size_t DOWNLOAD_CHUNK_SIZE = 64 * 1024;

}  // namespace

// File Download Handler
void download_handler(const Directories& dirs, const httplib::Request& req, httplib::Response& res) {
    std::string nav = query_value_or_default(req, "p", ".");

    fs::path resolved;
    switch (resolve_navigation(dirs.serve_root, nav, resolved)) {
    case PathStatus::ok:
        break;
    case PathStatus::escapes_root:
        logging::error("download outside serve root refused: " + sanitize_for_log(nav));
        res.status = 403;
        return;
    case PathStatus::unresolvable:
        logging::error("unable to resolve download path: " + sanitize_for_log(nav));
        res.status = 500;
        return;
    }

    // Attachment name comes from the joined path, not the canonical one
    fs::path fs_path = join_under(dirs.serve_root, nav);

    std::error_code ec;
    if (!fs::is_regular_file(resolved, ec)) {
        logging::error("not a regular file: " + sanitize_for_log(resolved.u8string()));
        res.status = 500;
        return;
    }
    auto size = fs::file_size(resolved, ec);
    if (ec) {
        logging::error("unable to stat " + sanitize_for_log(resolved.u8string()) + ": " + ec.message());
        res.status = 500;
        return;
    }

    auto file = std::make_shared<std::ifstream>(resolved, std::ios::binary);
    if (!*file) {
        logging::error("unable to open " + sanitize_for_log(resolved.u8string()));
        res.status = 500;
        return;
    }

    std::string file_name = fs_path.lexically_normal().filename().u8string();
    if (file_name.empty()) file_name = resolved.filename().u8string();

    res.status = 200;
    res.set_header("Content-Disposition", "attachment; filename=\"" + quote_header_value(file_name) + "\"");
    if (size == 0) {
        res.set_content("", "application/octet-stream");
        return;
    }

    auto log_name = sanitize_for_log(resolved.u8string());
    res.set_content_provider(
        static_cast<std::size_t>(size), "application/octet-stream",
        [file, log_name](std::size_t offset, std::size_t length, httplib::DataSink& sink) {
            std::vector<char> buf(std::min(length, DOWNLOAD_CHUNK_SIZE));
            file->clear();
            file->seekg(static_cast<std::streamoff>(offset));
            file->read(buf.data(), static_cast<std::streamsize>(buf.size()));
            auto got = file->gcount();
            if (got <= 0) {
                // Headers are already out; dropping the connection is all that is left
                logging::error("read failed while streaming " + log_name);
                return false;
            }
            return sink.write(buf.data(), static_cast<std::size_t>(got));
        });
}

}  // namespace updown
