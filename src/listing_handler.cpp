#include "updown/handlers.hpp"

#include "updown/logging.hpp"
#include "updown/paths.hpp"
#include "updown/text.hpp"
#include "updown/version.hpp"

#include <sstream>
#include <system_error>

namespace updown {

bool list_entries(const fs::path& dir, const std::string& nav, std::vector<FileEntry>& out) {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) return false;

    out.clear();
    out.push_back({ add_query_to_path("/", { { "p", join_navigation(nav, "..") } }), "../", "<DIR>" });

    // Filesystem order, no sort
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) return false;
        const auto& entry = *it;
        std::string name = entry.path().filename().u8string();
        std::string child = join_navigation(nav, name);

        std::error_code type_ec;
        if (entry.is_directory(type_ec)) {
            out.push_back({ add_query_to_path("/", { { "p", child } }), name + "/", "<DIR>" });
        }
        else {
            out.push_back({ add_query_to_path("/download", { { "p", child } }), name, "" });
        }
    }
    if (ec) return false;
    return true;
}

std::string render_listing(const std::string& full_path, const std::vector<FileEntry>& entries) {
    std::ostringstream html;
    html << "<!DOCTYPE html>\n"
        << "<html lang='en'>\n"
        << "<head>\n"
        << "  <meta charset='utf-8'>\n"
        << "  <meta name='viewport' content='width=device-width, initial-scale=1'>\n"
        << "  <title>Updown</title>\n"
        << "  <style>\n"
        << "    body { font-family: Arial, sans-serif; margin: 0 auto; max-width: 800px; padding: 20px; }\n"
        << "    ul { list-style: none; padding: 0; }\n"
        << "    ul li { margin-bottom: 6px; }\n"
        << "    a { text-decoration: none; color: #007ACC; }\n"
        << "    a:hover { text-decoration: underline; }\n"
        << "    .type { color: #777; }\n"
        << "    .footer { font-size: 0.8em; color: #777; margin-top: 30px; }\n"
        << "  </style>\n"
        << "</head>\n"
        << "<body>\n"
        << "  <h1>Updown</h1>\n"
        << "  <p>Welcome to updown.</p>\n"
        << "  <form method='post' action='/upload' enctype='multipart/form-data'>\n"
        << "    <input type='file' name='file'>\n"
        << "    <button type='submit'>Upload</button>\n"
        << "  </form>\n"
        << "  <h2>Serving files</h2>\n"
        << "  <p>Path: " << html_escape(full_path) << "</p>\n"
        << "  <ul>\n";
    for (const auto& e : entries) {
        html << "    <li><a href='" << html_escape(e.url) << "'>" << html_escape(e.name) << "</a>";
        if (!e.type.empty()) html << " <span class='type'>" << html_escape(e.type) << "</span>";
        html << "</li>\n";
    }
    html << "  </ul>\n"
        << "  <div class='footer'>Version " << UPDOWN_VERSION << "</div>\n"
        << "</body>\n"
        << "</html>\n";
    return html.str();
}

// Directory listing handler
void listing_handler(const Directories& dirs, const httplib::Request& req, httplib::Response& res) {
    std::string nav = query_value_or_default(req, "p", ".");

    fs::path full_path;
    switch (resolve_navigation(dirs.serve_root, nav, full_path)) {
    case PathStatus::ok:
        break;
    case PathStatus::escapes_root:
        logging::error("listing outside serve root refused: " + sanitize_for_log(nav));
        res.status = 403;
        return;
    case PathStatus::unresolvable:
        logging::error("unable to resolve listing path: " + sanitize_for_log(nav));
        res.status = 500;
        return;
    }

    std::vector<FileEntry> entries;
    if (!list_entries(full_path, nav, entries)) {
        logging::error("unable to read directory " + sanitize_for_log(full_path.u8string()));
        res.status = 500;
        return;
    }

    res.status = 200;
    res.set_content(render_listing(full_path.u8string(), entries), "text/html; charset=utf-8");
}

}  // namespace updown
