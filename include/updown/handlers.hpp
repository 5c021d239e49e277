#pragma once

#include <httplib.h>

#include <string>
#include <vector>

#include <filesystem>
namespace fs = std::filesystem;

namespace updown {

// Fixed at start-up and captured by value in every handler
struct Directories {
    fs::path serve_root;
    fs::path output_dir;
};

struct FileEntry {
    std::string url;
    std::string name;
    std::string type;  // "" or "<DIR>"
};

// Entries for one listing page, parent link first. False on a read error.
bool list_entries(const fs::path& dir, const std::string& nav, std::vector<FileEntry>& out);

std::string render_listing(const std::string& full_path, const std::vector<FileEntry>& entries);

// GET /
void listing_handler(const Directories& dirs, const httplib::Request& req, httplib::Response& res);

// GET /download
void download_handler(const Directories& dirs, const httplib::Request& req, httplib::Response& res);

// POST /upload
void upload_handler(const Directories& dirs, const httplib::Request& req, httplib::Response& res,
    const httplib::ContentReader& content_reader);

}  // namespace updown
