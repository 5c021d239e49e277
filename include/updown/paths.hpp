#pragma once

#include <string>

#include <filesystem>
namespace fs = std::filesystem;

namespace updown {

enum class PathStatus {
    ok,
    escapes_root,
    unresolvable
};

// Lexical join of two slash-separated navigation paths, cleaned the way a
// URL path is ("a/./b/.." -> "a"). Never returns an empty string.
std::string join_navigation(const std::string& base, const std::string& name);

// Joins a client navigation path onto root without canonicalizing it.
fs::path join_under(const fs::path& root, const std::string& nav);

// Canonicalizes root / nav into `out` and checks that it stays inside root.
PathStatus resolve_navigation(const fs::path& root, const std::string& nav, fs::path& out);

// True when `inner` equals `outer` or lies below it, compared component-wise.
bool is_within(const fs::path& outer, const fs::path& inner);

// Last component of a client supplied file name. Both '/' and '\' count as
// separators and trailing separators are ignored.
std::string upload_base_name(const std::string& filename);

}  // namespace updown
