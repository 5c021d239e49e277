#include "updown/paths.hpp"

#include <system_error>

namespace updown {

std::string join_navigation(const std::string& base, const std::string& name) {
    std::string joined = base;
    if (!joined.empty() && !name.empty()) joined += "/";
    joined += name;

    std::string clean = fs::path(joined).lexically_normal().generic_string();
    while (clean.size() > 1 && clean.back() == '/') clean.pop_back();
    if (clean.empty()) return ".";
    return clean;
}

fs::path join_under(const fs::path& root, const std::string& nav) {
    // An absolute nav would replace root on operator/, so drop its root part
    return root / fs::u8path(nav).relative_path();
}

bool is_within(const fs::path& outer, const fs::path& inner) {
    auto outer_it = outer.begin();
    auto inner_it = inner.begin();
    for (; outer_it != outer.end(); ++outer_it, ++inner_it) {
        // A trailing separator shows up as a final empty element
        if (outer_it->empty()) break;
        if (inner_it == inner.end() || *outer_it != *inner_it) return false;
    }
    return true;
}

PathStatus resolve_navigation(const fs::path& root, const std::string& nav, fs::path& out) {
    std::error_code ec;
    auto canonical_root = fs::weakly_canonical(root, ec);
    if (ec) return PathStatus::unresolvable;

    auto canonical_target = fs::weakly_canonical(join_under(root, nav), ec);
    if (ec) return PathStatus::unresolvable;

    if (!is_within(canonical_root, canonical_target)) return PathStatus::escapes_root;

    out = canonical_target;
    return PathStatus::ok;
}

std::string upload_base_name(const std::string& filename) {
    auto end = filename.find_last_not_of("/\\");
    if (end == std::string::npos) return {};

    auto start = filename.find_last_of("/\\", end);
    start = (start == std::string::npos) ? 0 : start + 1;
    return filename.substr(start, end - start + 1);
}

}  // namespace updown
