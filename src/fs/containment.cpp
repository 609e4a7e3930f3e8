#include "boxpath/fs/containment.hpp"

#include <cstddef>
#include <vector>

namespace boxpath::fs {

namespace stdfs = std::filesystem;

namespace {

/// Path elements without the empty element a trailing separator produces.
auto elements(const stdfs::path& path) -> std::vector<stdfs::path> {
    std::vector<stdfs::path> out;
    for (const auto& element : path) {
        if (!element.empty()) {
            out.push_back(element);
        }
    }
    return out;
}

/// Elements of `candidate` that follow the `root` prefix, or std::nullopt
/// when `root` is not a prefix.
auto matched_prefix(const stdfs::path& root, const stdfs::path& candidate)
    -> std::optional<std::vector<stdfs::path>> {
    if (root.empty() || candidate.empty()) return std::nullopt;
    if (root.is_absolute() != candidate.is_absolute()) return std::nullopt;

    auto root_parts = elements(root);
    auto candidate_parts = elements(candidate);
    if (candidate_parts.size() < root_parts.size()) return std::nullopt;

    for (size_t i = 0; i < root_parts.size(); ++i) {
        if (root_parts[i] != candidate_parts[i]) return std::nullopt;
    }
    return std::vector<stdfs::path>(candidate_parts.begin() + static_cast<std::ptrdiff_t>(root_parts.size()),
                                    candidate_parts.end());
}

} // anonymous namespace

auto contains(const stdfs::path& root, const stdfs::path& candidate) -> bool {
    return matched_prefix(root, candidate).has_value();
}

auto relative_within(const stdfs::path& root, const stdfs::path& candidate)
    -> std::optional<stdfs::path> {
    auto rest = matched_prefix(root, candidate);
    if (!rest) return std::nullopt;

    stdfs::path relative;
    for (const auto& element : *rest) {
        relative /= element;
    }
    if (relative.empty()) relative = ".";
    return relative;
}

} // namespace boxpath::fs
