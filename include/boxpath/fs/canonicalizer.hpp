#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string_view>

#include "boxpath/core/config.hpp"
#include "boxpath/core/error.hpp"

namespace boxpath::fs {

/// Outcome of a component-by-component resolution.
struct Resolution {
    /// Absolute path with every symlink followed and no `.`/`..` segments.
    /// When `obstacle` is set, the part after the obstacle is lexical only.
    std::filesystem::path path;

    /// False when the final component does not exist (the rest of the
    /// path resolved normally).
    bool leaf_exists = true;

    /// Set when an intermediate component is missing or is not a directory.
    /// The walk still completes so the caller can decide containment
    /// before reporting this ResolutionFailed error.
    std::optional<Error> obstacle;

    [[nodiscard]] auto complete() const noexcept -> bool { return !obstacle.has_value(); }
};

/// Walks `path` one component at a time with lstat()/readlink(), following
/// symlinks and collapsing `.` and `..` against the resolved prefix.
/// A relative `path` is resolved against `base`, which must be absolute.
///
/// Hard failures (permission denied, more than `max_symlink_hops` symlinks,
/// any other system error) return ResolutionFailed. Missing or non-directory
/// intermediates do not fail here; see Resolution::obstacle.
[[nodiscard]] auto resolve(const std::filesystem::path& path,
                           const std::filesystem::path& base,
                           std::size_t max_symlink_hops = kDefaultMaxSymlinkHops)
    -> Result<Resolution>;

/// Strict canonicalization, equivalent to realpath(3): every component,
/// including the last, must exist. Relative paths resolve against the
/// current working directory.
[[nodiscard]] auto canonicalize(const std::filesystem::path& path,
                                std::size_t max_symlink_hops = kDefaultMaxSymlinkHops)
    -> Result<std::filesystem::path>;

/// Rejects empty input and input containing a NUL byte, before any
/// filesystem access.
[[nodiscard]] auto validate_input(std::string_view raw, std::string_view what) -> VoidResult;

} // namespace boxpath::fs
