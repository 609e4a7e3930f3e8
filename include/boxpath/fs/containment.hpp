#pragma once

#include <filesystem>
#include <optional>

namespace boxpath::fs {

/// True iff `candidate` equals `root` or lies beneath it. Both arguments
/// must already be canonical. Comparison is per component, so `/sandbox-evil`
/// is not inside `/sandbox`. Pure; never touches the filesystem.
[[nodiscard]] auto contains(const std::filesystem::path& root,
                            const std::filesystem::path& candidate) -> bool;

/// `candidate` relative to `root` when contained ("." for the root itself),
/// std::nullopt otherwise.
[[nodiscard]] auto relative_within(const std::filesystem::path& root,
                                   const std::filesystem::path& candidate)
    -> std::optional<std::filesystem::path>;

} // namespace boxpath::fs
