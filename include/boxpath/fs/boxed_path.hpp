#pragma once

#include <filesystem>
#include <fstream>
#include <ios>
#include <memory>
#include <string>
#include <string_view>

#include "boxpath/core/config.hpp"
#include "boxpath/core/error.hpp"
#include "boxpath/fs/canonicalizer.hpp"
#include "boxpath/fs/metadata.hpp"

namespace boxpath::fs {

/// The trusted half of every boxed path. Created once per sandbox and shared
/// read-only by the sandbox and every path derived from it.
struct SandboxRoot {
    std::filesystem::path canonical;
    std::filesystem::path display;
    SandboxOptions options;
};

/// A path that is guaranteed to resolve inside its sandbox root.
///
/// Instances only come out of create() or join(), both of which resolve the
/// path against the live filesystem and check containment first. Every
/// operation that touches the filesystem (exists, open, stat) resolves and
/// checks again right before acting, so a symlink swapped in after
/// construction is caught at use time. The value itself never changes.
///
/// Relative input paths are relative to the sandbox root, not to the
/// process working directory.
class BoxedPath {
public:
    /// Fails with InvalidArgument for empty or NUL-containing input,
    /// ResolutionFailed if the root cannot be canonicalized, SandboxViolation
    /// if `path` resolves outside the root (whether or not the target
    /// exists), and ResolutionFailed if it resolves inside but an
    /// intermediate component is missing or not a directory.
    [[nodiscard]] static auto create(std::string_view path,
                                     std::string_view sandbox_root,
                                     SandboxOptions options = {}) -> Result<BoxedPath>;

    /// Appends `segment` and validates the result as create() does.
    /// Leading separators are stripped: "/etc/passwd" appends "etc/passwd".
    [[nodiscard]] auto join(std::string_view segment) const -> Result<BoxedPath>;

    /// Re-resolves, then reports whether the target exists. A violation is
    /// an error, never `false`.
    [[nodiscard]] auto exists() const -> Result<bool>;

    /// Re-resolves, then opens the resolved location with std::fstream.
    [[nodiscard]] auto open(std::ios_base::openmode mode = std::ios_base::in) const
        -> Result<std::fstream>;

    /// Re-resolves, then stat()s the resolved location.
    [[nodiscard]] auto stat() const -> Result<Metadata>;

    /// UNSAFE: the canonical absolute path with no containment check.
    /// This is the only way to obtain a location without the sandbox
    /// guarantee; every call is logged. Callers own the consequences.
    [[nodiscard]] auto insecure_unrestrained_realpath() const -> Result<std::string>;

    /// Path as the caller expressed it (relative to the root, or absolute).
    [[nodiscard]] auto path() const noexcept -> const std::filesystem::path& { return display_; }

    /// Canonical form from the last successful validation.
    [[nodiscard]] auto canonical() const noexcept -> const std::filesystem::path& { return canonical_; }

    [[nodiscard]] auto root() const noexcept -> const std::filesystem::path& { return root_->canonical; }
    [[nodiscard]] auto sandbox_root() const noexcept -> const std::shared_ptr<const SandboxRoot>& {
        return root_;
    }

    /// canonical() relative to root(); "." for the root itself.
    [[nodiscard]] auto relative_to_root() const -> std::filesystem::path;

    friend auto operator==(const BoxedPath& lhs, const BoxedPath& rhs) -> bool {
        return lhs.canonical_ == rhs.canonical_;
    }

protected:
    BoxedPath(std::shared_ptr<const SandboxRoot> root,
              std::filesystem::path display,
              std::filesystem::path anchored,
              std::filesystem::path canonical);

    [[nodiscard]] static auto make_root(std::string_view sandbox_root, SandboxOptions options)
        -> Result<std::shared_ptr<const SandboxRoot>>;

private:
    /// Resolves `anchored` and enforces containment. An incomplete
    /// resolution (Resolution::obstacle) is returned to the caller to judge.
    [[nodiscard]] static auto validate(const SandboxRoot& root,
                                       const std::filesystem::path& display,
                                       const std::filesystem::path& anchored) -> Result<Resolution>;

    [[nodiscard]] auto revalidate() const -> Result<Resolution>;

    /// revalidate() that also treats an incomplete resolution as an error.
    [[nodiscard]] auto resolve_for_io() const -> Result<std::filesystem::path>;

    std::shared_ptr<const SandboxRoot> root_;
    std::filesystem::path display_;
    std::filesystem::path anchored_;  // absolute, lexical; what gets re-resolved
    std::filesystem::path canonical_;
};

} // namespace boxpath::fs
