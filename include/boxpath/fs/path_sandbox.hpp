#pragma once

#include <filesystem>
#include <memory>
#include <string_view>

#include "boxpath/core/config.hpp"
#include "boxpath/core/error.hpp"
#include "boxpath/fs/boxed_path.hpp"

namespace boxpath::fs {

/// Entry point of a sandbox: a BoxedPath whose path is its own root.
/// Every other BoxedPath of the sandbox descends from one of these via join().
///
/// For an absolute root, PathSandbox::create(r) behaves exactly like
/// BoxedPath::create(r, r). A relative root is resolved against the working
/// directory once, here, and the sandbox path is the root itself.
class PathSandbox : public BoxedPath {
public:
    /// Fails only for malformed input or a root that cannot be canonicalized.
    [[nodiscard]] static auto create(std::string_view root, SandboxOptions options = {})
        -> Result<PathSandbox>;

    /// Builds a sandbox from Config::root and Config::sandbox.
    /// Fails with InvalidConfig when no root is configured.
    [[nodiscard]] static auto from_config(const Config& config) -> Result<PathSandbox>;

private:
    PathSandbox(std::shared_ptr<const SandboxRoot> root,
                std::filesystem::path display,
                std::filesystem::path anchored,
                std::filesystem::path canonical)
        : BoxedPath(std::move(root), std::move(display), std::move(anchored), std::move(canonical)) {}
};

} // namespace boxpath::fs
