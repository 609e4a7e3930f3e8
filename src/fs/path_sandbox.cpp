#include "boxpath/fs/path_sandbox.hpp"

#include "boxpath/core/logger.hpp"

namespace boxpath::fs {

auto PathSandbox::create(std::string_view root, SandboxOptions options) -> Result<PathSandbox> {
    auto sandbox_root = make_root(root, options);
    if (!sandbox_root) {
        return std::unexpected(sandbox_root.error());
    }

    auto canonical = (*sandbox_root)->canonical;
    auto display = (*sandbox_root)->display;
    LOG_DEBUG("Sandbox created at {} (max_symlink_hops={}, hardlinks={})",
              canonical.string(), options.max_symlink_hops,
              options.hardlinks == HardlinkPolicy::Reject ? "reject" : "allow");

    auto anchored = display.is_absolute() ? display : canonical;
    return PathSandbox(std::move(*sandbox_root), std::move(display), std::move(anchored),
                       std::move(canonical));
}

auto PathSandbox::from_config(const Config& config) -> Result<PathSandbox> {
    if (!config.root || config.root->empty()) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "No sandbox root configured"));
    }
    Logger::set_level(config.log_level);
    return create(*config.root, config.sandbox);
}

} // namespace boxpath::fs
