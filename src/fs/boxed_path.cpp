#include "boxpath/fs/boxed_path.hpp"

#include "boxpath/core/logger.hpp"
#include "boxpath/fs/containment.hpp"

#include <cerrno>
#include <sys/stat.h>

namespace boxpath::fs {

namespace stdfs = std::filesystem;

namespace {

auto last_os_error() -> std::error_code {
    if (errno == 0) {
        return std::make_error_code(std::errc::io_error);
    }
    return {errno, std::generic_category()};
}

auto strip_leading_separators(std::string_view segment) -> std::string_view {
    auto first = segment.find_first_not_of('/');
    return first == std::string_view::npos ? std::string_view{} : segment.substr(first);
}

} // anonymous namespace

BoxedPath::BoxedPath(std::shared_ptr<const SandboxRoot> root,
                     stdfs::path display,
                     stdfs::path anchored,
                     stdfs::path canonical)
    : root_(std::move(root)),
      display_(std::move(display)),
      anchored_(std::move(anchored)),
      canonical_(std::move(canonical)) {}

auto BoxedPath::make_root(std::string_view sandbox_root, SandboxOptions options)
    -> Result<std::shared_ptr<const SandboxRoot>> {
    if (auto valid = validate_input(sandbox_root, "Sandbox root"); !valid) {
        return std::unexpected(valid.error());
    }

    auto canonical = canonicalize(stdfs::path(sandbox_root), options.max_symlink_hops);
    if (!canonical) {
        LOG_DEBUG("Cannot canonicalize sandbox root {}: {}", sandbox_root, canonical.error().what());
        return std::unexpected(canonical.error());
    }

    std::shared_ptr<const SandboxRoot> root = std::make_shared<SandboxRoot>(
        SandboxRoot{std::move(*canonical), stdfs::path(sandbox_root), options});
    return root;
}

auto BoxedPath::create(std::string_view path,
                       std::string_view sandbox_root,
                       SandboxOptions options) -> Result<BoxedPath> {
    if (auto valid = validate_input(path, "Path"); !valid) {
        return std::unexpected(valid.error());
    }

    auto root = make_root(sandbox_root, options);
    if (!root) {
        return std::unexpected(root.error());
    }

    stdfs::path display(path);
    auto anchored = display.is_absolute() ? display : (*root)->canonical / display;

    auto resolution = validate(**root, display, anchored);
    if (!resolution) {
        return std::unexpected(resolution.error());
    }
    if (resolution->obstacle) {
        return std::unexpected(*resolution->obstacle);
    }

    return BoxedPath(std::move(*root), std::move(display), std::move(anchored),
                     std::move(resolution->path));
}

auto BoxedPath::join(std::string_view segment) const -> Result<BoxedPath> {
    if (auto valid = validate_input(segment, "Path segment"); !valid) {
        return std::unexpected(valid.error());
    }

    auto relative = strip_leading_separators(segment);
    if (relative.size() != segment.size()) {
        LOG_DEBUG("join: treating absolute-looking segment '{}' as relative", segment);
    }

    auto display = relative.empty() ? display_ : display_ / stdfs::path(relative);
    auto anchored = relative.empty() ? anchored_ : anchored_ / stdfs::path(relative);

    auto resolution = validate(*root_, display, anchored);
    if (!resolution) {
        return std::unexpected(resolution.error());
    }
    if (resolution->obstacle) {
        return std::unexpected(*resolution->obstacle);
    }

    return BoxedPath(root_, std::move(display), std::move(anchored), std::move(resolution->path));
}

auto BoxedPath::exists() const -> Result<bool> {
    auto resolution = revalidate();
    if (!resolution) {
        return std::unexpected(resolution.error());
    }
    // A missing intermediate means the target cannot exist.
    return resolution->complete() && resolution->leaf_exists;
}

auto BoxedPath::open(std::ios_base::openmode mode) const -> Result<std::fstream> {
    auto resolved = resolve_for_io();
    if (!resolved) {
        return std::unexpected(resolved.error());
    }

    struct stat st{};
    if (::stat(resolved->c_str(), &st) == 0) {
        if (S_ISDIR(st.st_mode)) {
            return std::unexpected(io_error("Failed to open file", resolved->string(),
                std::make_error_code(std::errc::is_a_directory)));
        }
        if (root_->options.hardlinks == HardlinkPolicy::Reject
            && S_ISREG(st.st_mode) && st.st_nlink > 1) {
            LOG_WARN("Refusing to open hardlinked file {} (nlink={})",
                     resolved->string(), st.st_nlink);
            return std::unexpected(make_error(ErrorCode::Forbidden,
                "Hardlinked file rejected (nlink > 1)",
                resolved->string() + " has " + std::to_string(st.st_nlink) + " links")
                .with_path(resolved->string()));
        }
    }

    errno = 0;
    std::fstream file(*resolved, mode);
    if (!file.is_open()) {
        auto cause = last_os_error();
        LOG_DEBUG("open failed for {}: {}", resolved->string(), cause.message());
        return std::unexpected(io_error("Failed to open file", resolved->string(), cause));
    }
    return file;
}

auto BoxedPath::stat() const -> Result<Metadata> {
    auto resolved = resolve_for_io();
    if (!resolved) {
        return std::unexpected(resolved.error());
    }

    struct stat st{};
    if (::stat(resolved->c_str(), &st) != 0) {
        auto cause = last_os_error();
        return std::unexpected(io_error("Failed to stat path", resolved->string(), cause));
    }
    return Metadata::from_stat(st);
}

auto BoxedPath::insecure_unrestrained_realpath() const -> Result<std::string> {
    auto resolution = resolve(anchored_, root_->canonical, root_->options.max_symlink_hops);
    if (!resolution) {
        return std::unexpected(resolution.error());
    }
    LOG_INFO("Unrestrained realpath requested for {} -> {}",
             display_.string(), resolution->path.string());
    return resolution->path.string();
}

auto BoxedPath::relative_to_root() const -> stdfs::path {
    return relative_within(root_->canonical, canonical_).value_or(canonical_);
}

auto BoxedPath::validate(const SandboxRoot& root,
                         const stdfs::path& display,
                         const stdfs::path& anchored) -> Result<Resolution> {
    auto resolution = resolve(anchored, root.canonical, root.options.max_symlink_hops);
    if (!resolution) {
        return std::unexpected(resolution.error());
    }

    if (!contains(root.canonical, resolution->path)) {
        LOG_WARN("Sandbox violation: {} resolves to {} outside {}",
                 display.string(), resolution->path.string(), root.canonical.string());
        return std::unexpected(sandbox_violation(display.string(), root.canonical.string()));
    }

    return resolution;
}

auto BoxedPath::revalidate() const -> Result<Resolution> {
    return validate(*root_, display_, anchored_);
}

auto BoxedPath::resolve_for_io() const -> Result<stdfs::path> {
    auto resolution = revalidate();
    if (!resolution) {
        return std::unexpected(resolution.error());
    }
    if (resolution->obstacle) {
        return std::unexpected(*resolution->obstacle);
    }
    return std::move(resolution->path);
}

} // namespace boxpath::fs
