#include "boxpath/fs/canonicalizer.hpp"

#include "boxpath/core/logger.hpp"

#include <cerrno>
#include <deque>
#include <string>
#include <sys/stat.h>
#include <vector>

namespace boxpath::fs {

namespace stdfs = std::filesystem;

namespace {

/// Splits on '/' and drops empty segments. A trailing separator becomes a
/// trailing "." so the preceding component must be a directory.
auto split_components(const std::string& text) -> std::vector<std::string> {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= text.size()) {
        auto end = text.find('/', start);
        if (end == std::string::npos) end = text.size();
        if (end > start) {
            parts.emplace_back(text.substr(start, end - start));
        }
        start = end + 1;
    }
    if (!text.empty() && text.back() == '/' && !parts.empty()) {
        parts.emplace_back(".");
    }
    return parts;
}

auto errno_code() -> std::error_code {
    return {errno, std::generic_category()};
}

} // anonymous namespace

auto validate_input(std::string_view raw, std::string_view what) -> VoidResult {
    if (raw.empty()) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
            std::string(what) + " must not be empty"));
    }
    if (raw.find('\0') != std::string_view::npos) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
            std::string(what) + " contains a NUL byte"));
    }
    return {};
}

auto resolve(const stdfs::path& path,
             const stdfs::path& base,
             std::size_t max_symlink_hops) -> Result<Resolution> {
    if (path.is_relative() && base.is_relative()) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
            "Resolution base must be absolute", base.string()));
    }

    auto full = path.is_absolute() ? path : base / path;
    auto parts = split_components(full.string());
    std::deque<std::string> pending(parts.begin(), parts.end());

    Resolution result;
    result.path = "/";
    std::size_t hops = 0;

    while (!pending.empty()) {
        auto component = std::move(pending.front());
        pending.pop_front();

        if (component == ".") {
            continue;
        }
        if (component == "..") {
            // The prefix is symlink-free, so its lexical parent is its real parent.
            result.path = result.path.parent_path();
            continue;
        }

        auto candidate = result.path / component;
        if (result.obstacle) {
            result.path = std::move(candidate);
            continue;
        }

        struct stat st{};
        if (::lstat(candidate.c_str(), &st) != 0) {
            auto ec = errno_code();
            if (ec != std::errc::no_such_file_or_directory) {
                LOG_DEBUG("lstat failed during resolution of {}: {}",
                          full.string(), ec.message());
                return std::unexpected(resolution_error(candidate.string(), ec));
            }
            if (!pending.empty()) {
                result.obstacle = resolution_error(candidate.string(), ec);
            }
            result.leaf_exists = false;
            result.path = std::move(candidate);
            continue;
        }

        if (S_ISLNK(st.st_mode)) {
            if (++hops > max_symlink_hops) {
                LOG_DEBUG("Symlink hop limit ({}) exceeded resolving {}",
                          max_symlink_hops, full.string());
                return std::unexpected(resolution_error(
                    candidate.string(), std::make_error_code(std::errc::too_many_symbolic_link_levels)));
            }

            std::error_code ec;
            auto target = stdfs::read_symlink(candidate, ec);
            if (ec) {
                return std::unexpected(resolution_error(candidate.string(), ec));
            }
            LOG_TRACE("Following symlink {} -> {}", candidate.string(), target.string());

            if (target.is_absolute()) {
                result.path = "/";
            }
            auto target_parts = split_components(target.string());
            pending.insert(pending.begin(), target_parts.begin(), target_parts.end());
            continue;
        }

        result.path = std::move(candidate);
        result.leaf_exists = true;

        if (!S_ISDIR(st.st_mode) && !pending.empty()) {
            result.obstacle = resolution_error(result.path.string(),
                std::make_error_code(std::errc::not_a_directory));
        }
    }

    return result;
}

auto canonicalize(const stdfs::path& path, std::size_t max_symlink_hops)
    -> Result<stdfs::path> {
    if (auto valid = validate_input(path.native(), "Path"); !valid) {
        return std::unexpected(valid.error());
    }

    std::error_code ec;
    auto cwd = stdfs::current_path(ec);
    if (ec) {
        return std::unexpected(resolution_error(".", ec));
    }

    auto resolution = resolve(path, cwd, max_symlink_hops);
    if (!resolution) {
        return std::unexpected(resolution.error());
    }
    if (resolution->obstacle) {
        return std::unexpected(*resolution->obstacle);
    }
    if (!resolution->leaf_exists) {
        return std::unexpected(resolution_error(resolution->path.string(),
            std::make_error_code(std::errc::no_such_file_or_directory)));
    }
    return std::move(resolution->path);
}

} // namespace boxpath::fs
