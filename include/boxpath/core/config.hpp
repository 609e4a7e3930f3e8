#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

// std::optional serializer for nlohmann/json; enables NLOHMANN_DEFINE macros
// to work with optional fields
namespace nlohmann {
template <typename T>
struct adl_serializer<std::optional<T>> {
    static void to_json(json& j, const std::optional<T>& opt) {
        if (opt.has_value()) {
            j = *opt;
        } else {
            j = nullptr;
        }
    }

    static void from_json(const json& j, std::optional<T>& opt) {
        if (j.is_null()) {
            opt = std::nullopt;
        } else {
            opt = j.get<T>();
        }
    }
};
} // namespace nlohmann

namespace boxpath {

using json = nlohmann::json;

/// What open() does with a regular file that has more than one hard link.
enum class HardlinkPolicy {
    Allow,
    /// Refuse: a second link may live outside the sandbox and alias its content.
    Reject,
};

NLOHMANN_JSON_SERIALIZE_ENUM(HardlinkPolicy, {
    {HardlinkPolicy::Allow, "allow"},
    {HardlinkPolicy::Reject, "reject"},
})

/// Linux SYMLOOP_MAX.
inline constexpr std::size_t kDefaultMaxSymlinkHops = 40;

struct SandboxOptions {
    std::size_t max_symlink_hops = kDefaultMaxSymlinkHops;
    HardlinkPolicy hardlinks = HardlinkPolicy::Allow;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(SandboxOptions, max_symlink_hops, hardlinks)

struct Config {
    std::optional<std::string> root;
    SandboxOptions sandbox;
    std::string log_level = "info";
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Config, root, sandbox, log_level)

auto load_config(const std::filesystem::path& path) -> Config;
auto load_config_from_env() -> Config;
auto default_config() -> Config;

/// Resolves `${VAR}` environment variable references in a string.
/// Supports `$${VAR}` escape (literal `${VAR}`).
auto resolve_env_refs(std::string_view input) -> std::string;

} // namespace boxpath
