#include "boxpath/core/config.hpp"
#include "boxpath/core/logger.hpp"

#include <charconv>
#include <cstdlib>
#include <fstream>

namespace boxpath {

namespace {

auto parse_hardlink_policy(std::string_view value) -> std::optional<HardlinkPolicy> {
    if (value == "allow") return HardlinkPolicy::Allow;
    if (value == "reject") return HardlinkPolicy::Reject;
    return std::nullopt;
}

} // anonymous namespace

auto load_config(const std::filesystem::path& path) -> Config {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        LOG_WARN("Config file not found: {}, using defaults", path.string());
        return default_config();
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Cannot open config file: {}, using defaults", path.string());
        return default_config();
    }

    try {
        json j = json::parse(file);
        auto config = j.get<Config>();

        if (config.root) {
            config.root = resolve_env_refs(*config.root);
        }
        if (config.sandbox.max_symlink_hops == 0) {
            LOG_WARN("Config: sandbox.max_symlink_hops must be positive, using {}",
                     kDefaultMaxSymlinkHops);
            config.sandbox.max_symlink_hops = kDefaultMaxSymlinkHops;
        }
        return config;
    } catch (const json::exception& e) {
        LOG_ERROR("Failed to parse config {}: {}", path.string(), e.what());
        return default_config();
    }
}

auto load_config_from_env() -> Config {
    Config config;

    if (auto* val = std::getenv("BOXPATH_ROOT"); val && *val) {
        config.root = val;
    }
    if (auto* val = std::getenv("BOXPATH_LOG_LEVEL"); val && *val) {
        config.log_level = val;
    }
    if (auto* val = std::getenv("BOXPATH_MAX_SYMLINK_HOPS"); val && *val) {
        std::string_view text(val);
        std::size_t hops = 0;
        auto [ptr, err] = std::from_chars(text.data(), text.data() + text.size(), hops);
        if (err == std::errc{} && ptr == text.data() + text.size() && hops > 0) {
            config.sandbox.max_symlink_hops = hops;
        } else {
            LOG_WARN("Ignoring invalid BOXPATH_MAX_SYMLINK_HOPS '{}'", text);
        }
    }
    if (auto* val = std::getenv("BOXPATH_HARDLINKS"); val && *val) {
        if (auto policy = parse_hardlink_policy(val)) {
            config.sandbox.hardlinks = *policy;
        } else {
            LOG_WARN("Ignoring invalid BOXPATH_HARDLINKS '{}'", val);
        }
    }

    return config;
}

auto default_config() -> Config {
    return Config{};
}

auto resolve_env_refs(std::string_view input) -> std::string {
    std::string out;
    out.reserve(input.size());

    while (!input.empty()) {
        auto dollar = input.find('$');
        out.append(input.substr(0, dollar));
        if (dollar == std::string_view::npos) {
            break;
        }
        input.remove_prefix(dollar);

        // $${NAME} stays literal as ${NAME}
        if (input.starts_with("$$")) {
            out += '$';
            input.remove_prefix(2);
            continue;
        }

        auto close = input.find('}');
        if (!input.starts_with("${") || close == std::string_view::npos) {
            out += '$';
            input.remove_prefix(1);
            continue;
        }

        std::string name(input.substr(2, close - 2));
        if (const char* value = std::getenv(name.c_str())) {
            out += value;
        } else {
            out.append(input.substr(0, close + 1));
            LOG_DEBUG("Leaving unset variable ${{{}}} in place", name);
        }
        input.remove_prefix(close + 1);
    }

    return out;
}

} // namespace boxpath
