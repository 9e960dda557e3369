#include <strata/config.hpp>
#include <strata/consts.hpp>
#include <toml++/toml.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace strata {

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return StrataError{StrataError::Parse,
            std::string("config TOML parse error: ") + std::string(e.description())};
    }

    Config cfg;

    if (auto v = doc["io-concurrency-limit"].value<int64_t>()) {
        if (*v <= 0) {
            return StrataError{StrataError::Config,
                "io-concurrency-limit must be positive, got " + std::to_string(*v)};
        }
        cfg.io_concurrency_limit = static_cast<size_t>(*v);
        cfg.io_concurrency_limit_set = true;
    }

    if (auto v = doc["interactive"].value<bool>()) {
        cfg.interactive = *v;
        cfg.interactive_set = true;
    }

    if (auto v = doc["log-level"].value<std::string>()) {
        auto lvl = log::parse_level(std::string(*v));
        if (!lvl) {
            return StrataError{StrataError::Config,
                "unknown log-level '" + std::string(*v) + "'",
                "expected one of: trace, debug, info, warn, error"};
        }
        cfg.log_level = *lvl;
    }

    // [pypi-config] section
    if (auto pypi = doc["pypi-config"].as_table()) {
        if (auto v = (*pypi)["index-url"].value<std::string>()) {
            cfg.pypi_config.index_url = std::string(*v);
        }
        if (auto arr = (*pypi)["extra-index-urls"].as_array()) {
            for (const auto& elem : *arr) {
                if (auto s = elem.value<std::string>()) {
                    cfg.pypi_config.extra_index_urls.push_back(std::string(*s));
                }
            }
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return StrataError{StrataError::IO,
            "cannot open config file: " + path.string()};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto cfg = Config::parse(ss.str());
    if (cfg.is_err()) {
        auto e = std::move(cfg).error();
        e.file = path.string();
        return e;
    }
    return cfg;
}

void Config::merge(const Config& other) {
    if (other.io_concurrency_limit_set) {
        io_concurrency_limit = other.io_concurrency_limit;
        io_concurrency_limit_set = true;
    }
    if (other.interactive_set) {
        interactive = other.interactive;
        interactive_set = true;
    }
    if (other.log_level) log_level = other.log_level;

    if (other.pypi_config.index_url) {
        pypi_config.index_url = other.pypi_config.index_url;
    }
    if (!other.pypi_config.extra_index_urls.empty()) {
        pypi_config.extra_index_urls = other.pypi_config.extra_index_urls;
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& project) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (project.has_value()) result.merge(project.value());
    return result;
}

Result<Config> Config::load_layers(const std::filesystem::path& state_dir) {
    std::optional<Config> global;
    std::optional<Config> project;
    std::error_code ec;

    std::string global_path = global_config_path();
    if (!global_path.empty() && std::filesystem::exists(global_path, ec)) {
        auto cfg = Config::load(global_path);
        if (cfg.is_err()) return std::move(cfg).error();
        global = std::move(cfg).value();
    }

    auto project_path = state_dir / CONFIG_FILE_NAME;
    if (std::filesystem::exists(project_path, ec)) {
        auto cfg = Config::load(project_path);
        if (cfg.is_err()) return std::move(cfg).error();
        project = std::move(cfg).value();
    }

    return Result<Config>::ok(Config::effective(global, project));
}

void Config::apply_log_level() const {
    if (log_level) log::set_level(*log_level);
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/" + STATE_DIR + "/" + CONFIG_FILE_NAME;
}

} // namespace strata
