#include <strata/environment_file.hpp>
#include <strata/consts.hpp>
#include <strata/log.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

namespace strata {

namespace fs = std::filesystem;
using json = nlohmann::json;

// Field names are shared with other tools reading the record, keep them
std::string EnvironmentFile::to_json() const {
    json j = {
        {"manifest_path", manifest_path},
        {"environment_name", environment_name},
        {"pixi_version", tool_version},
        {"environment_lock_file_hash", environment_lock_file_hash.str()},
    };
    return j.dump(2);
}

Result<EnvironmentFile> EnvironmentFile::from_json(const std::string& text) {
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return StrataError{StrataError::Parse, "environment file is not a JSON object"};
    }

    static const char* const required[] = {
        "manifest_path", "environment_name", "pixi_version", "environment_lock_file_hash",
    };
    for (const char* key : required) {
        auto it = j.find(key);
        if (it == j.end() || !it->is_string()) {
            return StrataError{StrataError::Parse,
                std::string("environment file has no string field '") + key + "'"};
        }
    }

    EnvironmentFile file;
    file.manifest_path = j["manifest_path"].get<std::string>();
    file.environment_name = j["environment_name"].get<std::string>();
    file.tool_version = j["pixi_version"].get<std::string>();
    file.environment_lock_file_hash = DriftHash(j["environment_lock_file_hash"].get<std::string>());
    return Result<EnvironmentFile>::ok(std::move(file));
}

fs::path environment_file_path(const fs::path& environment_dir) {
    return environment_dir / CONDA_META_DIR / ENVIRONMENT_FILE_NAME;
}

Result<fs::path> write_environment_file(const fs::path& environment_dir,
                                        const EnvironmentFile& file) {
    fs::path path = environment_file_path(environment_dir);

    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        log::debug("unable to create conda-meta folder for %s", path.string().c_str());
        return StrataError{StrataError::IO,
            "cannot create directory " + path.parent_path().string() + ": " + ec.message()};
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (out) out << file.to_json();
    if (!out) {
        log::debug("unable to write environment file to %s", path.string().c_str());
    } else {
        log::debug("wrote environment file to %s", path.string().c_str());
    }
    return Result<fs::path>::ok(path);
}

std::optional<EnvironmentFile> read_environment_file(const fs::path& environment_dir) {
    fs::path path = environment_file_path(environment_dir);

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        log::debug("environment file not yet found at %s", path.string().c_str());
        return std::nullopt;
    }

    std::ifstream in(path, std::ios::binary);
    std::ostringstream ss;
    if (in) ss << in.rdbuf();
    if (!in) {
        log::debug("failed to read environment file at %s, removing it", path.string().c_str());
        fs::remove(path, ec);
        return std::nullopt;
    }

    auto parsed = EnvironmentFile::from_json(ss.str());
    if (parsed.is_err()) {
        log::debug("invalid environment file at %s (%s), removing it",
                   path.string().c_str(), parsed.error().message.c_str());
        fs::remove(path, ec);
        return std::nullopt;
    }
    return std::move(parsed).value();
}

} // namespace strata
