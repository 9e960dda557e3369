#include <strata/prefix_record.hpp>
#include <strata/consts.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <sstream>

namespace strata {

namespace fs = std::filesystem;
using json = nlohmann::json;

std::string PrefixRecord::file_name() const {
    return package.name + "-" + package.version + "-" + package.build + ".json";
}

std::string PrefixRecord::to_json() const {
    json j = {
        {"name", package.name},
        {"version", package.version},
        {"build", package.build},
        {"subdir", package.subdir},
        {"url", package.location},
        {"depends", package.depends},
        {"files", files},
    };
    if (package.sha256) j["sha256"] = *package.sha256;
    if (package.md5) j["md5"] = *package.md5;
    return j.dump(2);
}

Result<PrefixRecord> PrefixRecord::from_json(const std::string& text) {
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return StrataError{StrataError::Parse, "package record is not a JSON object"};
    }

    for (const char* key : {"name", "version", "build"}) {
        auto it = j.find(key);
        if (it == j.end() || !it->is_string()) {
            return StrataError{StrataError::Parse,
                std::string("package record has no string field '") + key + "'"};
        }
    }

    PrefixRecord rec;
    rec.package.name = j["name"].get<std::string>();
    rec.package.version = j["version"].get<std::string>();
    rec.package.build = j["build"].get<std::string>();
    for (const char* key : {"subdir", "url"}) {
        auto it = j.find(key);
        if (it != j.end() && !it->is_string()) {
            return StrataError{StrataError::Parse,
                std::string("package record field '") + key + "' is not a string"};
        }
    }
    auto subdir = j.find("subdir");
    if (subdir != j.end()) rec.package.subdir = subdir->get<std::string>();
    auto url = j.find("url");
    if (url != j.end()) rec.package.location = url->get<std::string>();

    auto sha = j.find("sha256");
    if (sha != j.end() && sha->is_string()) rec.package.sha256 = sha->get<std::string>();
    auto md5 = j.find("md5");
    if (md5 != j.end() && md5->is_string()) rec.package.md5 = md5->get<std::string>();

    auto depends = j.find("depends");
    if (depends != j.end() && depends->is_array()) {
        for (const auto& d : *depends) {
            if (d.is_string()) rec.package.depends.push_back(d.get<std::string>());
        }
    }
    auto files = j.find("files");
    if (files != j.end() && files->is_array()) {
        for (const auto& f : *files) {
            if (f.is_string()) rec.files.push_back(f.get<std::string>());
        }
    }
    return Result<PrefixRecord>::ok(std::move(rec));
}

Result<std::vector<PrefixRecord>> load_prefix_records(const fs::path& prefix) {
    std::vector<PrefixRecord> records;
    fs::path meta = prefix / CONDA_META_DIR;

    std::error_code ec;
    if (!fs::is_directory(meta, ec)) {
        return Result<std::vector<PrefixRecord>>::ok(std::move(records));
    }

    std::vector<fs::path> paths;
    for (fs::directory_iterator it(meta, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code type_ec;
        if (it->path().extension() == ".json" && it->is_regular_file(type_ec)) {
            paths.push_back(it->path());
        }
    }
    if (ec) {
        return StrataError{StrataError::IO,
            "cannot list " + meta.string() + ": " + ec.message()};
    }
    std::sort(paths.begin(), paths.end());

    for (const auto& path : paths) {
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            return StrataError{StrataError::IO, "cannot open " + path.string()};
        }
        std::ostringstream ss;
        ss << in.rdbuf();

        auto rec = PrefixRecord::from_json(ss.str());
        if (rec.is_err()) {
            return std::move(rec).error().context(path.string());
        }
        records.push_back(std::move(rec).value());
    }
    return Result<std::vector<PrefixRecord>>::ok(std::move(records));
}

Status write_prefix_record(const fs::path& prefix, const PrefixRecord& record) {
    fs::path meta = prefix / CONDA_META_DIR;
    std::error_code ec;
    fs::create_directories(meta, ec);
    if (ec) {
        return StrataError{StrataError::IO,
            "cannot create " + meta.string() + ": " + ec.message()};
    }

    fs::path path = meta / record.file_name();
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (out) out << record.to_json();
    if (!out) {
        return StrataError{StrataError::IO, "cannot write " + path.string()};
    }
    return ok_status();
}

Status remove_prefix_record(const fs::path& prefix, const PrefixRecord& record) {
    fs::path path = prefix / CONDA_META_DIR / record.file_name();
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        return StrataError{StrataError::IO,
            "cannot remove " + path.string() + ": " + ec.message()};
    }
    return ok_status();
}

} // namespace strata
