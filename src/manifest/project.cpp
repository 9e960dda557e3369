#include <strata/project.hpp>
#include <strata/consts.hpp>
#include <strata/sha256.hpp>
#include <fstream>
#include <sstream>

namespace strata {

namespace fs = std::filesystem;

Result<fs::path> find_manifest(const fs::path& start_dir) {
    std::error_code ec;
    fs::path dir = fs::canonical(start_dir, ec);
    if (ec) {
        dir = fs::absolute(start_dir, ec);
        if (ec) {
            return StrataError{StrataError::IO,
                "cannot resolve path: " + start_dir.string()};
        }
    }

    while (true) {
        fs::path candidate = dir / MANIFEST_FILE_NAME;
        if (fs::exists(candidate, ec)) {
            return Result<fs::path>::ok(candidate);
        }

        fs::path parent = dir.parent_path();
        if (parent == dir) {
            return StrataError{StrataError::NotFound,
                std::string("no ") + MANIFEST_FILE_NAME + " found in " + start_dir.string() +
                " or any parent directory",
                "run the command inside a project, or create a strata.toml"};
        }
        dir = parent;
    }
}

Result<Project> Project::load(const fs::path& project_dir) {
    fs::path manifest_path = project_dir / MANIFEST_FILE_NAME;

    std::ifstream file(manifest_path);
    if (!file.is_open()) {
        return StrataError{StrataError::IO,
            "cannot open manifest: " + manifest_path.string()};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    std::string contents = ss.str();
    file.close();

    std::error_code ec;
    fs::path abs_root = fs::canonical(project_dir, ec);
    if (ec) abs_root = fs::absolute(project_dir);
    fs::path abs_manifest = abs_root / MANIFEST_FILE_NAME;

    auto manifest = Manifest::parse(contents, abs_manifest.string());
    if (manifest.is_err()) return std::move(manifest).error();

    Project proj;
    proj.manifest = std::move(manifest).value();
    proj.root_dir = abs_root;
    proj.manifest_path = abs_manifest;
    proj.checksum = Sha256::hash_hex(contents);

    return Result<Project>::ok(std::move(proj));
}

Result<Project> Project::discover(const fs::path& start_dir) {
    auto manifest_path = find_manifest(start_dir);
    if (manifest_path.is_err()) return std::move(manifest_path).error();

    return Project::load(manifest_path.value().parent_path());
}

fs::path Project::state_dir() const {
    return root_dir / STATE_DIR;
}

fs::path Project::environments_dir() const {
    return state_dir() / ENVIRONMENTS_DIR;
}

fs::path Project::environment_dir(const EnvironmentName& name) const {
    return environments_dir() / name.as_str();
}

fs::path Project::lock_file_path() const {
    return root_dir / LOCK_FILE_NAME;
}

} // namespace strata
