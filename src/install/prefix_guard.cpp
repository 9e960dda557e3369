#include <strata/prefix_guard.hpp>
#include <strata/consts.hpp>
#include <strata/log.hpp>
#include <fstream>
#include <iterator>
#include <sstream>

namespace strata {

namespace fs = std::filesystem;

static fs::path prefix_file_path(const fs::path& environment_dir) {
    return environment_dir / CONDA_META_DIR / PREFIX_FILE_NAME;
}

static bool path_starts_with(const fs::path& path, const fs::path& prefix) {
    auto p = path.begin();
    for (auto q = prefix.begin(); q != prefix.end(); ++q, ++p) {
        // A trailing separator shows up as an empty last component
        if (q->empty() && std::next(q) == prefix.end()) break;
        if (p == path.end() || *p != *q) return false;
    }
    return true;
}

static Status write_file(const fs::path& path, const std::string& contents) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        return StrataError{StrataError::IO,
            "cannot create directory " + path.parent_path().string() + ": " + ec.message()};
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (out) out << contents;
    if (!out) {
        return StrataError{StrataError::IO, "cannot write " + path.string()};
    }
    return ok_status();
}

static Status prefix_location_changed(const fs::path& environment_dir,
                                      const fs::path& previous_dir,
                                      Prompter& prompter) {
    std::string moved = previous_dir.string() + " -> " + environment_dir.string();

    auto answer = prompter.confirm(
        "The environment directory seems to have moved! Environments are non-relocatable, "
        "moving them can cause issues.\n\n\t" + moved +
        "\n\nThis can be fixed by reinstalling the environment from the lock file in the new "
        "location.\n\nDo you want to automatically recreate the environment?",
        true);

    if (answer && *answer) {
        log::info("removing old environment at %s", environment_dir.string().c_str());
        std::error_code ec;
        fs::remove_all(environment_dir, ec);
        if (ec) {
            return StrataError{StrataError::IO,
                "failed to remove old environment directory " + environment_dir.string() +
                ": " + ec.message()};
        }
        return ok_status();
    }

    return StrataError{StrataError::Relocated,
        "the environment directory has moved from '" + previous_dir.string() + "' to '" +
        environment_dir.string() + "'. Environments are non-relocatable, moving them can cause issues.",
        "remove the environment directory, it is recreated on the next run"};
}

Status verify_prefix_location_unchanged(const fs::path& environment_dir, Prompter& prompter) {
    fs::path prefix_file = prefix_file_path(environment_dir);
    log::debug("verifying prefix location is unchanged, with prefix file: %s",
               prefix_file.string().c_str());

    std::error_code ec;
    if (!fs::exists(prefix_file, ec)) {
        // New environment, or one installed before the marker existed
        return ok_status();
    }

    std::ifstream in(prefix_file, std::ios::binary);
    std::ostringstream ss;
    if (in) ss << in.rdbuf();
    std::string recorded = ss.str();
    while (!recorded.empty() && (recorded.back() == '\n' || recorded.back() == '\r')) {
        recorded.pop_back();
    }

    if (!in || recorded.empty()) {
        log::warn("unreadable prefix file %s, removing it", prefix_file.string().c_str());
        fs::remove(prefix_file, ec);
        return ok_status();
    }

    fs::path recorded_path(recorded);
    if (path_starts_with(prefix_file, recorded_path)) {
        return ok_status();
    }

    fs::path previous_dir = recorded_path.has_parent_path()
        ? recorded_path.parent_path() : recorded_path;
    return prefix_location_changed(environment_dir, previous_dir, prompter);
}

Status create_prefix_location_file(const fs::path& environment_dir) {
    fs::path prefix_file = prefix_file_path(environment_dir);
    fs::path parent = prefix_file.parent_path();

    std::error_code ec;
    if (!fs::exists(parent, ec)) return ok_status();

    std::string contents = parent.string();

    if (fs::exists(prefix_file, ec)) {
        std::ifstream in(prefix_file, std::ios::binary);
        std::ostringstream ss;
        if (!in) {
            return StrataError{StrataError::IO, "cannot read " + prefix_file.string()};
        }
        ss << in.rdbuf();
        if (ss.str() == contents) {
            log::debug("no update needed for the prefix file");
            return ok_status();
        }
    }

    STRATA_TRY(write_file(prefix_file, contents));
    log::debug("prefix file updated with: '%s'", contents.c_str());
    return ok_status();
}

Status create_history_file(const fs::path& environment_dir) {
    fs::path history = environment_dir / CONDA_META_DIR / HISTORY_FILE_NAME;
    log::debug("verify history file exists: %s", history.string().c_str());
    return write_file(history, "// not relevant for strata but for `conda run -p`");
}

Status ensure_state_directory_and_gitignore(const fs::path& state_dir) {
    std::error_code ec;
    if (!fs::exists(state_dir, ec)) {
        fs::create_directories(state_dir, ec);
        if (ec) {
            return StrataError{StrataError::IO,
                "failed to create " + std::string(STATE_DIR) + "/ directory at " +
                state_dir.string() + ": " + ec.message()};
        }
    }

    fs::path gitignore = state_dir / ".gitignore";
    if (!fs::exists(gitignore, ec)) {
        auto written = write_file(gitignore, "*\n");
        if (written.is_err()) {
            return std::move(written).error().context("failed to create .gitignore file");
        }
    }
    return ok_status();
}

} // namespace strata
