#pragma once

#include <strata/prompt.hpp>
#include <strata/result.hpp>
#include <filesystem>

namespace strata {

// Installed prefixes embed absolute paths and cannot be moved. The prefix
// marker records where conda-meta/ lived at install time.
//
// Ok when there is no marker or it matches. When the prefix moved the user
// is asked whether to delete it; confirming removes environment_dir so it
// can be recreated, anything else is a Relocated error.
Status verify_prefix_location_unchanged(const std::filesystem::path& environment_dir,
                                        Prompter& prompter);

// Write conda-meta/strata_env_prefix. Nothing happens when conda-meta/
// does not exist or the marker already holds the right path.
Status create_prefix_location_file(const std::filesystem::path& environment_dir);

// conda-meta/history, needed by `conda run -p <prefix>`
Status create_history_file(const std::filesystem::path& environment_dir);

// Create the project state directory and a .gitignore ignoring everything in it
Status ensure_state_directory_and_gitignore(const std::filesystem::path& state_dir);

} // namespace strata
