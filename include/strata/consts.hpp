#pragma once

namespace strata {

#ifndef STRATA_VERSION
#define STRATA_VERSION "0.1.0"
#endif

inline constexpr const char* TOOL_VERSION = STRATA_VERSION;

// Project state directory, next to strata.toml
inline constexpr const char* STATE_DIR = ".strata";
inline constexpr const char* ENVIRONMENTS_DIR = "envs";
inline constexpr const char* CONFIG_FILE_NAME = "config.toml";

// Layout inside an installed prefix
inline constexpr const char* CONDA_META_DIR = "conda-meta";
inline constexpr const char* PREFIX_FILE_NAME = "strata_env_prefix";
inline constexpr const char* ENVIRONMENT_FILE_NAME = "strata";
inline constexpr const char* HISTORY_FILE_NAME = "history";

// INSTALLER contents of the python distributions we install
inline constexpr const char* UV_INSTALLER = "uv-strata";

} // namespace strata
