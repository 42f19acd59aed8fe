// src/config.hpp
#pragma once

#include <string>

#include <glib.h>

// -----------------------------------------------------------------------------
// Backend configuration
// Read from packagekitd's own key file, which is only read, never modified.
//
//   [Deopkg]
//   ScriptPath=/usr/share/PackageKit/helpers/deopkg/deopkgBackend.py
// -----------------------------------------------------------------------------
struct BackendConfig {
  std::string script_path;
};

inline constexpr const char *k_config_group = "Deopkg";
inline constexpr const char *k_config_script_path = "ScriptPath";
inline constexpr const char *k_script_path_env = "DEOPKG_SCRIPT_PATH";

std::string default_script_path();
BackendConfig load_backend_config(GKeyFile *conf);

// -----------------------------------------------------------------------------
// EOF
// -----------------------------------------------------------------------------
