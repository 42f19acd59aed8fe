// -----------------------------------------------------------------------------
// src/config.cpp
// Config helpers for locating the package manager script
// Lookup order:
//   1. $DEOPKG_SCRIPT_PATH (developer override)
//   2. [Deopkg] ScriptPath in packagekitd's configuration
//   3. compiled-in default
// -----------------------------------------------------------------------------
#include "config.hpp"

#ifndef DEOPKG_SCRIPT_PATH
#define DEOPKG_SCRIPT_PATH "/usr/share/PackageKit/helpers/deopkg/deopkgBackend.py"
#endif

std::string
default_script_path()
{
  return DEOPKG_SCRIPT_PATH;
}

BackendConfig
load_backend_config(GKeyFile *conf)
{
  BackendConfig config;
  config.script_path = default_script_path();

  if (conf && g_key_file_has_key(conf, k_config_group, k_config_script_path, nullptr)) {
    g_autoptr(GError) error = nullptr;
    g_autofree gchar *value = g_key_file_get_string(conf, k_config_group, k_config_script_path, &error);
    if (value && *value) {
      config.script_path = value;
    } else if (error) {
      g_warning("ignoring %s/%s: %s", k_config_group, k_config_script_path, error->message);
    }
  }

  const char *env = g_getenv(k_script_path_env);
  if (env && *env) {
    config.script_path = env;
  }

  g_debug("using script %s", config.script_path.c_str());
  return config;
}

// -----------------------------------------------------------------------------
// EOF
// -----------------------------------------------------------------------------
