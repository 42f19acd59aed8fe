#include <catch2/catch_test_macros.hpp>

#include "config.hpp"

#include <string>

// -----------------------------------------------------------------------------
// Helper: parse an in-memory key file
// -----------------------------------------------------------------------------
static GKeyFile *
key_file_from(const char *data)
{
  GKeyFile *conf = g_key_file_new();
  g_autoptr(GError) error = nullptr;
  if (!g_key_file_load_from_data(conf, data, static_cast<gsize>(-1), G_KEY_FILE_NONE, &error)) {
    FAIL("invalid key file: " << error->message);
  }
  return conf;
}

TEST_CASE("Missing configuration falls back to the compiled-in script")
{
  g_unsetenv(k_script_path_env);

  auto config = load_backend_config(nullptr);

  REQUIRE(config.script_path == default_script_path());
  REQUIRE(!config.script_path.empty());
}

TEST_CASE("Daemon configuration without a Deopkg group uses the default")
{
  g_unsetenv(k_script_path_env);
  g_autoptr(GKeyFile) conf = key_file_from("[Daemon]\nDefaultBackend=deopkg\n");

  auto config = load_backend_config(conf);

  REQUIRE(config.script_path == default_script_path());
}

TEST_CASE("ScriptPath in the Deopkg group selects the script")
{
  g_unsetenv(k_script_path_env);
  g_autoptr(GKeyFile) conf = key_file_from("[Deopkg]\nScriptPath=/opt/deopkg/backend.py\n");

  auto config = load_backend_config(conf);

  REQUIRE(config.script_path == "/opt/deopkg/backend.py");
}

TEST_CASE("Configuration is only read, never modified")
{
  g_unsetenv(k_script_path_env);
  g_autoptr(GKeyFile) conf = key_file_from("[Deopkg]\nScriptPath=/opt/deopkg/backend.py\n");
  g_autofree gchar *before = g_key_file_to_data(conf, nullptr, nullptr);

  load_backend_config(conf);

  g_autofree gchar *after = g_key_file_to_data(conf, nullptr, nullptr);
  REQUIRE(std::string(before) == std::string(after));
}

TEST_CASE("Environment override wins over the key file")
{
  g_autoptr(GKeyFile) conf = key_file_from("[Deopkg]\nScriptPath=/opt/deopkg/backend.py\n");
  g_setenv(k_script_path_env, "/home/dev/deopkg/backend.py", TRUE);

  auto config = load_backend_config(conf);
  g_unsetenv(k_script_path_env);

  REQUIRE(config.script_path == "/home/dev/deopkg/backend.py");
}
