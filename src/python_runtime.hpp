// src/python_runtime.hpp
#pragma once

#include "script_runtime.hpp"

#include <string>
#include <vector>

// Python.h is kept out of this header
struct _object;
struct _ts;

// Name scripts use to reach the plugin ("import deopkg")
inline constexpr const char *k_bridge_module_name = "deopkg";

// -----------------------------------------------------------------------------
// CPython implementation of ScriptRuntime
// The interpreter is process-wide: only one PythonRuntime may be started per
// process and, once stopped, it cannot be started again.
// -----------------------------------------------------------------------------
class PythonRuntime : public ScriptRuntime {
  public:
  PythonRuntime() = default;
  ~PythonRuntime() override;

  PythonRuntime(const PythonRuntime &) = delete;
  PythonRuntime &operator=(const PythonRuntime &) = delete;

  void register_bridge_module() override;
  void start(const std::string &script_path) override;
  void stop() override;
  bool running() const override;

  RuntimeRecords call(const std::string &function,
                      const std::vector<RuntimeValue> &args,
                      RuntimeObserver *observer) override;

  private:
  void load_script(const std::string &script_path);

  _object *module_ = nullptr;
  _ts *main_thread_state_ = nullptr;
  bool interpreter_started_ = false;
};

// -----------------------------------------------------------------------------
// EOF
// -----------------------------------------------------------------------------
