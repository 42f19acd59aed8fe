// src/script_runtime.hpp
#pragma once

#include "runtime_value.hpp"

#include <string>
#include <vector>

// -----------------------------------------------------------------------------
// Receiver for callbacks the script makes through the bridge module while a
// call is in progress (progress, status, early package emission).
// -----------------------------------------------------------------------------
class RuntimeObserver {
  public:
  virtual ~RuntimeObserver() = default;

  virtual void on_percentage(unsigned percentage) = 0;
  virtual void on_status(const std::string &status) = 0;
  virtual void on_package(const std::string &info, const std::string &package_id, const std::string &summary) = 0;
};

// -----------------------------------------------------------------------------
// Embedded interpreter hosting the package manager logic
// Narrow, typed surface: register the bridge module, start, call a named
// function receiving an ordered sequence of records, stop.
// -----------------------------------------------------------------------------
class ScriptRuntime {
  public:
  virtual ~ScriptRuntime() = default;

  // Makes the bridge module importable; must happen before start()
  virtual void register_bridge_module() = 0;

  // Starts the interpreter and executes the script inside the bridge module
  virtual void start(const std::string &script_path) = 0;

  virtual void stop() = 0;

  virtual bool running() const = 0;

  // Calls bridge_module.<function>(*args); throws RuntimeError
  virtual RuntimeRecords call(const std::string &function,
                              const std::vector<RuntimeValue> &args,
                              RuntimeObserver *observer) = 0;
};

// -----------------------------------------------------------------------------
// EOF
// -----------------------------------------------------------------------------
