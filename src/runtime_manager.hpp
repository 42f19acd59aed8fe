// src/runtime_manager.hpp
#pragma once

#include "config.hpp"
#include "script_runtime.hpp"

#include <memory>
#include <stdexcept>
#include <string>

// Out-of-protocol lifecycle call (destroy before initialize, destroy twice)
class LifecycleError : public std::logic_error {
  public:
  using std::logic_error::logic_error;
};

// -----------------------------------------------------------------------------
// RuntimeManager: owner of the single embedded runtime
// Uninitialized -> Initialized -> Destroyed (terminal). Nothing else starts
// or stops the runtime. Handlers receive it by reference from the dispatcher.
// -----------------------------------------------------------------------------
class RuntimeManager {
  public:
  enum class State { Uninitialized, Initialized, Destroyed };

  explicit RuntimeManager(std::unique_ptr<ScriptRuntime> runtime);

  RuntimeManager(const RuntimeManager &) = delete;
  RuntimeManager &operator=(const RuntimeManager &) = delete;

  // Process-wide instance backed by CPython
  static RuntimeManager &instance();

  // Registers the bridge module, then starts the interpreter. A second call
  // is logged and ignored. Startup failures are recorded, not thrown.
  void initialize(const BackendConfig &config);

  // Stops the interpreter; throws LifecycleError unless Initialized
  void destroy();

  State state() const { return state_; }

  // Initialized and the interpreter came up
  bool ready() const;

  // Why the interpreter did not come up (empty when it did)
  const std::string &startup_error() const { return startup_error_; }

  // Throws RuntimeError unless ready()
  ScriptRuntime &runtime();

  private:
  std::unique_ptr<ScriptRuntime> runtime_;
  State state_ = State::Uninitialized;
  std::string startup_error_;
};

const char *runtime_state_to_string(RuntimeManager::State state);

// -----------------------------------------------------------------------------
// EOF
// -----------------------------------------------------------------------------
