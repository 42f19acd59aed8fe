// -----------------------------------------------------------------------------
// src/runtime_manager.cpp
// RuntimeManager: lifecycle of the embedded interpreter
// - initialize() runs once after packagekitd loads the backend
// - destroy() runs once when packagekitd unloads it
// - every job in between shares the same interpreter, one job at a time
// -----------------------------------------------------------------------------
#include "runtime_manager.hpp"
#include "python_runtime.hpp"

#include <glib.h>

RuntimeManager::RuntimeManager(std::unique_ptr<ScriptRuntime> runtime)
  : runtime_(std::move(runtime))
{
}

// -----------------------------------------------------------------------------
// Singleton: RuntimeManager instance accessor
// -----------------------------------------------------------------------------
RuntimeManager &
RuntimeManager::instance()
{
  static RuntimeManager mgr(std::make_unique<PythonRuntime>());
  return mgr;
}

const char *
runtime_state_to_string(RuntimeManager::State state)
{
  switch (state) {
  case RuntimeManager::State::Uninitialized:
    return "uninitialized";
  case RuntimeManager::State::Initialized:
    return "initialized";
  case RuntimeManager::State::Destroyed:
    return "destroyed";
  }
  return "unknown";
}

void
RuntimeManager::initialize(const BackendConfig &config)
{
  if (state_ != State::Uninitialized) {
    g_warning("ignoring initialize: runtime is %s", runtime_state_to_string(state_));
    return;
  }

  // Order matters: the bridge must be importable before the interpreter runs
  try {
    runtime_->register_bridge_module();
    runtime_->start(config.script_path);
  } catch (const RuntimeError &e) {
    startup_error_ = e.what();
    g_warning("embedded runtime failed to start: %s", e.what());
  }

  state_ = State::Initialized;
  g_debug("runtime initialized (%s)", ready() ? "ready" : "unusable");
}

void
RuntimeManager::destroy()
{
  if (state_ != State::Initialized) {
    throw LifecycleError(std::string("cannot destroy runtime: it is ") + runtime_state_to_string(state_));
  }

  runtime_->stop();
  state_ = State::Destroyed;
  g_debug("runtime destroyed");
}

bool
RuntimeManager::ready() const
{
  return state_ == State::Initialized && startup_error_.empty() && runtime_->running();
}

ScriptRuntime &
RuntimeManager::runtime()
{
  if (state_ != State::Initialized) {
    throw RuntimeError(std::string("embedded runtime is ") + runtime_state_to_string(state_));
  }
  if (!startup_error_.empty()) {
    throw RuntimeError("embedded runtime failed to start: " + startup_error_);
  }
  return *runtime_;
}

// -----------------------------------------------------------------------------
// EOF
// -----------------------------------------------------------------------------
