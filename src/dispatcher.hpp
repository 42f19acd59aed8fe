// src/dispatcher.hpp
#pragma once

#include "job.hpp"
#include "runtime_manager.hpp"

#include <functional>
#include <map>
#include <string>
#include <vector>

// -----------------------------------------------------------------------------
// Role arguments as received from packagekitd
// Only the fields meaningful for the invoked role are set.
// -----------------------------------------------------------------------------
struct JobArgs {
  PkBitfield filters = 0;
  PkBitfield transaction_flags = 0;
  std::vector<std::string> values; // search terms, package ids or file paths
  std::string repo_id;
  std::string directory;
  bool recursive = false;
  bool allow_deps = false;
  bool autoremove = false;
  bool enabled = false;
  bool force = false;
};

std::vector<std::string> strv_to_vector(const gchar *const *strv);

using RoleHandler = std::function<void(Job &job, const JobArgs &args, RuntimeManager &runtime)>;

// Error reported when the runtime fails a role without naming a code
PkErrorEnum default_error_for_role(PkRoleEnum role);

// -----------------------------------------------------------------------------
// Dispatcher: runs one role invocation to completion
// Every dispatch() ends with exactly one terminal signal on the sink, whatever
// the handler does. Jobs run synchronously on the calling thread, one at a
// time.
// -----------------------------------------------------------------------------
class Dispatcher {
  public:
  explicit Dispatcher(RuntimeManager &runtime);

  Dispatcher(const Dispatcher &) = delete;
  Dispatcher &operator=(const Dispatcher &) = delete;

  void register_handler(PkRoleEnum role, RoleHandler handler);

  // Role accepted as a no-op: finishes at once, never touches the runtime
  void register_acknowledgement(PkRoleEnum role);

  bool has_handler(PkRoleEnum role) const;

  // Roles in the bitfield with nothing registered for them
  std::vector<PkRoleEnum> unhandled_roles(PkBitfield roles) const;

  void dispatch(PkRoleEnum role, JobSink &sink, const JobArgs &args);

  RuntimeManager &runtime() { return runtime_; }

  private:
  struct Entry {
    RoleHandler handler;
    bool needs_runtime = true;
  };

  void run(Job &job, const Entry &entry, const JobArgs &args);

  RuntimeManager &runtime_;
  std::map<PkRoleEnum, Entry> handlers_;
  bool busy_ = false;
};

// -----------------------------------------------------------------------------
// EOF
// -----------------------------------------------------------------------------
