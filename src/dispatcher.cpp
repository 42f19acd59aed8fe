// -----------------------------------------------------------------------------
// src/dispatcher.cpp
// Job dispatch core
// Resolves a role to its handler, runs it against the shared runtime and
// makes sure the job is finalized before control returns to packagekitd.
// No exception leaves dispatch(): anything a handler throws becomes a failed
// job.
// -----------------------------------------------------------------------------
#include "dispatcher.hpp"

std::vector<std::string>
strv_to_vector(const gchar *const *strv)
{
  std::vector<std::string> values;
  if (!strv) {
    return values;
  }

  for (int i = 0; strv[i]; i++) {
    values.emplace_back(strv[i]);
  }
  return values;
}

PkErrorEnum
default_error_for_role(PkRoleEnum role)
{
  switch (role) {
  case PK_ROLE_ENUM_INSTALL_PACKAGES:
  case PK_ROLE_ENUM_INSTALL_FILES:
  case PK_ROLE_ENUM_REMOVE_PACKAGES:
  case PK_ROLE_ENUM_UPDATE_PACKAGES:
  case PK_ROLE_ENUM_UPGRADE_SYSTEM:
  case PK_ROLE_ENUM_REPAIR_SYSTEM:
    return PK_ERROR_ENUM_TRANSACTION_ERROR;
  case PK_ROLE_ENUM_REPO_ENABLE:
  case PK_ROLE_ENUM_REPO_REMOVE:
  case PK_ROLE_ENUM_REPO_SET_DATA:
    return PK_ERROR_ENUM_REPO_NOT_FOUND;
  case PK_ROLE_ENUM_DOWNLOAD_PACKAGES:
    return PK_ERROR_ENUM_PACKAGE_DOWNLOAD_FAILED;
  default:
    return PK_ERROR_ENUM_INTERNAL_ERROR;
  }
}

// -----------------------------------------------------------------------------
// Helper: pick the error code for a runtime failure
// A valid PackageKit error name supplied by the script takes precedence.
// -----------------------------------------------------------------------------
static PkErrorEnum
runtime_error_code(PkRoleEnum role, const RuntimeError &e)
{
  if (!e.error_code().empty()) {
    PkErrorEnum code = pk_error_enum_from_string(e.error_code().c_str());
    if (code != PK_ERROR_ENUM_UNKNOWN) {
      return code;
    }
    g_warning("script raised unknown error code '%s'", e.error_code().c_str());
  }
  return default_error_for_role(role);
}

// -----------------------------------------------------------------------------
// Helper: holds the single-flight flag for the lifetime of one job
// -----------------------------------------------------------------------------
class BusyScope {
  public:
  explicit BusyScope(bool &busy)
    : busy_(busy)
  {
    busy_ = true;
  }
  ~BusyScope() { busy_ = false; }

  BusyScope(const BusyScope &) = delete;
  BusyScope &operator=(const BusyScope &) = delete;

  private:
  bool &busy_;
};

Dispatcher::Dispatcher(RuntimeManager &runtime)
  : runtime_(runtime)
{
}

void
Dispatcher::register_handler(PkRoleEnum role, RoleHandler handler)
{
  handlers_[role] = Entry { std::move(handler), true };
}

void
Dispatcher::register_acknowledgement(PkRoleEnum role)
{
  handlers_[role] = Entry { [](Job &job, const JobArgs &, RuntimeManager &) { job.finish(); }, false };
}

bool
Dispatcher::has_handler(PkRoleEnum role) const
{
  return handlers_.count(role) > 0;
}

std::vector<PkRoleEnum>
Dispatcher::unhandled_roles(PkBitfield roles) const
{
  std::vector<PkRoleEnum> missing;
  for (int role = PK_ROLE_ENUM_UNKNOWN; role < PK_ROLE_ENUM_LAST; role++) {
    if (pk_bitfield_contain(roles, role) && !has_handler(static_cast<PkRoleEnum>(role))) {
      missing.push_back(static_cast<PkRoleEnum>(role));
    }
  }
  return missing;
}

// -----------------------------------------------------------------------------
// Dispatch one role invocation
// -----------------------------------------------------------------------------
void
Dispatcher::dispatch(PkRoleEnum role, JobSink &sink, const JobArgs &args)
{
  Job job(role, sink);
  job.start();

  // Reached only if a callback re-enters the backend while a job runs
  if (busy_) {
    g_warning("rejecting %s: another job is still running", pk_role_enum_to_string(role));
    job.fail(PK_ERROR_ENUM_INTERNAL_ERROR, "another job is already running in this backend");
    return;
  }

  g_debug("dispatching %s", pk_role_enum_to_string(role));

  auto it = handlers_.find(role);
  if (it == handlers_.end()) {
    job.fail(PK_ERROR_ENUM_NOT_SUPPORTED,
             std::string("role ") + pk_role_enum_to_string(role) + " is not supported by the deopkg backend");
    return;
  }

  {
    BusyScope busy(busy_);
    run(job, it->second, args);
  }

  if (!job.is_finalized()) {
    g_warning("%s handler returned without finishing the job", pk_role_enum_to_string(role));
    job.fail(PK_ERROR_ENUM_INTERNAL_ERROR, "backend did not finish the job");
  }
}

void
Dispatcher::run(Job &job, const Entry &entry, const JobArgs &args)
{
  if (entry.needs_runtime && !runtime_.ready()) {
    std::string reason = runtime_.startup_error().empty()
                           ? std::string("backend is ") + runtime_state_to_string(runtime_.state())
                           : "embedded runtime failed to start: " + runtime_.startup_error();
    job.fail(PK_ERROR_ENUM_FAILED_INITIALIZATION, reason);
    return;
  }

  try {
    entry.handler(job, args, runtime_);
  } catch (const JobError &e) {
    job.fail(e.code(), e.what());
  } catch (const RuntimeError &e) {
    job.fail(runtime_error_code(job.role(), e), e.what());
  } catch (const std::exception &e) {
    job.fail(PK_ERROR_ENUM_INTERNAL_ERROR, e.what());
  } catch (...) {
    g_warning("%s handler threw a non-standard exception", pk_role_enum_to_string(job.role()));
    job.fail(PK_ERROR_ENUM_INTERNAL_ERROR, "backend raised an unknown exception");
  }
}

// -----------------------------------------------------------------------------
// EOF
// -----------------------------------------------------------------------------
