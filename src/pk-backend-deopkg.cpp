// -----------------------------------------------------------------------------
// src/pk-backend-deopkg.cpp
// PackageKit backend entry points for deopkg
// Implements the C ABI packagekitd resolves from the module:
// https://github.com/PackageKit/PackageKit/blob/main/src/pk-backend.c
//
// The backend is synchronous: every role runs to completion on the calling
// thread and finalizes its job before returning (no job threads).
// -----------------------------------------------------------------------------
#include "capabilities.hpp"
#include "config.hpp"
#include "dispatcher.hpp"
#include "handlers/handlers.hpp"
#include "pk_job_sink.hpp"
#include "runtime_manager.hpp"

#include <mutex>

#include <pk-backend.h>

// -----------------------------------------------------------------------------
// Dispatcher bound to the process-wide runtime
// -----------------------------------------------------------------------------
static Dispatcher &
backend_dispatcher()
{
  static Dispatcher dispatcher(RuntimeManager::instance());
  static std::once_flag registered;
  std::call_once(registered, [] { register_default_handlers(dispatcher); });
  return dispatcher;
}

static void
dispatch_job(PkBackendJob *job, PkRoleEnum role, const JobArgs &args)
{
  PkJobSink sink(job);
  backend_dispatcher().dispatch(role, sink, args);
}

extern "C" {

// -----------------------------------------------------------------------------
// Identification and capabilities
// -----------------------------------------------------------------------------
const gchar *
pk_backend_get_author(PkBackend *backend)
{
  return backend_author();
}

const gchar *
pk_backend_get_name(PkBackend *backend)
{
  return backend_name();
}

const gchar *
pk_backend_get_description(PkBackend *backend)
{
  return backend_description();
}

PkBitfield
pk_backend_get_groups(PkBackend *backend)
{
  return backend_groups();
}

PkBitfield
pk_backend_get_roles(PkBackend *backend)
{
  return backend_roles();
}

PkBitfield
pk_backend_get_filters(PkBackend *backend)
{
  return backend_filters();
}

PkBitfield
pk_backend_get_provides(PkBackend *backend)
{
  return backend_provides();
}

gchar **
pk_backend_get_mime_types(PkBackend *backend)
{
  return backend_mime_types();
}

gboolean
pk_backend_supports_parallelization(PkBackend *backend)
{
  return backend_supports_parallelization() ? TRUE : FALSE;
}

// -----------------------------------------------------------------------------
// Lifecycle
// -----------------------------------------------------------------------------
void
pk_backend_initialize(GKeyFile *conf, PkBackend *backend)
{
  g_debug("initializing deopkg backend");

  Dispatcher &dispatcher = backend_dispatcher();
  dispatcher.runtime().initialize(load_backend_config(conf));

  // Roles are advertised by exclusion, so new PackageKit roles show up here
  for (PkRoleEnum role : dispatcher.unhandled_roles(backend_roles())) {
    g_warning("role %s is advertised but has no handler", pk_role_enum_to_string(role));
  }
}

void
pk_backend_destroy(PkBackend *backend)
{
  g_debug("destroying deopkg backend");

  try {
    backend_dispatcher().runtime().destroy();
  } catch (const LifecycleError &e) {
    g_warning("%s", e.what());
  }
}

void
pk_backend_start_job(PkBackend *backend, PkBackendJob *job)
{
  // Cancel is not supported
  pk_backend_job_set_allow_cancel(job, FALSE);
}

void
pk_backend_stop_job(PkBackend *backend, PkBackendJob *job)
{
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------
void
pk_backend_search_names(PkBackend *backend, PkBackendJob *job, PkBitfield filters, gchar **values)
{
  JobArgs args;
  args.filters = filters;
  args.values = strv_to_vector(values);
  dispatch_job(job, PK_ROLE_ENUM_SEARCH_NAME, args);
}

void
pk_backend_search_details(PkBackend *backend, PkBackendJob *job, PkBitfield filters, gchar **values)
{
  JobArgs args;
  args.filters = filters;
  args.values = strv_to_vector(values);
  dispatch_job(job, PK_ROLE_ENUM_SEARCH_DETAILS, args);
}

void
pk_backend_search_files(PkBackend *backend, PkBackendJob *job, PkBitfield filters, gchar **values)
{
  JobArgs args;
  args.filters = filters;
  args.values = strv_to_vector(values);
  dispatch_job(job, PK_ROLE_ENUM_SEARCH_FILE, args);
}

void
pk_backend_search_groups(PkBackend *backend, PkBackendJob *job, PkBitfield filters, gchar **values)
{
  JobArgs args;
  args.filters = filters;
  args.values = strv_to_vector(values);
  dispatch_job(job, PK_ROLE_ENUM_SEARCH_GROUP, args);
}

void
pk_backend_what_provides(PkBackend *backend, PkBackendJob *job, PkBitfield filters, gchar **values)
{
  JobArgs args;
  args.filters = filters;
  args.values = strv_to_vector(values);
  dispatch_job(job, PK_ROLE_ENUM_WHAT_PROVIDES, args);
}

void
pk_backend_resolve(PkBackend *backend, PkBackendJob *job, PkBitfield filters, gchar **packages)
{
  JobArgs args;
  args.filters = filters;
  args.values = strv_to_vector(packages);
  dispatch_job(job, PK_ROLE_ENUM_RESOLVE, args);
}

void
pk_backend_get_packages(PkBackend *backend, PkBackendJob *job, PkBitfield filters)
{
  JobArgs args;
  args.filters = filters;
  dispatch_job(job, PK_ROLE_ENUM_GET_PACKAGES, args);
}

void
pk_backend_get_details(PkBackend *backend, PkBackendJob *job, gchar **package_ids)
{
  JobArgs args;
  args.values = strv_to_vector(package_ids);
  dispatch_job(job, PK_ROLE_ENUM_GET_DETAILS, args);
}

void
pk_backend_get_details_local(PkBackend *backend, PkBackendJob *job, gchar **files)
{
  JobArgs args;
  args.values = strv_to_vector(files);
  dispatch_job(job, PK_ROLE_ENUM_GET_DETAILS_LOCAL, args);
}

void
pk_backend_get_files(PkBackend *backend, PkBackendJob *job, gchar **package_ids)
{
  JobArgs args;
  args.values = strv_to_vector(package_ids);
  dispatch_job(job, PK_ROLE_ENUM_GET_FILES, args);
}

void
pk_backend_get_files_local(PkBackend *backend, PkBackendJob *job, gchar **files)
{
  JobArgs args;
  args.values = strv_to_vector(files);
  dispatch_job(job, PK_ROLE_ENUM_GET_FILES_LOCAL, args);
}

void
pk_backend_depends_on(PkBackend *backend, PkBackendJob *job, PkBitfield filters, gchar **package_ids, gboolean recursive)
{
  JobArgs args;
  args.filters = filters;
  args.values = strv_to_vector(package_ids);
  args.recursive = recursive;
  dispatch_job(job, PK_ROLE_ENUM_DEPENDS_ON, args);
}

void
pk_backend_required_by(PkBackend *backend, PkBackendJob *job, PkBitfield filters, gchar **package_ids, gboolean recursive)
{
  JobArgs args;
  args.filters = filters;
  args.values = strv_to_vector(package_ids);
  args.recursive = recursive;
  dispatch_job(job, PK_ROLE_ENUM_REQUIRED_BY, args);
}

void
pk_backend_get_updates(PkBackend *backend, PkBackendJob *job, PkBitfield filters)
{
  JobArgs args;
  args.filters = filters;
  dispatch_job(job, PK_ROLE_ENUM_GET_UPDATES, args);
}

// -----------------------------------------------------------------------------
// Transactions
// -----------------------------------------------------------------------------
void
pk_backend_install_packages(PkBackend *backend, PkBackendJob *job, PkBitfield transaction_flags, gchar **package_ids)
{
  JobArgs args;
  args.transaction_flags = transaction_flags;
  args.values = strv_to_vector(package_ids);
  dispatch_job(job, PK_ROLE_ENUM_INSTALL_PACKAGES, args);
}

void
pk_backend_install_files(PkBackend *backend, PkBackendJob *job, PkBitfield transaction_flags, gchar **full_paths)
{
  JobArgs args;
  args.transaction_flags = transaction_flags;
  args.values = strv_to_vector(full_paths);
  dispatch_job(job, PK_ROLE_ENUM_INSTALL_FILES, args);
}

void
pk_backend_remove_packages(PkBackend *backend,
                           PkBackendJob *job,
                           PkBitfield transaction_flags,
                           gchar **package_ids,
                           gboolean allow_deps,
                           gboolean autoremove)
{
  JobArgs args;
  args.transaction_flags = transaction_flags;
  args.values = strv_to_vector(package_ids);
  args.allow_deps = allow_deps;
  args.autoremove = autoremove;
  dispatch_job(job, PK_ROLE_ENUM_REMOVE_PACKAGES, args);
}

void
pk_backend_update_packages(PkBackend *backend, PkBackendJob *job, PkBitfield transaction_flags, gchar **package_ids)
{
  JobArgs args;
  args.transaction_flags = transaction_flags;
  args.values = strv_to_vector(package_ids);
  dispatch_job(job, PK_ROLE_ENUM_UPDATE_PACKAGES, args);
}

void
pk_backend_download_packages(PkBackend *backend, PkBackendJob *job, gchar **package_ids, const gchar *directory)
{
  JobArgs args;
  args.values = strv_to_vector(package_ids);
  args.directory = directory ? directory : "";
  dispatch_job(job, PK_ROLE_ENUM_DOWNLOAD_PACKAGES, args);
}

void
pk_backend_refresh_cache(PkBackend *backend, PkBackendJob *job, gboolean force)
{
  JobArgs args;
  args.force = force;
  dispatch_job(job, PK_ROLE_ENUM_REFRESH_CACHE, args);
}

// -----------------------------------------------------------------------------
// Repositories
// -----------------------------------------------------------------------------
void
pk_backend_get_repo_list(PkBackend *backend, PkBackendJob *job, PkBitfield filters)
{
  JobArgs args;
  args.filters = filters;
  dispatch_job(job, PK_ROLE_ENUM_GET_REPO_LIST, args);
}

void
pk_backend_repo_enable(PkBackend *backend, PkBackendJob *job, const gchar *repo_id, gboolean enabled)
{
  JobArgs args;
  args.repo_id = repo_id ? repo_id : "";
  args.enabled = enabled;
  dispatch_job(job, PK_ROLE_ENUM_REPO_ENABLE, args);
}

void
pk_backend_repo_remove(PkBackend *backend,
                       PkBackendJob *job,
                       PkBitfield transaction_flags,
                       const gchar *repo_id,
                       gboolean autoremove)
{
  JobArgs args;
  args.transaction_flags = transaction_flags;
  args.repo_id = repo_id ? repo_id : "";
  args.autoremove = autoremove;
  dispatch_job(job, PK_ROLE_ENUM_REPO_REMOVE, args);
}

/* NOT SUPPORTED */
void
pk_backend_repair_system(PkBackend *backend, PkBackendJob *job, PkBitfield transaction_flags)
{
  JobArgs args;
  args.transaction_flags = transaction_flags;
  dispatch_job(job, PK_ROLE_ENUM_REPAIR_SYSTEM, args);
}

} // extern "C"

// -----------------------------------------------------------------------------
// EOF
// -----------------------------------------------------------------------------
