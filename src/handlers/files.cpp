// -----------------------------------------------------------------------------
// src/handlers/files.cpp
// File lists, for package ids or local package files
// Files records: (package_id, [path, ...])
// An empty result fails the job as package-not-found.
// -----------------------------------------------------------------------------
#include "handlers/handlers.hpp"
#include "handlers/common.hpp"

void
handle_get_files(Job &job, const JobArgs &args, RuntimeManager &runtime)
{
  check_package_ids(args.values);

  job.set_status(PK_STATUS_ENUM_INFO);
  auto records = call_runtime(job, runtime, "get_files", { args.values });
  check_found(records, "files");

  emit_files(job, records);
  finish_job(job);
}

void
handle_get_files_local(Job &job, const JobArgs &args, RuntimeManager &runtime)
{
  check_local_files(args.values);

  job.set_status(PK_STATUS_ENUM_INFO);
  auto records = call_runtime(job, runtime, "get_files_local", { args.values });
  check_found(records, "files");

  emit_files(job, records);
  finish_job(job);
}

// -----------------------------------------------------------------------------
// EOF
// -----------------------------------------------------------------------------
