// -----------------------------------------------------------------------------
// src/handlers/info.cpp
// Package details, for package ids or local package files
// Details records:
//   (package_id, summary, license, group, description, url, size, download_size)
// An empty result fails the job as package-not-found.
// -----------------------------------------------------------------------------
#include "handlers/handlers.hpp"
#include "handlers/common.hpp"

void
handle_get_details(Job &job, const JobArgs &args, RuntimeManager &runtime)
{
  check_package_ids(args.values);

  job.set_status(PK_STATUS_ENUM_INFO);
  auto records = call_runtime(job, runtime, "get_details", { args.values });
  check_found(records, "details");
  emit_details(job, records);
  finish_job(job);
}

void
handle_get_details_local(Job &job, const JobArgs &args, RuntimeManager &runtime)
{
  check_local_files(args.values);

  job.set_status(PK_STATUS_ENUM_INFO);
  auto records = call_runtime(job, runtime, "get_details_local", { args.values });
  check_found(records, "details");

  emit_details(job, records);
  finish_job(job);
}

// -----------------------------------------------------------------------------
// EOF
// -----------------------------------------------------------------------------
