// -----------------------------------------------------------------------------
// src/handlers/updates.cpp
// Listing and applying updates
// -----------------------------------------------------------------------------
#include "handlers/handlers.hpp"
#include "handlers/common.hpp"

void
handle_get_updates(Job &job, const JobArgs &args, RuntimeManager &runtime)
{
  check_filters(args.filters);

  job.set_status(PK_STATUS_ENUM_QUERY);
  auto records = call_runtime(job, runtime, "get_updates", { filter_names(args.filters) });

  emit_packages(job, records);
  finish_job(job);
}

// -----------------------------------------------------------------------------
// The script reports per-package progress through deopkg.package() and
// returns the final state of every package it touched.
// -----------------------------------------------------------------------------
void
handle_update_packages(Job &job, const JobArgs &args, RuntimeManager &runtime)
{
  check_package_ids(args.values);

  job.set_status(PK_STATUS_ENUM_UPDATE);
  auto records = call_runtime(job, runtime, "update_packages",
                              { transaction_flag_names(args.transaction_flags), args.values });

  emit_packages(job, records);
  finish_job(job);
}

// -----------------------------------------------------------------------------
// EOF
// -----------------------------------------------------------------------------
