// -----------------------------------------------------------------------------
// src/handlers/list.cpp
// Get packages: every package matching the filters
// -----------------------------------------------------------------------------
#include "handlers/handlers.hpp"
#include "handlers/common.hpp"

void
handle_get_packages(Job &job, const JobArgs &args, RuntimeManager &runtime)
{
  check_filters(args.filters);

  job.set_status(PK_STATUS_ENUM_QUERY);
  auto records = call_runtime(job, runtime, "get_packages", { filter_names(args.filters) });

  emit_packages(job, records);
  finish_job(job);
}

// -----------------------------------------------------------------------------
// EOF
// -----------------------------------------------------------------------------
