// -----------------------------------------------------------------------------
// src/handlers/lookup.cpp
// Resolve: turn package names into package ids
// -----------------------------------------------------------------------------
#include "handlers/handlers.hpp"
#include "handlers/common.hpp"

void
handle_resolve(Job &job, const JobArgs &args, RuntimeManager &runtime)
{
  check_filters(args.filters);
  check_search_terms(args.values);

  job.set_status(PK_STATUS_ENUM_QUERY);
  auto records = call_runtime(job, runtime, "resolve", { filter_names(args.filters), args.values });

  emit_packages(job, records);
  finish_job(job);
}

// -----------------------------------------------------------------------------
// EOF
// -----------------------------------------------------------------------------
