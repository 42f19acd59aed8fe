// -----------------------------------------------------------------------------
// src/handlers/refresh.cpp
// Refreshing repository metadata
// -----------------------------------------------------------------------------
#include "handlers/handlers.hpp"
#include "handlers/common.hpp"

void
handle_refresh_cache(Job &job, const JobArgs &args, RuntimeManager &runtime)
{
  job.set_status(PK_STATUS_ENUM_REFRESH_CACHE);
  auto records = call_runtime(job, runtime, "refresh_cache", { args.force });

  if (!records.empty()) {
    throw RuntimeError("refresh_cache returned unexpected records");
  }

  finish_job(job);
}

// -----------------------------------------------------------------------------
// EOF
// -----------------------------------------------------------------------------
