// -----------------------------------------------------------------------------
// src/handlers/remove.cpp
// Removing installed packages
// -----------------------------------------------------------------------------
#include "handlers/handlers.hpp"
#include "handlers/common.hpp"

void
handle_remove_packages(Job &job, const JobArgs &args, RuntimeManager &runtime)
{
  check_package_ids(args.values);

  job.set_status(PK_STATUS_ENUM_REMOVE);
  auto records = call_runtime(job, runtime, "remove_packages",
                              { transaction_flag_names(args.transaction_flags), args.values, args.allow_deps,
                                args.autoremove });

  emit_packages(job, records);
  finish_job(job);
}

// -----------------------------------------------------------------------------
// EOF
// -----------------------------------------------------------------------------
