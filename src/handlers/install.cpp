// -----------------------------------------------------------------------------
// src/handlers/install.cpp
// Installing packages from repositories or from local .eopkg files
// -----------------------------------------------------------------------------
#include "handlers/handlers.hpp"
#include "handlers/common.hpp"

void
handle_install_packages(Job &job, const JobArgs &args, RuntimeManager &runtime)
{
  check_package_ids(args.values);

  job.set_status(PK_STATUS_ENUM_INSTALL);
  auto records = call_runtime(job, runtime, "install_packages",
                              { transaction_flag_names(args.transaction_flags), args.values });

  emit_packages(job, records);
  finish_job(job);
}

void
handle_install_files(Job &job, const JobArgs &args, RuntimeManager &runtime)
{
  check_local_files(args.values);

  job.set_status(PK_STATUS_ENUM_INSTALL);
  auto records = call_runtime(job, runtime, "install_files",
                              { transaction_flag_names(args.transaction_flags), args.values });

  emit_packages(job, records);
  finish_job(job);
}

// -----------------------------------------------------------------------------
// EOF
// -----------------------------------------------------------------------------
