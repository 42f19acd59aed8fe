// -----------------------------------------------------------------------------
// src/handlers/repos.cpp
// Repository listing and configuration
// Repo records: (repo_id, description, enabled)
// -----------------------------------------------------------------------------
#include "handlers/handlers.hpp"
#include "handlers/common.hpp"

void
handle_get_repo_list(Job &job, const JobArgs &args, RuntimeManager &runtime)
{
  check_filters(args.filters);

  job.set_status(PK_STATUS_ENUM_QUERY);
  auto records = call_runtime(job, runtime, "get_repo_list", { filter_names(args.filters) });

  emit_repos(job, records);
  finish_job(job);
}

void
handle_repo_enable(Job &job, const JobArgs &args, RuntimeManager &runtime)
{
  check_repo_id(args.repo_id);

  job.set_status(PK_STATUS_ENUM_SETUP);
  call_runtime(job, runtime, "repo_enable", { args.repo_id, args.enabled });

  finish_job(job);
}

void
handle_repo_remove(Job &job, const JobArgs &args, RuntimeManager &runtime)
{
  check_repo_id(args.repo_id);

  job.set_status(PK_STATUS_ENUM_REMOVE);
  auto records = call_runtime(job, runtime, "repo_remove",
                              { transaction_flag_names(args.transaction_flags), args.repo_id, args.autoremove });

  // Packages removed along with the repository, when autoremove is set
  emit_packages(job, records);
  finish_job(job);
}

// -----------------------------------------------------------------------------
// EOF
// -----------------------------------------------------------------------------
