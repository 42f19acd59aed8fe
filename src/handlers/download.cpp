// -----------------------------------------------------------------------------
// src/handlers/download.cpp
// Downloading packages into a directory without installing them
// Returns files records: (package_id, [downloaded path, ...])
// -----------------------------------------------------------------------------
#include "handlers/handlers.hpp"
#include "handlers/common.hpp"

void
handle_download_packages(Job &job, const JobArgs &args, RuntimeManager &runtime)
{
  check_package_ids(args.values);
  if (args.directory.empty() || !g_file_test(args.directory.c_str(), G_FILE_TEST_IS_DIR)) {
    throw JobError(PK_ERROR_ENUM_PACKAGE_DOWNLOAD_FAILED, "download directory '" + args.directory + "' does not exist");
  }

  job.set_status(PK_STATUS_ENUM_DOWNLOAD);
  auto records = call_runtime(job, runtime, "download_packages", { args.values, args.directory });

  emit_files(job, records);
  finish_job(job);
}

// -----------------------------------------------------------------------------
// EOF
// -----------------------------------------------------------------------------
