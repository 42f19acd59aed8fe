// src/pk_job_sink.hpp
#pragma once

#include "job.hpp"

#include <pk-backend.h>

// -----------------------------------------------------------------------------
// JobSink forwarding to packagekitd's PkBackendJob
// Only built into the plugin; the pk_backend_job_*() symbols are resolved
// from the daemon when it loads the module.
// -----------------------------------------------------------------------------
class PkJobSink : public JobSink {
  public:
  explicit PkJobSink(PkBackendJob *job);

  void package(PkInfoEnum info, const std::string &package_id, const std::string &summary) override;
  void details(const PackageDetails &details) override;
  void files(const std::string &package_id, const std::vector<std::string> &files) override;
  void repo_detail(const std::string &repo_id, const std::string &description, bool enabled) override;
  void percentage(unsigned percentage) override;
  void status(PkStatusEnum status) override;
  void error(PkErrorEnum code, const std::string &message) override;
  void finished() override;

  private:
  PkBackendJob *job_;
};

// -----------------------------------------------------------------------------
// EOF
// -----------------------------------------------------------------------------
