// src/job.hpp
#pragma once

#include "script_runtime.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include <packagekit-glib2/packagekit.h>

// -----------------------------------------------------------------------------
// Result types handed to the host
// -----------------------------------------------------------------------------
struct PackageDetails {
  std::string package_id;
  std::string summary;
  std::string license;
  PkGroupEnum group = PK_GROUP_ENUM_UNKNOWN;
  std::string description;
  std::string url;
  std::uint64_t size = 0;
  std::uint64_t download_size = 0;
};

// -----------------------------------------------------------------------------
// Host callback surface for one job
// The daemon implementation forwards to pk_backend_job_*(); tests record.
// -----------------------------------------------------------------------------
class JobSink {
  public:
  virtual ~JobSink() = default;

  virtual void package(PkInfoEnum info, const std::string &package_id, const std::string &summary) = 0;
  virtual void details(const PackageDetails &details) = 0;
  virtual void files(const std::string &package_id, const std::vector<std::string> &files) = 0;
  virtual void repo_detail(const std::string &repo_id, const std::string &description, bool enabled) = 0;
  virtual void percentage(unsigned percentage) = 0;
  virtual void status(PkStatusEnum status) = 0;

  // Terminal signals; error() is always followed by finished() for a failure
  virtual void error(PkErrorEnum code, const std::string &message) = 0;
  virtual void finished() = 0;
};

// Invalid input detected by a handler before or after calling the runtime
class JobError : public std::runtime_error {
  public:
  JobError(PkErrorEnum code, const std::string &message)
    : std::runtime_error(message)
    , code_(code)
  {
  }

  PkErrorEnum code() const { return code_; }

  private:
  PkErrorEnum code_;
};

// -----------------------------------------------------------------------------
// Job: one role invocation, Received -> Running -> {Finished | Failed}
// Guarantees the sink sees at most one terminal signal; the dispatcher
// guarantees it sees at least one.
// -----------------------------------------------------------------------------
class Job : public RuntimeObserver {
  public:
  enum class State { Received, Running, Finished, Failed };

  Job(PkRoleEnum role, JobSink &sink);

  Job(const Job &) = delete;
  Job &operator=(const Job &) = delete;

  PkRoleEnum role() const { return role_; }
  State state() const { return state_; }
  bool is_finalized() const { return state_ == State::Finished || state_ == State::Failed; }

  // Received -> Running, throws std::logic_error on any other state
  void start();

  void package(PkInfoEnum info, const std::string &package_id, const std::string &summary);
  void details(const PackageDetails &details);
  void files(const std::string &package_id, const std::vector<std::string> &files);
  void repo_detail(const std::string &repo_id, const std::string &description, bool enabled);
  void set_percentage(unsigned percentage);
  void set_status(PkStatusEnum status);

  void finish();
  void fail(PkErrorEnum code, const std::string &message);

  // RuntimeObserver
  void on_percentage(unsigned percentage) override;
  void on_status(const std::string &status) override;
  void on_package(const std::string &info, const std::string &package_id, const std::string &summary) override;

  private:
  bool accepts_signals(const char *what) const;

  PkRoleEnum role_;
  JobSink &sink_;
  State state_ = State::Received;
};

const char *job_state_to_string(Job::State state);

// -----------------------------------------------------------------------------
// EOF
// -----------------------------------------------------------------------------
