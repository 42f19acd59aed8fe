// -----------------------------------------------------------------------------
// src/job.cpp
// Job state tracking and host signal forwarding
// -----------------------------------------------------------------------------
#include "job.hpp"

Job::Job(PkRoleEnum role, JobSink &sink)
  : role_(role)
  , sink_(sink)
{
}

const char *
job_state_to_string(Job::State state)
{
  switch (state) {
  case Job::State::Received:
    return "received";
  case Job::State::Running:
    return "running";
  case Job::State::Finished:
    return "finished";
  case Job::State::Failed:
    return "failed";
  }
  return "unknown";
}

void
Job::start()
{
  if (state_ != State::Received) {
    throw std::logic_error(std::string("job cannot start from state ") + job_state_to_string(state_));
  }
  state_ = State::Running;
}

// -----------------------------------------------------------------------------
// Helper: intermediate signals are only forwarded while running
// -----------------------------------------------------------------------------
bool
Job::accepts_signals(const char *what) const
{
  if (state_ == State::Running) {
    return true;
  }
  g_warning("dropping %s for %s job in state %s", what, pk_role_enum_to_string(role_), job_state_to_string(state_));
  return false;
}

void
Job::package(PkInfoEnum info, const std::string &package_id, const std::string &summary)
{
  if (accepts_signals("package")) {
    sink_.package(info, package_id, summary);
  }
}

void
Job::details(const PackageDetails &details)
{
  if (accepts_signals("details")) {
    sink_.details(details);
  }
}

void
Job::files(const std::string &package_id, const std::vector<std::string> &files)
{
  if (accepts_signals("files")) {
    sink_.files(package_id, files);
  }
}

void
Job::repo_detail(const std::string &repo_id, const std::string &description, bool enabled)
{
  if (accepts_signals("repo detail")) {
    sink_.repo_detail(repo_id, description, enabled);
  }
}

void
Job::set_percentage(unsigned percentage)
{
  if (percentage > 100) {
    percentage = 100;
  }
  if (accepts_signals("percentage")) {
    sink_.percentage(percentage);
  }
}

void
Job::set_status(PkStatusEnum status)
{
  if (accepts_signals("status")) {
    sink_.status(status);
  }
}

// -----------------------------------------------------------------------------
// Terminal signals: exactly one of finish()/fail() reaches the sink
// -----------------------------------------------------------------------------
void
Job::finish()
{
  if (is_finalized()) {
    g_warning("%s job already %s, ignoring finish", pk_role_enum_to_string(role_), job_state_to_string(state_));
    return;
  }

  state_ = State::Finished;
  sink_.finished();
}

void
Job::fail(PkErrorEnum code, const std::string &message)
{
  if (is_finalized()) {
    g_warning("%s job already %s, ignoring error: %s",
              pk_role_enum_to_string(role_),
              job_state_to_string(state_),
              message.c_str());
    return;
  }

  g_debug("%s failed (%s): %s", pk_role_enum_to_string(role_), pk_error_enum_to_string(code), message.c_str());

  state_ = State::Failed;
  sink_.error(code, message);
  sink_.finished();
}

// -----------------------------------------------------------------------------
// Bridge callbacks from the running script
// Names arrive as PackageKit strings and are validated here.
// -----------------------------------------------------------------------------
void
Job::on_percentage(unsigned percentage)
{
  set_percentage(percentage);
}

void
Job::on_status(const std::string &status)
{
  PkStatusEnum value = pk_status_enum_from_string(status.c_str());
  if (value == PK_STATUS_ENUM_UNKNOWN && status != "unknown") {
    throw RuntimeError("unknown status '" + status + "'");
  }
  set_status(value);
}

void
Job::on_package(const std::string &info, const std::string &package_id, const std::string &summary)
{
  PkInfoEnum value = pk_info_enum_from_string(info.c_str());
  if (value == PK_INFO_ENUM_UNKNOWN && info != "unknown") {
    throw RuntimeError("unknown package info '" + info + "'");
  }
  if (!pk_package_id_check(package_id.c_str())) {
    throw RuntimeError("invalid package id '" + package_id + "'");
  }
  package(value, package_id, summary);
}

// -----------------------------------------------------------------------------
// EOF
// -----------------------------------------------------------------------------
