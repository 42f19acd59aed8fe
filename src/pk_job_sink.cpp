// -----------------------------------------------------------------------------
// src/pk_job_sink.cpp
// PkBackendJob adapter
// -----------------------------------------------------------------------------
#include "pk_job_sink.hpp"

PkJobSink::PkJobSink(PkBackendJob *job)
  : job_(job)
{
}

void
PkJobSink::package(PkInfoEnum info, const std::string &package_id, const std::string &summary)
{
  pk_backend_job_package(job_, info, package_id.c_str(), summary.c_str());
}

void
PkJobSink::details(const PackageDetails &details)
{
  pk_backend_job_details(job_,
                         details.package_id.c_str(),
                         details.summary.c_str(),
                         details.license.c_str(),
                         details.group,
                         details.description.c_str(),
                         details.url.c_str(),
                         static_cast<gulong>(details.size),
                         static_cast<guint64>(details.download_size));
}

void
PkJobSink::files(const std::string &package_id, const std::vector<std::string> &files)
{
  std::vector<gchar *> strv;
  strv.reserve(files.size() + 1);
  for (const auto &file : files) {
    strv.push_back(const_cast<gchar *>(file.c_str()));
  }
  strv.push_back(nullptr);

  pk_backend_job_files(job_, package_id.c_str(), strv.data());
}

void
PkJobSink::repo_detail(const std::string &repo_id, const std::string &description, bool enabled)
{
  pk_backend_job_repo_detail(job_, repo_id.c_str(), description.c_str(), enabled ? TRUE : FALSE);
}

void
PkJobSink::percentage(unsigned percentage)
{
  pk_backend_job_set_percentage(job_, percentage);
}

void
PkJobSink::status(PkStatusEnum status)
{
  pk_backend_job_set_status(job_, status);
}

void
PkJobSink::error(PkErrorEnum code, const std::string &message)
{
  pk_backend_job_error_code(job_, code, "%s", message.c_str());
}

void
PkJobSink::finished()
{
  pk_backend_job_finished(job_);
}

// -----------------------------------------------------------------------------
// EOF
// -----------------------------------------------------------------------------
