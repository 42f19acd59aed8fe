// -----------------------------------------------------------------------------
// src/handlers/common.cpp
// Shared handler helpers
// Converts PackageKit bitfields into the name lists the script expects,
// validates job input, and turns runtime records into job signals. Records
// that do not have the expected shape fail the job instead of being guessed
// at.
// -----------------------------------------------------------------------------
#include "handlers/common.hpp"

#include <array>
#include <utility>

// -----------------------------------------------------------------------------
// Helper: split a "a;b;c" bitfield string, "none" for an empty field
// -----------------------------------------------------------------------------
static StringList
split_names(gchar *joined)
{
  g_autofree gchar *owned = joined;
  StringList names;
  if (!owned || g_strcmp0(owned, "none") == 0) {
    return names;
  }

  g_auto(GStrv) parts = g_strsplit(owned, ";", -1);
  for (int i = 0; parts[i]; i++) {
    if (*parts[i]) {
      names.emplace_back(parts[i]);
    }
  }
  return names;
}

StringList
filter_names(PkBitfield filters)
{
  return split_names(pk_filter_bitfield_to_string(filters));
}

StringList
transaction_flag_names(PkBitfield transaction_flags)
{
  return split_names(pk_transaction_flag_bitfield_to_string(transaction_flags));
}

// -----------------------------------------------------------------------------
// Filters that cannot be combined with their negation
// -----------------------------------------------------------------------------
static const std::array<std::pair<PkFilterEnum, PkFilterEnum>, 10> g_opposite_filters = { {
  { PK_FILTER_ENUM_INSTALLED, PK_FILTER_ENUM_NOT_INSTALLED },
  { PK_FILTER_ENUM_DEVELOPMENT, PK_FILTER_ENUM_NOT_DEVELOPMENT },
  { PK_FILTER_ENUM_GUI, PK_FILTER_ENUM_NOT_GUI },
  { PK_FILTER_ENUM_FREE, PK_FILTER_ENUM_NOT_FREE },
  { PK_FILTER_ENUM_VISIBLE, PK_FILTER_ENUM_NOT_VISIBLE },
  { PK_FILTER_ENUM_SUPPORTED, PK_FILTER_ENUM_NOT_SUPPORTED },
  { PK_FILTER_ENUM_BASENAME, PK_FILTER_ENUM_NOT_BASENAME },
  { PK_FILTER_ENUM_NEWEST, PK_FILTER_ENUM_NOT_NEWEST },
  { PK_FILTER_ENUM_ARCH, PK_FILTER_ENUM_NOT_ARCH },
  { PK_FILTER_ENUM_SOURCE, PK_FILTER_ENUM_NOT_SOURCE },
} };

void
check_filters(PkBitfield filters)
{
  for (const auto &[positive, negative] : g_opposite_filters) {
    if (pk_bitfield_contain(filters, positive) && pk_bitfield_contain(filters, negative)) {
      throw JobError(PK_ERROR_ENUM_FILTER_INVALID,
                     std::string("filters '") + pk_filter_enum_to_string(positive) + "' and '" +
                       pk_filter_enum_to_string(negative) + "' cannot be combined");
    }
  }
}

void
check_search_terms(const StringList &terms)
{
  if (terms.empty()) {
    throw JobError(PK_ERROR_ENUM_SEARCH_INVALID, "no search terms given");
  }
  for (const auto &term : terms) {
    if (term.empty()) {
      throw JobError(PK_ERROR_ENUM_SEARCH_INVALID, "empty search term");
    }
  }
}

void
check_package_ids(const StringList &package_ids)
{
  if (package_ids.empty()) {
    throw JobError(PK_ERROR_ENUM_PACKAGE_ID_INVALID, "no package ids given");
  }
  for (const auto &id : package_ids) {
    if (!pk_package_id_check(id.c_str())) {
      throw JobError(PK_ERROR_ENUM_PACKAGE_ID_INVALID, "invalid package id '" + id + "'");
    }
  }
}

void
check_local_files(const StringList &paths)
{
  if (paths.empty()) {
    throw JobError(PK_ERROR_ENUM_FILE_NOT_FOUND, "no files given");
  }
  for (const auto &path : paths) {
    if (!g_file_test(path.c_str(), G_FILE_TEST_IS_REGULAR)) {
      throw JobError(PK_ERROR_ENUM_FILE_NOT_FOUND, "file '" + path + "' does not exist");
    }
  }
}

void
check_repo_id(const std::string &repo_id)
{
  if (repo_id.empty()) {
    throw JobError(PK_ERROR_ENUM_REPO_NOT_FOUND, "no repository given");
  }
}

PkInfoEnum
parse_info(const std::string &info)
{
  PkInfoEnum value = pk_info_enum_from_string(info.c_str());
  if (value == PK_INFO_ENUM_UNKNOWN && info != "unknown") {
    throw RuntimeError("unknown package info '" + info + "'");
  }
  return value;
}

PkGroupEnum
parse_group(const std::string &group)
{
  if (group.empty()) {
    return PK_GROUP_ENUM_UNKNOWN;
  }
  PkGroupEnum value = pk_group_enum_from_string(group.c_str());
  if (value == PK_GROUP_ENUM_UNKNOWN && group != "unknown") {
    throw RuntimeError("unknown group '" + group + "'");
  }
  return value;
}

RuntimeRecords
call_runtime(Job &job, RuntimeManager &runtime, const std::string &function, const std::vector<RuntimeValue> &args)
{
  g_debug("calling deopkg.%s for %s", function.c_str(), pk_role_enum_to_string(job.role()));
  RuntimeRecords records = runtime.runtime().call(function, args, &job);
  g_debug("deopkg.%s returned %zu records", function.c_str(), records.size());
  return records;
}

// -----------------------------------------------------------------------------
// Record emitters
// Every record is validated before any signal is sent, so a malformed result
// never leaves the host with half a listing.
// -----------------------------------------------------------------------------
void
emit_packages(Job &job, const RuntimeRecords &records)
{
  struct Item {
    PkInfoEnum info;
    const std::string *package_id;
    const std::string *summary;
  };

  std::vector<Item> items;
  items.reserve(records.size());
  for (const auto &record : records) {
    expect_arity(record, 3, "package");
    const auto &package_id = record_string(record, 1, "package_id");
    if (!pk_package_id_check(package_id.c_str())) {
      throw RuntimeError("invalid package id '" + package_id + "'");
    }
    items.push_back(Item { parse_info(record_string(record, 0, "info")), &package_id,
                           &record_string(record, 2, "summary") });
  }

  for (const auto &item : items) {
    job.package(item.info, *item.package_id, *item.summary);
  }
}

void
emit_details(Job &job, const RuntimeRecords &records)
{
  std::vector<PackageDetails> items;
  items.reserve(records.size());
  for (const auto &record : records) {
    expect_arity(record, 8, "details");

    PackageDetails details;
    details.package_id = record_string(record, 0, "package_id");
    if (!pk_package_id_check(details.package_id.c_str())) {
      throw RuntimeError("invalid package id '" + details.package_id + "'");
    }
    details.summary = record_string(record, 1, "summary");
    details.license = record_string(record, 2, "license");
    details.group = parse_group(record_string(record, 3, "group"));
    details.description = record_string(record, 4, "description");
    details.url = record_string(record, 5, "url");

    std::int64_t size = record_int(record, 6, "size");
    std::int64_t download_size = record_int(record, 7, "download_size");
    if (size < 0 || download_size < 0) {
      throw RuntimeError("negative size for " + details.package_id);
    }
    details.size = static_cast<std::uint64_t>(size);
    details.download_size = static_cast<std::uint64_t>(download_size);

    items.push_back(std::move(details));
  }

  for (const auto &details : items) {
    job.details(details);
  }
}

void
emit_files(Job &job, const RuntimeRecords &records)
{
  for (const auto &record : records) {
    expect_arity(record, 2, "files");
    const auto &package_id = record_string(record, 0, "package_id");
    if (!pk_package_id_check(package_id.c_str())) {
      throw RuntimeError("invalid package id '" + package_id + "'");
    }
    record_list(record, 1, "files");
  }

  for (const auto &record : records) {
    job.files(record_string(record, 0, "package_id"), record_list(record, 1, "files"));
  }
}

void
emit_repos(Job &job, const RuntimeRecords &records)
{
  for (const auto &record : records) {
    expect_arity(record, 3, "repo");
    if (record_string(record, 0, "repo_id").empty()) {
      throw RuntimeError("repository without an id");
    }
    record_string(record, 1, "description");
    record_bool(record, 2, "enabled");
  }

  for (const auto &record : records) {
    job.repo_detail(record_string(record, 0, "repo_id"), record_string(record, 1, "description"),
                    record_bool(record, 2, "enabled"));
  }
}

void
check_found(const RuntimeRecords &records, const char *what)
{
  if (records.empty()) {
    throw JobError(PK_ERROR_ENUM_PACKAGE_NOT_FOUND, std::string("no ") + what + " found for the requested packages");
  }
}

void
finish_job(Job &job)
{
  job.set_percentage(100);
  job.finish();
}

// -----------------------------------------------------------------------------
// EOF
// -----------------------------------------------------------------------------
