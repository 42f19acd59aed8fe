// -----------------------------------------------------------------------------
// src/handlers/search.cpp
// Search roles: name, details, file, group and what-provides
// All return package records: (info, package_id, summary)
// -----------------------------------------------------------------------------
#include "handlers/handlers.hpp"
#include "handlers/common.hpp"

static const char *
search_function(PkRoleEnum role)
{
  switch (role) {
  case PK_ROLE_ENUM_SEARCH_NAME:
    return "search_names";
  case PK_ROLE_ENUM_SEARCH_DETAILS:
    return "search_details";
  case PK_ROLE_ENUM_SEARCH_FILE:
    return "search_files";
  case PK_ROLE_ENUM_SEARCH_GROUP:
    return "search_groups";
  default:
    throw JobError(PK_ERROR_ENUM_NOT_SUPPORTED,
                   std::string("search handler cannot serve ") + pk_role_enum_to_string(role));
  }
}

void
handle_search(Job &job, const JobArgs &args, RuntimeManager &runtime)
{
  const char *function = search_function(job.role());
  check_filters(args.filters);
  check_search_terms(args.values);

  job.set_status(PK_STATUS_ENUM_QUERY);
  auto records = call_runtime(job, runtime, function, { filter_names(args.filters), args.values });

  emit_packages(job, records);
  finish_job(job);
}

void
handle_what_provides(Job &job, const JobArgs &args, RuntimeManager &runtime)
{
  check_filters(args.filters);
  check_search_terms(args.values);

  job.set_status(PK_STATUS_ENUM_QUERY);
  auto records = call_runtime(job, runtime, "what_provides", { filter_names(args.filters), args.values });

  emit_packages(job, records);
  finish_job(job);
}

// -----------------------------------------------------------------------------
// EOF
// -----------------------------------------------------------------------------
