// -----------------------------------------------------------------------------
// src/handlers/deps.cpp
// Depends-on and required-by
// Both take (filters, package_ids, recursive) and return package records.
// -----------------------------------------------------------------------------
#include "handlers/handlers.hpp"
#include "handlers/common.hpp"

void
handle_dependencies(Job &job, const JobArgs &args, RuntimeManager &runtime)
{
  std::string function;
  if (job.role() == PK_ROLE_ENUM_DEPENDS_ON) {
    function = "depends_on";
  } else if (job.role() == PK_ROLE_ENUM_REQUIRED_BY) {
    function = "required_by";
  } else {
    throw JobError(PK_ERROR_ENUM_NOT_SUPPORTED,
                   std::string("dependency handler cannot serve ") + pk_role_enum_to_string(job.role()));
  }

  check_filters(args.filters);
  check_package_ids(args.values);

  job.set_status(PK_STATUS_ENUM_DEP_RESOLVE);
  auto records = call_runtime(job, runtime, function, { filter_names(args.filters), args.values, args.recursive });

  emit_packages(job, records);
  finish_job(job);
}

// -----------------------------------------------------------------------------
// EOF
// -----------------------------------------------------------------------------
