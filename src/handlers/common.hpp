// src/handlers/common.hpp
#pragma once

#include "dispatcher.hpp"
#include "job.hpp"
#include "runtime_manager.hpp"
#include "runtime_value.hpp"

#include <string>
#include <vector>

// -----------------------------------------------------------------------------
// Shared helpers for the role handlers
// -----------------------------------------------------------------------------

// PackageKit names of the set bits ("installed", "~devel", "simulate", ...)
StringList filter_names(PkBitfield filters);
StringList transaction_flag_names(PkBitfield transaction_flags);

// Input validation, throw JobError
void check_filters(PkBitfield filters);
void check_search_terms(const StringList &terms);
void check_package_ids(const StringList &package_ids);
void check_local_files(const StringList &paths);
void check_repo_id(const std::string &repo_id);

// Name validation for runtime results, throw RuntimeError
PkInfoEnum parse_info(const std::string &info);
PkGroupEnum parse_group(const std::string &group);

// Calls deopkg.<function> with the job observing progress callbacks
RuntimeRecords call_runtime(Job &job,
                            RuntimeManager &runtime,
                            const std::string &function,
                            const std::vector<RuntimeValue> &args);

// Record emitters, validate shape and forward to the job
void emit_packages(Job &job, const RuntimeRecords &records);
void emit_details(Job &job, const RuntimeRecords &records);
void emit_files(Job &job, const RuntimeRecords &records);
void emit_repos(Job &job, const RuntimeRecords &records);

// Lookups by package id or local file must name at least one package;
// throws JobError(PACKAGE_NOT_FOUND) for an empty result
void check_found(const RuntimeRecords &records, const char *what);

// 100% then finished
void finish_job(Job &job);

// -----------------------------------------------------------------------------
// EOF
// -----------------------------------------------------------------------------
