// src/handlers/handlers.hpp
#pragma once

#include "dispatcher.hpp"

// -----------------------------------------------------------------------------
// Role handlers
// Each one validates its arguments, calls the matching deopkg.<function>,
// emits the returned records and finishes the job. Failures are thrown and
// turned into failed jobs by the dispatcher.
// -----------------------------------------------------------------------------

// search.cpp
void handle_search(Job &job, const JobArgs &args, RuntimeManager &runtime);
void handle_what_provides(Job &job, const JobArgs &args, RuntimeManager &runtime);

// lookup.cpp
void handle_resolve(Job &job, const JobArgs &args, RuntimeManager &runtime);

// list.cpp
void handle_get_packages(Job &job, const JobArgs &args, RuntimeManager &runtime);

// info.cpp
void handle_get_details(Job &job, const JobArgs &args, RuntimeManager &runtime);
void handle_get_details_local(Job &job, const JobArgs &args, RuntimeManager &runtime);

// files.cpp
void handle_get_files(Job &job, const JobArgs &args, RuntimeManager &runtime);
void handle_get_files_local(Job &job, const JobArgs &args, RuntimeManager &runtime);

// deps.cpp
void handle_dependencies(Job &job, const JobArgs &args, RuntimeManager &runtime);

// updates.cpp
void handle_get_updates(Job &job, const JobArgs &args, RuntimeManager &runtime);
void handle_update_packages(Job &job, const JobArgs &args, RuntimeManager &runtime);

// install.cpp
void handle_install_packages(Job &job, const JobArgs &args, RuntimeManager &runtime);
void handle_install_files(Job &job, const JobArgs &args, RuntimeManager &runtime);

// remove.cpp
void handle_remove_packages(Job &job, const JobArgs &args, RuntimeManager &runtime);

// refresh.cpp
void handle_refresh_cache(Job &job, const JobArgs &args, RuntimeManager &runtime);

// repos.cpp
void handle_get_repo_list(Job &job, const JobArgs &args, RuntimeManager &runtime);
void handle_repo_enable(Job &job, const JobArgs &args, RuntimeManager &runtime);
void handle_repo_remove(Job &job, const JobArgs &args, RuntimeManager &runtime);

// download.cpp
void handle_download_packages(Job &job, const JobArgs &args, RuntimeManager &runtime);

// registry.cpp: every handler above plus the repair-system acknowledgement
void register_default_handlers(Dispatcher &dispatcher);

// -----------------------------------------------------------------------------
// EOF
// -----------------------------------------------------------------------------
