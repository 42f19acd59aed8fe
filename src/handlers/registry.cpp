// -----------------------------------------------------------------------------
// src/handlers/registry.cpp
// Role -> handler table
// Roles advertised by backend_roles() but missing here are reported at
// initialize time and fail as not supported when invoked.
// -----------------------------------------------------------------------------
#include "handlers/handlers.hpp"

void
register_default_handlers(Dispatcher &dispatcher)
{
  dispatcher.register_handler(PK_ROLE_ENUM_SEARCH_NAME, handle_search);
  dispatcher.register_handler(PK_ROLE_ENUM_SEARCH_DETAILS, handle_search);
  dispatcher.register_handler(PK_ROLE_ENUM_SEARCH_FILE, handle_search);
  dispatcher.register_handler(PK_ROLE_ENUM_SEARCH_GROUP, handle_search);
  dispatcher.register_handler(PK_ROLE_ENUM_WHAT_PROVIDES, handle_what_provides);

  dispatcher.register_handler(PK_ROLE_ENUM_RESOLVE, handle_resolve);
  dispatcher.register_handler(PK_ROLE_ENUM_GET_PACKAGES, handle_get_packages);

  dispatcher.register_handler(PK_ROLE_ENUM_GET_DETAILS, handle_get_details);
  dispatcher.register_handler(PK_ROLE_ENUM_GET_DETAILS_LOCAL, handle_get_details_local);
  dispatcher.register_handler(PK_ROLE_ENUM_GET_FILES, handle_get_files);
  dispatcher.register_handler(PK_ROLE_ENUM_GET_FILES_LOCAL, handle_get_files_local);

  dispatcher.register_handler(PK_ROLE_ENUM_DEPENDS_ON, handle_dependencies);
  dispatcher.register_handler(PK_ROLE_ENUM_REQUIRED_BY, handle_dependencies);

  dispatcher.register_handler(PK_ROLE_ENUM_GET_UPDATES, handle_get_updates);
  dispatcher.register_handler(PK_ROLE_ENUM_UPDATE_PACKAGES, handle_update_packages);

  dispatcher.register_handler(PK_ROLE_ENUM_INSTALL_PACKAGES, handle_install_packages);
  dispatcher.register_handler(PK_ROLE_ENUM_INSTALL_FILES, handle_install_files);
  dispatcher.register_handler(PK_ROLE_ENUM_REMOVE_PACKAGES, handle_remove_packages);

  dispatcher.register_handler(PK_ROLE_ENUM_REFRESH_CACHE, handle_refresh_cache);

  dispatcher.register_handler(PK_ROLE_ENUM_GET_REPO_LIST, handle_get_repo_list);
  dispatcher.register_handler(PK_ROLE_ENUM_REPO_ENABLE, handle_repo_enable);
  dispatcher.register_handler(PK_ROLE_ENUM_REPO_REMOVE, handle_repo_remove);

  dispatcher.register_handler(PK_ROLE_ENUM_DOWNLOAD_PACKAGES, handle_download_packages);

  // NOT SUPPORTED: acknowledged without doing any work
  dispatcher.register_acknowledgement(PK_ROLE_ENUM_REPAIR_SYSTEM);
}

// -----------------------------------------------------------------------------
// EOF
// -----------------------------------------------------------------------------
