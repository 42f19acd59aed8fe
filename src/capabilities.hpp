// src/capabilities.hpp
#pragma once

#include <packagekit-glib2/packagekit.h>

// -----------------------------------------------------------------------------
// Capability tables advertised to packagekitd
// Pure functions, safe to call before the backend is initialized.
// -----------------------------------------------------------------------------
const char *backend_author();
const char *backend_name();
const char *backend_description();

PkBitfield backend_groups();
PkBitfield backend_roles();
PkBitfield backend_filters();
PkBitfield backend_provides();
bool backend_supports_parallelization();

// Returns a newly allocated NULL terminated copy, free with g_strfreev()
gchar **backend_mime_types();

bool role_is_excluded(PkRoleEnum role);

// -----------------------------------------------------------------------------
// EOF
// -----------------------------------------------------------------------------
