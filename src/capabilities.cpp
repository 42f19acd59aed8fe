// -----------------------------------------------------------------------------
// src/capabilities.cpp
// Capability tables
// Static description of what the deopkg backend offers to the daemon. The
// daemon queries these once at load time and routes requests with them.
//
// Roles are computed from a deny-list so any role PackageKit adds later is
// advertised automatically; filters are a hand-picked allow-list.
// -----------------------------------------------------------------------------
#include "capabilities.hpp"

#include <algorithm>
#include <array>

// -----------------------------------------------------------------------------
// Roles never advertised
// -----------------------------------------------------------------------------
static constexpr std::array<PkRoleEnum, 4> g_excluded_roles = {
  PK_ROLE_ENUM_UNKNOWN,
  PK_ROLE_ENUM_ACCEPT_EULA,
  PK_ROLE_ENUM_CANCEL,
  PK_ROLE_ENUM_GET_OLD_TRANSACTIONS,
};

// No mime types are advertised yet
static const gchar *const g_mime_types[] = { nullptr };

const char *
backend_author()
{
  return "Ikey Doherty";
}

const char *
backend_name()
{
  return "deopkg";
}

const char *
backend_description()
{
  return "eopkg support";
}

// -----------------------------------------------------------------------------
// Every group except PK_GROUP_ENUM_UNKNOWN (value 0)
// -----------------------------------------------------------------------------
PkBitfield
backend_groups()
{
  PkBitfield groups = 0;
  for (int group = PK_GROUP_ENUM_UNKNOWN + 1; group < PK_GROUP_ENUM_LAST; group++) {
    pk_bitfield_add(groups, group);
  }
  return groups;
}

bool
role_is_excluded(PkRoleEnum role)
{
  return std::find(g_excluded_roles.begin(), g_excluded_roles.end(), role) != g_excluded_roles.end();
}

// -----------------------------------------------------------------------------
// Every role except cancel, EULA acceptance and old transactions
// -----------------------------------------------------------------------------
PkBitfield
backend_roles()
{
  PkBitfield roles = 0;
  for (int role = PK_ROLE_ENUM_UNKNOWN; role < PK_ROLE_ENUM_LAST; role++) {
    if (role_is_excluded(static_cast<PkRoleEnum>(role))) {
      continue;
    }
    pk_bitfield_add(roles, role);
  }
  return roles;
}

PkBitfield
backend_filters()
{
  return pk_bitfield_from_enums(PK_FILTER_ENUM_DEVELOPMENT, PK_FILTER_ENUM_GUI, PK_FILTER_ENUM_INSTALLED, -1);
}

PkBitfield
backend_provides()
{
  return 0;
}

bool
backend_supports_parallelization()
{
  return false;
}

gchar **
backend_mime_types()
{
  return g_strdupv(const_cast<gchar **>(g_mime_types));
}

// -----------------------------------------------------------------------------
// EOF
// -----------------------------------------------------------------------------
