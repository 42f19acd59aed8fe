#include <catch2/catch_test_macros.hpp>

#include "capabilities.hpp"

#include <string>

// -----------------------------------------------------------------------------
// Helper: number of bits set in a bitfield
// -----------------------------------------------------------------------------
static int
count_bits(PkBitfield bitfield)
{
  int count = 0;
  for (int bit = 0; bit < 64; bit++) {
    if (pk_bitfield_contain(bitfield, bit)) {
      count++;
    }
  }
  return count;
}

// -----------------------------------------------------------------------------
// Roles: deny-list filtered
// -----------------------------------------------------------------------------

TEST_CASE("Roles never include unknown, accept-eula, cancel or get-old-transactions")
{
  auto roles = backend_roles();

  REQUIRE_FALSE(pk_bitfield_contain(roles, PK_ROLE_ENUM_UNKNOWN));
  REQUIRE_FALSE(pk_bitfield_contain(roles, PK_ROLE_ENUM_ACCEPT_EULA));
  REQUIRE_FALSE(pk_bitfield_contain(roles, PK_ROLE_ENUM_CANCEL));
  REQUIRE_FALSE(pk_bitfield_contain(roles, PK_ROLE_ENUM_GET_OLD_TRANSACTIONS));
}

TEST_CASE("Every other defined role is advertised")
{
  auto roles = backend_roles();

  for (int role = PK_ROLE_ENUM_UNKNOWN; role < PK_ROLE_ENUM_LAST; role++) {
    auto value = static_cast<PkRoleEnum>(role);
    INFO("role " << pk_role_enum_to_string(value));
    REQUIRE(pk_bitfield_contain(roles, role) == !role_is_excluded(value));
  }

  REQUIRE(count_bits(roles) == PK_ROLE_ENUM_LAST - 4);
  REQUIRE(pk_bitfield_contain(roles, PK_ROLE_ENUM_REPAIR_SYSTEM));
  REQUIRE(pk_bitfield_contain(roles, PK_ROLE_ENUM_INSTALL_PACKAGES));
  REQUIRE(pk_bitfield_contain(roles, PK_ROLE_ENUM_SEARCH_NAME));
}

TEST_CASE("Roles are stable across calls")
{
  REQUIRE(backend_roles() == backend_roles());
}

// -----------------------------------------------------------------------------
// Filters: allow-list
// -----------------------------------------------------------------------------

TEST_CASE("Filters are exactly development, gui and installed")
{
  auto filters = backend_filters();

  REQUIRE(filters == pk_bitfield_from_enums(PK_FILTER_ENUM_INSTALLED, PK_FILTER_ENUM_GUI, PK_FILTER_ENUM_DEVELOPMENT, -1));
  REQUIRE(count_bits(filters) == 3);
  REQUIRE_FALSE(pk_bitfield_contain(filters, PK_FILTER_ENUM_NOT_INSTALLED));
  REQUIRE_FALSE(pk_bitfield_contain(filters, PK_FILTER_ENUM_NEWEST));
}

// -----------------------------------------------------------------------------
// Groups
// -----------------------------------------------------------------------------

TEST_CASE("Groups include every defined group except unknown")
{
  auto groups = backend_groups();

  REQUIRE_FALSE(pk_bitfield_contain(groups, PK_GROUP_ENUM_UNKNOWN));
  for (int group = PK_GROUP_ENUM_UNKNOWN + 1; group < PK_GROUP_ENUM_LAST; group++) {
    INFO("group " << pk_group_enum_to_string(static_cast<PkGroupEnum>(group)));
    REQUIRE(pk_bitfield_contain(groups, group));
  }
  REQUIRE(count_bits(groups) == PK_GROUP_ENUM_LAST - 1);
}

// -----------------------------------------------------------------------------
// Remaining capability queries
// -----------------------------------------------------------------------------

TEST_CASE("Parallelization is never supported")
{
  REQUIRE_FALSE(backend_supports_parallelization());
  REQUIRE_FALSE(backend_supports_parallelization());
}

TEST_CASE("Provides is an empty bitfield")
{
  REQUIRE(backend_provides() == 0);
}

TEST_CASE("Mime types are an empty list returned as an owned copy")
{
  gchar **first = backend_mime_types();
  gchar **second = backend_mime_types();

  REQUIRE(first != nullptr);
  REQUIRE(second != nullptr);
  REQUIRE(first != second);
  REQUIRE(first[0] == nullptr);
  REQUIRE(g_strv_length(first) == 0);

  // Releasing one copy leaves the others intact
  g_strfreev(first);
  REQUIRE(g_strv_length(second) == 0);

  gchar **third = backend_mime_types();
  REQUIRE(g_strv_length(third) == 0);

  g_strfreev(second);
  g_strfreev(third);
}

TEST_CASE("Identification strings are fixed")
{
  REQUIRE(std::string(backend_name()) == "deopkg");
  REQUIRE(std::string(backend_author()) == "Ikey Doherty");
  REQUIRE(std::string(backend_description()) == "eopkg support");
}
