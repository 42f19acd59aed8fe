// -----------------------------------------------------------------------------
// src/runtime_value.cpp
// Typed access to records returned by the embedded runtime
// -----------------------------------------------------------------------------
#include "runtime_value.hpp"

#include <sstream>

const char *
runtime_value_type_name(const RuntimeValue &value)
{
  switch (value.index()) {
  case 0:
    return "string";
  case 1:
    return "integer";
  case 2:
    return "boolean";
  case 3:
    return "string list";
  default:
    return "unknown";
  }
}

void
expect_arity(const RuntimeRecord &record, std::size_t arity, const char *kind)
{
  if (record.size() != arity) {
    std::ostringstream oss;
    oss << "malformed " << kind << " record: expected " << arity << " fields, got " << record.size();
    throw RuntimeError(oss.str());
  }
}

// -----------------------------------------------------------------------------
// Helper: fetch a field of a given alternative or explain what was found
// -----------------------------------------------------------------------------
template <typename T>
static const T &
record_field(const RuntimeRecord &record, std::size_t index, const char *field, const char *expected)
{
  if (index >= record.size()) {
    throw RuntimeError(std::string("missing field '") + field + "'");
  }

  const auto *value = std::get_if<T>(&record[index]);
  if (!value) {
    throw RuntimeError(std::string("field '") + field + "' should be a " + expected + ", got " +
                       runtime_value_type_name(record[index]));
  }

  return *value;
}

const std::string &
record_string(const RuntimeRecord &record, std::size_t index, const char *field)
{
  return record_field<std::string>(record, index, field, "string");
}

std::int64_t
record_int(const RuntimeRecord &record, std::size_t index, const char *field)
{
  return record_field<std::int64_t>(record, index, field, "integer");
}

bool
record_bool(const RuntimeRecord &record, std::size_t index, const char *field)
{
  return record_field<bool>(record, index, field, "boolean");
}

const StringList &
record_list(const RuntimeRecord &record, std::size_t index, const char *field)
{
  return record_field<StringList>(record, index, field, "string list");
}

// -----------------------------------------------------------------------------
// EOF
// -----------------------------------------------------------------------------
