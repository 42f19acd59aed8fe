// src/runtime_value.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

// -----------------------------------------------------------------------------
// Values crossing the embedded runtime boundary
// Arguments and record fields share one closed set of types. Anything the
// runtime returns outside of this set is rejected by the marshaling layer.
// -----------------------------------------------------------------------------
using StringList = std::vector<std::string>;
using RuntimeValue = std::variant<std::string, std::int64_t, bool, StringList>;
using RuntimeRecord = std::vector<RuntimeValue>;
using RuntimeRecords = std::vector<RuntimeRecord>;

// Failure raised by, or while talking to, the embedded runtime
class RuntimeError : public std::runtime_error {
  public:
  explicit RuntimeError(const std::string &message, std::string error_code = {})
    : std::runtime_error(message)
    , error_code_(std::move(error_code))
  {
  }

  // PackageKit error name supplied by the script (may be empty)
  const std::string &error_code() const { return error_code_; }

  private:
  std::string error_code_;
};

const char *runtime_value_type_name(const RuntimeValue &value);

// Typed field accessors, throw RuntimeError on arity or type mismatch
void expect_arity(const RuntimeRecord &record, std::size_t arity, const char *kind);
const std::string &record_string(const RuntimeRecord &record, std::size_t index, const char *field);
std::int64_t record_int(const RuntimeRecord &record, std::size_t index, const char *field);
bool record_bool(const RuntimeRecord &record, std::size_t index, const char *field);
const StringList &record_list(const RuntimeRecord &record, std::size_t index, const char *field);

// -----------------------------------------------------------------------------
// EOF
// -----------------------------------------------------------------------------
