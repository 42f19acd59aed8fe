#include <catch2/catch_test_macros.hpp>

#include "dispatcher.hpp"
#include "test_utils.hpp"

#include <memory>
#include <stdexcept>
#include <utility>

// -----------------------------------------------------------------------------
// Helper: dispatcher with an initialized fake runtime and no handlers
// -----------------------------------------------------------------------------
struct BareBackend {
  BareBackend()
    : BareBackend(std::make_unique<FakeRuntime>())
  {
  }

  explicit BareBackend(std::unique_ptr<FakeRuntime> runtime)
    : fake(runtime.get())
    , manager(std::move(runtime))
    , dispatcher(manager)
  {
  }

  void initialize() { manager.initialize(BackendConfig { "/usr/share/deopkg/test.py" }); }

  RecordingSink
  run(PkRoleEnum role, const JobArgs &args = {})
  {
    RecordingSink sink;
    dispatcher.dispatch(role, sink, args);
    return sink;
  }

  FakeRuntime *fake;
  RuntimeManager manager;
  Dispatcher dispatcher;
};

// -----------------------------------------------------------------------------
// Terminal signal guarantees
// -----------------------------------------------------------------------------

TEST_CASE("A handler that finishes produces one finished signal")
{
  BareBackend b;
  b.initialize();
  b.dispatcher.register_handler(PK_ROLE_ENUM_GET_PACKAGES, [](Job &job, const JobArgs &, RuntimeManager &) {
    job.package(PK_INFO_ENUM_INSTALLED, k_vim_id, "Vi improved");
    job.finish();
  });

  auto sink = b.run(PK_ROLE_ENUM_GET_PACKAGES);

  REQUIRE(sink.finalized_once());
  REQUIRE_FALSE(sink.failed());
  REQUIRE(sink.packages.size() == 1);
}

TEST_CASE("A handler that forgets to finish is failed by the dispatcher")
{
  BareBackend b;
  b.initialize();
  b.dispatcher.register_handler(PK_ROLE_ENUM_GET_PACKAGES, [](Job &, const JobArgs &, RuntimeManager &) {});

  auto sink = b.run(PK_ROLE_ENUM_GET_PACKAGES);

  REQUIRE(sink.finalized_once());
  REQUIRE(sink.error_code() == PK_ERROR_ENUM_INTERNAL_ERROR);
  REQUIRE(sink.error_message() == "backend did not finish the job");
}

TEST_CASE("A handler finishing twice still yields one finished signal")
{
  BareBackend b;
  b.initialize();
  b.dispatcher.register_handler(PK_ROLE_ENUM_GET_PACKAGES, [](Job &job, const JobArgs &, RuntimeManager &) {
    job.finish();
    job.finish();
  });

  auto sink = b.run(PK_ROLE_ENUM_GET_PACKAGES);

  REQUIRE(sink.finished_count == 1);
  REQUIRE_FALSE(sink.failed());
}

TEST_CASE("An exception after finishing does not produce a second terminal signal")
{
  BareBackend b;
  b.initialize();
  b.dispatcher.register_handler(PK_ROLE_ENUM_GET_PACKAGES, [](Job &job, const JobArgs &, RuntimeManager &) {
    job.finish();
    throw std::runtime_error("cleanup went wrong");
  });

  auto sink = b.run(PK_ROLE_ENUM_GET_PACKAGES);

  REQUIRE(sink.finalized_once());
  REQUIRE_FALSE(sink.failed());
}

// -----------------------------------------------------------------------------
// Exception mapping
// -----------------------------------------------------------------------------

TEST_CASE("JobError keeps its own code")
{
  BareBackend b;
  b.initialize();
  b.dispatcher.register_handler(PK_ROLE_ENUM_GET_DETAILS, [](Job &, const JobArgs &, RuntimeManager &) {
    throw JobError(PK_ERROR_ENUM_PACKAGE_ID_INVALID, "bad id");
  });

  auto sink = b.run(PK_ROLE_ENUM_GET_DETAILS);

  REQUIRE(sink.finalized_once());
  REQUIRE(sink.error_code() == PK_ERROR_ENUM_PACKAGE_ID_INVALID);
  REQUIRE(sink.error_message() == "bad id");
}

TEST_CASE("RuntimeError with a known code uses that code")
{
  BareBackend b;
  b.initialize();
  b.dispatcher.register_handler(PK_ROLE_ENUM_INSTALL_PACKAGES, [](Job &, const JobArgs &, RuntimeManager &) {
    throw RuntimeError("no space left", "no-space-on-device");
  });

  auto sink = b.run(PK_ROLE_ENUM_INSTALL_PACKAGES);

  REQUIRE(sink.error_code() == PK_ERROR_ENUM_NO_SPACE_ON_DEVICE);
  REQUIRE(sink.error_message() == "no space left");
}

TEST_CASE("RuntimeError without a usable code falls back to the role default")
{
  BareBackend b;
  b.initialize();
  auto thrower = [](const std::string &code) {
    return [code](Job &, const JobArgs &, RuntimeManager &) { throw RuntimeError("script failed", code); };
  };

  SECTION("no code on a transaction role")
  {
    b.dispatcher.register_handler(PK_ROLE_ENUM_INSTALL_PACKAGES, thrower(""));
    REQUIRE(b.run(PK_ROLE_ENUM_INSTALL_PACKAGES).error_code() == PK_ERROR_ENUM_TRANSACTION_ERROR);
  }

  SECTION("bogus code on a query role")
  {
    b.dispatcher.register_handler(PK_ROLE_ENUM_SEARCH_NAME, thrower("definitely-not-an-error"));
    REQUIRE(b.run(PK_ROLE_ENUM_SEARCH_NAME).error_code() == PK_ERROR_ENUM_INTERNAL_ERROR);
  }
}

TEST_CASE("Any other exception becomes an internal error")
{
  BareBackend b;
  b.initialize();
  b.dispatcher.register_handler(PK_ROLE_ENUM_GET_PACKAGES, [](Job &, const JobArgs &, RuntimeManager &) {
    throw std::out_of_range("index 7");
  });

  auto sink = b.run(PK_ROLE_ENUM_GET_PACKAGES);

  REQUIRE(sink.finalized_once());
  REQUIRE(sink.error_code() == PK_ERROR_ENUM_INTERNAL_ERROR);
  REQUIRE(sink.error_message() == "index 7");
}

TEST_CASE("A non-standard exception fails the job and releases the backend")
{
  BareBackend b;
  b.initialize();
  b.dispatcher.register_handler(PK_ROLE_ENUM_GET_PACKAGES, [](Job &, const JobArgs &, RuntimeManager &) {
    throw 42;
  });
  b.dispatcher.register_handler(PK_ROLE_ENUM_SEARCH_NAME,
                                [](Job &job, const JobArgs &, RuntimeManager &) { job.finish(); });

  RecordingSink sink;
  REQUIRE_NOTHROW(b.dispatcher.dispatch(PK_ROLE_ENUM_GET_PACKAGES, sink, JobArgs {}));
  REQUIRE(sink.finalized_once());
  REQUIRE(sink.error_code() == PK_ERROR_ENUM_INTERNAL_ERROR);

  // The next job is not mistaken for a re-entrant call
  auto next = b.run(PK_ROLE_ENUM_SEARCH_NAME);
  REQUIRE(next.finalized_once());
  REQUIRE_FALSE(next.failed());
}

// -----------------------------------------------------------------------------
// Roles without handlers and runtime availability
// -----------------------------------------------------------------------------

TEST_CASE("A role with no handler fails as not supported")
{
  BareBackend b;
  b.initialize();

  auto sink = b.run(PK_ROLE_ENUM_GET_CATEGORIES);

  REQUIRE(sink.finalized_once());
  REQUIRE(sink.error_code() == PK_ERROR_ENUM_NOT_SUPPORTED);
  REQUIRE(b.fake->calls.empty());
}

TEST_CASE("Runtime roles fail before initialize")
{
  BareBackend b;
  bool called = false;
  b.dispatcher.register_handler(PK_ROLE_ENUM_GET_PACKAGES,
                                [&called](Job &job, const JobArgs &, RuntimeManager &) {
                                  called = true;
                                  job.finish();
                                });

  auto sink = b.run(PK_ROLE_ENUM_GET_PACKAGES);

  REQUIRE_FALSE(called);
  REQUIRE(sink.finalized_once());
  REQUIRE(sink.error_code() == PK_ERROR_ENUM_FAILED_INITIALIZATION);
}

TEST_CASE("Runtime roles fail when the interpreter did not start")
{
  BareBackend b;
  b.fake->fail_start = true;
  b.initialize();
  b.dispatcher.register_handler(PK_ROLE_ENUM_GET_PACKAGES,
                                [](Job &job, const JobArgs &, RuntimeManager &) { job.finish(); });

  auto sink = b.run(PK_ROLE_ENUM_GET_PACKAGES);

  REQUIRE(sink.error_code() == PK_ERROR_ENUM_FAILED_INITIALIZATION);
  REQUIRE(sink.error_message().find("interpreter refused to start") != std::string::npos);
}

TEST_CASE("Acknowledged roles finish without a runtime")
{
  BareBackend b;
  b.dispatcher.register_acknowledgement(PK_ROLE_ENUM_REPAIR_SYSTEM);

  auto sink = b.run(PK_ROLE_ENUM_REPAIR_SYSTEM);

  REQUIRE(sink.finalized_once());
  REQUIRE_FALSE(sink.failed());
  REQUIRE(b.fake->calls.empty());
}

TEST_CASE("Re-entering the backend while a job runs is rejected")
{
  BareBackend b;
  b.initialize();
  RecordingSink inner;
  b.dispatcher.register_handler(PK_ROLE_ENUM_GET_PACKAGES,
                                [&b, &inner](Job &job, const JobArgs &args, RuntimeManager &) {
                                  b.dispatcher.dispatch(PK_ROLE_ENUM_GET_PACKAGES, inner, args);
                                  job.finish();
                                });

  auto outer = b.run(PK_ROLE_ENUM_GET_PACKAGES);

  REQUIRE(outer.finalized_once());
  REQUIRE_FALSE(outer.failed());
  REQUIRE(inner.finalized_once());
  REQUIRE(inner.error_code() == PK_ERROR_ENUM_INTERNAL_ERROR);

  // The guard is released once the outer job is done
  auto next = b.run(PK_ROLE_ENUM_GET_PACKAGES);
  REQUIRE(next.finalized_once());
}

// -----------------------------------------------------------------------------
// Registration queries
// -----------------------------------------------------------------------------

TEST_CASE("Unhandled roles lists advertised roles without handlers")
{
  BareBackend b;
  b.dispatcher.register_handler(PK_ROLE_ENUM_SEARCH_NAME,
                                [](Job &job, const JobArgs &, RuntimeManager &) { job.finish(); });

  PkBitfield roles = pk_bitfield_from_enums(PK_ROLE_ENUM_SEARCH_NAME, PK_ROLE_ENUM_GET_CATEGORIES, -1);
  auto missing = b.dispatcher.unhandled_roles(roles);

  REQUIRE(b.dispatcher.has_handler(PK_ROLE_ENUM_SEARCH_NAME));
  REQUIRE(missing == std::vector<PkRoleEnum> { PK_ROLE_ENUM_GET_CATEGORIES });
}

TEST_CASE("Default error codes follow the role kind")
{
  REQUIRE(default_error_for_role(PK_ROLE_ENUM_INSTALL_PACKAGES) == PK_ERROR_ENUM_TRANSACTION_ERROR);
  REQUIRE(default_error_for_role(PK_ROLE_ENUM_REMOVE_PACKAGES) == PK_ERROR_ENUM_TRANSACTION_ERROR);
  REQUIRE(default_error_for_role(PK_ROLE_ENUM_REPO_ENABLE) == PK_ERROR_ENUM_REPO_NOT_FOUND);
  REQUIRE(default_error_for_role(PK_ROLE_ENUM_DOWNLOAD_PACKAGES) == PK_ERROR_ENUM_PACKAGE_DOWNLOAD_FAILED);
  REQUIRE(default_error_for_role(PK_ROLE_ENUM_SEARCH_NAME) == PK_ERROR_ENUM_INTERNAL_ERROR);
}

TEST_CASE("strv_to_vector copies a NULL-terminated array")
{
  const gchar *values[] = { "nano", "vim", nullptr };

  REQUIRE(strv_to_vector(values) == std::vector<std::string> { "nano", "vim" });
  REQUIRE(strv_to_vector(nullptr).empty());
}
