#include <cachet/core/exception.h>

#include <cachet/utilities/errors.h>
#include <cachet/utilities/testing.h>

using namespace cachet;

namespace {

CACHET_DEFINE_EXCEPTION(test_failure)
CACHET_DEFINE_ERROR_INFO(string, test_detail)

} // namespace

TEST_CASE("error info", "[core][exception]")
{
    test_failure error;
    error << test_detail_info("asdf");

    REQUIRE(get_required_error_info<test_detail_info>(error) == "asdf");

    try
    {
        get_required_error_info<internal_error_message_info>(error);
        FAIL("no exception thrown");
    }
    catch (missing_error_info& e)
    {
        get_required_error_info<error_info_id_info>(e);
        get_required_error_info<wrapped_exception_diagnostics_info>(e);
    }
}

TEST_CASE("thrown exceptions", "[core][exception]")
{
    try
    {
        CACHET_THROW(test_failure() << test_detail_info("details"));
        FAIL("no exception thrown");
    }
    catch (test_failure& e)
    {
        REQUIRE(get_required_error_info<test_detail_info>(e) == "details");
        INFO("CACHET_THROW attaches a stacktrace.");
        REQUIRE(get_error_info<stacktrace_info>(e) != nullptr);
        INFO("what() includes the error info.");
        REQUIRE(string(e.what()).find("details") != string::npos);
    }
}
