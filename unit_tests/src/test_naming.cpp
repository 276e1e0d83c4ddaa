#include <catch2/catch.hpp>

#include "mbean_error_enum_matcher.hpp"
#include "unit_test_utils.hpp"

#include "mbean/mbean_exception.hpp"
#include "mbean/naming.hpp"

namespace utils = unit_test_utils;

TEST_CASE("get_object_name derives the type and domain from the interface", "[naming]")
{
    const auto name = mbean::get_object_name(&utils::thing_interface);

    CHECK(name.str() == "org.example:type=Thing");
    CHECK(name.domain() == "org.example");
    CHECK(name.key_property("type") == "Thing");
    CHECK(name == mbean::object_name{"org.example:type=Thing"});
}

TEST_CASE("get_object_name always carries the simple name of the interface", "[naming]")
{
    const auto* iface = GENERATE(&utils::thing_interface, &utils::counter_interface, &utils::gauge_interface);

    const auto name = mbean::get_object_name(iface);

    CHECK(name.domain() == iface->package_name());
    CHECK(name.key_property("type") == iface->simple_name());
    CHECK(name.key_properties().size() == 1);
}

TEST_CASE("get_object_name copies caller-supplied key properties", "[naming]")
{
    SECTION("type comes first")
    {
        const auto name = mbean::get_object_name(&utils::counter_interface, mbean::key_property_list{{"name", "a"}, {"zone", "b"}});
        CHECK(name.str() == "org.example:type=CounterMXBean,name=a,zone=b");
    }

    SECTION("last write wins on duplicate keys")
    {
        const auto name = mbean::get_object_name(&utils::counter_interface,
                                                 mbean::key_property_list{{"name", "a"}, {"zone", "b"}, {"name", "c"}});
        CHECK(name.str() == "org.example:type=CounterMXBean,name=c,zone=b");
    }

    SECTION("the type key property cannot be replaced")
    {
        const auto name = mbean::get_object_name(&utils::counter_interface, mbean::key_property_list{{"type", "Other"}});
        CHECK(name.str() == "org.example:type=CounterMXBean");
    }

    SECTION("single key property")
    {
        const auto name = mbean::get_object_name(&utils::counter_interface, "name", "a");
        CHECK(name.str() == "org.example:type=CounterMXBean,name=a");
    }

    SECTION("absent key properties")
    {
        CHECK(mbean::get_object_name(&utils::counter_interface, std::nullopt).str() == "org.example:type=CounterMXBean");
    }
}

TEST_CASE("get_object_name uses an empty domain for interfaces without a package", "[naming]")
{
    const mbean::interface_descriptor iface{"ThingMXBean", {}};
    CHECK(mbean::get_object_name(&iface).str() == ":type=ThingMXBean");
}

TEST_CASE("get_object_name rejects invalid input", "[naming]")
{
    SECTION("null interface")
    {
        try {
            mbean::get_object_name(nullptr);
            FAIL("expected an exception");
        }
        catch (const mbean::exception& e) {
            CHECK_THAT(e.code(), equals_mbean_error(INVALID_ARGUMENT));
        }
    }

    SECTION("malformed key property")
    {
        try {
            mbean::get_object_name(&utils::counter_interface, "name", "a,b");
            FAIL("expected an exception");
        }
        catch (const mbean::exception& e) {
            CHECK_THAT(e.code(), equals_mbean_error(INVALID_ARGUMENT));
            CHECK_THAT(utils::cause_code(e.cause()), equals_mbean_error(MALFORMED_OBJECT_NAME));
            CHECK_THAT(e.client_display_what(), Catch::Contains("org.example.CounterMXBean"));
            CHECK_THAT(e.what(), Catch::Contains("caused by"));
        }
    }
}
