#include <catch2/catch.hpp>

#include "at_scope_exit.hpp"
#include "mbean_error_enum_matcher.hpp"
#include "unit_test_utils.hpp"

#include "mbean/connector_factory.hpp"
#include "mbean/implementation_registry.hpp"
#include "mbean/local_registry.hpp"
#include "mbean/loopback_connector.hpp"
#include "mbean/management.hpp"
#include "mbean/mbean_configuration_keywords.hpp"
#include "mbean/mbean_exception.hpp"
#include "mbean/naming.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <unordered_map>

namespace utils = unit_test_utils;

using json = nlohmann::json;

TEST_CASE("register and unregister are idempotent", "[management]")
{
    const mbean::implementation_registration<utils::thing> registration{utils::thing_interface};
    unit_test_utils::at_scope_exit cleanup{[] { mbean::implementation_registry::instance().remove_all(utils::thing_interface); }};

    auto& registry = mbean::platform_registry();

    const auto name = mbean::register_managed_object(&utils::thing_interface);
    CHECK(name.str() == "org.example:type=Thing");
    CHECK(registry.is_registered(name));
    CHECK(registry.query_all().size() == 1);

    const auto again = mbean::register_managed_object(&utils::thing_interface);
    CHECK(again == name);
    CHECK(again.str() == name.str());
    CHECK(registry.query_all().size() == 1);

    mbean::unregister_managed_object(name);
    CHECK_FALSE(registry.is_registered(name));

    CHECK_NOTHROW(mbean::unregister_managed_object(name));
    CHECK(registry.query_all().empty());
}

TEST_CASE("register derives names from key properties", "[management]")
{
    const mbean::implementation_registration<utils::counter> registration{utils::counter_interface};
    unit_test_utils::at_scope_exit cleanup{[] { mbean::implementation_registry::instance().remove_all(utils::counter_interface); }};

    const auto first = mbean::register_managed_object(&utils::counter_interface, "name", "first");
    const auto second = mbean::register_managed_object(&utils::counter_interface, mbean::key_property_list{{"name", "second"}});
    const auto third = mbean::register_managed_object(&utils::counter_interface, mbean::object_name{"custom:id=3"});

    unit_test_utils::at_scope_exit unregister{[&] {
        mbean::unregister_managed_object(first);
        mbean::unregister_managed_object(second);
        mbean::unregister_managed_object(third);
    }};

    CHECK(first.str() == "org.example:type=CounterMXBean,name=first");
    CHECK(second.str() == "org.example:type=CounterMXBean,name=second");
    CHECK(third.str() == "custom:id=3");
    CHECK(mbean::platform_registry().query_all().size() == 3);
}

TEST_CASE("register reports invalid arguments", "[management]")
{
    SECTION("null interface")
    {
        try {
            mbean::register_managed_object(nullptr);
            FAIL("expected an exception");
        }
        catch (const mbean::exception& e) {
            CHECK_THAT(e.code(), equals_mbean_error(INVALID_ARGUMENT));
        }
    }

    SECTION("no implementation")
    {
        REQUIRE_THROWS_WITH(mbean::register_managed_object(&utils::gauge_interface),
                            Catch::Contains("No managed object implementation found"));
    }

    SECTION("several implementations")
    {
        auto& impls = mbean::implementation_registry::instance();
        unit_test_utils::at_scope_exit cleanup{[&impls] { impls.remove_all(utils::gauge_interface); }};

        impls.add(utils::gauge_interface, [] { return std::make_shared<utils::counter>(); });
        impls.add(utils::gauge_interface, [] { return std::make_shared<utils::counter>(); });

        try {
            mbean::register_managed_object(&utils::gauge_interface);
            FAIL("expected an exception");
        }
        catch (const mbean::exception& e) {
            CHECK_THAT(e.code(), equals_mbean_error(INVALID_ARGUMENT));
            CHECK_THAT(e.client_display_what(), Catch::Contains("More than one"));
        }
    }

    CHECK(mbean::platform_registry().query_all().empty());
}

TEST_CASE("register and unregister wrap registry errors", "[management]")
{
    const mbean::implementation_registration<utils::counter> registration{utils::counter_interface};
    unit_test_utils::at_scope_exit cleanup{[] { mbean::implementation_registry::instance().remove_all(utils::counter_interface); }};

    utils::fake_registry registry;
    const auto name = mbean::get_object_name(&utils::counter_interface);

    SECTION("register fails")
    {
        registry.registered = false;
        registry.register_error = TRANSPORT_ERROR;

        try {
            mbean::register_managed_object(registry, &utils::counter_interface);
            FAIL("expected an exception");
        }
        catch (const mbean::exception& e) {
            CHECK_THAT(e.code(), equals_mbean_error(OPERATION_FAILED));
            CHECK_THAT(e.client_display_what(), Catch::Contains(name.canonical_name()));
            CHECK_THAT(utils::cause_code(e.cause()), equals_mbean_error(TRANSPORT_ERROR));
        }
    }

    SECTION("registry rejects the object as an invalid argument")
    {
        registry.registered = false;
        registry.register_error = INVALID_ARGUMENT;

        try {
            mbean::register_managed_object(registry, &utils::counter_interface);
            FAIL("expected an exception");
        }
        catch (const mbean::exception& e) {
            CHECK_THAT(e.code(), equals_mbean_error(OPERATION_FAILED));
            CHECK_THAT(utils::cause_code(e.cause()), equals_mbean_error(INVALID_ARGUMENT));
        }
    }

    SECTION("registration check raises an invalid argument")
    {
        registry.is_registered_error = INVALID_ARGUMENT;

        try {
            mbean::register_managed_object(registry, &utils::counter_interface);
            FAIL("expected an exception");
        }
        catch (const mbean::exception& e) {
            CHECK_THAT(e.code(), equals_mbean_error(OPERATION_FAILED));
            CHECK_THAT(utils::cause_code(e.cause()), equals_mbean_error(INVALID_ARGUMENT));
        }

        CHECK(registry.register_calls.load() == 0);
    }

    SECTION("registered concurrently")
    {
        registry.registered = false;
        registry.register_error = INSTANCE_ALREADY_EXISTS;

        CHECK(mbean::register_managed_object(registry, &utils::counter_interface) == name);
        CHECK(registry.register_calls.load() == 1);
    }

    SECTION("already registered")
    {
        CHECK(mbean::register_managed_object(registry, &utils::counter_interface, name) == name);
        CHECK(registry.register_calls.load() == 0);
    }

    SECTION("registration check fails")
    {
        registry.is_registered_error = TRANSPORT_ERROR;
        REQUIRE_THROWS_AS(mbean::register_managed_object(registry, &utils::counter_interface), mbean::exception);
        REQUIRE_THROWS_AS(mbean::unregister_managed_object(registry, name), mbean::exception);
    }

    SECTION("unregister fails")
    {
        registry.unregister_error = TRANSPORT_ERROR;

        try {
            mbean::unregister_managed_object(registry, name);
            FAIL("expected an exception");
        }
        catch (const mbean::exception& e) {
            CHECK_THAT(e.code(), equals_mbean_error(OPERATION_FAILED));
            CHECK_THAT(e.client_display_what(), Catch::Contains(name.canonical_name()));
        }
    }

    SECTION("unregistered concurrently")
    {
        registry.unregister_error = INSTANCE_NOT_FOUND;
        CHECK_NOTHROW(mbean::unregister_managed_object(registry, name));
        CHECK(registry.unregister_calls.load() == 1);
    }

    SECTION("not registered")
    {
        registry.registered = false;
        CHECK_NOTHROW(mbean::unregister_managed_object(registry, name));
        CHECK(registry.unregister_calls.load() == 0);
    }
}

TEST_CASE("get_managed_object returns a validated local caller", "[management]")
{
    const mbean::implementation_registration<utils::counter> registration{utils::counter_interface};
    unit_test_utils::at_scope_exit cleanup{[] { mbean::implementation_registry::instance().remove_all(utils::counter_interface); }};

    const auto name = mbean::register_managed_object(&utils::counter_interface);
    unit_test_utils::at_scope_exit unregister{[&name] { mbean::unregister_managed_object(name); }};

    const auto caller = mbean::get_managed_object(&utils::counter_interface);

    REQUIRE(caller);
    CHECK(caller->name() == name);
    CHECK(caller->call("add", json::array({4})) == 4);
    CHECK(caller->call("getCount", nullptr) == 4);

    REQUIRE_THROWS_WITH(mbean::get_managed_object(&utils::counter_interface, mbean::object_name{"org.example:type=Missing"}),
                        Catch::Contains("not registered"));
    REQUIRE_THROWS_AS(mbean::get_managed_object(&utils::thing_interface), mbean::exception);
}

TEST_CASE("get_managed_object returns a remote caller", "[management][loopback]")
{
    const mbean::implementation_registration<utils::counter> registration{utils::counter_interface};
    unit_test_utils::at_scope_exit cleanup{[] { mbean::implementation_registry::instance().remove_all(utils::counter_interface); }};

    const auto name = mbean::register_managed_object(&utils::counter_interface);
    unit_test_utils::at_scope_exit unregister{[&name] { mbean::unregister_managed_object(name); }};

    auto& factory = mbean::connector_factory::instance();
    factory.add_provider("rmi",
                         std::make_shared<mbean::loopback_connector_provider>(
                             mbean::platform_registry(), std::unordered_map<std::string, std::string>{{"rods", "secret"}}));
    unit_test_utils::at_scope_exit remove_provider{[&factory] { factory.remove_provider("rmi"); }};

    mbean::configuration_parser config;
    config.load(json{{mbean::KW_CFG_MBEAN_HOST, "localhost"},
                     {mbean::KW_CFG_MBEAN_PORT, 9999},
                     {mbean::KW_CFG_MBEAN_LOGIN, "rods"},
                     {mbean::KW_CFG_MBEAN_PASSWORD, "secret"}});

    const auto remote = mbean::get_managed_object(&utils::counter_interface, config);
    const auto local = mbean::get_managed_object(&utils::counter_interface);

    CHECK(remote->call("add", json::array({10})) == 10);
    CHECK(local->call("getCount", json::array()) == 10);
    CHECK(mbean::get_managed_object(&utils::counter_interface, name, config)->call("getCount", nullptr) == 10);
}
