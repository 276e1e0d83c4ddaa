#include <catch2/catch.hpp>

#include "at_scope_exit.hpp"
#include "mbean_error_enum_matcher.hpp"
#include "unit_test_utils.hpp"

#include "mbean/implementation_registry.hpp"
#include "mbean/mbean_exception.hpp"

#include <memory>

namespace utils = unit_test_utils;

TEST_CASE("implementation_registry creates the single implementation", "[implementation_registry]")
{
    auto& registry = mbean::implementation_registry::instance();
    unit_test_utils::at_scope_exit cleanup{[&registry] { registry.remove_all(utils::counter_interface); }};

    CHECK(registry.count(utils::counter_interface) == 0);

    const mbean::implementation_registration<utils::counter> registration{utils::counter_interface};
    CHECK(registry.count(utils::counter_interface) == 1);

    const auto first = registry.create(utils::counter_interface);
    const auto second = registry.create(utils::counter_interface);

    REQUIRE(first);
    REQUIRE(second);
    CHECK(first != second);
    CHECK(first->is_instance_of(utils::counter_interface.qualified_name()));
}

TEST_CASE("implementation_registry requires exactly one implementation", "[implementation_registry]")
{
    auto& registry = mbean::implementation_registry::instance();
    unit_test_utils::at_scope_exit cleanup{[&registry] { registry.remove_all(utils::gauge_interface); }};

    SECTION("no implementation")
    {
        REQUIRE_THROWS_WITH(registry.create(utils::gauge_interface),
                            Catch::Contains("No managed object implementation found for org.example.GaugeMXBean"));
    }

    SECTION("several implementations")
    {
        registry.add(utils::gauge_interface, [] { return std::make_shared<utils::counter>(); });
        registry.add(utils::gauge_interface, [] { return std::make_shared<utils::thing>(); });

        CHECK(registry.count(utils::gauge_interface) == 2);

        try {
            registry.create(utils::gauge_interface);
            FAIL("expected an exception");
        }
        catch (const mbean::exception& e) {
            CHECK_THAT(e.code(), equals_mbean_error(INVALID_ARGUMENT));
            CHECK_THAT(e.client_display_what(), Catch::Contains("More than one"));
        }
    }

    SECTION("factory returning null")
    {
        registry.add(utils::gauge_interface, [] { return std::shared_ptr<mbean::managed_object>{}; });
        REQUIRE_THROWS_AS(registry.create(utils::gauge_interface), mbean::exception);
    }

    SECTION("empty factory")
    {
        REQUIRE_THROWS_AS(registry.add(utils::gauge_interface, nullptr), mbean::exception);
        CHECK(registry.count(utils::gauge_interface) == 0);
    }
}
