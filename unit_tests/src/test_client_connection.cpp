#include <catch2/catch.hpp>

#include "at_scope_exit.hpp"
#include "mbean_error_enum_matcher.hpp"
#include "unit_test_utils.hpp"

#include "mbean/client_connection.hpp"
#include "mbean/connector_factory.hpp"
#include "mbean/local_registry.hpp"
#include "mbean/loopback_connector.hpp"
#include "mbean/mbean_exception.hpp"
#include "mbean/naming.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <utility>

namespace utils = unit_test_utils;

namespace
{
    const mbean::endpoint test_endpoint{"localhost", 9999, "rods", "secret"};

    struct close_failure
    {
        int code;
    };

    class non_standard_failing_connector : public mbean::connector
    {
    public:
        explicit non_standard_failing_connector(int& _close_calls)
            : close_calls_{&_close_calls}
        {
        }

        auto connection() -> mbean::registry_connection& override { return registry_; }

        auto close() -> void override
        {
            ++*close_calls_;
            throw close_failure{42};
        }

    private:
        int* close_calls_;
        unit_test_utils::fake_registry registry_;
    }; // class non_standard_failing_connector
} // anonymous namespace

TEST_CASE("client_connection closes exactly once", "[client_connection]")
{
    utils::fake_registry registry;
    auto provider = std::make_shared<utils::counting_connector_provider>(registry);

    auto& factory = mbean::connector_factory::instance();
    factory.add_provider("rmi", provider);
    unit_test_utils::at_scope_exit remove_provider{[&factory] { factory.remove_provider("rmi"); }};

    SECTION("on destruction")
    {
        {
            mbean::client_connection conn{test_endpoint};
            REQUIRE(conn);
            CHECK(provider->open.load() == 1);
            CHECK(static_cast<mbean::registry_connection&>(conn).is_registered(mbean::object_name{"a:b=c"}));
        }

        CHECK(provider->connects.load() == 1);
        CHECK(provider->closes.load() == 1);
        CHECK(provider->open.load() == 0);
        CHECK(provider->last_url() == "service:jmx:rmi://localhost:9999/jndi/rmi://localhost:9999/jmxrmi");
        CHECK(provider->last_login() == "rods");
    }

    SECTION("on explicit disconnect")
    {
        mbean::client_connection conn{test_endpoint};
        conn.disconnect();
        CHECK_FALSE(conn);
        conn.disconnect();
        CHECK(provider->closes.load() == 1);
    }

    SECTION("after a move")
    {
        {
            mbean::client_connection conn{test_endpoint};
            mbean::client_connection other{std::move(conn)};
            CHECK(other);
        }

        CHECK(provider->connects.load() == 1);
        CHECK(provider->closes.load() == 1);
    }

    SECTION("when reconnecting")
    {
        mbean::client_connection conn{test_endpoint};
        conn.connect(test_endpoint);
        CHECK(provider->connects.load() == 2);
        CHECK(provider->closes.load() == 1);
    }

    SECTION("when closing fails")
    {
        provider->fail_close = true;

        {
            mbean::client_connection conn{test_endpoint};
        }

        CHECK(provider->closes.load() == 1);
    }
}

TEST_CASE("client_connection can defer connecting", "[client_connection]")
{
    mbean::client_connection conn{mbean::defer_connection};

    CHECK_FALSE(conn);
    CHECK(static_cast<mbean::connector*>(conn) == nullptr);

    try {
        static_cast<void>(static_cast<mbean::registry_connection&>(conn));
        FAIL("expected an exception");
    }
    catch (const mbean::exception& e) {
        CHECK_THAT(e.code(), equals_mbean_error(TRANSPORT_ERROR));
    }
}

TEST_CASE("connector_factory selects providers by transport", "[client_connection][connector_factory]")
{
    auto& factory = mbean::connector_factory::instance();

    utils::fake_registry registry;
    auto provider = std::make_shared<utils::counting_connector_provider>(registry);

    CHECK_FALSE(factory.has_provider("jmxmp"));

    factory.add_provider("jmxmp", provider);
    utils::at_scope_exit remove_provider{[&factory] { factory.remove_provider("jmxmp"); }};

    CHECK(factory.has_provider("jmxmp"));

    auto conn = factory.connect(mbean::service_url{"service:jmx:jmxmp://localhost:5555"}, {"rods", "secret"});
    REQUIRE(conn);
    CHECK(provider->connects.load() == 1);
    CHECK(provider->last_url() == "service:jmx:jmxmp://localhost:5555");
    CHECK(provider->last_login() == "rods");

    mbean::close(conn.release());
    CHECK(provider->closes.load() == 1);

    factory.remove_provider("jmxmp");
    CHECK_FALSE(factory.has_provider("jmxmp"));

    try {
        static_cast<void>(factory.connect(mbean::service_url{"service:jmx:jmxmp://localhost:5555"}, {"rods", "secret"}));
        FAIL("expected an exception");
    }
    catch (const mbean::exception& e) {
        CHECK_THAT(e.code(), equals_mbean_error(CONNECTOR_PROVIDER_NOT_FOUND));
    }
}

TEST_CASE("connect reports failures as CONNECT_FAILED", "[client_connection]")
{
    auto& factory = mbean::connector_factory::instance();

    SECTION("no provider for the transport")
    {
        factory.remove_provider("rmi");

        try {
            mbean::client_connection conn{test_endpoint};
            FAIL("expected an exception");
        }
        catch (const mbean::exception& e) {
            CHECK_THAT(e.code(), equals_mbean_error(CONNECT_FAILED));
            CHECK_THAT(utils::cause_code(e.cause()), equals_mbean_error(CONNECTOR_PROVIDER_NOT_FOUND));
        }
    }

    SECTION("transport error")
    {
        utils::fake_registry registry;
        auto provider = std::make_shared<utils::counting_connector_provider>(registry);
        provider->fail_connect = true;

        factory.add_provider("rmi", provider);
        unit_test_utils::at_scope_exit remove_provider{[&factory] { factory.remove_provider("rmi"); }};

        try {
            static_cast<void>(mbean::connect(test_endpoint));
            FAIL("expected an exception");
        }
        catch (const mbean::exception& e) {
            CHECK_THAT(e.code(), equals_mbean_error(CONNECT_FAILED));
            CHECK_THAT(utils::cause_code(e.cause()), equals_mbean_error(TRANSPORT_ERROR));
        }

        CHECK(provider->open.load() == 0);
        CHECK(provider->closes.load() == 0);
    }

    SECTION("host that cannot form a service URL")
    {
        utils::fake_registry registry;
        auto provider = std::make_shared<utils::counting_connector_provider>(registry);

        factory.add_provider("rmi", provider);
        unit_test_utils::at_scope_exit remove_provider{[&factory] { factory.remove_provider("rmi"); }};

        try {
            static_cast<void>(mbean::connect(mbean::endpoint{"evil/x", 1099, "rods", "secret"}));
            FAIL("expected an exception");
        }
        catch (const mbean::exception& e) {
            CHECK_THAT(e.code(), equals_mbean_error(CONNECT_FAILED));
            CHECK_THAT(utils::cause_code(e.cause()), equals_mbean_error(MALFORMED_SERVICE_URL));
        }

        CHECK(provider->connects.load() == 0);
    }
}

TEST_CASE("close ignores null connections", "[client_connection]")
{
    CHECK_NOTHROW(mbean::close(nullptr));
}

TEST_CASE("close discards errors of any type", "[client_connection]")
{
    int close_calls = 0;

    CHECK_NOTHROW(mbean::close(new non_standard_failing_connector{close_calls}));
    CHECK(close_calls == 1);

    close_calls = 0;

    {
        mbean::client_connection conn{std::make_unique<non_standard_failing_connector>(close_calls)};
        REQUIRE(conn);
    }

    CHECK(close_calls == 1);
}

TEST_CASE("loopback connector authenticates and forwards to the registry", "[client_connection][loopback]")
{
    mbean::local_registry registry;
    const auto name = mbean::get_object_name(&utils::counter_interface);
    registry.register_object(std::make_shared<utils::counter>(), name);

    auto& factory = mbean::connector_factory::instance();
    factory.add_provider("rmi",
                         std::make_shared<mbean::loopback_connector_provider>(
                             registry, std::unordered_map<std::string, std::string>{{"rods", "secret"}}));
    unit_test_utils::at_scope_exit remove_provider{[&factory] { factory.remove_provider("rmi"); }};

    SECTION("valid credentials")
    {
        mbean::client_connection conn{test_endpoint};
        auto& reg = static_cast<mbean::registry_connection&>(conn);

        CHECK(reg.is_registered(name));
        CHECK(reg.invoke(name, "add", nlohmann::json::array({5})) == 5);
    }

    SECTION("invalid credentials")
    {
        auto ep = test_endpoint;
        ep.password = "wrong";

        try {
            mbean::client_connection conn{ep};
            FAIL("expected an exception");
        }
        catch (const mbean::exception& e) {
            CHECK_THAT(e.code(), equals_mbean_error(CONNECT_FAILED));
            CHECK_THAT(utils::cause_code(e.cause()), equals_mbean_error(AUTHENTICATION_FAILED));
        }
    }

    SECTION("use after close")
    {
        auto conn = mbean::connect(test_endpoint);
        auto& reg = conn->connection();

        conn->close();

        REQUIRE_THROWS_AS(reg.is_registered(name), mbean::exception);
        REQUIRE_THROWS_AS(conn->connection(), mbean::exception);
        REQUIRE_THROWS_AS(conn->close(), mbean::exception);

        // Closing again is logged and discarded.
        mbean::close(conn.release());
    }
}
