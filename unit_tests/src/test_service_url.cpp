#include <catch2/catch.hpp>

#include "mbean_error_enum_matcher.hpp"

#include "mbean/mbean_exception.hpp"
#include "mbean/service_url.hpp"

#include <string>

TEST_CASE("make_registry_service_url repeats the host and port", "[service_url]")
{
    const auto url = mbean::make_registry_service_url("mgmt.example.org", 9999);

    CHECK(url.str() == "service:jmx:rmi://mgmt.example.org:9999/jndi/rmi://mgmt.example.org:9999/jmxrmi");
    CHECK(url.protocol() == "jmx");
    CHECK(url.transport() == "rmi");
    CHECK(url.host() == "mgmt.example.org");
    CHECK(url.port() == 9999);
    CHECK(url.url_path() == "/jndi/rmi://mgmt.example.org:9999/jmxrmi");
}

TEST_CASE("make_registry_service_url brackets IPv6 hosts", "[service_url]")
{
    const auto url = mbean::make_registry_service_url("::1", 1099);

    CHECK(url.str() == "service:jmx:rmi://[::1]:1099/jndi/rmi://[::1]:1099/jmxrmi");
    CHECK(url.host() == "::1");
    CHECK(url.port() == 1099);
}

TEST_CASE("service_url parses optional parts", "[service_url]")
{
    SECTION("no port and no path")
    {
        const mbean::service_url url{"service:jmx:jmxmp://localhost"};
        CHECK(url.transport() == "jmxmp");
        CHECK(url.host() == "localhost");
        CHECK_FALSE(url.port());
        CHECK(url.url_path().empty());
        CHECK(url.str() == "service:jmx:jmxmp://localhost");
    }

    SECTION("port without path")
    {
        const mbean::service_url url{"service:jmx:rmi://localhost:1099"};
        CHECK(url.port() == 1099);
        CHECK(url.url_path().empty());
    }

    SECTION("path without port")
    {
        const mbean::service_url url{"service:jmx:rmi://localhost/jndi/x"};
        CHECK_FALSE(url.port());
        CHECK(url.url_path() == "/jndi/x");
    }
}

TEST_CASE("service_url rejects malformed URLs", "[service_url]")
{
    const auto input = GENERATE(as<std::string>{},
                                "jmx:rmi://localhost:1099",
                                "service:jmx",
                                "service:jmx:rmi:localhost",
                                "service:jmx:rmi://",
                                "service:jmx:rmi://:1099",
                                "service:jmx:rmi://localhost:port",
                                "service:jmx:rmi://localhost:70000",
                                "service:jmx:rmi://[::1:1099",
                                "service:j mx:rmi://localhost",
                                "service:jmx:rmi://[::1]x");

    try {
        mbean::service_url{input};
        FAIL("expected an exception for " << input);
    }
    catch (const mbean::exception& e) {
        CHECK_THAT(e.code(), equals_mbean_error(MALFORMED_SERVICE_URL));
    }
}

TEST_CASE("make_registry_service_url rejects an empty host", "[service_url]")
{
    REQUIRE_THROWS_AS(mbean::make_registry_service_url("", 1099), mbean::exception);
}

TEST_CASE("make_registry_service_url rejects hosts that change the URL shape", "[service_url]")
{
    const auto host = GENERATE(as<std::string>{}, "evil/x", "a]b", "user@host", "[::1]", "bad host");

    try {
        mbean::make_registry_service_url(host, 1099);
        FAIL("expected an exception for host " << host);
    }
    catch (const mbean::exception& e) {
        CHECK_THAT(e.code(), equals_mbean_error(MALFORMED_SERVICE_URL));
    }
}
