#include <catch2/catch.hpp>

#include "mbean_error_enum_matcher.hpp"

#include "mbean/mbean_exception.hpp"
#include "mbean/object_name.hpp"

#include <sstream>
#include <string>
#include <unordered_set>

TEST_CASE("object_name parses the string form", "[object_name]")
{
    const mbean::object_name name{"org.example:type=Thing,name=first"};

    CHECK(name.domain() == "org.example");
    REQUIRE(name.key_properties().size() == 2);
    CHECK(name.key_properties()[0] == mbean::key_property{"type", "Thing"});
    CHECK(name.key_properties()[1] == mbean::key_property{"name", "first"});
    CHECK(name.key_property("name") == "first");
    CHECK_FALSE(name.key_property("missing"));
}

TEST_CASE("object_name string forms", "[object_name]")
{
    const mbean::object_name name{"org.example", {{"type", "Thing"}, {"name", "first"}}};

    CHECK(name.str() == "org.example:type=Thing,name=first");
    CHECK(name.key_property_list_string() == "type=Thing,name=first");
    CHECK(name.canonical_key_property_list_string() == "name=first,type=Thing");
    CHECK(name.canonical_name() == "org.example:name=first,type=Thing");

    std::ostringstream ss;
    ss << name;
    CHECK(ss.str() == name.str());
}

TEST_CASE("object_name survives a round trip through its string form", "[object_name]")
{
    const auto input = GENERATE(as<std::string>{},
                                "org.example:type=Thing",
                                "org.example:type=Thing,name=first",
                                ":type=Thing",
                                "a.b.c:z=1,y=2,x=",
                                "domain with spaces:key=value with spaces");

    const mbean::object_name name{input};
    const mbean::object_name parsed{name.str()};

    CHECK(parsed == name);
    CHECK(parsed.str() == name.str());
    CHECK(mbean::object_name{name.canonical_name()} == name);
}

TEST_CASE("object_name equality ignores the order of key properties", "[object_name]")
{
    const mbean::object_name a{"org.example:type=Thing,name=first"};
    const mbean::object_name b{"org.example:name=first,type=Thing"};
    const mbean::object_name c{"org.example:type=Thing,name=second"};
    const mbean::object_name d{"com.example:type=Thing,name=first"};

    CHECK(a == b);
    CHECK(a != c);
    CHECK(a != d);

    std::unordered_set<mbean::object_name> names{a, b, c, d};
    CHECK(names.size() == 3);
}

TEST_CASE("object_name rejects malformed names", "[object_name]")
{
    const auto input = GENERATE(as<std::string>{},
                                "no-domain-separator",
                                "org.example:",
                                "org.example:type",
                                "org.example:=Thing",
                                "org.example:type=Thing,",
                                "org.example:type=Thing,,name=a",
                                "org.example:type=Thing,type=Other",
                                "org.example:type=Th*ng",
                                "org.example:type=\"Thing\"",
                                "org.ex?mple:type=Thing",
                                "org.example:ty,pe=Thing");

    try {
        mbean::object_name{input};
        FAIL("expected an exception for " << input);
    }
    catch (const mbean::exception& e) {
        CHECK_THAT(e.code(), equals_mbean_error(MALFORMED_OBJECT_NAME));
    }
}

TEST_CASE("object_name validates key properties passed as a list", "[object_name]")
{
    SECTION("empty list")
    {
        REQUIRE_THROWS_AS(mbean::object_name("org.example", mbean::key_property_list{}), mbean::exception);
    }

    SECTION("illegal character in value")
    {
        REQUIRE_THROWS_WITH(mbean::object_name("org.example", "type", "a:b"), Catch::Contains("illegal character"));
    }

    SECTION("illegal character in domain")
    {
        REQUIRE_THROWS_WITH(mbean::object_name("org:example", "type", "Thing"), Catch::Contains("Domain"));
    }

    SECTION("duplicate keys")
    {
        REQUIRE_THROWS_WITH(mbean::object_name("org.example", {{"type", "a"}, {"type", "b"}}),
                            Catch::Contains("more than once"));
    }
}
