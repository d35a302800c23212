#include <catch2/catch.hpp>
#include <monolith/resolver.hpp>

using namespace monolith;

// {"a": {"b": [10, 20, 30]}, "user": {"name": "Ada", "tags": ["x", "y"]}}
static Value sample_context() {
    return Value::object({
        {"a", Value::object({
            {"b", Value::array({Value::integer(10), Value::integer(20), Value::integer(30)})},
        })},
        {"user", Value::object({
            {"name", Value::string("Ada")},
            {"tags", Value::array({Value::string("x"), Value::string("y")})},
        })},
        {"education", Value::array({
            Value::object({{"institute", Value::string("MIT")}}),
        })},
    });
}

// ===== PathExpr =====

TEST_CASE("parse plain dotted path", "[resolver]") {
    auto pe = PathExpr::parse("  user.name ");
    REQUIRE(pe.segments == std::vector<std::string>{"user", "name"});
    REQUIRE_FALSE(pe.fallback.has_value());
}

TEST_CASE("parse path with default filter", "[resolver]") {
    auto pe = PathExpr::parse("education.2.institute | default:'N/A'");
    REQUIRE(pe.segments == std::vector<std::string>{"education", "2", "institute"});
    REQUIRE(pe.fallback == std::string("N/A"));
}

TEST_CASE("default filter accepts double quotes and spacing", "[resolver]") {
    REQUIRE(PathExpr::parse("x|default:\"none\"").fallback == std::string("none"));
    REQUIRE(PathExpr::parse("x | default: 'a b' ").fallback == std::string("a b"));
    REQUIRE(PathExpr::parse("x | default:''").fallback == std::string(""));
}

TEST_CASE("filters other than default are ignored", "[resolver]") {
    auto pe = PathExpr::parse("x | upper");
    REQUIRE(pe.segments == std::vector<std::string>{"x"});
    REQUIRE_FALSE(pe.fallback.has_value());
}

// ===== Resolution =====

TEST_CASE("resolve through mappings and sequences", "[resolver]") {
    auto ctx = sample_context();
    auto r = resolve("a.b.1", ctx);
    REQUIRE(r.found());
    REQUIRE(r.value.as_integer() == 20);

    REQUIRE(resolve("education.0.institute", ctx).value.as_string() == "MIT");
}

TEST_CASE("resolve returns native kinds", "[resolver]") {
    auto r = resolve("user.tags", sample_context());
    REQUIRE(r.found());
    REQUIRE(r.value.is_array());
    REQUIRE(r.value.size() == 2);
}

TEST_CASE("out-of-range index is absent", "[resolver]") {
    auto r = resolve("a.b.9", sample_context());
    REQUIRE(r.absent());
}

TEST_CASE("out-of-range index uses the default", "[resolver]") {
    auto r = resolve("a.b.9 | default:'none'", sample_context());
    REQUIRE(r.state == Resolution::Defaulted);
    REQUIRE(r.value.as_string() == "none");
}

TEST_CASE("descending into a scalar fails", "[resolver]") {
    REQUIRE(resolve("user.name.first", sample_context()).absent());
    REQUIRE(resolve("a.b.1.x", sample_context()).absent());
}

TEST_CASE("non-digit segment on a sequence fails", "[resolver]") {
    REQUIRE(resolve("a.b.first", sample_context()).absent());
    REQUIRE(resolve("a.b.-1", sample_context()).absent());
}

TEST_CASE("digit segment on a mapping is a key", "[resolver]") {
    auto ctx = Value::object({{"2024", Value::string("leap")}});
    REQUIRE(resolve("2024", ctx).value.as_string() == "leap");
}

TEST_CASE("huge index is out of range, not an exception", "[resolver]") {
    REQUIRE(resolve("a.b.99999999999999999999999", sample_context()).absent());
}

TEST_CASE("found value wins over default", "[resolver]") {
    auto r = resolve("user.name | default:'anon'", sample_context());
    REQUIRE(r.found());
    REQUIRE(r.value.as_string() == "Ada");
}

// ===== Substitution =====

TEST_CASE("substitute renders display text", "[resolver]") {
    auto ctx = sample_context();
    REQUIRE(substitute("a.b.1", ctx) == "20");
    REQUIRE(substitute("a.b.9", ctx) == "");
    REQUIRE(substitute("missing.path | default:'N/A'", ctx) == "N/A");
    REQUIRE(substitute("user.tags", ctx) == "[\"x\", \"y\"]");
}

TEST_CASE("string helpers", "[resolver]") {
    REQUIRE(trim("  a b \n") == "a b");
    REQUIRE(strip_quotes("'abc'") == "abc");
    REQUIRE(strip_quotes("\"abc\"") == "abc");
    REQUIRE(strip_quotes("abc") == "abc");
    REQUIRE(is_all_digits("0123"));
    REQUIRE_FALSE(is_all_digits(""));
    REQUIRE_FALSE(is_all_digits("1a"));
}
