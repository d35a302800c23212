#include <catch2/catch.hpp>
#include <monolith/tmpl/parser.hpp>

using namespace monolith;

TEST_CASE("parse empty template", "[parser]") {
    auto t = parse_template("");
    REQUIRE(t.nodes.empty());
    REQUIRE(t.unmatched.empty());
}

TEST_CASE("parse text and variables", "[parser]") {
    auto t = parse_template("Hello {{ name }}!");
    REQUIRE(t.nodes.size() == 3);
    CHECK(t.nodes[0].kind == Node::Text);
    CHECK(t.nodes[1].kind == Node::Variable);
    CHECK(t.nodes[1].expr == "name");
    CHECK(t.nodes[2].text == "!");
}

TEST_CASE("parse if with all branch kinds", "[parser]") {
    auto t = parse_template(
        "{%1 if x==1 %}one{%1 elseif x==2 %}two{%1 else %}other{%1 endif %}");
    REQUIRE(t.nodes.size() == 1);
    const auto& n = t.nodes[0];
    REQUIRE(n.kind == Node::If);
    CHECK(n.block_id == "1");
    REQUIRE(n.branches.size() == 3);
    CHECK(n.branches[0].condition == std::string("x==1"));
    CHECK(n.branches[0].body[0].text == "one");
    CHECK(n.branches[1].condition == std::string("x==2"));
    CHECK_FALSE(n.branches[2].condition.has_value());
    CHECK(n.branches[2].body[0].text == "other");
}

TEST_CASE("nested groups keep their own branch tags", "[parser]") {
    auto t = parse_template(
        "{%1 if true %}A{%2 if false %}B{%2 else %}C{%2 endif %}D{%1 endif %}");
    REQUIRE(t.nodes.size() == 1);
    const auto& outer = t.nodes[0];
    REQUIRE(outer.branches.size() == 1);

    const auto& body = outer.branches[0].body;
    REQUIRE(body.size() == 3);
    CHECK(body[0].text == "A");
    REQUIRE(body[1].kind == Node::If);
    CHECK(body[1].branches.size() == 2);
    CHECK(body[2].text == "D");
}

TEST_CASE("branch tags of an outer id inside a nested group stay nested", "[parser]") {
    auto t = parse_template(
        "{%1 if a %}{%2 if b %}X{%1 else %}Y{%2 endif %}{%1 endif %}");
    const auto& outer = t.nodes[0];
    REQUIRE(outer.kind == Node::If);
    REQUIRE(outer.branches.size() == 1);

    const auto& inner = outer.branches[0].body[0];
    REQUIRE(inner.kind == Node::If);
    REQUIRE(inner.branches.size() == 1);
    CHECK(inner.branches[0].body[0].text == "X{%1 else %}Y");
    REQUIRE(t.unmatched.size() == 1);
    CHECK(t.unmatched[0].text == "{%1 else %}");
}

TEST_CASE("parse for loop", "[parser]") {
    auto t = parse_template("<ul>{%1 for p in posts %}<li>{{ p.title }}</li>{%1 endfor %}</ul>");
    REQUIRE(t.nodes.size() == 3);
    const auto& loop = t.nodes[1];
    REQUIRE(loop.kind == Node::For);
    CHECK(loop.var == "p");
    CHECK(loop.expr == "posts");
    REQUIRE(loop.body.size() == 3);
    CHECK(loop.body[1].kind == Node::Variable);
}

TEST_CASE("mismatched ids leave tags as text", "[parser]") {
    auto t = parse_template("{%1 if true %}body{%2 endif %}");
    REQUIRE(t.nodes.size() == 1);
    CHECK(t.nodes[0].kind == Node::Text);
    CHECK(t.nodes[0].text == "{%1 if true %}body{%2 endif %}");
    REQUIRE(t.unmatched.size() == 2);
}

TEST_CASE("unterminated loop is text", "[parser]") {
    auto t = parse_template("{%4 for x in xs %}{{ x }}");
    REQUIRE(t.nodes.size() == 2);
    CHECK(t.nodes[0].text == "{%4 for x in xs %}");
    CHECK(t.nodes[1].kind == Node::Variable);
    REQUIRE(t.unmatched.size() == 1);
    CHECK(t.unmatched[0].pos.col == 1);
}

TEST_CASE("opening tag pairs with the first closer of its id", "[parser]") {
    auto t = parse_template("{%1 if a %}x{%1 endif %}y{%1 endif %}");
    REQUIRE(t.nodes.size() == 2);
    CHECK(t.nodes[0].kind == Node::If);
    CHECK(t.nodes[1].text == "y{%1 endif %}");
}

TEST_CASE("same-id nested groups pair by depth", "[parser]") {
    auto t = parse_template("{%1 if a %}{%1 if b %}X{%1 endif %}Y{%1 endif %}");
    REQUIRE(t.nodes.size() == 1);
    REQUIRE(t.unmatched.empty());
    const auto& body = t.nodes[0].branches[0].body;
    REQUIRE(body.size() == 2);
    REQUIRE(body[0].kind == Node::If);
    CHECK(body[0].branches[0].body[0].text == "X");
    CHECK(body[1].text == "Y");
}

TEST_CASE("unbalanced same-id openers fall back to the first closer", "[parser]") {
    auto t = parse_template("{%1 if a %}{%1 if b %}X{%1 endif %}");
    REQUIRE(t.nodes.size() == 1);
    REQUIRE(t.nodes[0].kind == Node::If);
    CHECK(t.nodes[0].branches[0].body[0].text == "{%1 if b %}X");
    REQUIRE(t.unmatched.size() == 1);
}

TEST_CASE("a closer outside the enclosing body does not pair", "[parser]") {
    // The inner for's endfor lies past the if group, so the for is literal
    auto t = parse_template("{%1 if a %}{%2 for x in xs %}{%1 endif %}{%2 endfor %}");
    REQUIRE(t.nodes.size() == 2);
    REQUIRE(t.nodes[0].kind == Node::If);
    CHECK(t.nodes[0].branches[0].body[0].text == "{%2 for x in xs %}");
    CHECK(t.nodes[1].text == "{%2 endfor %}");
}

TEST_CASE("sibling groups may reuse an id", "[parser]") {
    auto t = parse_template("{%1 if a %}A{%1 endif %}-{%1 if b %}B{%1 endif %}");
    REQUIRE(t.nodes.size() == 3);
    CHECK(t.nodes[0].kind == Node::If);
    CHECK(t.nodes[1].text == "-");
    CHECK(t.nodes[2].kind == Node::If);
}
