#include <catch2/catch_all.hpp>
#include <od/yaml.h>

#include <cmath>
#include <limits>

using namespace od;
using namespace od::yaml;

TEST_CASE("YAML dump keeps insertion order", "[yaml]") {
    Dict d;
    d.set("zeta", 1);
    d.set("alpha", "x");
    d.set("nested", make_dict({{"c", true}, {"b", Value()}}));
    d.set("list", Value::list_t{1, "two"});

    std::string expected = "zeta: 1\n"
                           "alpha: x\n"
                           "nested:\n"
                           "  c: true\n"
                           "  b: null\n"
                           "list:\n"
                           "  - 1\n"
                           "  - two\n";
    REQUIRE(dump_yaml(d) == expected);
}

TEST_CASE("YAML round trip through MapSlice preserves order", "[yaml][roundtrip]") {
    Dict d;
    d.set("b", 2);
    d.set("a", "text with spaces");
    d.set("quoted", "true");
    d.set("colon", "k: v");
    d.set("f", 1.0);
    d.set("neg", -4);
    d.set("inner", make_dict({{"y", 1}, {"x", Value::list_t{"p", "q"}}}));
    d.set("empty", make_dict());
    d.set("none", Value::list_t{});

    MapSlice pairs = to_pairs(d);
    REQUIRE(pairs.size() == d.size());
    REQUIRE(pairs[0].key == Value("b"));

    MapSlice back = parse_pairs(dump_pairs(pairs));
    REQUIRE(back.size() == pairs.size());
    for (size_t k = 0; k < back.size(); ++k) {
        REQUIRE(back[k].key == pairs[k].key);
        REQUIRE(back[k].value == pairs[k].value);
    }

    Dict restored;
    from_pairs(back, restored);
    REQUIRE(restored.keys() == d.keys());
    REQUIRE(restored.get("f").first.is_double());
    REQUIRE(restored.get("quoted").first == Value("true"));
}

TEST_CASE("non-string YAML keys are skipped", "[yaml]") {
    std::string doc = "1: one\n"
                      "name: x\n"
                      "true: y\n"
                      "null: z\n"
                      "'2': two\n";
    MapSlice pairs = parse_pairs(doc);
    REQUIRE(pairs.size() == 5);
    REQUIRE(pairs[0].key == Value(1));
    REQUIRE(pairs[2].key == Value(true));

    auto d = parse_yaml(doc);
    REQUIRE(d->keys() == std::vector<std::string>{"name", "2"});
}

TEST_CASE("dump_pairs writes non-string keys as scalars", "[yaml]") {
    MapSlice pairs{{Value(1), Value("one")}, {Value("k"), Value(2)}};
    REQUIRE(dump_pairs(pairs) == "1: one\nk: 2\n");
    REQUIRE(dump_pairs({}) == "{}\n");
}

TEST_CASE("YAML block sequences of mappings and sequences", "[yaml]") {
    std::string doc = "# servers\n"
                      "items:\n"
                      "  - name: a\n"
                      "    size: 1\n"
                      "  - name: b\n"
                      "matrix:\n"
                      "  - - 1\n"
                      "    - 2\n"
                      "  - 3\n"
                      "tags: [x, 'y z', 3]\n"
                      "note: it's # trailing comment\n"
                      "q: 'it''s'\n";
    auto d = parse_yaml(doc);
    REQUIRE(d->keys() == std::vector<std::string>{"items", "matrix", "tags", "note", "q"});

    auto items = d->get("items").first.as_list();
    REQUIRE(items.size() == 2);
    REQUIRE(items[0].as_dict()->keys() == std::vector<std::string>{"name", "size"});
    REQUIRE(items[0].as_dict()->get("size").first == Value(1));
    REQUIRE(items[1].as_dict()->getString("name") == std::optional<std::string>("b"));

    auto matrix = d->get("matrix").first.as_list();
    REQUIRE(matrix.size() == 2);
    REQUIRE(matrix[0] == Value(Value::list_t{1, 2}));
    REQUIRE(matrix[1] == Value(3));

    REQUIRE(d->getStrings("tags") == std::optional<std::vector<std::string>>(std::vector<std::string>{"x", "y z"}));
    REQUIRE(d->getString("note") == std::optional<std::string>("it's"));
    REQUIRE(d->getString("q") == std::optional<std::string>("it's"));
}

TEST_CASE("YAML scalars are typed", "[yaml]") {
    auto d = parse_yaml("i: -12\nu: 18446744073709551615\nf: 2.5\nb: False\nn: ~\ns: 12abc\n");
    REQUIRE(d->get("i").first == Value(-12));
    REQUIRE(d->get("u").first.is_uint());
    REQUIRE(d->get("f").first == Value(2.5));
    REQUIRE(d->get("b").first == Value(false));
    REQUIRE(d->get("n").first.is_null());
    REQUIRE(d->get("s").first == Value("12abc"));
}

TEST_CASE("YAML dump skips a dict found inside itself", "[yaml][cycle]") {
    auto d = make_dict({{"a", 1}});
    d->set("self", Value(d));
    d->set("l", Value::list_t{Value(d)});
    REQUIRE(dump_yaml(*d) == "a: 1\nl:\n  - null\n");
    d->erase("self");
    d->erase("l");
}

TEST_CASE("empty YAML documents", "[yaml]") {
    REQUIRE(parse_yaml("")->empty());
    REQUIRE(parse_yaml("---\n# nothing\n")->empty());
    REQUIRE(parse_yaml("{}\n")->empty());
    REQUIRE(dump_yaml(Dict()) == "{}\n");
}

TEST_CASE("YAML errors report the line", "[yaml][errors]") {
    auto line_of = [](const std::string& doc) -> size_t {
        try {
            parse_yaml(doc);
        } catch (const YamlError& e) {
            return e.line;
        }
        return 0;
    };
    REQUIRE(line_of("- a\n- b\n") == 1);
    REQUIRE(line_of("a: 1\n   b: 2\n") == 2);
    REQUIRE(line_of("a: 1\n\tb: 2\n") == 2);
    REQUIRE(line_of("a: 1\nno colon here\n") == 2);
    REQUIRE(line_of("a: 1\nb: \"open\n") == 2);
    REQUIRE(line_of("a: |\n  text\n") == 1);
    REQUIRE(line_of("a: 1\n") == 0);

    try {
        parse_yaml("x: 1\ny: [1, 2\n");
        FAIL("expected parse to throw");
    } catch (const std::exception& e) {
        std::string msg = e.what();
        REQUIRE(msg.find("line 2") != std::string::npos);
    }
}

TEST_CASE("an empty sequence item is null", "[yaml]") {
    MapSlice pairs = parse_pairs("xs:\n  -\n  - 1\n  -\nys:\n  -\n    a: 1\n");
    REQUIRE(pairs.size() == 2);

    auto xs = pairs[0].value.as_list();
    REQUIRE(xs.size() == 3);
    REQUIRE(xs[0].is_null());
    REQUIRE(xs[1] == Value(1));
    REQUIRE(xs[2].is_null());

    auto ys = pairs[1].value.as_list();
    REQUIRE(ys.size() == 1);
    REQUIRE(ys[0].as_dict()->get("a").first == Value(1));
}

TEST_CASE("special floats survive a YAML round trip", "[yaml][roundtrip]") {
    Dict d;
    d.set("inf", std::numeric_limits<double>::infinity());
    d.set("ninf", -std::numeric_limits<double>::infinity());
    d.set("nan", std::numeric_limits<double>::quiet_NaN());
    d.set("text", ".inf");

    auto back = parse_yaml(dump_yaml(d));
    REQUIRE(back->get("inf").first == Value(std::numeric_limits<double>::infinity()));
    REQUIRE(back->get("ninf").first == Value(-std::numeric_limits<double>::infinity()));
    auto nan = back->get("nan").first;
    REQUIRE(nan.is_double());
    REQUIRE(std::isnan(nan.as_double()));
    REQUIRE(back->get("text").first == Value(".inf"));

    REQUIRE(parse_yaml("a: .Inf\nb: -.INF\nc: .NaN\n")->get("b").first.is_double());
}

TEST_CASE("YAML nesting is bounded", "[yaml][depth]") {
    std::string doc;
    for (size_t k = 0; k < kMaxNestingDepth + 100; ++k) doc += std::string(k, ' ') + "k:\n";
    REQUIRE_THROWS_AS(parse_yaml(doc), YamlError);

    auto root = make_dict();
    auto cur = root;
    for (size_t k = 0; k < kMaxNestingDepth + 100; ++k) {
        auto next = make_dict({{"x", 1}});
        cur->set("k", Value(next));
        cur = next;
    }
    std::string out = dump_yaml(*root);
    REQUIRE(out.find(" null\n") != std::string::npos);
}
