#include <catch2/catch.hpp>
#include "AG/Runtime/FactStore.hpp"
#include "AG/Runtime/Matcher.hpp"
#include "AG/Runtime/RuleLibrary.hpp"
#include <string>
#include <vector>

using namespace ag;

static std::vector<std::vector<FactId>> matchedFacts(const std::vector<Activation>& acts) {
    std::vector<std::vector<FactId>> out;
    for (const auto& a : acts) out.push_back(a.facts);
    return out;
}

TEST_CASE("Single pattern matches each fact of its kind", "[matcher]") {
    auto lib = RuleLibrary::fromSource("rule r { lab(N < 50) => assert low(n = 1) }");
    FactStore store;
    store.assertFact("lab", {{"N", 30}});
    store.assertFact("lab", {{"N", 80}});
    store.assertFact("lab", {{"N", 10}});
    store.assertFact("crop", {{"N", 10}});

    Matcher m(*lib);
    auto acts = m.match(store);
    CHECK(matchedFacts(acts) == std::vector<std::vector<FactId>>{{1}, {3}});
    CHECK(acts[0].rule == lib->find("r"));
}

TEST_CASE("Constraints on absent attributes fail", "[matcher]") {
    auto lib = RuleLibrary::fromSource("rule r { soil(ph < 6.0) => assert a(v = 1) }");
    FactStore store;
    store.assertFact("soil", {{"type", "loam"}});
    Matcher m(*lib);
    CHECK(m.match(store).empty());
}

TEST_CASE("Values of different types never match", "[matcher]") {
    auto lib = RuleLibrary::fromSource(R"(
        rule eq { reading(v = 1) => assert a(v = 1) }
        rule lt { reading(v < 10) => assert a(v = 2) }
    )");
    FactStore store;
    store.assertFact("reading", {{"v", "1"}});
    store.assertFact("reading", {{"v", true}});
    Matcher m(*lib);
    CHECK(m.match(store).empty());
}

TEST_CASE("Join carries bindings between patterns", "[matcher][join]") {
    auto lib = RuleLibrary::fromSource(R"(
        rule same_crop {
            crop(name = ?c, stage = flowering)
            lab(crop = ?c, K < 50)
            =>
            assert recommendation(crop = ?c)
        }
    )");
    FactStore store;
    store.assertFact("crop", {{"name", "tomato"}, {"stage", "flowering"}}); // 1
    store.assertFact("crop", {{"name", "pepper"}, {"stage", "flowering"}}); // 2
    store.assertFact("crop", {{"name", "maize"}, {"stage", "vegetative"}}); // 3
    store.assertFact("lab", {{"crop", "pepper"}, {"K", 30}});               // 4
    store.assertFact("lab", {{"crop", "tomato"}, {"K", 45}});               // 5
    store.assertFact("lab", {{"crop", "maize"}, {"K", 10}});                // 6
    store.assertFact("lab", {{"crop", "tomato"}, {"K", 300}});              // 7

    Matcher m(*lib);
    auto acts = m.match(store);
    REQUIRE(matchedFacts(acts) == std::vector<std::vector<FactId>>{{1, 5}, {2, 4}});
    CHECK(acts[0].binding.values.at("c").asString() == "tomato");
    CHECK(acts[1].binding.values.at("c").asString() == "pepper");
}

TEST_CASE("Bound variables compare with ordering operators", "[matcher][join]") {
    auto lib = RuleLibrary::fromSource(R"(
        rule rising { reading(v = ?a) reading(v > ?a) => assert rise(v = 1) }
    )");
    FactStore store;
    store.assertFact("reading", {{"v", 1}});
    store.assertFact("reading", {{"v", 3}});
    store.assertFact("reading", {{"v", 2}});

    Matcher m(*lib);
    CHECK(matchedFacts(m.match(store)) == std::vector<std::vector<FactId>>{{1, 2}, {1, 3}, {3, 2}});
}

TEST_CASE("Fact variables record the matched id", "[matcher]") {
    auto lib = RuleLibrary::fromSource("rule r { ?l <- lab(N = ?n) => retract ?l }");
    FactStore store;
    store.assertFact("crop", {{"name", "tomato"}});
    store.assertFact("lab", {{"N", 30}});

    Matcher m(*lib);
    auto acts = m.match(store);
    REQUIRE(acts.size() == 1);
    CHECK(acts[0].binding.facts.at("l") == 2);
    CHECK(acts[0].binding.values.at("n").asNumber() == 30);
}

TEST_CASE("Negated patterns hold only when nothing matches", "[matcher][negation]") {
    auto lib = RuleLibrary::fromSource(R"(
        rule untreated {
            diagnosis(crop = ?c)
            not treatment(crop = ?c)
            =>
            assert alert(crop = ?c)
        }
        rule nothing_known { not diagnosis() => assert alert(general = true) }
    )");
    FactStore store;
    Matcher m(*lib);

    auto acts = m.match(store);
    REQUIRE(acts.size() == 1);
    CHECK(acts[0].rule->name.name == "nothing_known");
    CHECK(acts[0].facts.empty());
    CHECK(acts[0].mostRecentFact() == 0);

    store.assertFact("diagnosis", {{"crop", "tomato"}}); // 1
    store.assertFact("diagnosis", {{"crop", "pepper"}}); // 2
    store.assertFact("treatment", {{"crop", "tomato"}}); // 3

    acts = m.match(store);
    REQUIRE(acts.size() == 1);
    CHECK(acts[0].rule->name.name == "untreated");
    CHECK(acts[0].facts == std::vector<FactId>{2});
}

TEST_CASE("Variables inside a negation do not leak", "[matcher][negation]") {
    auto lib = RuleLibrary::fromSource(R"(
        rule lonely { crop(name = ?n) not neighbour(of = ?n, name = ?other) => assert alone(name = ?n) }
    )");
    FactStore store;
    store.assertFact("crop", {{"name", "tomato"}});
    store.assertFact("crop", {{"name", "bean"}});
    store.assertFact("neighbour", {{"of", "bean"}, {"name", "maize"}});

    Matcher m(*lib);
    auto acts = m.match(store);
    REQUIRE(acts.size() == 1);
    CHECK(acts[0].binding.values.count("other") == 0);
    CHECK(acts[0].binding.values.at("n").asString() == "tomato");
}

TEST_CASE("Test guards filter bindings", "[matcher][test]") {
    auto lib = RuleLibrary::fromSource(R"(
        rule extreme_ph {
            soil(type = ?t, ph = ?ph)
            test(?ph < 5.5 or ?ph > 7.8)
            =>
            assert recommendation(soil = ?t)
        }
        rule low_k { lab(K = ?k) test(npk_level(?k) == low) => assert recommendation(k = ?k) }
    )");
    FactStore store;
    store.assertFact("soil", {{"type", "loam"}, {"ph", 6.3}});
    store.assertFact("soil", {{"type", "sandy"}, {"ph", 5.1}});
    store.assertFact("soil", {{"type", "clay"}, {"ph", 8.2}});
    store.assertFact("soil", {{"type", "peat"}, {"ph", "unknown"}});
    store.assertFact("lab", {{"K", 45}});
    store.assertFact("lab", {{"K", 120}});

    Matcher m(*lib);
    CHECK(matchedFacts(m.match(store)) == std::vector<std::vector<FactId>>{{2}, {3}, {5}});
}

TEST_CASE("Activations come out in rule declaration order", "[matcher]") {
    auto lib = RuleLibrary::fromSource(R"(
        rule second { crop(name = ?n) => assert a(v = ?n) }
        rule first { crop(name = ?n) => assert b(v = ?n) }
    )");
    FactStore store;
    store.assertFact("crop", {{"name", "tomato"}});

    Matcher m(*lib);
    auto acts = m.match(store);
    REQUIRE(acts.size() == 2);
    CHECK(acts[0].rule->name.name == "second");
    CHECK(acts[1].rule->name.name == "first");
}
