#include <catch2/catch.hpp>
#include "AG/Parser.hpp"
#include "AG/Runtime/Errors.hpp"
#include "AG/Runtime/InferenceEngine.hpp"
#include <atomic>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

using namespace ag;

namespace {

std::vector<std::string> firedRules(const InferenceEngine& engine) {
    std::vector<std::string> out;
    for (const auto& f : engine.firings()) out.push_back(f.rule);
    return out;
}

std::vector<std::string> describe(const std::vector<Conclusion>& conclusions) {
    std::vector<std::string> out;
    for (const auto& c : conclusions) out.push_back(toString(c));
    return out;
}

const char* kNitrogenRule = R"(
    output diagnosis
    rule nitrogen_deficiency {
        symptom(crop = tomato, symptom = leaf-yellowing)
        soil(ph < 6.0)
        =>
        assert diagnosis(disease = nitrogen-deficiency)
    }
)";

void assertNitrogenObservations(FactStore& store) {
    store.assertFact("symptom", {{"crop", "tomato"}, {"symptom", "leaf-yellowing"}});
    store.assertFact("soil", {{"ph", 5.5}});
}

} // namespace

TEST_CASE("Symptom and acidic soil yield a nitrogen diagnosis", "[engine][scenario]") {
    std::stringstream log;
    auto lib = RuleLibrary::fromSource(kNitrogenRule);
    FactStore store;
    assertNitrogenObservations(store);

    InferenceEngine engine(lib, store, {}, &log);
    CHECK(engine.state() == EngineState::Idle);
    auto conclusions = engine.run();

    REQUIRE(conclusions.size() == 1);
    CHECK(conclusions[0].kind == "diagnosis");
    CHECK(conclusions[0].attributes.at("disease").asString() == "nitrogen-deficiency");
    CHECK(engine.state() == EngineState::Quiescent);
    CHECK(engine.cycles() == 1);

    // A fresh session gives the same answer
    FactStore store2;
    assertNitrogenObservations(store2);
    InferenceEngine engine2(lib, store2, {}, &log);
    CHECK(describe(engine2.run()) == describe(conclusions));
}

TEST_CASE("A rule does not fire twice on the same facts", "[engine][refraction]") {
    std::stringstream log;
    auto lib = RuleLibrary::fromSource(kNitrogenRule);
    FactStore store;
    assertNitrogenObservations(store);

    InferenceEngine engine(lib, store, {}, &log);
    engine.run();
    auto again = engine.run();
    CHECK(engine.cycles() == 0);
    CHECK(engine.firings().size() == 1);
    CHECK(again.size() == 1);

    // New observations between runs enable new activations
    store.assertFact("symptom", {{"crop", "tomato"}, {"symptom", "leaf-yellowing"}, {"severity", 2}});
    engine.run();
    CHECK(engine.cycles() == 1);
    CHECK(engine.firings().size() == 2);
}

TEST_CASE("Higher priority rules fire first", "[engine][priority]") {
    std::stringstream log;
    auto lib = RuleLibrary::fromSource(R"(
        output log
        rule a_low { x(v = 1) => assert log(rule = low) }
        rule z_high priority 5 { x(v = 1) => assert log(rule = high) }
    )");
    FactStore store;
    store.assertFact("x", {{"v", 1}});

    InferenceEngine engine(lib, store, {}, &log);
    auto conclusions = engine.run();
    CHECK(firedRules(engine) == std::vector<std::string>{"z_high", "a_low"});
    CHECK(describe(conclusions) == std::vector<std::string>{"log(rule=\"high\")", "log(rule=\"low\")"});
}

TEST_CASE("Equal priorities fire the older trigger first", "[engine][recency]") {
    std::stringstream log;
    auto lib = RuleLibrary::fromSource(R"(
        rule alpha { trigger(id = 2) => assert seen(id = 2) }
        rule zeta { trigger(id = 1) => assert seen(id = 1) }
    )");
    FactStore store;
    store.assertFact("trigger", {{"id", 1}});
    store.assertFact("trigger", {{"id", 2}});

    InferenceEngine engine(lib, store, {}, &log);
    engine.run();
    REQUIRE(engine.firings().size() == 2);
    CHECK(engine.firings()[0].rule == "zeta");
    CHECK(engine.firings()[0].facts == std::vector<FactId>{1});
    CHECK(engine.firings()[1].rule == "alpha");
    CHECK(engine.firings()[1].cycle == 2);
}

TEST_CASE("Assertions chain into later rules", "[engine][chaining]") {
    std::stringstream log;
    auto lib = RuleLibrary::fromSource(R"(
        output recommendation
        rule classify { lab(K = ?k) => assert level(nutrient = K, level = npk_level(?k)) }
        rule advise { crop(stage = flowering) level(nutrient = K, level = low) =>
                      assert recommendation(stage_advice = "Increase potassium") }
    )");
    FactStore store;
    store.assertFact("crop", {{"name", "tomato"}, {"stage", "flowering"}});
    store.assertFact("lab", {{"K", 45}});

    InferenceEngine engine(lib, store, {}, &log);
    auto conclusions = engine.run();
    CHECK(firedRules(engine) == std::vector<std::string>{"classify", "advise"});
    REQUIRE(conclusions.size() == 1);
    CHECK(conclusions[0].attributes.at("stage_advice").asString() == "Increase potassium");
}

TEST_CASE("Repeated runs are deterministic", "[engine][determinism]") {
    auto lib = RuleLibrary::fromSource(R"(
        output diagnosis, recommendation
        rule mildew priority 10 { symptoms(powdery_white = true) => assert diagnosis(disease = "Powdery Mildew") }
        rule low_n { lab(N = ?n) test(?n < 50) => assert recommendation(nutrient = N) }
        rule low_k { lab(K = ?k) test(?k < 50) => assert recommendation(nutrient = K) }
        rule stage { crop(stage = ?s) lab(K = ?k) test(?k < 50) => assert recommendation(stage = ?s) }
    )");

    auto once = [&lib]() {
        std::stringstream log;
        FactStore store;
        store.assertFact("crop", {{"name", "tomato"}, {"stage", "flowering"}});
        store.assertFact("lab", {{"N", 30}, {"K", 45}});
        store.assertFact("symptoms", {{"powdery_white", true}});
        InferenceEngine engine(lib, store, {}, &log);
        auto conclusions = engine.run();
        return std::make_pair(describe(conclusions), firedRules(engine));
    };

    const auto first = once();
    CHECK(first.second == std::vector<std::string>{"mildew", "low_k", "low_n", "stage"});
    for (int i = 0; i < 5; ++i) {
        CHECK(once() == first);
    }
}

TEST_CASE("Oscillating rules hit the cycle limit with a trace", "[engine][cycles]") {
    std::stringstream log;
    auto lib = RuleLibrary::fromSource(R"(
        rule switch_on { ?l <- light(state = off) => retract ?l assert light(state = on) }
        rule switch_off { ?l <- light(state = on) => retract ?l assert light(state = off) }
    )");
    FactStore store;
    store.assertFact("light", {{"state", "off"}});

    EngineConfig config;
    config.maxCycles = 20;
    config.traceDepth = 5;
    InferenceEngine engine(lib, store, config, &log);

    try {
        engine.run();
        FAIL("expected CycleLimitExceeded");
    } catch (const CycleLimitExceeded& e) {
        CHECK(e.limit() == 20);
        const auto& recent = e.recentFirings();
        REQUIRE(recent.size() == 5);
        CHECK(recent.front().cycle == 16);
        CHECK(recent.back().cycle == 20);
        CHECK(recent.front().rule == "switch_off");
        CHECK(recent.back().rule == "switch_off");
        CHECK(recent[1].rule == "switch_on");
    }
    CHECK(engine.state() == EngineState::CycleLimitExceeded);
    CHECK(engine.firings().size() == 20);

    // The failure is final
    REQUIRE_THROWS_AS(engine.run(), SessionError);
}

TEST_CASE("Oscillation through a negated condition hits the cycle limit", "[engine][negation][cycles]") {
    std::stringstream log;
    auto lib = RuleLibrary::fromSource(R"(
        rule raise { not alert() => assert alert(level = high) }
        rule clear { ?a <- alert() => retract ?a }
    )");
    FactStore store;

    EngineConfig config;
    config.maxCycles = 50;
    InferenceEngine engine(lib, store, config, &log);
    REQUIRE_THROWS_AS(engine.run(), CycleLimitExceeded);
    CHECK(engine.state() == EngineState::CycleLimitExceeded);
    CHECK(engine.firings().size() == 50);
    CHECK(engine.firings()[2].rule == "raise");
}

TEST_CASE("A negated rule fires again once its negation holds again", "[engine][negation]") {
    std::stringstream log;
    auto lib = RuleLibrary::fromSource(R"(
        output alarm
        rule quiet { not noise() => assert alarm(state = quiet) }
        rule loud { noise() ?q <- alarm(state = quiet) => retract ?q }
    )");
    FactStore store;
    InferenceEngine engine(lib, store, {}, &log);

    CHECK(engine.run().size() == 1);
    const FactId noise = store.assertFact("noise", {});
    CHECK(engine.run().empty());
    store.retract(noise);
    CHECK(engine.run().size() == 1);
    CHECK(firedRules(engine) == std::vector<std::string>{"quiet", "loud", "quiet"});
}

TEST_CASE("A run may use exactly the cycle limit", "[engine][cycles]") {
    std::stringstream log;
    auto lib = RuleLibrary::fromSource(R"(
        rule one { start() => assert step(n = 1) }
        rule two { step(n = 1) => assert step(n = 2) }
        rule three { step(n = 2) => assert step(n = 3) }
    )");
    FactStore store;
    store.assertFact("start", {});

    EngineConfig config;
    config.maxCycles = 3;
    InferenceEngine engine(lib, store, config, &log);
    REQUIRE_NOTHROW(engine.run());
    CHECK(engine.state() == EngineState::Quiescent);
    CHECK(engine.cycles() == 3);
}

TEST_CASE("Failed actions are skipped and recorded", "[engine][skipped]") {
    std::stringstream log;
    auto lib = RuleLibrary::fromSource(R"(
        output y, z, done
        rule dup { x(v = 1) => assert y(v = 1) assert z(v = 1) }
        rule double_retract { ?f <- x(v = 2) => retract ?f retract ?f assert done(v = 2) }
        rule bad_math { x(v = ?v) test(?v == 3) => assert z(v = ?v / 0) assert done(v = 3) }
    )");
    FactStore store;
    store.assertFact("y", {{"v", 1}});
    store.assertFact("x", {{"v", 1}});
    store.assertFact("x", {{"v", 2}});
    store.assertFact("x", {{"v", 3}});

    InferenceEngine engine(lib, store, {}, &log);
    engine.run();
    CHECK(engine.state() == EngineState::Quiescent);

    const auto& skipped = engine.skippedActions();
    REQUIRE(skipped.size() == 3);
    CHECK(skipped[0].rule == "dup");
    CHECK(skipped[0].firing == 1);
    CHECK(skipped[1].rule == "double_retract");
    CHECK(skipped[2].rule == "bad_math");

    // Later actions of the same firing still ran
    CHECK(store.find("z", {{"v", 1}}) != 0);
    CHECK(store.find("done", {{"v", 2}}) != 0);
    CHECK(store.find("done", {{"v", 3}}) != 0);
    CHECK_FALSE(store.contains(3));
}

TEST_CASE("Skipped actions are numbered by firing across runs", "[engine][skipped]") {
    std::stringstream log;
    auto lib = RuleLibrary::fromSource("rule mark { x(v = ?v) => assert y(v = 1) }");
    FactStore store;
    store.assertFact("x", {{"v", 1}});

    InferenceEngine engine(lib, store, {}, &log);
    engine.run();
    CHECK(engine.skippedActions().empty());

    store.assertFact("x", {{"v", 2}});
    engine.run();
    CHECK(engine.cycles() == 1);
    REQUIRE(engine.skippedActions().size() == 1);
    CHECK(engine.skippedActions()[0].firing == 2);
    CHECK(engine.skippedActions()[0].firing == engine.firings().back().cycle);
}

TEST_CASE("Cancellation stops the run between cycles", "[engine][cancel]") {
    std::stringstream log;
    std::atomic<bool> cancel{false};

    SECTION("cancelled before the first cycle") {
        auto lib = RuleLibrary::fromSource(kNitrogenRule);
        FactStore store;
        assertNitrogenObservations(store);
        InferenceEngine engine(lib, store, {}, &log);

        cancel = true;
        REQUIRE_THROWS_AS(engine.run(&cancel), SessionAborted);
        CHECK(engine.state() == EngineState::Aborted);
        CHECK(engine.firings().empty());
        REQUIRE_THROWS_AS(engine.run(), SessionError);
    }

    SECTION("cancelled while matching") {
        // A guard that requests cancellation; the current cycle completes
        FunctionRegistry functions = FunctionRegistry::builtins();
        functions.registerFunction({"stop", 1, 1, [&cancel](const std::vector<Value>&) -> std::optional<Value> {
            cancel = true;
            return Value(true);
        }});
        auto lib = RuleLibrary::load(parseProgram(R"(
            rule count { n(v = ?v) test(stop(?v)) => assert n(v = ?v + 1) }
        )"), functions);
        FactStore store;
        store.assertFact("n", {{"v", 1}});
        InferenceEngine engine(lib, store, {}, &log);

        REQUIRE_THROWS_AS(engine.run(&cancel), SessionAborted);
        CHECK(engine.firings().size() == 1);
        CHECK(store.size() == 2);
    }
}

TEST_CASE("Debug mode logs firings", "[engine][debug]") {
    std::stringstream log;
    auto lib = RuleLibrary::fromSource(kNitrogenRule);
    FactStore store;
    assertNitrogenObservations(store);

    InferenceEngine engine(lib, store, {}, &log);
    engine.setDebug(true);
    engine.run();
    const std::string text = log.str();
    CHECK(text.find("[InferenceEngine] Firing nitrogen_deficiency [f-1, f-2]") != std::string::npos);
    CHECK(text.find("Quiescent after 1 cycle(s)") != std::string::npos);

    std::stringstream quiet;
    FactStore store2;
    assertNitrogenObservations(store2);
    InferenceEngine silent(lib, store2, {}, &quiet);
    silent.run();
    CHECK(quiet.str().empty());
}
