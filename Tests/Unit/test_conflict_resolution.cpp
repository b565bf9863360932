#include <catch2/catch.hpp>
#include "AG/Runtime/ConflictResolver.hpp"
#include "AG/Runtime/RuleLibrary.hpp"
#include <stdexcept>
#include <string>
#include <vector>

using namespace ag;

namespace {

std::shared_ptr<const RuleLibrary> library() {
    return RuleLibrary::fromSource(R"(
        rule alpha { x(v = 1) => assert y(v = 1) }
        rule beta { x(v = 1) => assert y(v = 2) }
        rule urgent priority 10 { x(v = 1) => assert y(v = 3) }
        rule fallback priority -5 { not y() => assert y(v = 4) }
    )");
}

Activation activation(const RuleLibrary& lib, const std::string& rule, std::vector<FactId> facts) {
    Activation a;
    a.rule = lib.find(rule);
    a.facts = std::move(facts);
    return a;
}

std::vector<std::string> describe(const std::vector<Activation>& acts) {
    std::vector<std::string> out;
    for (const auto& a : acts) out.push_back(toString(a));
    return out;
}

} // namespace

TEST_CASE("Higher priority wins regardless of fact recency", "[conflict]") {
    auto lib = library();
    ConflictResolver resolver;
    std::vector<Activation> acts{
        activation(*lib, "alpha", {1}),
        activation(*lib, "urgent", {9}),
        activation(*lib, "fallback", {}),
    };
    CHECK(resolver.select(acts).rule->name.name == "urgent");
}

TEST_CASE("Equal priority prefers the older most recent fact", "[conflict]") {
    auto lib = library();
    ConflictResolver resolver;
    std::vector<Activation> acts{
        activation(*lib, "alpha", {4, 2}),
        activation(*lib, "beta", {1, 3}),
    };
    // alpha's most recent fact is f-4, beta's is f-3
    CHECK(resolver.select(acts).rule->name.name == "beta");
}

TEST_CASE("Rule name breaks ties on recency", "[conflict]") {
    auto lib = library();
    ConflictResolver resolver;
    std::vector<Activation> acts{
        activation(*lib, "beta", {2}),
        activation(*lib, "alpha", {2}),
    };
    CHECK(resolver.select(acts).rule->name.name == "alpha");
}

TEST_CASE("Matched fact ids order two bindings of the same rule", "[conflict]") {
    auto lib = library();
    ConflictResolver resolver;
    std::vector<Activation> acts{
        activation(*lib, "alpha", {2, 5}),
        activation(*lib, "alpha", {1, 5}),
    };
    CHECK(resolver.select(acts).facts == std::vector<FactId>{1, 5});
}

TEST_CASE("Order is total and independent of input order", "[conflict]") {
    auto lib = library();
    ConflictResolver resolver;
    std::vector<Activation> acts{
        activation(*lib, "fallback", {}),
        activation(*lib, "beta", {3}),
        activation(*lib, "alpha", {3}),
        activation(*lib, "alpha", {1}),
        activation(*lib, "urgent", {7}),
    };
    const std::vector<std::string> expected{
        "urgent [f-7]", "alpha [f-1]", "alpha [f-3]", "beta [f-3]", "fallback []",
    };
    CHECK(describe(resolver.order(acts)) == expected);

    std::vector<Activation> reversed(acts.rbegin(), acts.rend());
    CHECK(describe(resolver.order(reversed)) == expected);
    CHECK(resolver.select(reversed).rule->name.name == "urgent");
}

TEST_CASE("Selecting from no candidates is an error", "[conflict]") {
    ConflictResolver resolver;
    REQUIRE_THROWS_AS(resolver.select({}), std::invalid_argument);
}
