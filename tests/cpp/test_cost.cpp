#include <catch2/catch.hpp>
#include "obseq/cost.hpp"
#include <stdexcept>
#include <string>

using namespace obseq;

namespace {

const std::string& text(const CostPtr& c) { return cost_value<std::string>(*c); }

/// 操作の組み立て方を文字列で記録する代数
class RecordingAlgebra : public CostAlgebra {
public:
    std::string name() const override { return "recording"; }
    CostPtr singleton(ElementId e) const override { return make_cost(std::to_string(e)); }
    CostPtr extend_right(const Cost& g, ElementId e) const override {
        return make_cost("(" + cost_value<std::string>(g) + "+" + std::to_string(e) + ")");
    }
    CostPtr close(const Cost& g) const override {
        return make_cost("close(" + cost_value<std::string>(g) + ")");
    }
    CostPtr append(const Cost& t, const Cost& g) const override {
        return make_cost("(" + cost_value<std::string>(t) + "|" + cost_value<std::string>(g) + ")");
    }
    bool less(const Cost& a, const Cost& b) const override {
        return cost_value<std::string>(a) < cost_value<std::string>(b);
    }
};

/// 左方向の操作を独自に定義する代数
class OrderedAlgebra : public RecordingAlgebra {
public:
    CostPtr extend_left(ElementId e, const Cost& g) const override {
        return make_cost("(" + std::to_string(e) + "+" + cost_value<std::string>(g) + ")");
    }
    CostPtr prepend(const Cost& g, const Cost& t) const override {
        return make_cost("(" + cost_value<std::string>(g) + "|" + cost_value<std::string>(t) + ")");
    }
};

GroupCost group(const std::string& s) { return GroupCost{make_cost(s)}; }
TotalCost total(const std::string& s) { return TotalCost{make_cost(s)}; }

const std::string& group_text(const Designator& d) { return text(std::get<GroupCost>(d).value); }
const std::string& total_text(const Designator& d) { return text(std::get<TotalCost>(d).value); }

}  // namespace

// ============================================================================
// Cost values
// ============================================================================

TEST_CASE("BasicCost wraps arbitrary values", "[cost]") {
    CostPtr c = make_cost<int64_t>(42);
    REQUIRE(cost_value<int64_t>(*c) == 42);

    CostPtr s = make_cost(std::string("abc"));
    REQUIRE(text(s) == "abc");
}

// ============================================================================
// combine dispatch
// ============================================================================

TEST_CASE("combine builds groups from elements", "[cost][combine]") {
    RecordingAlgebra a;

    SECTION("element with absence is a singleton") {
        REQUIRE(group_text(combine(a, Designator{ElementId{3}}, Absent{})) == "3");
        REQUIRE(group_text(combine(a, Absent{}, Designator{ElementId{3}})) == "3");
    }

    SECTION("group extended on the right") {
        REQUIRE(group_text(combine(a, group("g"), Designator{ElementId{7}})) == "(g+7)");
    }

    SECTION("group extended on the left mirrors extend_right by default") {
        REQUIRE(group_text(combine(a, Designator{ElementId{7}}, group("g"))) == "(g+7)");
    }

    SECTION("overridden extend_left is used") {
        OrderedAlgebra o;
        REQUIRE(group_text(combine(o, Designator{ElementId{7}}, group("g"))) == "(7+g)");
    }
}

TEST_CASE("combine builds totals from groups", "[cost][combine]") {
    RecordingAlgebra a;

    SECTION("group with absence closes") {
        REQUIRE(total_text(combine(a, group("g"), Absent{})) == "close(g)");
        REQUIRE(total_text(combine(a, Absent{}, group("g"))) == "close(g)");
    }

    SECTION("total followed by group appends") {
        REQUIRE(total_text(combine(a, total("t"), group("g"))) == "(t|g)");
    }

    SECTION("group followed by total mirrors append by default") {
        REQUIRE(total_text(combine(a, group("g"), total("t"))) == "(t|g)");
    }

    SECTION("overridden prepend is used") {
        OrderedAlgebra o;
        REQUIRE(total_text(combine(o, group("g"), total("t"))) == "(g|t)");
    }

    SECTION("total with absence is unchanged") {
        TotalCost t = total("t");
        Designator r1 = combine(a, t, Absent{});
        Designator r2 = combine(a, Absent{}, t);
        REQUIRE(std::get<TotalCost>(r1).value == t.value);
        REQUIRE(std::get<TotalCost>(r2).value == t.value);
    }
}

TEST_CASE("combine rejects unsupported pairs", "[cost][combine]") {
    RecordingAlgebra a;
    Designator e = ElementId{1};

    REQUIRE_THROWS_AS(combine(a, e, e), std::invalid_argument);
    REQUIRE_THROWS_AS(combine(a, Absent{}, Absent{}), std::invalid_argument);
    REQUIRE_THROWS_AS(combine(a, group("a"), group("b")), std::invalid_argument);
    REQUIRE_THROWS_AS(combine(a, total("a"), total("b")), std::invalid_argument);
    REQUIRE_THROWS_AS(combine(a, total("t"), e), std::invalid_argument);
    REQUIRE_THROWS_AS(combine(a, e, total("t")), std::invalid_argument);
}

// ============================================================================
// less
// ============================================================================

TEST_CASE("less compares totals", "[cost][less]") {
    RecordingAlgebra a;

    REQUIRE(less(a, total("a"), total("b")));
    REQUIRE(!less(a, total("b"), total("a")));
    REQUIRE(!less(a, total("a"), total("a")));

    REQUIRE_THROWS_AS(less(a, group("a"), total("b")), std::invalid_argument);
    REQUIRE_THROWS_AS(less(a, total("a"), Absent{}), std::invalid_argument);
}

TEST_CASE("cannot_decrease defaults to false", "[cost]") {
    RecordingAlgebra a;
    CostPtr g = a.singleton(1);
    REQUIRE(!a.cannot_decrease(*g));
}
