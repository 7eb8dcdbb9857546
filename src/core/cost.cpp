/**
 * @file cost.cpp
 * @brief コスト指示子の結合・比較ディスパッチ
 */
#include "obseq/cost.hpp"
#include <stdexcept>

namespace obseq {

namespace {

const char* kind_name(const Designator& d) {
    switch (d.index()) {
        case 0: return "absent";
        case 1: return "element";
        case 2: return "group";
        default: return "total";
    }
}

[[noreturn]] void unsupported(const char* op, const Designator& a, const Designator& b) {
    throw std::invalid_argument(std::string(op) + ": unsupported designators (" +
                                kind_name(a) + ", " + kind_name(b) + ")");
}

const CostPtr& total_of(const Designator& d) {
    if (auto t = std::get_if<TotalCost>(&d)) return t->value;
    throw std::invalid_argument(std::string("less: ") + kind_name(d) + " is not a total cost");
}

}  // namespace

Designator combine(const CostAlgebra& algebra, const Designator& a, const Designator& b) {
    if (auto g = std::get_if<GroupCost>(&a)) {
        if (auto e = std::get_if<ElementId>(&b)) {
            return GroupCost{algebra.extend_right(*g->value, *e)};
        }
        if (std::holds_alternative<Absent>(b)) {
            return TotalCost{algebra.close(*g->value)};
        }
        if (auto t = std::get_if<TotalCost>(&b)) {
            return TotalCost{algebra.prepend(*g->value, *t->value)};
        }
        unsupported("combine", a, b);
    }

    if (auto e = std::get_if<ElementId>(&a)) {
        if (auto g = std::get_if<GroupCost>(&b)) {
            return GroupCost{algebra.extend_left(*e, *g->value)};
        }
        if (std::holds_alternative<Absent>(b)) {
            return GroupCost{algebra.singleton(*e)};
        }
        unsupported("combine", a, b);
    }

    if (auto t = std::get_if<TotalCost>(&a)) {
        if (auto g = std::get_if<GroupCost>(&b)) {
            return TotalCost{algebra.append(*t->value, *g->value)};
        }
        if (std::holds_alternative<Absent>(b)) {
            return a;
        }
        unsupported("combine", a, b);
    }

    // a は不在: 右辺を閉じる
    if (auto e = std::get_if<ElementId>(&b)) {
        return GroupCost{algebra.singleton(*e)};
    }
    if (auto g = std::get_if<GroupCost>(&b)) {
        return TotalCost{algebra.close(*g->value)};
    }
    if (std::holds_alternative<TotalCost>(b)) {
        return b;
    }
    unsupported("combine", a, b);
}

bool less(const CostAlgebra& algebra, const Designator& a, const Designator& b) {
    return algebra.less(*total_of(a), *total_of(b));
}

} // namespace obseq
