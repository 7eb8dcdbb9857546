/**
 * @file test_helpers.hpp
 * @brief テスト用の要素列とコスト代数
 */
#ifndef OBSEQ_TEST_HELPERS_HPP
#define OBSEQ_TEST_HELPERS_HPP

#include "obseq/cost.hpp"
#include "obseq/linked_view.hpp"
#include "obseq/obseq.hpp"
#include <limits>
#include <string>
#include <utility>
#include <vector>

namespace obseq_test {

using obseq::Cost;
using obseq::CostPtr;
using obseq::ElementId;
using obseq::NO_ELEMENT;
using obseq::NO_INDEX;

/**
 * @brief vector ベースの要素列（ElementId = 作成順）
 */
class TestSequence : public obseq::Traversal {
public:
    TestSequence() = default;

    explicit TestSequence(const std::vector<int64_t>& weights) {
        for (auto w : weights) push_back(w);
    }

    ElementId next(ElementId e) const override {
        if (e == NO_ELEMENT) return order_.empty() ? NO_ELEMENT : order_.front();
        size_t p = pos_[e] + 1;
        return p < order_.size() ? order_[p] : NO_ELEMENT;
    }

    ElementId prev(ElementId e) const override {
        if (e == NO_ELEMENT) return order_.empty() ? NO_ELEMENT : order_.back();
        size_t p = pos_[e];
        return p > 0 ? order_[p - 1] : NO_ELEMENT;
    }

    ElementId push_back(int64_t w) { return insert(order_.size(), w); }

    ElementId insert(size_t position, int64_t w) {
        ElementId id = weights_.size();
        weights_.push_back(w);
        pos_.push_back(NO_INDEX);
        order_.insert(order_.begin() + static_cast<std::ptrdiff_t>(position), id);
        reindex();
        return id;
    }

    void erase(size_t position) {
        pos_[order_[position]] = NO_INDEX;
        order_.erase(order_.begin() + static_cast<std::ptrdiff_t>(position));
        reindex();
    }

    void set_weight(ElementId e, int64_t w) { weights_[e] = w; }
    int64_t weight(ElementId e) const { return weights_[e]; }

    const std::vector<ElementId>& order() const { return order_; }
    ElementId at(size_t position) const { return order_[position]; }
    size_t size() const { return order_.size(); }

private:
    void reindex() {
        for (size_t i = 0; i < order_.size(); ++i) pos_[order_[i]] = i;
    }

    std::vector<ElementId> order_;
    std::vector<int64_t> weights_;
    std::vector<size_t> pos_;
};

inline double total(const Cost& c) { return obseq::cost_value<double>(c); }

/**
 * @brief グループ = 重みの和、総コスト = グループの和 + 区切りごとに penalty
 */
class SumAlgebra : public obseq::CostAlgebra {
public:
    SumAlgebra(const TestSequence& seq, double penalty, bool monotone = false)
        : seq_(&seq), penalty_(penalty), monotone_(monotone) {}

    std::string name() const override { return "test-sum"; }
    CostPtr singleton(ElementId e) const override {
        return obseq::make_cost(static_cast<double>(seq_->weight(e)));
    }
    CostPtr extend_right(const Cost& g, ElementId e) const override {
        return obseq::make_cost(total(g) + static_cast<double>(seq_->weight(e)));
    }
    CostPtr close(const Cost& g) const override { return obseq::make_cost(total(g)); }
    CostPtr append(const Cost& t, const Cost& g) const override {
        return obseq::make_cost(total(t) + penalty_ + total(g));
    }
    bool less(const Cost& a, const Cost& b) const override { return total(a) < total(b); }
    bool cannot_decrease(const Cost&) const override { return monotone_; }

private:
    const TestSequence* seq_;
    double penalty_;
    bool monotone_;
};

/**
 * @brief グループ = (要素数 - 1)^2、総コスト = グループの和 + 区切りごとに penalty
 */
class SizeSquareAlgebra : public obseq::CostAlgebra {
public:
    explicit SizeSquareAlgebra(double penalty) : penalty_(penalty) {}

    std::string name() const override { return "test-size-square"; }
    CostPtr singleton(ElementId) const override { return obseq::make_cost<int64_t>(1); }
    CostPtr extend_right(const Cost& g, ElementId) const override {
        return obseq::make_cost<int64_t>(obseq::cost_value<int64_t>(g) + 1);
    }
    CostPtr close(const Cost& g) const override { return obseq::make_cost(badness(g)); }
    CostPtr append(const Cost& t, const Cost& g) const override {
        return obseq::make_cost(total(t) + penalty_ + badness(g));
    }
    bool less(const Cost& a, const Cost& b) const override { return total(a) < total(b); }

private:
    static double badness(const Cost& g) {
        double extra = static_cast<double>(obseq::cost_value<int64_t>(g) - 1);
        return extra * extra;
    }

    double penalty_;
};

/**
 * @brief グループ = (重みの和 - target)^2、総コスト = グループの和 + 区切りごとに penalty
 *
 * monotone なら和が target 以上のグループで cannot_decrease を返す。
 */
class TargetAlgebra : public obseq::CostAlgebra {
public:
    TargetAlgebra(const TestSequence& seq, double target, double penalty, bool monotone)
        : seq_(&seq), target_(target), penalty_(penalty), monotone_(monotone) {}

    std::string name() const override { return "test-target"; }
    CostPtr singleton(ElementId e) const override {
        return obseq::make_cost(static_cast<double>(seq_->weight(e)));
    }
    CostPtr extend_right(const Cost& g, ElementId e) const override {
        return obseq::make_cost(total(g) + static_cast<double>(seq_->weight(e)));
    }
    CostPtr close(const Cost& g) const override { return obseq::make_cost(badness(g)); }
    CostPtr append(const Cost& t, const Cost& g) const override {
        return obseq::make_cost(total(t) + penalty_ + badness(g));
    }
    bool less(const Cost& a, const Cost& b) const override { return total(a) < total(b); }
    bool cannot_decrease(const Cost& g) const override { return monotone_ && total(g) >= target_; }

private:
    double badness(const Cost& g) const {
        double d = total(g) - target_;
        return d * d;
    }

    const TestSequence* seq_;
    double target_;
    double penalty_;
    bool monotone_;
};

/**
 * @brief 全ての分割が同コスト（0）
 */
class ZeroAlgebra : public obseq::CostAlgebra {
public:
    std::string name() const override { return "test-zero"; }
    CostPtr singleton(ElementId) const override { return obseq::make_cost(0.0); }
    CostPtr extend_right(const Cost&, ElementId) const override { return obseq::make_cost(0.0); }
    CostPtr close(const Cost&) const override { return obseq::make_cost(0.0); }
    CostPtr append(const Cost&, const Cost&) const override { return obseq::make_cost(0.0); }
    bool less(const Cost& a, const Cost& b) const override { return total(a) < total(b); }
};

/**
 * @brief グループ列の総コスト（右方向の操作だけで計算）
 */
inline double partition_cost(const obseq::CostAlgebra& algebra,
                             const std::vector<std::vector<ElementId>>& groups) {
    CostPtr t;
    for (const auto& group : groups) {
        CostPtr g = algebra.singleton(group.front());
        for (size_t i = 1; i < group.size(); ++i) g = algebra.extend_right(*g, group[i]);
        t = t ? algebra.append(*t, *g) : algebra.close(*g);
    }
    return t ? total(*t) : 0.0;
}

/**
 * @brief 全分割を列挙した最小コスト
 */
inline double brute_force_cost(const obseq::CostAlgebra& algebra, const std::vector<ElementId>& elems) {
    if (elems.empty()) return 0.0;
    const size_t n = elems.size();
    double best = std::numeric_limits<double>::infinity();
    for (uint64_t mask = 0; mask < (uint64_t{1} << (n - 1)); ++mask) {
        std::vector<std::vector<ElementId>> groups(1);
        for (size_t i = 0; i < n; ++i) {
            groups.back().push_back(elems[i]);
            if (i + 1 < n && (mask >> i & 1)) groups.emplace_back();
        }
        double c = partition_cost(algebra, groups);
        if (c < best) best = c;
    }
    return best;
}

/**
 * @brief solve 済みエンジンから interval でグループ列を復元
 */
inline std::vector<std::vector<ElementId>> groups_of(const obseq::Obseq& engine, const TestSequence& seq) {
    std::vector<std::vector<ElementId>> groups;
    size_t i = 0;
    while (i < seq.size()) {
        auto range = engine.interval(seq.at(i));
        groups.emplace_back();
        while (true) {
            groups.back().push_back(seq.at(i));
            if (seq.at(i++) == range.second) break;
        }
    }
    return groups;
}

} // namespace obseq_test

#endif // OBSEQ_TEST_HELPERS_HPP
