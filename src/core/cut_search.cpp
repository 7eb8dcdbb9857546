/**
 * @file cut_search.cpp
 * @brief 窓の重なり部分での最適カット点探索（solve）
 *
 * 境界 a | b（a = prev(b)）で切る分割の最適コストは、a までの prefix 値と
 * b からの suffix 値の両方が有効なら正確に計算できる。
 * そのような境界は prev(tail) | tail から head | next(head) までの範囲にある。
 *
 * 範囲内のどの境界でも切らない分割は、prev(tail)..next(head) を含む
 * 1つのグループ（gap）を持つ。gap が cannot_decrease を満たし、最良候補が
 * close(gap) より真に小さければ、最適分割は範囲内で切れている。
 */
#include "obseq/obseq.hpp"
#include <iostream>

namespace obseq {

void Obseq::solve() {
    if (solved_) return;
    ++stats_.solve_count;

    if (verbose_) {
        std::cerr << "% [verbose] solve start (" << algebra_->name()
                  << "): prefix window " << prefix_window_.size()
                  << ", suffix window " << suffix_window_.size() << "\n";
    }

    best_boundary_ = {LEFT_SENTINEL, RIGHT_SENTINEL};
    best_cost_.reset();

    if (view_.empty()) {
        solved_ = true;
        if (verbose_) std::cerr << "% [verbose] solve done: empty sequence\n";
        return;
    }

    close_gap();
    search_overlap();
    solved_ = true;

    if (verbose_) {
        std::cerr << "% [verbose] solve done: prefix window " << prefix_window_.size()
                  << ", suffix window " << suffix_window_.size()
                  << ", candidates " << stats_.candidate_count << "\n";
    }
}

void Obseq::close_gap() {
    while (left_index(tail()) == NO_INDEX) {
        if (!view_.is_rightmost(head())) {
            expand_head();
        }
        if (left_index(tail()) != NO_INDEX) break;
        if (!view_.is_leftmost(tail())) {
            expand_tail();
        }
    }
}

void Obseq::search_overlap() {
    // 重なり部分の全境界を評価
    const size_t first = left_index(tail()) - 1;
    for (size_t i = first; i <= prefix_window_.size(); ++i) {
        ElementId left = prefix_at(i);
        ElementId right = (i < prefix_window_.size()) ? prefix_at(i + 1) : view_.next(head());
        consider_cut(left, right);
    }

    // gap = prev(tail)..next(head)（実要素の範囲）
    ElementId gap_begin = view_.prev(tail());
    if (!is_real(gap_begin)) gap_begin = tail();
    ElementId gap_end = view_.next(head());
    if (!is_real(gap_end)) gap_end = head();

    CostPtr gap = algebra_->singleton(gap_begin);
    for (ElementId e = gap_begin; e != gap_end;) {
        e = view_.next(e);
        gap = algebra_->extend_right(*gap, e);
    }

    bool grow_tail = true;
    while (true) {
        const bool left_done = view_.is_leftmost(tail());
        const bool right_done = view_.is_rightmost(head());
        if (left_done && right_done) break;

        if (algebra_->cannot_decrease(*gap) &&
            algebra_->less(*best_cost_, *algebra_->close(*gap))) {
            ++stats_.early_exit_count;
            if (verbose_) {
                std::cerr << "% [verbose] early exit: overlap "
                          << (prefix_window_.size() + 1 - first) << " boundaries\n";
            }
            break;
        }

        if ((grow_tail && !left_done) || right_done) {
            expand_tail();
            ElementId t = tail();
            ElementId left = prefix_at(left_index(t) - 1);
            consider_cut(left, t);
            if (is_real(left)) {
                gap = algebra_->extend_left(left, *gap);
            }
        } else {
            expand_head();
            ElementId h = head();
            ElementId right = view_.next(h);
            consider_cut(h, right);
            if (is_real(right)) {
                gap = algebra_->extend_right(*gap, right);
            }
        }
        grow_tail = !grow_tail;
    }
}

void Obseq::consider_cut(ElementId left, ElementId right) {
    CostPtr cost = cut_cost(left, right);
    ++stats_.candidate_count;
    // 同コストなら先に見つけた候補を残す
    if (!best_cost_ || algebra_->less(*cost, *best_cost_)) {
        best_cost_ = std::move(cost);
        best_boundary_ = {left, right};
    }
}

CostPtr Obseq::cut_cost(ElementId left, ElementId right) const {
    if (left == LEFT_SENTINEL) return entry(right).suffix_cost;
    if (right == RIGHT_SENTINEL) return entry(left).prefix_cost;

    if (left_index(left) <= right_index(right)) {
        // 左側が短い: suffix 値に prefix 側のグループを左から順に前置
        CostPtr total = entry(right).suffix_cost;
        ElementId end = left;
        while (end != LEFT_SENTINEL) {
            const ElementId cut = entry(end).prefix_cut;
            CostPtr group = algebra_->singleton(end);
            for (size_t i = left_index(end) - 1; i > left_index(cut); --i) {
                group = algebra_->extend_left(prefix_at(i), *group);
            }
            total = algebra_->prepend(*group, *total);
            end = cut;
        }
        return total;
    }

    // 右側が短い: prefix 値に suffix 側のグループを順に追加
    CostPtr total = entry(left).prefix_cost;
    ElementId start = right;
    while (start != RIGHT_SENTINEL) {
        const ElementId cut = entry(start).suffix_cut;
        CostPtr group = algebra_->singleton(start);
        for (size_t i = right_index(start) - 1; i > right_index(cut); --i) {
            group = algebra_->extend_right(*group, suffix_at(i));
        }
        total = algebra_->append(*total, *group);
        start = cut;
    }
    return total;
}

} // namespace obseq
