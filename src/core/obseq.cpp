/**
 * @file obseq.cpp
 * @brief 窓の拡大・縮小、差分通知、グループ範囲の問い合わせ
 *
 * カット点探索（solve）は cut_search.cpp に配置。
 */
#include "obseq/obseq.hpp"
#include <iostream>
#include <stdexcept>

namespace obseq {

Obseq::Obseq(const Traversal& traversal, CostAlgebraPtr algebra)
    : view_(traversal), algebra_(std::move(algebra)) {
    if (!algebra_) {
        throw std::invalid_argument("Obseq: cost algebra must not be null");
    }
    left_sentinel_.left_index = 0;
    right_sentinel_.right_index = 0;
}

void Obseq::set_cost_algebra(CostAlgebraPtr algebra) {
    if (!algebra) {
        throw std::invalid_argument("Obseq::set_cost_algebra: cost algebra must not be null");
    }
    clear_windows();
    algebra_ = std::move(algebra);
    if (verbose_) {
        std::cerr << "% [verbose] cost algebra set: " << algebra_->name() << "\n";
    }
}

void Obseq::clear_windows() {
    while (!prefix_window_.empty()) contract_head();
    while (!suffix_window_.empty()) contract_tail();
    solved_ = false;
}

// ===== 状態参照 =====

const Obseq::ElementState& Obseq::entry(ElementId element) const {
    static const ElementState empty_state;
    if (element == LEFT_SENTINEL) return left_sentinel_;
    if (element == RIGHT_SENTINEL) return right_sentinel_;
    if (element >= states_.size()) return empty_state;
    return states_[element];
}

Obseq::ElementState& Obseq::mutable_entry(ElementId element) {
    if (!is_real(element)) {
        throw std::invalid_argument("Obseq: sentinel has no mutable state");
    }
    if (element >= states_.size()) {
        states_.resize(element + 1);
    }
    return states_[element];
}

ElementId Obseq::prefix_at(size_t index) const {
    return index == 0 ? LEFT_SENTINEL : prefix_window_[index - 1];
}

ElementId Obseq::suffix_at(size_t index) const {
    return index == 0 ? RIGHT_SENTINEL : suffix_window_[index - 1];
}

size_t Obseq::left_index(ElementId element) const {
    return entry(element).left_index;
}

size_t Obseq::right_index(ElementId element) const {
    return entry(element).right_index;
}

CostPtr Obseq::prefix_cost(ElementId element) const {
    if (!is_real(element)) return nullptr;
    return entry(element).prefix_cost;
}

CostPtr Obseq::suffix_cost(ElementId element) const {
    if (!is_real(element)) return nullptr;
    return entry(element).suffix_cost;
}

std::optional<Cut> Obseq::best_cut() const {
    if (!solved_ || !best_cost_) return std::nullopt;
    if (is_real(best_boundary_.first)) {
        return Cut{best_boundary_.first, Side::Right};
    }
    return Cut{best_boundary_.second, Side::Left};
}

bool Obseq::precedes(ElementId a, ElementId b) const {
    const auto& ea = entry(a);
    const auto& eb = entry(b);
    if (ea.left_index != NO_INDEX && eb.left_index != NO_INDEX) {
        return ea.left_index < eb.left_index;
    }
    if (ea.right_index != NO_INDEX && eb.right_index != NO_INDEX) {
        return ea.right_index > eb.right_index;
    }
    // 片方が prefix 窓だけ、もう片方が suffix 窓だけにある
    if (ea.left_index != NO_INDEX && eb.right_index != NO_INDEX) return true;
    if (ea.right_index != NO_INDEX && eb.left_index != NO_INDEX) return false;
    throw std::invalid_argument("Obseq::precedes: elements are outside both windows");
}

// ===== 窓操作 =====

void Obseq::expand_head() {
    if (view_.is_rightmost(head())) {
        throw std::logic_error("Obseq::expand_head: head is already the rightmost element");
    }
    const ElementId h = view_.next(head());
    const size_t n = prefix_window_.size();

    // グループ s..h の開始位置 s を h から左端まで動かす
    CostPtr group = algebra_->singleton(h);
    CostPtr best;
    ElementId best_cut = LEFT_SENTINEL;
    for (size_t i = n + 1; i-- > 0;) {
        if (i < n) {
            group = algebra_->extend_left(prefix_window_[i], *group);
        }
        ElementId cut = prefix_at(i);
        CostPtr candidate = (i == 0)
            ? algebra_->close(*group)
            : algebra_->append(*entry(cut).prefix_cost, *group);
        ++stats_.scan_count;

        // 同コストなら h に近いカットを優先
        if (!best || algebra_->less(*candidate, *best)) {
            best = std::move(candidate);
            best_cut = cut;
        }
        if (expand_pruning_ && algebra_->cannot_decrease(*group) &&
            algebra_->less(*best, *algebra_->close(*group))) {
            break;
        }
    }

    prefix_window_.push_back(h);
    auto& state = mutable_entry(h);
    state.left_index = prefix_window_.size();
    state.prefix_cost = std::move(best);
    state.prefix_cut = best_cut;
    solved_ = false;
    ++stats_.expand_head_count;
}

void Obseq::expand_tail() {
    if (view_.is_leftmost(tail())) {
        throw std::logic_error("Obseq::expand_tail: tail is already the leftmost element");
    }
    const ElementId t = view_.prev(tail());
    const size_t n = suffix_window_.size();

    // グループ t..e の終了位置 e を t から右端まで動かす
    CostPtr group = algebra_->singleton(t);
    CostPtr best;
    ElementId best_cut = RIGHT_SENTINEL;
    for (size_t i = n + 1; i-- > 0;) {
        if (i < n) {
            group = algebra_->extend_right(*group, suffix_window_[i]);
        }
        ElementId cut = suffix_at(i);
        CostPtr candidate = (i == 0)
            ? algebra_->close(*group)
            : algebra_->prepend(*group, *entry(cut).suffix_cost);
        ++stats_.scan_count;

        if (!best || algebra_->less(*candidate, *best)) {
            best = std::move(candidate);
            best_cut = cut;
        }
        if (expand_pruning_ && algebra_->cannot_decrease(*group) &&
            algebra_->less(*best, *algebra_->close(*group))) {
            break;
        }
    }

    suffix_window_.push_back(t);
    auto& state = mutable_entry(t);
    state.right_index = suffix_window_.size();
    state.suffix_cost = std::move(best);
    state.suffix_cut = best_cut;
    solved_ = false;
    ++stats_.expand_tail_count;
}

void Obseq::contract_head() {
    if (prefix_window_.empty()) {
        throw std::logic_error("Obseq::contract_head: prefix window is empty");
    }
    auto& state = mutable_entry(prefix_window_.back());
    state.left_index = NO_INDEX;
    state.prefix_cost.reset();
    state.prefix_cut = NO_ELEMENT;
    prefix_window_.pop_back();
    solved_ = false;
    ++stats_.contract_head_count;
}

void Obseq::contract_tail() {
    if (suffix_window_.empty()) {
        throw std::logic_error("Obseq::contract_tail: suffix window is empty");
    }
    auto& state = mutable_entry(suffix_window_.back());
    state.right_index = NO_INDEX;
    state.suffix_cost.reset();
    state.suffix_cut = NO_ELEMENT;
    suffix_window_.pop_back();
    solved_ = false;
    ++stats_.contract_tail_count;
}

// ===== 差分通知 =====

void Obseq::notify_after(ElementId element) {
    size_t keep = 0;
    if (element != NO_ELEMENT) {
        if (!is_real(element)) {
            throw std::invalid_argument("Obseq::notify_after: not an element");
        }
        // prefix 窓外の要素なら、左に辿って窓内の最も近い要素を境界にする
        ElementId anchor = element;
        while (anchor != LEFT_SENTINEL && left_index(anchor) == NO_INDEX) {
            anchor = view_.prev(anchor);
        }
        keep = left_index(anchor);
    }

    while (prefix_window_.size() > keep) contract_head();
    // suffix 値は変更範囲を含むので全て無効
    while (!suffix_window_.empty()) contract_tail();
    solved_ = false;

    if (verbose_) {
        std::cerr << "% [verbose] notify_after: prefix window kept " << prefix_window_.size()
                  << ", suffix window cleared\n";
    }
}

void Obseq::notify_before(ElementId element) {
    size_t keep = 0;
    if (element != NO_ELEMENT) {
        if (!is_real(element)) {
            throw std::invalid_argument("Obseq::notify_before: not an element");
        }
        ElementId anchor = element;
        while (anchor != RIGHT_SENTINEL && right_index(anchor) == NO_INDEX) {
            anchor = view_.next(anchor);
        }
        keep = right_index(anchor);
    }

    while (suffix_window_.size() > keep) contract_tail();
    while (!prefix_window_.empty()) contract_head();
    solved_ = false;

    if (verbose_) {
        std::cerr << "% [verbose] notify_before: suffix window kept " << suffix_window_.size()
                  << ", prefix window cleared\n";
    }
}

// ===== 問い合わせ =====

std::pair<ElementId, ElementId> Obseq::interval(ElementId element) const {
    if (!solved_) {
        throw std::logic_error("Obseq::interval: solve() has not been called");
    }
    if (!is_real(element)) {
        throw std::invalid_argument("Obseq::interval: not an element");
    }
    if (left_index(element) == NO_INDEX && right_index(element) == NO_INDEX) {
        throw std::invalid_argument("Obseq::interval: element is not in this sequence");
    }

    const ElementId left = best_boundary_.first;
    const ElementId right = best_boundary_.second;

    if (is_real(left) && !precedes(left, element)) {
        // カットより左: prefix のカット連鎖を左へ辿る
        ElementId end = left;
        while (true) {
            ElementId cut = entry(end).prefix_cut;
            if (cut == LEFT_SENTINEL || precedes(cut, element)) {
                return {prefix_at(left_index(cut) + 1), end};
            }
            end = cut;
        }
    }

    // カットより右: suffix のカット連鎖を右へ辿る
    ElementId start = right;
    while (true) {
        ElementId cut = entry(start).suffix_cut;
        if (cut == RIGHT_SENTINEL || precedes(element, cut)) {
            return {start, suffix_at(right_index(cut) + 1)};
        }
        start = cut;
    }
}

} // namespace obseq
