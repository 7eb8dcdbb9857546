/**
 * @file obseq.hpp
 * @brief 最適分割エンジン（窓付き前向き／後ろ向き DP、カット点探索、差分無効化）
 */
#ifndef OBSEQ_OBSEQ_HPP
#define OBSEQ_OBSEQ_HPP

#include "obseq/cost.hpp"
#include "obseq/linked_view.hpp"
#include "obseq/types.hpp"
#include <optional>
#include <utility>
#include <vector>

namespace obseq {

/**
 * @brief エンジン統計情報
 */
struct ObseqStats {
    size_t expand_head_count = 0;
    size_t expand_tail_count = 0;
    size_t contract_head_count = 0;
    size_t contract_tail_count = 0;
    size_t solve_count = 0;        // 実際に探索した solve の回数
    size_t candidate_count = 0;    // 評価したカット候補の数
    size_t early_exit_count = 0;   // 単調性により探索を打ち切った回数
    size_t scan_count = 0;         // DP 走査ステップ数
};

/**
 * @brief 要素列の最適分割エンジン
 *
 * クライアントが所有する要素列を、コスト代数の総コストが最小になる
 * 連続グループに分割する。列全体を走査せずに最適なカット点を1つ確定し、
 * そこからカットの連鎖を辿って任意の要素のグループを求める。
 *
 * 2つの部分 DP 表を持つ:
 * - prefix 窓（左端から head まで）: 先頭からその要素までの最適分割コスト
 * - suffix 窓（tail から右端まで）: その要素から末尾までの最適分割コスト
 *
 * 窓が重なった後、重なり部分でカット点を探す。コスト代数の
 * cannot_decrease() が使えれば、列全体を見る前に探索を打ち切れる。
 * 各カット候補のコストは短い側の窓のグループを組み直して正確に求めるため、
 * 候補1つあたり O(窓の長さ) の代数操作がかかる。
 *
 * 列が変更されたら、クライアントは notify_after() / notify_before() で
 * 変更範囲を通知する。次の solve() では無効化された部分だけを再計算する。
 */
class Obseq {
public:
    /**
     * @brief エンジンを作成
     * @param traversal クライアントの走査（エンジンより長く生存すること）
     * @param algebra コスト代数
     * @throws std::invalid_argument algebra が null の場合
     */
    Obseq(const Traversal& traversal, CostAlgebraPtr algebra);

    /**
     * @brief コスト代数を差し替える（両方の窓を破棄する）
     * @throws std::invalid_argument algebra が null の場合
     */
    void set_cost_algebra(CostAlgebraPtr algebra);

    /**
     * @brief コスト代数を取得
     */
    const CostAlgebra& cost_algebra() const { return *algebra_; }

    /**
     * @brief 最適なカット点を1つ確定する（solved なら何もしない）
     */
    void solve();

    /**
     * @brief 要素を含むグループの範囲
     * @return (グループ先頭要素, グループ末尾要素)
     * @throws std::logic_error solve() 前に呼んだ場合
     * @throws std::invalid_argument 番兵・列外の要素を指定した場合
     */
    std::pair<ElementId, ElementId> interval(ElementId element) const;

    /**
     * @brief element より後ろが変更された可能性を通知
     * @param element 信頼できる最後の要素（NO_ELEMENT なら列全体が変更）
     */
    void notify_after(ElementId element);

    /**
     * @brief element より前が変更された可能性を通知
     * @param element 信頼できる最初の要素（NO_ELEMENT なら列全体が変更）
     */
    void notify_before(ElementId element);

    // ===== 窓操作 =====

    /**
     * @brief head を右に1要素進め、その要素の prefix 値を計算
     * @throws std::logic_error head が既に右端の場合
     */
    void expand_head();

    /**
     * @brief tail を左に1要素進め、その要素の suffix 値を計算
     * @throws std::logic_error tail が既に左端の場合
     */
    void expand_tail();

    /**
     * @brief expand_head() を1回取り消す
     * @throws std::logic_error prefix 窓が空の場合
     */
    void contract_head();

    /**
     * @brief expand_tail() を1回取り消す
     * @throws std::logic_error suffix 窓が空の場合
     */
    void contract_tail();

    // ===== 状態参照 =====

    /**
     * @brief prefix 値が有効な最も右の要素（なければ LEFT_SENTINEL）
     */
    ElementId head() const { return prefix_window_.empty() ? LEFT_SENTINEL : prefix_window_.back(); }

    /**
     * @brief suffix 値が有効な最も左の要素（なければ RIGHT_SENTINEL）
     */
    ElementId tail() const { return suffix_window_.empty() ? RIGHT_SENTINEL : suffix_window_.back(); }

    bool is_solved() const { return solved_; }

    /**
     * @brief 確定したカット点（空の列では std::nullopt）
     */
    std::optional<Cut> best_cut() const;

    /**
     * @brief 最適分割の総コスト（未 solve・空の列では null）
     */
    CostPtr best_cost() const { return solved_ ? best_cost_ : nullptr; }

    /**
     * @brief 左からの位置番号（LEFT_SENTINEL は 0、窓外は NO_INDEX）
     */
    size_t left_index(ElementId element) const;

    /**
     * @brief 右からの位置番号（RIGHT_SENTINEL は 0、窓外は NO_INDEX）
     */
    size_t right_index(ElementId element) const;

    /**
     * @brief 先頭からその要素までの最適分割コスト（窓外は null）
     */
    CostPtr prefix_cost(ElementId element) const;

    /**
     * @brief その要素から末尾までの最適分割コスト（窓外は null）
     */
    CostPtr suffix_cost(ElementId element) const;

    /**
     * @brief a が b より前にあるか（O(1)）
     *
     * 両方に left_index があればそれで、なければ right_index（逆順）で比較する。
     *
     * @throws std::invalid_argument 位置番号で比較できない場合
     */
    bool precedes(ElementId a, ElementId b) const;

    const LinkedView& view() const { return view_; }

    const ObseqStats& stats() const { return stats_; }

    // ===== 設定 =====

    /**
     * @brief verbose モードを有効/無効にする
     */
    void set_verbose(bool enabled) { verbose_ = enabled; }

    /**
     * @brief expand_head/expand_tail の走査を単調性で打ち切るか
     *
     * cannot_decrease() の契約を満たす代数では結果は変わらない。
     */
    void set_expand_pruning(bool enabled) { expand_pruning_ = enabled; }

private:
    /**
     * @brief 要素ごとの DP 値
     */
    struct ElementState {
        size_t left_index = NO_INDEX;
        CostPtr prefix_cost;
        ElementId prefix_cut = NO_ELEMENT;   // 前のグループの末尾要素
        size_t right_index = NO_INDEX;
        CostPtr suffix_cost;
        ElementId suffix_cut = NO_ELEMENT;   // 次のグループの先頭要素
    };

    const ElementState& entry(ElementId element) const;
    ElementState& mutable_entry(ElementId element);

    /// left_index が index の要素（0 なら LEFT_SENTINEL）
    ElementId prefix_at(size_t index) const;
    /// right_index が index の要素（0 なら RIGHT_SENTINEL）
    ElementId suffix_at(size_t index) const;

    void clear_windows();

    // ===== カット点探索（cut_search.cpp） =====

    /// tail が prefix 窓に入るまで両方の窓を広げる
    void close_gap();

    /// 重なり部分でカット点を探して確定する
    void search_overlap();

    /// 境界 left | right の候補を評価し、最良なら採用
    void consider_cut(ElementId left, ElementId right);

    /// 境界 left | right で切った場合の最適総コスト
    CostPtr cut_cost(ElementId left, ElementId right) const;

    LinkedView view_;
    CostAlgebraPtr algebra_;

    ElementState left_sentinel_;
    ElementState right_sentinel_;
    std::vector<ElementState> states_;

    // 窓の要素（prefix: 左から順、suffix: 右から順）
    std::vector<ElementId> prefix_window_;
    std::vector<ElementId> suffix_window_;

    bool solved_ = false;
    std::pair<ElementId, ElementId> best_boundary_{LEFT_SENTINEL, RIGHT_SENTINEL};
    CostPtr best_cost_;

    // 設定
    bool verbose_ = false;
    bool expand_pruning_ = false;

    ObseqStats stats_;
};

} // namespace obseq

#endif // OBSEQ_OBSEQ_HPP
