/**
 * @file cost.hpp
 * @brief コスト値とコスト代数（クライアントが実装するインターフェース）
 */
#ifndef OBSEQ_COST_HPP
#define OBSEQ_COST_HPP

#include "obseq/types.hpp"
#include <memory>
#include <string>
#include <variant>

namespace obseq {

/**
 * @brief コスト値の基底クラス
 *
 * グループコスト・総コストのどちらもこの型で保持する。
 * 中身の解釈はコスト代数に任される。
 */
class Cost {
public:
    virtual ~Cost() = default;
};

using CostPtr = std::shared_ptr<const Cost>;

/**
 * @brief 任意の値型を包むコスト値
 */
template <class T>
class BasicCost : public Cost {
public:
    explicit BasicCost(T value) : value_(std::move(value)) {}

    const T& value() const { return value_; }

private:
    T value_;
};

/**
 * @brief BasicCost<T> を生成
 */
template <class T>
CostPtr make_cost(T value) {
    return std::make_shared<const BasicCost<T>>(std::move(value));
}

/**
 * @brief BasicCost<T> の値を取り出す
 * @pre c が make_cost<T>() で生成されたこと
 */
template <class T>
const T& cost_value(const Cost& c) {
    return static_cast<const BasicCost<T>&>(c).value();
}

/**
 * @brief コスト代数
 *
 * 要素・グループコスト・総コスト・不在（空グループ／空分割）の4種類を
 * 組み合わせて大きなコストを作り、比較する。
 *
 * 右方向の操作（singleton, extend_right, close, append）は必須。
 * 左方向の操作（extend_left, prepend）は既定で引数を入れ替えて右方向の
 * 操作を呼ぶ。結合が順序に依存する代数は両方をオーバーライドすること。
 */
class CostAlgebra {
public:
    virtual ~CostAlgebra() = default;

    /**
     * @brief 代数の名前（ログ用）
     */
    virtual std::string name() const = 0;

    /**
     * @brief 要素1つからなるグループのコスト: combine(element, absence)
     */
    virtual CostPtr singleton(ElementId element) const = 0;

    /**
     * @brief グループを右に1要素延長: combine(group, element)
     */
    virtual CostPtr extend_right(const Cost& group, ElementId element) const = 0;

    /**
     * @brief グループ1つだけの分割の総コスト: combine(group, absence)
     */
    virtual CostPtr close(const Cost& group) const = 0;

    /**
     * @brief 分割の右端にグループを追加: combine(total, group)
     */
    virtual CostPtr append(const Cost& total, const Cost& group) const = 0;

    /**
     * @brief グループを左に1要素延長: combine(element, group)
     */
    virtual CostPtr extend_left(ElementId element, const Cost& group) const {
        return extend_right(group, element);
    }

    /**
     * @brief 分割の左端にグループを追加: combine(group, total)
     */
    virtual CostPtr prepend(const Cost& group, const Cost& total) const {
        return append(total, group);
    }

    /**
     * @brief 総コストの比較 a < b（どちらも less でなければ等しい）
     *
     * エンジンは総コスト同士だけを比較する。
     */
    virtual bool less(const Cost& a, const Cost& b) const = 0;

    /**
     * @brief グループをさらに延長してもコストが下がらないか
     *
     * true を返す場合、group をどちらの方向に延長してもコストは下がらず、
     * それを含むどの分割の総コストも close(group) 未満にならないことを
     * 保証しなければならない。既定は false（枝刈りなし）。
     */
    virtual bool cannot_decrease(const Cost& /*group*/) const { return false; }
};

using CostAlgebraPtr = std::shared_ptr<const CostAlgebra>;

// ===== コスト指示子（タグ付き共用体） =====

/// 不在（空グループ／空分割）
struct Absent {};

/// グループコスト
struct GroupCost {
    CostPtr value;
};

/// 総コスト
struct TotalCost {
    CostPtr value;
};

/**
 * @brief コスト指示子
 *
 * 要素（ElementId）・グループコスト・総コスト・不在のいずれか。
 */
using Designator = std::variant<Absent, ElementId, GroupCost, TotalCost>;

/**
 * @brief 2つの指示子を結合
 *
 * 対応する組み合わせ:
 * - (group, element) -> group    extend_right
 * - (element, group) -> group    extend_left
 * - (element, absent) / (absent, element) -> group    singleton
 * - (group, absent) / (absent, group) -> total        close
 * - (total, group) -> total      append
 * - (group, total) -> total      prepend
 * - (total, absent) / (absent, total) -> total        そのまま
 *
 * @throws std::invalid_argument 対応しない組み合わせ
 */
Designator combine(const CostAlgebra& algebra, const Designator& a, const Designator& b);

/**
 * @brief 2つの総コストを比較
 * @throws std::invalid_argument どちらかが総コストでない場合
 */
bool less(const CostAlgebra& algebra, const Designator& a, const Designator& b);

} // namespace obseq

#endif // OBSEQ_COST_HPP
