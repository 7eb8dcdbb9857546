/**
 * @file cost_models.hpp
 * @brief スクリプトで使うコストモデル (sum, square, line)
 */
#ifndef OBSEQ_SCRIPT_COST_MODELS_HPP
#define OBSEQ_SCRIPT_COST_MODELS_HPP

#include "obseq/cost.hpp"
#include "obseq/script/element_list.hpp"
#include <map>
#include <string>

namespace obseq {
namespace script {

/**
 * @brief sum モデル: グループ = 重みの和、総コスト = グループの和 + 区切り1つごとに penalty
 */
class SumCostModel : public CostAlgebra {
public:
    SumCostModel(const ElementList& list, double penalty);

    std::string name() const override;
    CostPtr singleton(ElementId element) const override;
    CostPtr extend_right(const Cost& group, ElementId element) const override;
    CostPtr close(const Cost& group) const override;
    CostPtr append(const Cost& total, const Cost& group) const override;
    bool less(const Cost& a, const Cost& b) const override;
    bool cannot_decrease(const Cost& group) const override;

private:
    const ElementList* list_;
    double penalty_;
};

/**
 * @brief square モデル: グループ = (要素数 - 1)^2、総コスト = グループの和 + 区切り1つごとに penalty
 *
 * 細かく分けるほど安くなる。
 */
class SquareCostModel : public CostAlgebra {
public:
    explicit SquareCostModel(double penalty);

    std::string name() const override;
    CostPtr singleton(ElementId element) const override;
    CostPtr extend_right(const Cost& group, ElementId element) const override;
    CostPtr close(const Cost& group) const override;
    CostPtr append(const Cost& total, const Cost& group) const override;
    bool less(const Cost& a, const Cost& b) const override;
    bool cannot_decrease(const Cost& group) const override;

private:
    double badness(const Cost& group) const;

    double penalty_;
};

/**
 * @brief line モデル（行分割）
 *
 * 要素の重みを語の幅とみなし、語間に space を入れた行の長さを width と比べる。
 * - 収まる行: (width - 長さ)^2
 * - はみ出す行: OVERFULL_COST + はみ出し量
 * 総コスト = 行の和 + 改行1つごとに penalty
 */
class LineCostModel : public CostAlgebra {
public:
    /// はみ出した行の基本コスト
    static constexpr double OVERFULL_COST = 1e6;

    LineCostModel(const ElementList& list, double width, double space, double penalty);

    std::string name() const override;
    CostPtr singleton(ElementId element) const override;
    CostPtr extend_right(const Cost& group, ElementId element) const override;
    CostPtr close(const Cost& group) const override;
    CostPtr append(const Cost& total, const Cost& group) const override;
    bool less(const Cost& a, const Cost& b) const override;
    bool cannot_decrease(const Cost& group) const override;

private:
    double badness(const Cost& group) const;

    const ElementList* list_;
    double width_;
    double space_;
    double penalty_;
};

/**
 * @brief モデル名とパラメータからコストモデルを作成
 *
 * - sum:    penalty (既定 0)
 * - square: penalty (既定 0)
 * - line:   width (既定 72), space (既定 0), penalty (既定 0)
 *
 * @throws std::runtime_error 未知のモデル名・パラメータの場合
 */
CostAlgebraPtr make_cost_model(const std::string& name,
                               const std::map<std::string, int64_t>& params,
                               const ElementList& list);

} // namespace script
} // namespace obseq

#endif // OBSEQ_SCRIPT_COST_MODELS_HPP
