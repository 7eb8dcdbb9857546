#include "obseq/script/cost_models.hpp"
#include <memory>
#include <set>
#include <stdexcept>

namespace obseq {
namespace script {

namespace {

struct LineGroup {
    double length;
    int64_t count;
};

double total_value(const Cost& c) {
    return cost_value<double>(c);
}

void check_params(const std::string& model, const std::map<std::string, int64_t>& params,
                  const std::set<std::string>& allowed) {
    for (const auto& param : params) {
        if (allowed.count(param.first) == 0) {
            throw std::runtime_error("Unknown parameter for model " + model + ": " + param.first);
        }
    }
}

double param_or(const std::map<std::string, int64_t>& params, const std::string& key, double fallback) {
    auto it = params.find(key);
    return it == params.end() ? fallback : static_cast<double>(it->second);
}

}  // namespace

// ============================================================================
// SumCostModel
// ============================================================================

SumCostModel::SumCostModel(const ElementList& list, double penalty)
    : list_(&list), penalty_(penalty) {}

std::string SumCostModel::name() const {
    return "sum";
}

CostPtr SumCostModel::singleton(ElementId element) const {
    return make_cost(static_cast<double>(list_->weight(element)));
}

CostPtr SumCostModel::extend_right(const Cost& group, ElementId element) const {
    return make_cost(cost_value<double>(group) + static_cast<double>(list_->weight(element)));
}

CostPtr SumCostModel::close(const Cost& group) const {
    return make_cost(cost_value<double>(group));
}

CostPtr SumCostModel::append(const Cost& total, const Cost& group) const {
    return make_cost(total_value(total) + penalty_ + cost_value<double>(group));
}

bool SumCostModel::less(const Cost& a, const Cost& b) const {
    return total_value(a) < total_value(b);
}

bool SumCostModel::cannot_decrease(const Cost& /*group*/) const {
    // 重みは非負
    return true;
}

// ============================================================================
// SquareCostModel
// ============================================================================

SquareCostModel::SquareCostModel(double penalty)
    : penalty_(penalty) {}

std::string SquareCostModel::name() const {
    return "square";
}

double SquareCostModel::badness(const Cost& group) const {
    double extra = static_cast<double>(cost_value<int64_t>(group) - 1);
    return extra * extra;
}

CostPtr SquareCostModel::singleton(ElementId /*element*/) const {
    return make_cost<int64_t>(1);
}

CostPtr SquareCostModel::extend_right(const Cost& group, ElementId /*element*/) const {
    return make_cost<int64_t>(cost_value<int64_t>(group) + 1);
}

CostPtr SquareCostModel::close(const Cost& group) const {
    return make_cost(badness(group));
}

CostPtr SquareCostModel::append(const Cost& total, const Cost& group) const {
    return make_cost(total_value(total) + penalty_ + badness(group));
}

bool SquareCostModel::less(const Cost& a, const Cost& b) const {
    return total_value(a) < total_value(b);
}

bool SquareCostModel::cannot_decrease(const Cost& /*group*/) const {
    return true;
}

// ============================================================================
// LineCostModel
// ============================================================================

LineCostModel::LineCostModel(const ElementList& list, double width, double space, double penalty)
    : list_(&list), width_(width), space_(space), penalty_(penalty) {}

std::string LineCostModel::name() const {
    return "line";
}

double LineCostModel::badness(const Cost& group) const {
    const auto& line = cost_value<LineGroup>(group);
    if (line.length > width_) {
        return OVERFULL_COST + (line.length - width_);
    }
    double slack = width_ - line.length;
    return slack * slack;
}

CostPtr LineCostModel::singleton(ElementId element) const {
    return make_cost(LineGroup{static_cast<double>(list_->weight(element)), 1});
}

CostPtr LineCostModel::extend_right(const Cost& group, ElementId element) const {
    const auto& line = cost_value<LineGroup>(group);
    return make_cost(LineGroup{line.length + space_ + static_cast<double>(list_->weight(element)),
                               line.count + 1});
}

CostPtr LineCostModel::close(const Cost& group) const {
    return make_cost(badness(group));
}

CostPtr LineCostModel::append(const Cost& total, const Cost& group) const {
    return make_cost(total_value(total) + penalty_ + badness(group));
}

bool LineCostModel::less(const Cost& a, const Cost& b) const {
    return total_value(a) < total_value(b);
}

bool LineCostModel::cannot_decrease(const Cost& group) const {
    // 幅に達した行は延ばすほど悪くなる
    return cost_value<LineGroup>(group).length >= width_;
}

// ============================================================================
// Factory
// ============================================================================

CostAlgebraPtr make_cost_model(const std::string& name,
                               const std::map<std::string, int64_t>& params,
                               const ElementList& list) {
    if (name == "sum") {
        check_params(name, params, {"penalty"});
        return std::make_shared<SumCostModel>(list, param_or(params, "penalty", 0));
    }
    if (name == "square") {
        check_params(name, params, {"penalty"});
        return std::make_shared<SquareCostModel>(param_or(params, "penalty", 0));
    }
    if (name == "line") {
        check_params(name, params, {"width", "space", "penalty"});
        return std::make_shared<LineCostModel>(list,
                                               param_or(params, "width", 72),
                                               param_or(params, "space", 0),
                                               param_or(params, "penalty", 0));
    }
    throw std::runtime_error("Unknown cost model: " + name);
}

} // namespace script
} // namespace obseq
