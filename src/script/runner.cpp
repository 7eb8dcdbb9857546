#include "obseq/script/runner.hpp"
#include "obseq/script/cost_models.hpp"
#include <stdexcept>
#include <string>

namespace obseq {
namespace script {

namespace {

size_t to_position(int64_t value, size_t limit, const char* what) {
    if (value < 0 || static_cast<uint64_t>(value) > limit) {
        throw std::runtime_error(std::string(what) + ": position " + std::to_string(value) +
                                 " out of range (size " + std::to_string(limit) + ")");
    }
    return static_cast<size_t>(value);
}

}  // namespace

Runner::Runner(std::ostream& out)
    : out_(&out) {}

void Runner::run(const Program& program) {
    for (size_t i = 0; i < program.size(); ++i) {
        try {
            execute(program.commands()[i]);
        } catch (const std::exception& e) {
            throw std::runtime_error("line " + std::to_string(program.line_of(i)) + ": " + e.what());
        }
    }
}

void Runner::execute(const Command& command) {
    if (auto cmd = std::get_if<ModelCommand>(&command)) {
        run_model(*cmd);
    } else if (auto cmd = std::get_if<ElementsCommand>(&command)) {
        run_elements(*cmd);
    } else if (std::holds_alternative<SolveCommand>(command)) {
        run_solve();
    } else if (auto cmd = std::get_if<InsertCommand>(&command)) {
        run_insert(*cmd);
    } else if (auto cmd = std::get_if<EraseCommand>(&command)) {
        run_erase(*cmd);
    } else if (auto cmd = std::get_if<SetCommand>(&command)) {
        run_set(*cmd);
    } else if (auto cmd = std::get_if<QueryCommand>(&command)) {
        run_query(*cmd);
    }
}

Obseq& Runner::require_engine() {
    if (!engine_) {
        throw std::runtime_error("no cost model (missing 'model' statement)");
    }
    return *engine_;
}

ElementId Runner::element_before(size_t position) const {
    return position == 0 ? NO_ELEMENT : list_.at(position - 1);
}

void Runner::notify_edit(ElementId anchor) {
    if (engine_) {
        engine_->notify_after(anchor);
    }
}

void Runner::run_model(const ModelCommand& cmd) {
    auto algebra = make_cost_model(cmd.name, cmd.params, list_);
    if (engine_) {
        engine_->set_cost_algebra(std::move(algebra));
        return;
    }
    engine_ = std::make_unique<Obseq>(list_, std::move(algebra));
    engine_->set_verbose(verbose_);
    engine_->set_expand_pruning(expand_pruning_);
}

void Runner::run_elements(const ElementsCommand& cmd) {
    ElementId anchor = list_.prev(NO_ELEMENT);
    for (auto w : cmd.weights) {
        list_.push_back(w);
    }
    notify_edit(anchor);
}

void Runner::run_insert(const InsertCommand& cmd) {
    size_t pos = to_position(cmd.position, list_.size(), "insert");
    ElementId anchor = element_before(pos);
    for (size_t i = 0; i < cmd.weights.size(); ++i) {
        list_.insert(pos + i, cmd.weights[i]);
    }
    notify_edit(anchor);
}

void Runner::run_erase(const EraseCommand& cmd) {
    size_t first = to_position(cmd.first, list_.size(), "erase");
    size_t last = to_position(cmd.last, list_.size(), "erase");
    if (first > last) {
        throw std::runtime_error("erase: empty range [" + std::to_string(first) + ", " +
                                 std::to_string(last) + ")");
    }
    ElementId anchor = element_before(first);
    for (size_t i = first; i < last; ++i) {
        list_.erase(first);
    }
    notify_edit(anchor);
}

void Runner::run_set(const SetCommand& cmd) {
    if (list_.empty()) {
        throw std::runtime_error("set: sequence is empty");
    }
    size_t pos = to_position(cmd.position, list_.size() - 1, "set");
    ElementId anchor = element_before(pos);
    list_.set_weight(list_.at(pos), cmd.weight);
    notify_edit(anchor);
}

void Runner::run_solve() {
    Obseq& engine = require_engine();
    engine.solve();

    auto& out = *out_;
    ElementId e = list_.next(NO_ELEMENT);
    bool first_group = true;
    while (e != NO_ELEMENT) {
        auto [first, last] = engine.interval(e);
        if (!first_group) out << ' ';
        first_group = false;
        out << '[';
        for (ElementId x = first;; x = list_.next(x)) {
            out << list_.weight(x);
            if (x == last) break;
            out << ' ';
        }
        out << ']';
        e = list_.next(last);
    }
    if (!list_.empty()) out << '\n';

    // スクリプトのコストモデルは総コストを double で持つ
    CostPtr cost = engine.best_cost();
    out << "cost = " << (cost ? cost_value<double>(*cost) : 0.0) << '\n';
    out << "----------\n";
}

void Runner::run_query(const QueryCommand& cmd) {
    Obseq& engine = require_engine();
    if (list_.empty()) {
        throw std::runtime_error("query: sequence is empty");
    }
    size_t pos = to_position(cmd.position, list_.size() - 1, "query");
    engine.solve();
    auto [first, last] = engine.interval(list_.at(pos));
    *out_ << pos << ": [" << list_.position(first) << ", " << list_.position(last) << "]\n";
}

} // namespace script
} // namespace obseq
