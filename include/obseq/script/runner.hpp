/**
 * @file runner.hpp
 * @brief スクリプトの実行（要素列の編集・エンジンへの通知・結果出力）
 */
#ifndef OBSEQ_SCRIPT_RUNNER_HPP
#define OBSEQ_SCRIPT_RUNNER_HPP

#include "obseq/obseq.hpp"
#include "obseq/script/element_list.hpp"
#include "obseq/script/program.hpp"
#include <memory>
#include <ostream>

namespace obseq {
namespace script {

/**
 * @brief スクリプト実行器
 *
 * 要素列（ElementList）を所有し、最初の model 文でエンジンを作成する。
 * 編集文のたびに、編集位置より前で最後の要素を notify_after() で通知する。
 */
class Runner {
public:
    explicit Runner(std::ostream& out);

    /**
     * @brief スクリプト全体を実行
     * @throws std::runtime_error 実行エラー時（行番号付き）
     */
    void run(const Program& program);

    /**
     * @brief 1文を実行
     */
    void execute(const Command& command);

    const ElementList& elements() const { return list_; }

    /**
     * @brief エンジン（model 文の前は nullptr）
     */
    const Obseq* engine() const { return engine_.get(); }

    void set_verbose(bool enabled) { verbose_ = enabled; }
    void set_expand_pruning(bool enabled) { expand_pruning_ = enabled; }

private:
    void run_model(const ModelCommand& cmd);
    void run_elements(const ElementsCommand& cmd);
    void run_solve();
    void run_insert(const InsertCommand& cmd);
    void run_erase(const EraseCommand& cmd);
    void run_set(const SetCommand& cmd);
    void run_query(const QueryCommand& cmd);

    /// position の直前の要素（position == 0 なら NO_ELEMENT）
    ElementId element_before(size_t position) const;

    /// 編集後の通知
    void notify_edit(ElementId anchor);

    Obseq& require_engine();

    std::ostream* out_;
    ElementList list_;
    std::unique_ptr<Obseq> engine_;
    bool verbose_ = false;
    bool expand_pruning_ = false;
};

} // namespace script
} // namespace obseq

#endif // OBSEQ_SCRIPT_RUNNER_HPP
