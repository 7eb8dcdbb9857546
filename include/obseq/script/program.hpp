/**
 * @file program.hpp
 * @brief 分割スクリプトの中間表現
 */
#ifndef OBSEQ_SCRIPT_PROGRAM_HPP
#define OBSEQ_SCRIPT_PROGRAM_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace obseq {
namespace script {

/**
 * @brief model 文: コストモデルを設定（エンジンの窓は全て破棄される）
 */
struct ModelCommand {
    std::string name;
    std::map<std::string, int64_t> params;
};

/**
 * @brief elements 文: 末尾に要素を追加
 */
struct ElementsCommand {
    std::vector<int64_t> weights;
};

/**
 * @brief solve 文: 最適分割を出力
 */
struct SolveCommand {};

/**
 * @brief insert 文: position の直前に要素を挿入
 */
struct InsertCommand {
    int64_t position;
    std::vector<int64_t> weights;
};

/**
 * @brief erase 文: [first, last) の要素を削除
 */
struct EraseCommand {
    int64_t first;
    int64_t last;
};

/**
 * @brief set 文: position の要素の重みを変更
 */
struct SetCommand {
    int64_t position;
    int64_t weight;
};

/**
 * @brief query 文: position の要素を含むグループの範囲を出力
 */
struct QueryCommand {
    int64_t position;
};

using Command = std::variant<
    ModelCommand,
    ElementsCommand,
    SolveCommand,
    InsertCommand,
    EraseCommand,
    SetCommand,
    QueryCommand
>;

/**
 * @brief スクリプト（文の列）
 */
class Program {
public:
    Program() = default;

    /**
     * @brief 文を追加
     * @param command 文
     * @param line ソース上の行番号（エラーメッセージ用）
     */
    void add_command(Command command, int line);

    const std::vector<Command>& commands() const { return commands_; }

    /**
     * @brief i 番目の文の行番号
     */
    int line_of(size_t i) const { return lines_[i]; }

    size_t size() const { return commands_.size(); }

private:
    std::vector<Command> commands_;
    std::vector<int> lines_;
};

/**
 * @brief スクリプトファイルをパース
 * @param filename ファイル名
 * @return パースされたスクリプト
 * @throws std::runtime_error ファイルを開けない・パースエラー時
 */
std::unique_ptr<Program> parse_file(const std::string& filename);

/**
 * @brief スクリプト文字列をパース
 * @param input 入力文字列
 * @return パースされたスクリプト
 * @throws std::runtime_error パースエラー時
 */
std::unique_ptr<Program> parse_string(const std::string& input);

} // namespace script
} // namespace obseq

#endif // OBSEQ_SCRIPT_PROGRAM_HPP
