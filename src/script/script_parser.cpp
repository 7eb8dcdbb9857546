/**
 * @file script_parser.cpp
 * @brief flex/bison で生成したパーサーの駆動
 */
#include "script_parser.hpp"
#include "parser.hpp"
#include <cstdio>
#include <stdexcept>

namespace obseq {
namespace script {

namespace {

/**
 * @brief 再入可能スキャナの所有者
 *
 * 破棄時に yylex_destroy を呼ぶ。スキャナに積まれたバッファも解放される。
 */
class Scanner {
public:
    Scanner() {
        if (yylex_init(&scanner_) != 0) {
            throw std::runtime_error("Cannot initialize script scanner");
        }
    }
    ~Scanner() { yylex_destroy(scanner_); }

    Scanner(const Scanner&) = delete;
    Scanner& operator=(const Scanner&) = delete;

    yyscan_t get() const { return scanner_; }

private:
    yyscan_t scanner_ = nullptr;
};

/**
 * @brief 文字列入力バッファ（Scanner より先に破棄すること）
 */
class StringBuffer {
public:
    StringBuffer(const std::string& input, const Scanner& scanner)
        : scanner_(scanner.get()), buffer_(yy_scan_string(input.c_str(), scanner_)) {
        if (!buffer_) {
            throw std::runtime_error("Cannot allocate script input buffer");
        }
    }
    ~StringBuffer() { yy_delete_buffer(buffer_, scanner_); }

    StringBuffer(const StringBuffer&) = delete;
    StringBuffer& operator=(const StringBuffer&) = delete;

private:
    yyscan_t scanner_;
    YY_BUFFER_STATE buffer_;
};

struct FileCloser {
    void operator()(FILE* file) const { std::fclose(file); }
};

/// 入力を設定済みのスキャナで1回パースする
std::unique_ptr<Program> parse_with(yyscan_t scanner) {
    ParserContext ctx;
    const int result = yyparse(scanner, &ctx);
    if (result != 0 || ctx.has_error) {
        throw std::runtime_error("Parse error: " + ctx.error_message);
    }
    return std::move(ctx.program);
}

}  // namespace

std::unique_ptr<Program> parse_file(const std::string& filename) {
    std::unique_ptr<FILE, FileCloser> file(std::fopen(filename.c_str(), "r"));
    if (!file) {
        throw std::runtime_error("Cannot open file: " + filename);
    }
    Scanner scanner;
    yyset_in(file.get(), scanner.get());
    return parse_with(scanner.get());
}

std::unique_ptr<Program> parse_string(const std::string& input) {
    Scanner scanner;
    StringBuffer buffer(input, scanner);
    return parse_with(scanner.get());
}

} // namespace script
} // namespace obseq
