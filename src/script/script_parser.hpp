/**
 * @file script_parser.hpp
 * @brief 生成されたスキャナ・パーサーの宣言（script_parser.cpp 専用）
 *
 * parse_file() / parse_string() 自体は obseq/script/program.hpp で公開する。
 */
#ifndef OBSEQ_SCRIPT_PARSER_HPP
#define OBSEQ_SCRIPT_PARSER_HPP

#include "obseq/script/program.hpp"
#include <cstdio>

typedef void* yyscan_t;
struct ParserContext;
struct yy_buffer_state;
typedef struct yy_buffer_state* YY_BUFFER_STATE;

// lexer.l (flex, reentrant)
int yylex_init(yyscan_t* scanner);
int yylex_destroy(yyscan_t scanner);
void yyset_in(FILE* in, yyscan_t scanner);
YY_BUFFER_STATE yy_scan_string(const char* str, yyscan_t scanner);
void yy_delete_buffer(YY_BUFFER_STATE buffer, yyscan_t scanner);

// parser.y (bison, pure)
int yyparse(yyscan_t scanner, ParserContext* ctx);

#endif // OBSEQ_SCRIPT_PARSER_HPP
