#ifndef LR_PARSER_H
#define LR_PARSER_H

/**
 * @file LRParser.h
 * @brief Table-driven shift/reduce parser
 *
 * Runs on an explicit state stack and value stack: one ACTION lookup per
 * step, no recursion. Nesting is bounded by ParserLimits rather than by the
 * call stack.
 */

#include "ast/AstBuilderRegistry.h"
#include "core/FormulaError.h"
#include "lexer/Token.h"
#include "parser/Grammar.h"
#include "parser/ParseTable.h"
#include <QVector>

struct ParserLimits {
    int maxParsingSteps = 100000;   // shift + reduce actions
    int maxStackDepth   = 10000;    // entries on the state stack
    int maxParsingDepth = 100;      // open parentheses at any point
};

class LRParser {
public:
    LRParser(const Grammar &grammar, const ParseTable &table,
             const AstBuilderRegistry &builders);

    // Returns the AST root, or nullptr with *error filled.
    AstNodePtr parse(const QVector<Token> &tokens,
                     const ParserLimits &limits = ParserLimits(),
                     FormulaError *error = nullptr) const;

private:
    FormulaError unexpectedToken(int state, const Token &token) const;

    const Grammar            &m_grammar;
    const ParseTable         &m_table;
    const AstBuilderRegistry &m_builders;
};

#endif // LR_PARSER_H
