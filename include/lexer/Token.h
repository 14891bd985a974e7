#ifndef TOKEN_H
#define TOKEN_H

/**
 * @file Token.h
 * @brief Lexical token of the score formula language
 *
 * Token types double as the terminal symbols of the expression grammar,
 * so a `Token::Type` value can be used directly as a `GrammarSymbol`.
 */

#include "core/FormulaError.h"
#include <QString>

// ═══════════════════════════════════════════════════════════════════
// TOKEN
// ═══════════════════════════════════════════════════════════════════

struct Token {
    enum Type {
        Number,        // 42, 3.14, 1e3
        Identifier,    // function name or bare name (ABS, PI, days)
        Variable,      // {name} or ${name}
        Plus,          // +
        Minus,         // -
        Multiply,      // *
        Divide,        // /
        Modulo,        // %
        Power,         // ^
        Equal,         // == (also =)
        NotEqual,      // !=
        Less,          // <
        LessEqual,     // <=
        Greater,       // >
        GreaterEqual,  // >=
        And,           // && (also AND)
        Or,            // || (also OR)
        Not,           // !  (also NOT)
        LParen,        // (
        RParen,        // )
        Comma,         // ,
        If,            // IF
        True,          // TRUE
        False,         // FALSE
        End,           // end of input ($)

        TypeCount
    };

    Type type = End;

    // Raw source text of the lexeme, delimiters included ("${rate}", "and")
    QString text;

    // Normalised value: variable name without braces, identifier as written,
    // number literal as written
    QString value;

    SourcePosition position;

    // Whitespace skipped immediately before this token
    QString leadingWhitespace;

    static QString typeName(Type type);
    // Canonical spelling used in diagnostics ("+", "&&", "NUMBER")
    static QString symbolText(Type type);
};

#endif // TOKEN_H
