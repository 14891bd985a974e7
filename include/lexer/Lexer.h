#ifndef LEXER_H
#define LEXER_H

/**
 * @file Lexer.h
 * @brief Single-pass tokenizer for score formulas
 *
 *   Lexer lexer;
 *   FormulaError err;
 *   QVector<Token> tokens = lexer.tokenize("IF({days} >= 5, 10, 15)", &err);
 *
 * `TokenStream` yields the same tokens lazily; `Lexer::tokenize` is built
 * on top of it so both variants always agree on token boundaries.
 */

#include "core/FormulaError.h"
#include "lexer/Token.h"
#include <QString>
#include <QVector>

struct LexerOptions {
    int maxFormulaLength = 5000;
    int maxTokenCount    = 10000;
};

// ═══════════════════════════════════════════════════════════════════
// TOKEN STREAM: lazy tokenizer
// ═══════════════════════════════════════════════════════════════════

class TokenStream {
public:
    explicit TokenStream(const QString &input,
                         const LexerOptions &options = LexerOptions());

    // Produces the next token. The End token is returned once input is
    // exhausted; after an error or the End token atEnd() is true.
    bool next(Token *token, FormulaError *error = nullptr);

    bool atEnd() const { return m_finished; }
    int tokenCount() const { return m_tokenCount; }

private:
    QChar peek(int offset = 0) const;
    void advance();
    SourcePosition position() const;

    bool fail(const FormulaError &err, FormulaError *error);
    bool lexNumber(Token *token, FormulaError *error);
    bool lexIdentifier(Token *token);
    bool lexVariable(Token *token, FormulaError *error);
    bool lexOperator(Token *token, FormulaError *error);

    static bool isIdentifierStart(QChar ch);
    static bool isIdentifierPart(QChar ch);

    QString      m_input;
    LexerOptions m_options;
    int          m_index  = 0;
    int          m_line   = 1;
    int          m_column = 1;
    int          m_tokenCount = 0;
    bool         m_started  = false;
    bool         m_finished = false;
};

// ═══════════════════════════════════════════════════════════════════
// LEXER: eager tokenizer
// ═══════════════════════════════════════════════════════════════════

class Lexer {
public:
    explicit Lexer(const LexerOptions &options = LexerOptions());

    // Returns all tokens terminated by an End token, or an empty vector
    // with *error filled.
    QVector<Token> tokenize(const QString &input,
                            FormulaError *error = nullptr) const;

    // Leading whitespace + raw text of every token, End included.
    static QString reconstruct(const QVector<Token> &tokens);

    const LexerOptions &options() const { return m_options; }

private:
    LexerOptions m_options;
};

#endif // LEXER_H
