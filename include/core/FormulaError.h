#ifndef FORMULA_ERROR_H
#define FORMULA_ERROR_H

/**
 * @file FormulaError.h
 * @brief Structured error record shared by every stage of the formula engine
 *
 * Nothing in the engine throws. Fallible calls return a value (or null
 * pointer / false) and fill an optional `FormulaError *error` out-parameter,
 * the same way the strategy code reports through `bool *ok`.
 *
 *   FormulaError err;
 *   QVector<Token> tokens = lexer.tokenize("2 + $x", &err);
 *   if (err.isError())
 *       qWarning() << err.toString();
 */

#include <QJsonObject>
#include <QString>
#include <memory>

// ═══════════════════════════════════════════════════════════════════
// SOURCE POSITION
// ═══════════════════════════════════════════════════════════════════

struct SourcePosition {
    int index  = 0;   // 0-based character offset
    int line   = 1;   // 1-based
    int column = 1;   // 1-based

    QString toString() const;
    bool operator==(const SourcePosition &other) const {
        return index == other.index && line == other.line && column == other.column;
    }
};

// ═══════════════════════════════════════════════════════════════════
// FORMULA ERROR
// ═══════════════════════════════════════════════════════════════════

struct FormulaError {
    enum class Kind {
        None,

        // ── Lexer ──
        UnexpectedCharacter,
        UnclosedVariable,
        InvalidNumberFormat,
        InvalidTokenSequence,

        // ── Grammar / table construction ──
        InvalidGrammar,
        GrammarConflict,
        EmptyCoreItems,
        LalrMergeRejected,

        // ── Parser ──
        UnexpectedToken,
        TooDeep,
        TooManySteps,

        // ── AST builders ──
        ChildCountMismatch,
        ChildTypeMismatch,
        MissingBuilder,

        // ── Evaluator ──
        UndefinedVariable,
        DivisionByZero,
        UnsupportedOperator,
        UnsupportedFunction,
        WrongArgumentCount,
        UnsupportedType,
        NumberConversionError,
        MathError,

        // ── Orchestrator ──
        EmptySteps,
        StepExecutionError,
        InvalidFormulaSet,

        // ── Guards and wrappers ──
        TooLarge,
        TooManyVariables,
        InvalidFormula,
        VariableExtractionFailed,
        InvalidConfiguration
    };

    Kind kind = Kind::None;
    QString message;

    // Offending lexeme / operator / variable / function name
    QString offendingText;
    SourcePosition position;
    bool hasPosition = false;

    // Configuration guards: configured limit and observed value
    qint64 limit    = -1;
    qint64 observed = -1;

    // Orchestrator failures: 0-based index of the failing step
    int stepIndex = -1;

    // Wrapped original failure (kept intact, never collapsed)
    std::shared_ptr<const FormulaError> cause;

    bool isError() const { return kind != Kind::None; }

    // Innermost error of the cause chain (this one if nothing is wrapped)
    const FormulaError &rootCause() const;

    QString toString() const;
    QJsonObject toJson() const;

    static QString kindName(Kind kind);

    // ── Factories ──
    static FormulaError make(Kind kind, const QString &message,
                             const QString &offendingText = QString());
    static FormulaError at(Kind kind, const QString &message,
                           const QString &offendingText,
                           const SourcePosition &position);
    static FormulaError limitExceeded(Kind kind, const QString &what,
                                      qint64 limit, qint64 observed);
    static FormulaError wrap(Kind kind, const QString &message,
                             const FormulaError &cause);
};

// Writes `value` into `*error` when the caller asked for it.
inline void reportError(FormulaError *error, const FormulaError &value) {
    if (error)
        *error = value;
}

#endif // FORMULA_ERROR_H
