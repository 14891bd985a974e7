#ifndef EVALUATOR_H
#define EVALUATOR_H

/**
 * @file Evaluator.h
 * @brief Tree-walking evaluator over immutable ASTs
 *
 * ── Values ──
 *   double, bool, QString, or null (invalid QVariant). Integer inputs are
 *   read as double.
 *
 * ── Numeric coercion (arithmetic, comparisons, function arguments) ──
 *   number → itself, bool → 1/0, numeric string → parsed,
 *   other string → NumberConversionError, null → UnsupportedType.
 *   Strict mode accepts numbers only.
 *
 * ── Truthiness (&&, ||, !, IF condition) ──
 *   bool → itself, number → != 0, "TRUE"/"FALSE" (any case) → the flag,
 *   other non-empty string → true, empty string / null → false.
 *   Strict mode rejects strings other than TRUE/FALSE and null.
 *
 * ── Equality (==, !=) ──
 *   string vs string and bool vs bool compare directly, null equals only
 *   null, everything else compares numerically with a 1e-10 relative
 *   tolerance.
 *
 * && and || short-circuit; IF evaluates only the selected branch.
 *
 * An Evaluator keeps a result cache (when the context enables caching) and
 * must not be shared between threads. The AST and context are never
 * modified.
 */

#include "ast/AstNode.h"
#include "evaluator/EvaluationContext.h"
#include "evaluator/EvaluationResult.h"
#include "evaluator/FunctionRegistry.h"
#include <QHash>

class Evaluator {
public:
    static constexpr int MaxCacheEntries = 1024;

    explicit Evaluator(const FunctionRegistry &functions);

    EvaluationResult evaluate(const AstNode &root, const EvaluationContext &context) const;

    void clearCache() const { m_cache.clear(); }
    int cacheSize() const { return m_cache.size(); }
    int cacheHits() const { return m_cacheHits; }

    // ── Coercion rules ──
    static bool toNumber(const QVariant &value, bool strict, double *out,
                         FormulaError *error = nullptr);
    static bool toBoolean(const QVariant &value, bool strict, bool *out,
                          FormulaError *error = nullptr);
    static bool isNumeric(const QVariant &value);

private:
    struct Trace {
        QStringList variables;
        QStringList functions;
    };

    bool eval(const AstNode &node, const EvaluationContext &ctx, int depth,
              Trace &trace, QVariant *out, FormulaError *error) const;
    bool evalVariable(const AstNode &node, const EvaluationContext &ctx, Trace &trace,
                      QVariant *out, FormulaError *error) const;
    bool evalUnary(const AstNode &node, const EvaluationContext &ctx, int depth,
                   Trace &trace, QVariant *out, FormulaError *error) const;
    bool evalBinary(const AstNode &node, const EvaluationContext &ctx, int depth,
                    Trace &trace, QVariant *out, FormulaError *error) const;
    bool evalFunction(const AstNode &node, const EvaluationContext &ctx, int depth,
                      Trace &trace, QVariant *out, FormulaError *error) const;
    bool evalIf(const AstNode &node, const EvaluationContext &ctx, int depth,
                Trace &trace, QVariant *out, FormulaError *error) const;

    static bool finiteNumber(const QString &op, double value, QVariant *out,
                             FormulaError *error);

    const FunctionRegistry &m_functions;
    mutable QHash<QString, EvaluationResult> m_cache;
    mutable int m_cacheHits = 0;
};

#endif // EVALUATOR_H
