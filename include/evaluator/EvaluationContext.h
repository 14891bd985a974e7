#ifndef EVALUATION_CONTEXT_H
#define EVALUATION_CONTEXT_H

/**
 * @file EvaluationContext.h
 * @brief Immutable variable bindings and evaluation limits
 *
 * Every withX() call returns a new context; the receiver is never
 * modified. Contexts are cheap to copy (QVariantMap is implicitly shared),
 * so the orchestrator threads a fresh one into every formula step.
 */

#include "core/FormulaError.h"
#include <QString>
#include <QVariant>
#include <QVariantMap>

class EvaluationContext {
public:
    static constexpr int DefaultMaxDepth = 100;
    static constexpr int DefaultMaxVariables = 1000;

    EvaluationContext() = default;

    // Fails with TooManyVariables when `variables` exceeds maxVariables.
    static EvaluationContext fromVariables(const QVariantMap &variables,
                                           int maxVariables = DefaultMaxVariables,
                                           FormulaError *error = nullptr);

    // ── Bindings ──
    const QVariantMap &variables() const { return m_variables; }
    bool hasVariable(const QString &name) const { return m_variables.contains(name); }
    QVariant variable(const QString &name) const { return m_variables.value(name); }
    int variableCount() const { return m_variables.size(); }

    // Return the context unchanged and fill *error on TooManyVariables
    EvaluationContext withVariable(const QString &name, const QVariant &value,
                                   FormulaError *error = nullptr) const;
    EvaluationContext withVariables(const QVariantMap &variables,
                                    FormulaError *error = nullptr) const;
    EvaluationContext withoutVariable(const QString &name) const;

    // ── Limits and flags ──
    int maxDepth() const { return m_maxDepth; }
    int maxVariables() const { return m_maxVariables; }
    bool strictMode() const { return m_strictMode; }
    bool cachingEnabled() const { return m_enableCaching; }
    bool optimizationEnabled() const { return m_enableOptimization; }

    EvaluationContext withMaxDepth(int depth) const;
    EvaluationContext withMaxVariables(int count) const;
    EvaluationContext withStrictMode(bool strict) const;
    EvaluationContext withCaching(bool enabled) const;
    EvaluationContext withOptimization(bool enabled) const;

    // Deterministic snapshot of bindings and flags, usable as a cache key
    QString fingerprint() const;

private:
    QVariantMap m_variables;
    int  m_maxDepth = DefaultMaxDepth;
    int  m_maxVariables = DefaultMaxVariables;
    bool m_strictMode = false;
    bool m_enableCaching = true;
    bool m_enableOptimization = true;
};

#endif // EVALUATION_CONTEXT_H
