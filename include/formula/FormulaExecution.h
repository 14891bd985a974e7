#ifndef FORMULA_EXECUTION_H
#define FORMULA_EXECUTION_H

#include "core/FormulaError.h"
#include <QDateTime>
#include <QJsonObject>
#include <QString>
#include <QStringList>
#include <QVariant>
#include <QVariantMap>
#include <QVector>

struct ExecutionStep {
    int stepOrder = 0;
    QString formulaId;
    QString formulaName;
    QString formulaExpression;
    QString resultVariableName;
    QVariant resultValue;
    QDateTime executedAt;
    qint64 evaluationTimeNs = 0;

    QJsonObject toJson() const;
};

/**
 * Audit trail of one orchestration run. Built by FormulaOrchestrator and
 * read-only afterwards.
 */
class FormulaExecution {
public:
    enum class Status { Success, Failed, Partial };

    FormulaExecution(const QString &executionId,
                     const QString &formulaSetId,
                     const QVariantMap &inputVariables,
                     const QVector<ExecutionStep> &steps,
                     const QStringList &skippedFormulas,
                     const QVariant &finalResult,
                     Status status,
                     const FormulaError &error,
                     const QDateTime &executedAt);

    const QString &executionId() const { return m_executionId; }
    const QString &formulaSetId() const { return m_formulaSetId; }
    const QVariantMap &inputVariables() const { return m_inputVariables; }
    const QVector<ExecutionStep> &steps() const { return m_steps; }
    const QStringList &skippedFormulas() const { return m_skippedFormulas; }
    const QVariant &finalResult() const { return m_finalResult; }
    Status status() const { return m_status; }
    const FormulaError &error() const { return m_error; }
    const QDateTime &executedAt() const { return m_executedAt; }

    bool isSuccess() const { return m_status == Status::Success; }

    // Value bound to `variableName` after the run: step results first, then
    // inputs. "final_score" falls back to the final result.
    QVariant result(const QString &variableName) const;
    // Inputs overlaid with every step result, plus "final_score"
    // unless a step already produced it
    QVariantMap allResults() const;
    const ExecutionStep *step(int stepOrder) const;

    static QString statusName(Status status);
    QJsonObject toJson() const;

private:
    QString m_executionId;
    QString m_formulaSetId;
    QVariantMap m_inputVariables;
    QVector<ExecutionStep> m_steps;
    QStringList m_skippedFormulas;
    QVariant m_finalResult;
    Status m_status;
    FormulaError m_error;
    QDateTime m_executedAt;
};

#endif // FORMULA_EXECUTION_H
