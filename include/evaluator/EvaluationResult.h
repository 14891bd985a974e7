#ifndef EVALUATION_RESULT_H
#define EVALUATION_RESULT_H

#include "core/FormulaError.h"
#include <QJsonObject>
#include <QStringList>
#include <QVariant>

struct EvaluationResult {
    QVariant value;            // double, bool, QString or invalid (null)
    bool success = false;
    FormulaError error;
    qint64 evaluationTimeNs = 0;
    QStringList touchedVariables;
    QStringList touchedFunctions;

    static EvaluationResult ok(const QVariant &value);
    static EvaluationResult failure(const FormulaError &error);

    QString errorMessage() const { return error.toString(); }

    // Value, status, error kind and touched names; timing is ignored
    bool sameOutcome(const EvaluationResult &other) const;

    QJsonObject toJson() const;
};

#endif // EVALUATION_RESULT_H
