#ifndef FORMULA_SET_H
#define FORMULA_SET_H

/**
 * @file FormulaSet.h
 * @brief Named, ordered multi-step formula definitions
 *
 * A formula set is data, usually loaded from JSON:
 *
 *   {
 *     "formula_set_id": "gpa-general",
 *     "name": "General admission score",
 *     "final_result_variable": "final_score",
 *     "formulas": [
 *       { "order": 1, "name": "grades",  "expression": "{korean} + {math}",
 *         "result_variable": "grade_sum" },
 *       { "order": 2, "name": "bonus",   "expression": "grade_sum * 1.1",
 *         "result_variable": "final_score",
 *         "execution_condition": "{has_bonus}" }
 *     ]
 *   }
 */

#include "core/FormulaError.h"
#include <QString>
#include <QVector>

struct Formula {
    QString id;
    QString name;
    QString expression;
    int order = 0;                  // 1-based position in the set
    QString resultVariable;
    QString description;
    QString executionCondition;     // empty: always runs

    bool hasCondition() const { return !executionCondition.trimmed().isEmpty(); }

    // id, name and expression non-blank, order > 0
    bool validate(QString *errorMsg = nullptr) const;
};

// Selection criteria; informational only inside the engine
struct FormulaSetCriteria {
    QString applicationType;
    QString educationalStatus;
    QString region;
};

struct FormulaSet {
    QString id;
    QString name;
    QString type;
    QString description;
    bool isActive = true;
    FormulaSetCriteria criteria;
    QString finalResultVariable;    // empty: last executed step's value
    QVector<Formula> formulas;

    // Formulas sorted by order
    QVector<Formula> orderedFormulas() const;
    const Formula *formulaById(const QString &formulaId) const;

    // EmptySteps when there is nothing to run, InvalidFormulaSet otherwise
    bool validate(FormulaError *error = nullptr) const;
};

#endif // FORMULA_SET_H
