#ifndef FORMULA_ORCHESTRATOR_H
#define FORMULA_ORCHESTRATOR_H

#include "engine/ParserEngine.h"
#include "evaluator/Evaluator.h"
#include "formula/FormulaExecution.h"
#include "formula/FormulaSet.h"
#include <QStringList>
#include <QVariantMap>
#include <QVector>
#include <memory>

/**
 * @brief Runs a FormulaSet step by step against a running variable map
 *
 * For each formula (by order):
 *   1. evaluate its execution condition, if any; false → skip (PARTIAL)
 *   2. evaluate the expression against inputs + earlier results
 *   3. bind the value to the formula's result variable
 *
 * The first failing step stops the run: the execution is FAILED and carries
 * a StepExecutionError whose cause is the step's own error.
 *
 * One orchestrator owns one Evaluator (and its cache); use one instance per
 * thread. The ParserEngine itself is shared.
 */
class FormulaOrchestrator {
public:
    explicit FormulaOrchestrator(std::shared_ptr<const ParserEngine> engine);

    FormulaExecution execute(const FormulaSet &set, const QVariantMap &inputs) const;

    // Evaluates `expressions` in order, binding result i as "step<i+1>".
    // Returns one result per attempted expression; stops after the first
    // failure.
    QVector<EvaluationResult> calculateMultiStep(const QStringList &expressions,
                                                 const QVariantMap &inputs) const;

    const ParserEngine &engine() const { return *m_engine; }

private:
    FormulaExecution failed(const FormulaSet &set, const QVariantMap &inputs,
                            const QVector<ExecutionStep> &steps,
                            const QStringList &skipped, const FormulaError &error,
                            const QDateTime &startedAt) const;

    std::shared_ptr<const ParserEngine> m_engine;
    Evaluator m_evaluator;
};

#endif // FORMULA_ORCHESTRATOR_H
