#include "formula/FormulaOrchestrator.h"
#include <QDebug>
#include <QUuid>

namespace {

QString newExecutionId() { return QUuid::createUuid().toString(QUuid::WithoutBraces); }

FormulaError stepError(int stepIndex, const Formula &formula, const QString &what,
                       const FormulaError &cause) {
  FormulaError err = FormulaError::wrap(
      FormulaError::Kind::StepExecutionError,
      QString("Step %1 (%2) %3: %4").arg(formula.order).arg(formula.name, what, cause.message),
      cause);
  err.stepIndex = stepIndex;
  err.offendingText = formula.id;
  return err;
}

} // namespace

FormulaOrchestrator::FormulaOrchestrator(std::shared_ptr<const ParserEngine> engine)
    : m_engine(std::move(engine)), m_evaluator(m_engine->functions()) {}

FormulaExecution FormulaOrchestrator::failed(const FormulaSet &set,
                                             const QVariantMap &inputs,
                                             const QVector<ExecutionStep> &steps,
                                             const QStringList &skipped,
                                             const FormulaError &error,
                                             const QDateTime &startedAt) const {
  qWarning().noquote() << "[FormulaOrchestrator] formula set" << set.id
                       << "failed:" << error.toString();
  return FormulaExecution(newExecutionId(), set.id, inputs, steps, skipped, QVariant(),
                          FormulaExecution::Status::Failed, error, startedAt);
}

// ═══════════════════════════════════════════════════════════════════
// Formula set execution
// ═══════════════════════════════════════════════════════════════════

FormulaExecution FormulaOrchestrator::execute(const FormulaSet &set,
                                              const QVariantMap &inputs) const {
  const QDateTime startedAt = QDateTime::currentDateTimeUtc();
  const EngineConfig &config = m_engine->config();

  // ── Guards ──
  FormulaError err;
  if (!set.validate(&err))
    return failed(set, inputs, {}, {}, err, startedAt);

  if (set.formulas.size() > config.maxSteps) {
    return failed(set, inputs, {}, {},
                  FormulaError::limitExceeded(FormulaError::Kind::TooManySteps,
                                              "Formula count", config.maxSteps,
                                              set.formulas.size()),
                  startedAt);
  }

  if (inputs.size() > config.maxVariables) {
    return failed(set, inputs, {}, {},
                  FormulaError::limitExceeded(FormulaError::Kind::TooManyVariables,
                                              "Input variable count", config.maxVariables,
                                              inputs.size()),
                  startedAt);
  }

  EvaluationContext context = m_engine->defaultContext().withVariables(inputs, &err);
  if (err.isError())
    return failed(set, inputs, {}, {}, err, startedAt);

  QVector<ExecutionStep> steps;
  QStringList skipped;
  QVariant lastValue;

  // ── Steps ──
  const QVector<Formula> ordered = set.orderedFormulas();
  for (int index = 0; index < ordered.size(); ++index) {
    const Formula &formula = ordered[index];
    if (formula.hasCondition()) {
      EvaluationResult cond =
          m_engine->evaluate(formula.executionCondition, context, m_evaluator);
      if (!cond.success)
        return failed(set, inputs, steps, skipped,
                      stepError(index, formula, "condition failed", cond.error), startedAt);

      bool run = false;
      if (!Evaluator::toBoolean(cond.value, context.strictMode(), &run, &err))
        return failed(set, inputs, steps, skipped,
                      stepError(index, formula, "condition is not boolean", err), startedAt);

      if (!run) {
        qInfo().noquote() << "[FormulaOrchestrator] skipping step" << formula.order
                          << formula.name << "- condition" << formula.executionCondition
                          << "is false";
        skipped.append(formula.name);
        continue;
      }
    }

    EvaluationResult result = m_engine->evaluate(formula.expression, context, m_evaluator);
    if (!result.success)
      return failed(set, inputs, steps, skipped,
                    stepError(index, formula, "failed", result.error), startedAt);

    EvaluationContext next = context.withVariable(formula.resultVariable, result.value, &err);
    if (err.isError())
      return failed(set, inputs, steps, skipped,
                    stepError(index, formula, "cannot bind result", err), startedAt);
    context = next;

    ExecutionStep step;
    step.stepOrder = formula.order;
    step.formulaId = formula.id;
    step.formulaName = formula.name;
    step.formulaExpression = formula.expression;
    step.resultVariableName = formula.resultVariable;
    step.resultValue = result.value;
    step.executedAt = QDateTime::currentDateTimeUtc();
    step.evaluationTimeNs = result.evaluationTimeNs;
    steps.append(step);
    lastValue = result.value;

    qDebug().noquote() << "[FormulaOrchestrator] step" << formula.order << formula.name
                       << "->" << formula.resultVariable << "=" << result.value.toString();
  }

  QVariant finalResult = lastValue;
  if (!set.finalResultVariable.isEmpty()) {
    if (!context.hasVariable(set.finalResultVariable)) {
      FormulaError missing = FormulaError::make(
          FormulaError::Kind::UndefinedVariable,
          QString("Final result variable '%1' was never produced").arg(set.finalResultVariable),
          set.finalResultVariable);
      return failed(set, inputs, steps, skipped, missing, startedAt);
    }
    finalResult = context.variable(set.finalResultVariable);
  }

  FormulaExecution::Status status = skipped.isEmpty() ? FormulaExecution::Status::Success
                                                      : FormulaExecution::Status::Partial;
  return FormulaExecution(newExecutionId(), set.id, inputs, steps, skipped, finalResult,
                          status, FormulaError(), startedAt);
}

QVector<EvaluationResult> FormulaOrchestrator::calculateMultiStep(
    const QStringList &expressions, const QVariantMap &inputs) const {
  QVector<EvaluationResult> results;

  FormulaError err;
  EvaluationContext context = m_engine->defaultContext().withVariables(inputs, &err);
  if (err.isError()) {
    results.append(EvaluationResult::failure(err));
    return results;
  }

  for (int i = 0; i < expressions.size(); ++i) {
    EvaluationResult result = m_engine->evaluate(expressions[i], context, m_evaluator);
    if (!result.success) {
      results.append(result);
      break;
    }

    context = context.withVariable(QString("step%1").arg(i + 1), result.value, &err);
    if (err.isError()) {
      results.append(EvaluationResult::failure(err));
      break;
    }
    results.append(result);
  }
  return results;
}
