#include "formula/FormulaExecution.h"
#include <QJsonArray>
#include <QJsonValue>

namespace {

QJsonValue toJsonValue(const QVariant &value) {
  return value.isValid() ? QJsonValue::fromVariant(value) : QJsonValue();
}

} // namespace

QJsonObject ExecutionStep::toJson() const {
  QJsonObject json;
  json["step_order"] = stepOrder;
  json["formula_id"] = formulaId;
  json["formula_name"] = formulaName;
  json["expression"] = formulaExpression;
  json["result_variable"] = resultVariableName;
  json["result_value"] = toJsonValue(resultValue);
  json["executed_at"] = executedAt.toString(Qt::ISODateWithMs);
  json["evaluation_time_ns"] = double(evaluationTimeNs);
  return json;
}

FormulaExecution::FormulaExecution(const QString &executionId,
                                   const QString &formulaSetId,
                                   const QVariantMap &inputVariables,
                                   const QVector<ExecutionStep> &steps,
                                   const QStringList &skippedFormulas,
                                   const QVariant &finalResult, Status status,
                                   const FormulaError &error,
                                   const QDateTime &executedAt)
    : m_executionId(executionId), m_formulaSetId(formulaSetId),
      m_inputVariables(inputVariables), m_steps(steps),
      m_skippedFormulas(skippedFormulas), m_finalResult(finalResult),
      m_status(status), m_error(error), m_executedAt(executedAt) {}

QVariant FormulaExecution::result(const QString &variableName) const {
  for (int i = m_steps.size() - 1; i >= 0; --i)
    if (m_steps[i].resultVariableName == variableName)
      return m_steps[i].resultValue;
  if (m_inputVariables.contains(variableName))
    return m_inputVariables.value(variableName);
  if (variableName == "final_score")
    return m_finalResult;
  return QVariant();
}

QVariantMap FormulaExecution::allResults() const {
  QVariantMap all = m_inputVariables;
  for (const ExecutionStep &s : m_steps)
    all.insert(s.resultVariableName, s.resultValue);
  if (!all.contains("final_score"))
    all.insert("final_score", m_finalResult);
  return all;
}

const ExecutionStep *FormulaExecution::step(int stepOrder) const {
  for (const ExecutionStep &s : m_steps)
    if (s.stepOrder == stepOrder)
      return &s;
  return nullptr;
}

QString FormulaExecution::statusName(Status status) {
  switch (status) {
  case Status::Success:
    return "SUCCESS";
  case Status::Failed:
    return "FAILED";
  case Status::Partial:
    return "PARTIAL";
  }
  return "UNKNOWN";
}

QJsonObject FormulaExecution::toJson() const {
  QJsonObject json;
  json["execution_id"] = m_executionId;
  json["formula_set_id"] = m_formulaSetId;
  json["status"] = statusName(m_status);
  json["executed_at"] = m_executedAt.toString(Qt::ISODateWithMs);
  json["final_result"] = toJsonValue(m_finalResult);

  QJsonObject inputs;
  for (auto it = m_inputVariables.constBegin(); it != m_inputVariables.constEnd(); ++it)
    inputs[it.key()] = toJsonValue(it.value());
  json["input_variables"] = inputs;

  QJsonArray steps;
  for (const ExecutionStep &s : m_steps)
    steps.append(s.toJson());
  json["steps"] = steps;
  json["skipped_formulas"] = QJsonArray::fromStringList(m_skippedFormulas);

  if (m_error.isError())
    json["error"] = m_error.toJson();
  return json;
}
