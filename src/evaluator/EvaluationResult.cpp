#include "evaluator/EvaluationResult.h"
#include <QJsonArray>
#include <QJsonValue>

EvaluationResult EvaluationResult::ok(const QVariant &value) {
  EvaluationResult r;
  r.value = value;
  r.success = true;
  return r;
}

EvaluationResult EvaluationResult::failure(const FormulaError &error) {
  EvaluationResult r;
  r.success = false;
  r.error = error;
  return r;
}

bool EvaluationResult::sameOutcome(const EvaluationResult &other) const {
  return success == other.success && value == other.value &&
         error.kind == other.error.kind && error.message == other.error.message &&
         touchedVariables == other.touchedVariables &&
         touchedFunctions == other.touchedFunctions;
}

QJsonObject EvaluationResult::toJson() const {
  QJsonObject json;
  json["success"] = success;
  json["value"] = value.isValid() ? QJsonValue::fromVariant(value) : QJsonValue();
  json["evaluation_time_ns"] = double(evaluationTimeNs);
  json["variables"] = QJsonArray::fromStringList(touchedVariables);
  json["functions"] = QJsonArray::fromStringList(touchedFunctions);
  if (!success)
    json["error"] = error.toJson();
  return json;
}
