#include "formula/FormulaSetParser.h"
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>

// ═══════════════════════════════════════════════════════════
// PARSE JSON → FormulaSet
// ═══════════════════════════════════════════════════════════

FormulaSet FormulaSetParser::parseJson(const QJsonObject &json, QString &errorMsg) {
  FormulaSet set;
  errorMsg.clear();

  // ── Basic fields ──
  set.id = json["formula_set_id"].toString();
  set.name = json["name"].toString();
  set.type = json["type"].toString("SCORE_CALCULATION");
  set.description = json["description"].toString();
  set.isActive = json["is_active"].toBool(true);
  set.finalResultVariable = json["final_result_variable"].toString();

  if (set.name.isEmpty()) {
    errorMsg = "Formula set name is required";
    return FormulaSet();
  }

  // ── Criteria ──
  if (json.contains("criteria")) {
    QJsonObject criteria = json["criteria"].toObject();
    set.criteria.applicationType = criteria["application_type"].toString();
    set.criteria.educationalStatus = criteria["educational_status"].toString();
    set.criteria.region = criteria["region"].toString();
  }

  // ── Formulas ──
  if (!json["formulas"].isArray()) {
    errorMsg = "Formula set must contain a 'formulas' array";
    return FormulaSet();
  }

  QJsonArray formulas = json["formulas"].toArray();
  for (int i = 0; i < formulas.size(); ++i) {
    if (!formulas[i].isObject()) {
      errorMsg = QString("Formula #%1 is not an object").arg(i + 1);
      return FormulaSet();
    }
    Formula formula = parseFormula(formulas[i].toObject(), i);
    if (formula.expression.trimmed().isEmpty()) {
      errorMsg = QString("Formula '%1' has no expression").arg(formula.id);
      return FormulaSet();
    }
    set.formulas.append(formula);
  }

  return set;
}

FormulaSet FormulaSetParser::parseJsonText(const QByteArray &text, QString &errorMsg) {
  QJsonParseError parseError;
  QJsonDocument doc = QJsonDocument::fromJson(text, &parseError);
  if (parseError.error != QJsonParseError::NoError) {
    errorMsg = QString("Invalid JSON at offset %1: %2")
                   .arg(parseError.offset)
                   .arg(parseError.errorString());
    return FormulaSet();
  }
  if (!doc.isObject()) {
    errorMsg = "Formula set document must be a JSON object";
    return FormulaSet();
  }
  return parseJson(doc.object(), errorMsg);
}

FormulaSet FormulaSetParser::loadFile(const QString &filePath, QString &errorMsg) {
  QFile file(filePath);
  if (!file.open(QIODevice::ReadOnly)) {
    errorMsg = QString("Cannot open formula set file %1: %2")
                   .arg(filePath, file.errorString());
    return FormulaSet();
  }
  return parseJsonText(file.readAll(), errorMsg);
}

Formula FormulaSetParser::parseFormula(const QJsonObject &json, int index) {
  Formula f;
  f.order = json["order"].toInt(index + 1);
  f.id = json["formula_id"].toString(QString("formula_%1").arg(f.order));
  f.name = json["name"].toString(f.id);
  f.expression = json["expression"].toString();
  f.resultVariable = json["result_variable"].toString();
  f.description = json["description"].toString();
  f.executionCondition = json["execution_condition"].toString();
  return f;
}

// ═══════════════════════════════════════════════════════════
// FormulaSet → JSON
// ═══════════════════════════════════════════════════════════

QJsonObject FormulaSetParser::toJson(const FormulaSet &set) {
  QJsonObject json;
  json["formula_set_id"] = set.id;
  json["name"] = set.name;
  json["type"] = set.type;
  json["description"] = set.description;
  json["is_active"] = set.isActive;
  if (!set.finalResultVariable.isEmpty())
    json["final_result_variable"] = set.finalResultVariable;

  QJsonObject criteria;
  criteria["application_type"] = set.criteria.applicationType;
  criteria["educational_status"] = set.criteria.educationalStatus;
  criteria["region"] = set.criteria.region;
  json["criteria"] = criteria;

  QJsonArray formulas;
  for (const Formula &f : set.formulas)
    formulas.append(formulaToJson(f));
  json["formulas"] = formulas;
  return json;
}

QJsonObject FormulaSetParser::formulaToJson(const Formula &formula) {
  QJsonObject json;
  json["formula_id"] = formula.id;
  json["order"] = formula.order;
  json["name"] = formula.name;
  json["expression"] = formula.expression;
  json["result_variable"] = formula.resultVariable;
  if (!formula.description.isEmpty())
    json["description"] = formula.description;
  if (formula.hasCondition())
    json["execution_condition"] = formula.executionCondition;
  return json;
}
