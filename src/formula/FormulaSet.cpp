#include "formula/FormulaSet.h"
#include <QSet>
#include <algorithm>

bool Formula::validate(QString *errorMsg) const {
  QString problem;
  if (id.trimmed().isEmpty())
    problem = "Formula id is required";
  else if (name.trimmed().isEmpty())
    problem = QString("Formula '%1' has no name").arg(id);
  else if (expression.trimmed().isEmpty())
    problem = QString("Formula '%1' has an empty expression").arg(id);
  else if (order <= 0)
    problem = QString("Formula '%1' has non-positive order %2").arg(id).arg(order);

  if (problem.isEmpty())
    return true;
  if (errorMsg)
    *errorMsg = problem;
  return false;
}

QVector<Formula> FormulaSet::orderedFormulas() const {
  QVector<Formula> sorted = formulas;
  std::stable_sort(sorted.begin(), sorted.end(),
                   [](const Formula &a, const Formula &b) { return a.order < b.order; });
  return sorted;
}

const Formula *FormulaSet::formulaById(const QString &formulaId) const {
  for (const Formula &f : formulas)
    if (f.id == formulaId)
      return &f;
  return nullptr;
}

bool FormulaSet::validate(FormulaError *error) const {
  auto invalid = [&](const QString &msg, const QString &text = QString()) {
    reportError(error,
                FormulaError::make(FormulaError::Kind::InvalidFormulaSet, msg, text));
    return false;
  };

  if (name.trimmed().isEmpty())
    return invalid("Formula set name is required", id);

  if (formulas.isEmpty()) {
    reportError(error, FormulaError::make(FormulaError::Kind::EmptySteps,
                                          QString("Formula set '%1' has no formulas").arg(name),
                                          id));
    return false;
  }

  QSet<int> orders;
  QSet<QString> results;
  for (const Formula &f : formulas) {
    QString msg;
    if (!f.validate(&msg))
      return invalid(msg, f.id);
    if (orders.contains(f.order))
      return invalid(QString("Duplicate formula order %1").arg(f.order), f.id);
    orders.insert(f.order);

    QString result = f.resultVariable.trimmed();
    if (result.isEmpty())
      return invalid(QString("Formula '%1' has no result variable").arg(f.id), f.id);
    // Variable references never carry whitespace, so such a name is unreachable
    if (result != f.resultVariable)
      return invalid(QString("Result variable '%1' has surrounding whitespace")
                         .arg(f.resultVariable),
                     f.id);
    if (results.contains(result))
      return invalid(QString("Result variable '%1' is produced twice").arg(result), result);
    results.insert(result);
  }

  // Orders must be exactly 1..n
  for (int i = 1; i <= formulas.size(); ++i) {
    if (!orders.contains(i))
      return invalid(QString("Formula orders must run 1..%1, missing %2")
                         .arg(formulas.size())
                         .arg(i));
  }
  return true;
}
