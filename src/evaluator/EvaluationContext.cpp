#include "evaluator/EvaluationContext.h"

EvaluationContext EvaluationContext::fromVariables(const QVariantMap &variables,
                                                   int maxVariables,
                                                   FormulaError *error) {
  EvaluationContext ctx;
  ctx.m_maxVariables = maxVariables;
  return ctx.withVariables(variables, error);
}

EvaluationContext EvaluationContext::withVariable(const QString &name,
                                                  const QVariant &value,
                                                  FormulaError *error) const {
  if (!m_variables.contains(name) && m_variables.size() + 1 > m_maxVariables) {
    FormulaError err = FormulaError::limitExceeded(
        FormulaError::Kind::TooManyVariables, "Variable count", m_maxVariables,
        m_variables.size() + 1);
    err.offendingText = name;
    reportError(error, err);
    return *this;
  }
  EvaluationContext next = *this;
  next.m_variables.insert(name, value);
  return next;
}

EvaluationContext EvaluationContext::withVariables(const QVariantMap &variables,
                                                   FormulaError *error) const {
  int added = 0;
  for (auto it = variables.constBegin(); it != variables.constEnd(); ++it)
    if (!m_variables.contains(it.key()))
      ++added;

  if (m_variables.size() + added > m_maxVariables) {
    reportError(error, FormulaError::limitExceeded(FormulaError::Kind::TooManyVariables,
                                                   "Variable count", m_maxVariables,
                                                   m_variables.size() + added));
    return *this;
  }

  EvaluationContext next = *this;
  for (auto it = variables.constBegin(); it != variables.constEnd(); ++it)
    next.m_variables.insert(it.key(), it.value());
  return next;
}

EvaluationContext EvaluationContext::withoutVariable(const QString &name) const {
  EvaluationContext next = *this;
  next.m_variables.remove(name);
  return next;
}

EvaluationContext EvaluationContext::withMaxDepth(int depth) const {
  EvaluationContext next = *this;
  next.m_maxDepth = depth;
  return next;
}

EvaluationContext EvaluationContext::withMaxVariables(int count) const {
  EvaluationContext next = *this;
  next.m_maxVariables = count;
  return next;
}

EvaluationContext EvaluationContext::withStrictMode(bool strict) const {
  EvaluationContext next = *this;
  next.m_strictMode = strict;
  return next;
}

EvaluationContext EvaluationContext::withCaching(bool enabled) const {
  EvaluationContext next = *this;
  next.m_enableCaching = enabled;
  return next;
}

EvaluationContext EvaluationContext::withOptimization(bool enabled) const {
  EvaluationContext next = *this;
  next.m_enableOptimization = enabled;
  return next;
}

QString EvaluationContext::fingerprint() const {
  // Length-prefixed fields so names and values may contain any separator.
  // QVariantMap iterates in key order.
  QString key;
  for (auto it = m_variables.constBegin(); it != m_variables.constEnd(); ++it) {
    const QString value = it.value().toString();
    // Multi-argument arg() substitutes in one pass, so '%' in names is inert
    key += QString("%1:%2%3:%4:%5")
               .arg(QString::number(it.key().length()), it.key(),
                    QString::number(it.value().userType()),
                    QString::number(value.length()), value);
  }
  key += QString("#depth=%1,strict=%2").arg(m_maxDepth).arg(m_strictMode ? 1 : 0);
  return key;
}
