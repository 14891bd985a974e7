#include "evaluator/Evaluator.h"
#include <QDebug>
#include <QElapsedTimer>
#include <QtMath>
#include <cmath>

Evaluator::Evaluator(const FunctionRegistry &functions) : m_functions(functions) {}

// ═══════════════════════════════════════════════════════════════════
// Entry point
// ═══════════════════════════════════════════════════════════════════

EvaluationResult Evaluator::evaluate(const AstNode &root,
                                     const EvaluationContext &context) const {
  QElapsedTimer timer;
  timer.start();

  if (context.variableCount() > context.maxVariables()) {
    EvaluationResult r = EvaluationResult::failure(FormulaError::limitExceeded(
        FormulaError::Kind::TooManyVariables, "Variable count", context.maxVariables(),
        context.variableCount()));
    r.evaluationTimeNs = timer.nsecsElapsed();
    return r;
  }

  QString cacheKey;
  if (context.cachingEnabled()) {
    cacheKey = root.toString() + QLatin1Char('\n') + context.fingerprint();
    auto it = m_cache.constFind(cacheKey);
    if (it != m_cache.constEnd()) {
      ++m_cacheHits;
      EvaluationResult cached = it.value();
      cached.evaluationTimeNs = timer.nsecsElapsed();
      return cached;
    }
  }

  Trace trace;
  QVariant value;
  FormulaError err;
  EvaluationResult result = eval(root, context, 1, trace, &value, &err)
                                ? EvaluationResult::ok(value)
                                : EvaluationResult::failure(err);
  result.touchedVariables = trace.variables;
  result.touchedFunctions = trace.functions;

  if (context.cachingEnabled()) {
    if (m_cache.size() >= MaxCacheEntries)
      m_cache.clear();
    m_cache.insert(cacheKey, result);
  }

  result.evaluationTimeNs = timer.nsecsElapsed();
  return result;
}

// ═══════════════════════════════════════════════════════════════════
// Coercion
// ═══════════════════════════════════════════════════════════════════

bool Evaluator::isNumeric(const QVariant &value) {
  switch (value.userType()) {
  case QMetaType::Double:
  case QMetaType::Float:
  case QMetaType::Int:
  case QMetaType::UInt:
  case QMetaType::LongLong:
  case QMetaType::ULongLong:
  case QMetaType::Long:
  case QMetaType::ULong:
  case QMetaType::Short:
  case QMetaType::UShort:
    return true;
  default:
    return false;
  }
}

bool Evaluator::toNumber(const QVariant &value, bool strict, double *out,
                         FormulaError *error) {
  if (isNumeric(value)) {
    *out = value.toDouble();
    return true;
  }
  if (!value.isValid()) {
    reportError(error, FormulaError::make(FormulaError::Kind::UnsupportedType,
                                          "Null value used as a number"));
    return false;
  }
  if (value.userType() == QMetaType::Bool) {
    if (strict) {
      reportError(error, FormulaError::make(FormulaError::Kind::UnsupportedType,
                                            "Boolean used as a number in strict mode",
                                            value.toString()));
      return false;
    }
    *out = value.toBool() ? 1.0 : 0.0;
    return true;
  }
  if (value.userType() == QMetaType::QString) {
    QString text = value.toString();
    if (strict) {
      reportError(error, FormulaError::make(FormulaError::Kind::UnsupportedType,
                                            "String used as a number in strict mode",
                                            text));
      return false;
    }
    bool ok = false;
    double parsed = text.trimmed().toDouble(&ok);
    if (!ok) {
      reportError(error, FormulaError::make(FormulaError::Kind::NumberConversionError,
                                            QString("Cannot convert '%1' to a number")
                                                .arg(text),
                                            text));
      return false;
    }
    *out = parsed;
    return true;
  }
  reportError(error, FormulaError::make(FormulaError::Kind::UnsupportedType,
                                        QString("Value of type %1 is not numeric")
                                            .arg(value.typeName())));
  return false;
}

bool Evaluator::toBoolean(const QVariant &value, bool strict, bool *out,
                          FormulaError *error) {
  if (value.userType() == QMetaType::Bool) {
    *out = value.toBool();
    return true;
  }
  if (isNumeric(value)) {
    *out = value.toDouble() != 0.0;
    return true;
  }
  if (!value.isValid()) {
    if (strict) {
      reportError(error, FormulaError::make(FormulaError::Kind::UnsupportedType,
                                            "Null value used as a condition in strict mode"));
      return false;
    }
    *out = false;
    return true;
  }
  if (value.userType() == QMetaType::QString) {
    QString text = value.toString().trimmed();
    if (text.compare("TRUE", Qt::CaseInsensitive) == 0) {
      *out = true;
      return true;
    }
    if (text.compare("FALSE", Qt::CaseInsensitive) == 0) {
      *out = false;
      return true;
    }
    if (strict) {
      reportError(error, FormulaError::make(FormulaError::Kind::UnsupportedType,
                                            QString("String '%1' is not a boolean").arg(text),
                                            text));
      return false;
    }
    *out = !text.isEmpty();
    return true;
  }
  reportError(error, FormulaError::make(FormulaError::Kind::UnsupportedType,
                                        QString("Value of type %1 is not a boolean")
                                            .arg(value.typeName())));
  return false;
}

bool Evaluator::finiteNumber(const QString &op, double value, QVariant *out,
                             FormulaError *error) {
  if (!std::isfinite(value)) {
    reportError(error, FormulaError::make(FormulaError::Kind::MathError,
                                          QString("'%1' produced a non-finite result").arg(op),
                                          op));
    return false;
  }
  *out = value;
  return true;
}

// ═══════════════════════════════════════════════════════════════════
// Node dispatch
// ═══════════════════════════════════════════════════════════════════

bool Evaluator::eval(const AstNode &node, const EvaluationContext &ctx, int depth,
                     Trace &trace, QVariant *out, FormulaError *error) const {
  if (depth > ctx.maxDepth()) {
    reportError(error, FormulaError::limitExceeded(FormulaError::Kind::TooDeep,
                                                   "Evaluation depth", ctx.maxDepth(),
                                                   depth));
    return false;
  }

  switch (node.kind) {
  case AstNode::Kind::Number:
    *out = node.value;
    return true;
  case AstNode::Kind::Boolean:
    *out = node.boolValue;
    return true;
  case AstNode::Kind::Variable:
    return evalVariable(node, ctx, trace, out, error);
  case AstNode::Kind::UnaryOp:
    return evalUnary(node, ctx, depth, trace, out, error);
  case AstNode::Kind::BinaryOp:
    return evalBinary(node, ctx, depth, trace, out, error);
  case AstNode::Kind::FunctionCall:
    return evalFunction(node, ctx, depth, trace, out, error);
  case AstNode::Kind::If:
    return evalIf(node, ctx, depth, trace, out, error);
  }

  reportError(error, FormulaError::make(FormulaError::Kind::UnsupportedType,
                                        "Unknown AST node kind"));
  return false;
}

bool Evaluator::evalVariable(const AstNode &node, const EvaluationContext &ctx,
                             Trace &trace, QVariant *out, FormulaError *error) const {
  if (!trace.variables.contains(node.name))
    trace.variables << node.name;

  if (ctx.hasVariable(node.name)) {
    QVariant value = ctx.variable(node.name);
    // Integer inputs behave as doubles
    *out = isNumeric(value) ? QVariant(value.toDouble()) : value;
    return true;
  }

  if (!ctx.strictMode()) {
    QString upper = node.name.toUpper();
    if (upper == "PI") {
      *out = M_PI;
      return true;
    }
    if (upper == "E") {
      *out = M_E;
      return true;
    }
  }

  reportError(error, FormulaError::make(FormulaError::Kind::UndefinedVariable,
                                        QString("Undefined variable '%1'").arg(node.name),
                                        node.name));
  return false;
}

bool Evaluator::evalUnary(const AstNode &node, const EvaluationContext &ctx, int depth,
                          Trace &trace, QVariant *out, FormulaError *error) const {
  QVariant operand;
  if (!eval(*node.left, ctx, depth + 1, trace, &operand, error))
    return false;

  if (node.name == "!") {
    bool flag = false;
    if (!toBoolean(operand, ctx.strictMode(), &flag, error))
      return false;
    *out = !flag;
    return true;
  }

  double x = 0.0;
  if (node.name == "-" || node.name == "+") {
    if (!toNumber(operand, ctx.strictMode(), &x, error))
      return false;
    *out = (node.name == "-") ? -x : x;
    return true;
  }

  reportError(error, FormulaError::make(FormulaError::Kind::UnsupportedOperator,
                                        QString("Unsupported unary operator '%1'")
                                            .arg(node.name),
                                        node.name));
  return false;
}

bool Evaluator::evalBinary(const AstNode &node, const EvaluationContext &ctx, int depth,
                           Trace &trace, QVariant *out, FormulaError *error) const {
  const QString &op = node.name;
  const bool strict = ctx.strictMode();

  // ── Logical, short-circuit ──
  if (op == "&&" || op == "||") {
    QVariant lhs;
    bool l = false;
    if (!eval(*node.left, ctx, depth + 1, trace, &lhs, error) ||
        !toBoolean(lhs, strict, &l, error))
      return false;
    if ((op == "&&" && !l) || (op == "||" && l)) {
      *out = l;
      return true;
    }
    QVariant rhs;
    bool r = false;
    if (!eval(*node.right, ctx, depth + 1, trace, &rhs, error) ||
        !toBoolean(rhs, strict, &r, error))
      return false;
    *out = r;
    return true;
  }

  QVariant lhs, rhs;
  if (!eval(*node.left, ctx, depth + 1, trace, &lhs, error) ||
      !eval(*node.right, ctx, depth + 1, trace, &rhs, error))
    return false;

  // ── Equality ──
  if (op == "==" || op == "!=") {
    bool equal = false;
    const int lt = lhs.userType();
    const int rt = rhs.userType();
    if (!lhs.isValid() || !rhs.isValid()) {
      equal = !lhs.isValid() && !rhs.isValid();
    } else if (lt == QMetaType::QString && rt == QMetaType::QString) {
      equal = lhs.toString() == rhs.toString();
    } else if (lt == QMetaType::Bool && rt == QMetaType::Bool) {
      equal = lhs.toBool() == rhs.toBool();
    } else {
      double a = 0.0, b = 0.0;
      if (!toNumber(lhs, strict, &a, error) || !toNumber(rhs, strict, &b, error))
        return false;
      double scale = qMax(1.0, qMax(std::fabs(a), std::fabs(b)));
      equal = std::fabs(a - b) <= 1e-10 * scale;
    }
    *out = (op == "==") ? equal : !equal;
    return true;
  }

  double a = 0.0, b = 0.0;
  if (!toNumber(lhs, strict, &a, error) || !toNumber(rhs, strict, &b, error))
    return false;

  // ── Relational ──
  if (op == "<") {
    *out = a < b;
    return true;
  }
  if (op == "<=") {
    *out = a <= b;
    return true;
  }
  if (op == ">") {
    *out = a > b;
    return true;
  }
  if (op == ">=") {
    *out = a >= b;
    return true;
  }

  // ── Arithmetic ──
  if (op == "+")
    return finiteNumber(op, a + b, out, error);
  if (op == "-")
    return finiteNumber(op, a - b, out, error);
  if (op == "*")
    return finiteNumber(op, a * b, out, error);
  if (op == "/" || op == "%") {
    if (b == 0.0) {
      reportError(error, FormulaError::make(FormulaError::Kind::DivisionByZero,
                                            QString("Division by zero in '%1'")
                                                .arg(node.toString()),
                                            op));
      return false;
    }
    return finiteNumber(op, op == "/" ? a / b : std::fmod(a, b), out, error);
  }
  if (op == "^")
    return finiteNumber(op, std::pow(a, b), out, error);

  reportError(error, FormulaError::make(FormulaError::Kind::UnsupportedOperator,
                                        QString("Unsupported operator '%1'").arg(op), op));
  return false;
}

bool Evaluator::evalFunction(const AstNode &node, const EvaluationContext &ctx, int depth,
                             Trace &trace, QVariant *out, FormulaError *error) const {
  const QString name = node.name.toUpper();
  if (!trace.functions.contains(name))
    trace.functions << name;

  const FunctionSpec *spec = m_functions.find(name);
  if (!spec) {
    reportError(error, FormulaError::make(FormulaError::Kind::UnsupportedFunction,
                                          QString("Unsupported function '%1'").arg(node.name),
                                          node.name));
    return false;
  }

  const int count = int(node.args.size());
  if (!spec->acceptsArgumentCount(count)) {
    reportError(error, FormulaError::make(FormulaError::Kind::WrongArgumentCount,
                                          QString("%1 expects %2 argument(s), got %3")
                                              .arg(name, spec->arityText())
                                              .arg(count),
                                          node.name));
    return false;
  }

  QVector<double> args;
  args.reserve(count);
  for (const AstNodePtr &arg : node.args) {
    QVariant v;
    double x = 0.0;
    if (!eval(*arg, ctx, depth + 1, trace, &v, error) ||
        !toNumber(v, ctx.strictMode(), &x, error))
      return false;
    args.append(x);
  }

  double result = 0.0;
  if (!spec->impl(args, &result, error))
    return false;
  return finiteNumber(name, result, out, error);
}

bool Evaluator::evalIf(const AstNode &node, const EvaluationContext &ctx, int depth,
                       Trace &trace, QVariant *out, FormulaError *error) const {
  QVariant condition;
  bool flag = false;
  if (!eval(*node.left, ctx, depth + 1, trace, &condition, error) ||
      !toBoolean(condition, ctx.strictMode(), &flag, error))
    return false;
  return eval(flag ? *node.middle : *node.right, ctx, depth + 1, trace, out, error);
}
