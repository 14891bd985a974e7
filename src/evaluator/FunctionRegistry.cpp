#include "evaluator/FunctionRegistry.h"
#include <QtMath>
#include <algorithm>
#include <cmath>

QString FunctionSpec::arityText() const {
  if (maxArgs < 0)
    return QString("at least %1").arg(minArgs);
  if (minArgs == maxArgs)
    return QString::number(minArgs);
  return QString("%1 to %2").arg(minArgs).arg(maxArgs);
}

// ═══════════════════════════════════════════════════════════════════
// Helpers
// ═══════════════════════════════════════════════════════════════════

namespace {

bool mathError(const QString &function, const QString &message, FormulaError *error) {
  reportError(error, FormulaError::make(FormulaError::Kind::MathError,
                                        QString("%1: %2").arg(function, message),
                                        function));
  return false;
}

bool isInteger(double v) { return std::isfinite(v) && std::floor(v) == v; }

// Largest magnitude below which every integer is exactly representable
constexpr double MaxExactInteger = 9007199254740992.0; // 2^53

// Integer arguments for GCD/LCM, safe to convert to qint64
bool checkIntegerPair(const QString &name, const QVector<double> &a, FormulaError *error) {
  if (!isInteger(a[0]) || !isInteger(a[1]))
    return mathError(name, "arguments must be integers", error);
  if (std::fabs(a[0]) > MaxExactInteger || std::fabs(a[1]) > MaxExactInteger)
    return mathError(name, QString("arguments must not exceed %1 in magnitude")
                               .arg(MaxExactInteger, 0, 'f', 0),
                     error);
  return true;
}

FunctionSpec unary(const QString &name, std::function<double(double)> fn) {
  return FunctionSpec{name, 1, 1,
                      [fn](const QVector<double> &a, double *r, FormulaError *) {
                        *r = fn(a[0]);
                        return true;
                      }};
}

// Unary function defined on [lo, hi]
FunctionSpec bounded(const QString &name, double lo, double hi,
                     std::function<double(double)> fn) {
  return FunctionSpec{name, 1, 1,
                      [name, lo, hi, fn](const QVector<double> &a, double *r,
                                         FormulaError *error) {
                        if (a[0] < lo || a[0] > hi)
                          return mathError(name,
                                           QString("argument %1 outside [%2, %3]")
                                               .arg(a[0])
                                               .arg(lo)
                                               .arg(hi),
                                           error);
                        *r = fn(a[0]);
                        return true;
                      }};
}

double factorial(int n) {
  double out = 1.0;
  for (int i = 2; i <= n; ++i)
    out *= i;
  return out;
}

// Both arguments non-negative integers with k <= n <= limit
bool checkCombinatorics(const QString &name, const QVector<double> &a, int limit,
                        FormulaError *error) {
  if (!isInteger(a[0]) || !isInteger(a[1]) || a[0] < 0 || a[1] < 0)
    return mathError(name, "arguments must be non-negative integers", error);
  if (a[0] > limit)
    return mathError(name, QString("n must not exceed %1").arg(limit), error);
  if (a[1] > a[0])
    return mathError(name, "k must not exceed n", error);
  return true;
}

} // namespace

// ═══════════════════════════════════════════════════════════════════
// Registry
// ═══════════════════════════════════════════════════════════════════

void FunctionRegistry::registerFunction(const FunctionSpec &spec) {
  m_functions.insert(spec.name.toUpper(), spec);
}

void FunctionRegistry::registerAlias(const QString &alias, const QString &target) {
  const FunctionSpec *spec = find(target);
  if (!spec)
    return;
  FunctionSpec copy = *spec;
  copy.name = alias.toUpper();
  m_functions.insert(copy.name, copy);
}

const FunctionSpec *FunctionRegistry::find(const QString &name) const {
  auto it = m_functions.constFind(name.toUpper());
  return it == m_functions.constEnd() ? nullptr : &it.value();
}

QStringList FunctionRegistry::names() const {
  QStringList out = m_functions.keys();
  out.sort();
  return out;
}

FunctionRegistry FunctionRegistry::createDefault() {
  FunctionRegistry r;

  // ── Basic ──
  r.registerFunction(unary("ABS", [](double x) { return std::fabs(x); }));
  r.registerFunction(bounded("SQRT", 0.0, HUGE_VAL, [](double x) { return std::sqrt(x); }));
  r.registerFunction(unary("FLOOR", [](double x) { return std::floor(x); }));
  r.registerFunction(unary("CEIL", [](double x) { return std::ceil(x); }));
  r.registerFunction(unary("TRUNC", [](double x) { return std::trunc(x); }));
  r.registerFunction(unary("SIGN", [](double x) {
    return x > 0 ? 1.0 : (x < 0 ? -1.0 : 0.0);
  }));
  r.registerFunction(FunctionSpec{
      "ROUND", 1, 2, [](const QVector<double> &a, double *res, FormulaError *error) {
        if (a.size() == 1) {
          *res = std::round(a[0]);
          return true;
        }
        if (!isInteger(a[1]) || std::fabs(a[1]) > 15)
          return mathError("ROUND", "digits must be an integer between -15 and 15", error);
        double scale = std::pow(10.0, a[1]);
        *res = std::round(a[0] * scale) / scale;
        return true;
      }});

  // ── Aggregates ──
  r.registerFunction(FunctionSpec{
      "MIN", 1, -1, [](const QVector<double> &a, double *res, FormulaError *) {
        *res = *std::min_element(a.begin(), a.end());
        return true;
      }});
  r.registerFunction(FunctionSpec{
      "MAX", 1, -1, [](const QVector<double> &a, double *res, FormulaError *) {
        *res = *std::max_element(a.begin(), a.end());
        return true;
      }});
  r.registerFunction(FunctionSpec{
      "SUM", 1, -1, [](const QVector<double> &a, double *res, FormulaError *) {
        double total = 0.0;
        for (double v : a)
          total += v;
        *res = total;
        return true;
      }});
  r.registerFunction(FunctionSpec{
      "AVG", 1, -1, [](const QVector<double> &a, double *res, FormulaError *) {
        double total = 0.0;
        for (double v : a)
          total += v;
        *res = total / a.size();
        return true;
      }});

  // ── Powers and logarithms ──
  r.registerFunction(FunctionSpec{
      "POW", 2, 2, [](const QVector<double> &a, double *res, FormulaError *error) {
        if (a[0] == 0.0 && a[1] < 0)
          return mathError("POW", "zero raised to a negative power", error);
        if (a[0] < 0 && !isInteger(a[1]))
          return mathError("POW", "negative base with fractional exponent", error);
        *res = std::pow(a[0], a[1]);
        return true;
      }});
  r.registerFunction(unary("EXP", [](double x) { return std::exp(x); }));
  r.registerFunction(FunctionSpec{
      "LOG", 1, 1, [](const QVector<double> &a, double *res, FormulaError *error) {
        if (a[0] <= 0)
          return mathError("LOG", "argument must be positive", error);
        *res = std::log(a[0]);
        return true;
      }});
  r.registerFunction(FunctionSpec{
      "LOG10", 1, 1, [](const QVector<double> &a, double *res, FormulaError *error) {
        if (a[0] <= 0)
          return mathError("LOG10", "argument must be positive", error);
        *res = std::log10(a[0]);
        return true;
      }});
  r.registerFunction(FunctionSpec{
      "MOD", 2, 2, [](const QVector<double> &a, double *res, FormulaError *error) {
        if (a[1] == 0.0) {
          reportError(error, FormulaError::make(FormulaError::Kind::DivisionByZero,
                                                "MOD: division by zero", "MOD"));
          return false;
        }
        *res = std::fmod(a[0], a[1]);
        return true;
      }});

  // ── Trigonometry ──
  r.registerFunction(unary("SIN", [](double x) { return std::sin(x); }));
  r.registerFunction(unary("COS", [](double x) { return std::cos(x); }));
  r.registerFunction(unary("TAN", [](double x) { return std::tan(x); }));
  r.registerFunction(bounded("ASIN", -1.0, 1.0, [](double x) { return std::asin(x); }));
  r.registerFunction(bounded("ACOS", -1.0, 1.0, [](double x) { return std::acos(x); }));
  r.registerFunction(unary("ATAN", [](double x) { return std::atan(x); }));
  r.registerFunction(FunctionSpec{
      "ATAN2", 2, 2, [](const QVector<double> &a, double *res, FormulaError *) {
        *res = std::atan2(a[0], a[1]);
        return true;
      }});
  r.registerFunction(unary("SINH", [](double x) { return std::sinh(x); }));
  r.registerFunction(unary("COSH", [](double x) { return std::cosh(x); }));
  r.registerFunction(unary("TANH", [](double x) { return std::tanh(x); }));
  r.registerFunction(unary("ASINH", [](double x) { return std::asinh(x); }));
  r.registerFunction(bounded("ACOSH", 1.0, HUGE_VAL, [](double x) { return std::acosh(x); }));
  r.registerFunction(FunctionSpec{
      "ATANH", 1, 1, [](const QVector<double> &a, double *res, FormulaError *error) {
        if (a[0] <= -1.0 || a[0] >= 1.0)
          return mathError("ATANH", "argument must be inside (-1, 1)", error);
        *res = std::atanh(a[0]);
        return true;
      }});
  r.registerFunction(unary("RADIANS", [](double x) { return qDegreesToRadians(x); }));
  r.registerFunction(unary("DEGREES", [](double x) { return qRadiansToDegrees(x); }));

  // ── Integer arithmetic ──
  r.registerFunction(FunctionSpec{
      "GCD", 2, 2, [](const QVector<double> &a, double *res, FormulaError *error) {
        if (!checkIntegerPair("GCD", a, error))
          return false;
        qint64 x = qAbs(qint64(a[0]));
        qint64 y = qAbs(qint64(a[1]));
        while (y != 0) {
          qint64 t = x % y;
          x = y;
          y = t;
        }
        *res = double(x);
        return true;
      }});
  r.registerFunction(FunctionSpec{
      "LCM", 2, 2, [](const QVector<double> &a, double *res, FormulaError *error) {
        if (!checkIntegerPair("LCM", a, error))
          return false;
        qint64 x = qAbs(qint64(a[0]));
        qint64 y = qAbs(qint64(a[1]));
        if (x == 0 || y == 0) {
          *res = 0.0;
          return true;
        }
        qint64 g = x, h = y;
        while (h != 0) {
          qint64 t = g % h;
          g = h;
          h = t;
        }
        *res = double(x / g) * double(y);
        return true;
      }});
  r.registerFunction(FunctionSpec{
      "FACTORIAL", 1, 1, [](const QVector<double> &a, double *res, FormulaError *error) {
        if (!isInteger(a[0]) || a[0] < 0)
          return mathError("FACTORIAL", "argument must be a non-negative integer", error);
        if (a[0] > MaxFactorialArgument)
          return mathError("FACTORIAL",
                           QString("argument must not exceed %1").arg(MaxFactorialArgument),
                           error);
        *res = factorial(int(a[0]));
        return true;
      }});
  r.registerFunction(FunctionSpec{
      "COMBINATION", 2, 2, [](const QVector<double> &a, double *res, FormulaError *error) {
        if (!checkCombinatorics("COMBINATION", a, MaxCombinationArgument, error))
          return false;
        int n = int(a[0]);
        int k = std::min(int(a[1]), n - int(a[1]));
        double out = 1.0;
        for (int i = 1; i <= k; ++i)
          out = out * (n - k + i) / i;
        *res = std::round(out);
        return true;
      }});
  r.registerFunction(FunctionSpec{
      "PERMUTATION", 2, 2, [](const QVector<double> &a, double *res, FormulaError *error) {
        if (!checkCombinatorics("PERMUTATION", a, MaxPermutationArgument, error))
          return false;
        int n = int(a[0]);
        int k = int(a[1]);
        double out = 1.0;
        for (int i = n - k + 1; i <= n; ++i)
          out *= i;
        *res = out;
        return true;
      }});

  // ── Constants ──
  r.registerFunction(FunctionSpec{"PI", 0, 0,
                                  [](const QVector<double> &, double *res, FormulaError *) {
                                    *res = M_PI;
                                    return true;
                                  }});
  r.registerFunction(FunctionSpec{"E", 0, 0,
                                  [](const QVector<double> &, double *res, FormulaError *) {
                                    *res = M_E;
                                    return true;
                                  }});

  r.registerAlias("CEILING", "CEIL");
  r.registerAlias("TRUNCATE", "TRUNC");
  r.registerAlias("AVERAGE", "AVG");
  r.registerAlias("COMB", "COMBINATION");
  r.registerAlias("PERM", "PERMUTATION");
  return r;
}
