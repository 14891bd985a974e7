#ifndef FUNCTION_REGISTRY_H
#define FUNCTION_REGISTRY_H

/**
 * @file FunctionRegistry.h
 * @brief Built-in numeric functions with their arity table
 *
 * ── Built-ins ──
 *   ABS(x) SQRT(x) ROUND(x[, digits]) FLOOR(x) CEIL(x)/CEILING(x)
 *   TRUNC(x)/TRUNCATE(x) SIGN(x)
 *   MIN(...) MAX(...) SUM(...) AVG(...)/AVERAGE(...)
 *   POW(a, b) EXP(x) LOG(x) LOG10(x) MOD(a, b)
 *   SIN COS TAN ASIN ACOS ATAN ATAN2(y, x) SINH COSH TANH ASINH ACOSH ATANH
 *   RADIANS(deg) DEGREES(rad)
 *   GCD(a, b) LCM(a, b) FACTORIAL(n) COMBINATION/COMB(n, k)
 *   PERMUTATION/PERM(n, k)
 *   PI() E()
 *
 * Names are case-insensitive. Arguments are coerced to double by the
 * evaluator before the implementation runs.
 */

#include "core/FormulaError.h"
#include <QHash>
#include <QString>
#include <QStringList>
#include <QVector>
#include <functional>

struct FunctionSpec {
    using Impl = std::function<bool(const QVector<double> &args, double *result,
                                    FormulaError *error)>;

    QString name;
    int minArgs = 0;
    int maxArgs = 0;     // -1: variadic
    Impl impl;

    bool acceptsArgumentCount(int count) const {
        return count >= minArgs && (maxArgs < 0 || count <= maxArgs);
    }
    QString arityText() const;
};

class FunctionRegistry {
public:
    static constexpr int MaxFactorialArgument = 20;
    static constexpr int MaxCombinationArgument = 62;
    static constexpr int MaxPermutationArgument = 20;

    FunctionRegistry() = default;

    static FunctionRegistry createDefault();

    void registerFunction(const FunctionSpec &spec);
    void registerAlias(const QString &alias, const QString &target);

    const FunctionSpec *find(const QString &name) const;
    bool contains(const QString &name) const { return find(name) != nullptr; }
    QStringList names() const;
    int size() const { return m_functions.size(); }

private:
    QHash<QString, FunctionSpec> m_functions;   // key: upper-case name
};

#endif // FUNCTION_REGISTRY_H
