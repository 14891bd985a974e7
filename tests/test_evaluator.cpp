#include <QtTest>
#include "engine/ParserEngine.h"
#include "evaluator/Evaluator.h"
#include <QtMath>

class TestEvaluator : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();

    // Arithmetic and logic
    void testNumericResults_data();
    void testNumericResults();
    void testBooleanResults_data();
    void testBooleanResults();
    void testShortCircuit();
    void testTouchedNames();

    // Failures
    void testDivisionByZero();
    void testUndefinedVariable();
    void testErrors_data();
    void testErrors();
    void testDepthGuard();
    void testVariableCountGuard();

    // Coercion
    void testStringAndBooleanCoercion();
    void testStrictMode();
    void testTruthiness_data();
    void testTruthiness();
    void testConstants();

    // Purity and caching
    void testContextIsNotModified();
    void testCache();
    void testCacheKeyKeepsBindingsApart();

private:
    AstNodePtr compile(const QString &formula) const;
    EvaluationResult run(const QString &formula, const QVariantMap &variables = QVariantMap(),
                         bool strict = false) const;

    std::shared_ptr<const ParserEngine> m_engine;
};

void TestEvaluator::initTestCase() {
    // Keep trees unfolded so the evaluator sees every operator
    EngineConfig config;
    config.enableOptimization = false;

    FormulaError err;
    m_engine = ParserEngine::create(config, &err);
    QVERIFY2(m_engine, qPrintable(err.toString()));
}

AstNodePtr TestEvaluator::compile(const QString &formula) const {
    FormulaError err;
    AstNodePtr ast = m_engine->compile(formula, &err);
    if (!ast)
        qWarning() << "compile failed:" << err.toString();
    return ast;
}

EvaluationResult TestEvaluator::run(const QString &formula, const QVariantMap &variables,
                                    bool strict) const {
    FormulaError err;
    AstNodePtr ast = m_engine->compile(formula, &err);
    if (!ast)
        return EvaluationResult::failure(err);

    EvaluationContext context =
        m_engine->defaultContext().withStrictMode(strict).withVariables(variables, &err);
    if (err.isError())
        return EvaluationResult::failure(err);

    Evaluator evaluator(m_engine->functions());
    return evaluator.evaluate(*ast, context);
}

// ═══════════════════════════════════════════════════════════
// Arithmetic and logic
// ═══════════════════════════════════════════════════════════

void TestEvaluator::testNumericResults_data() {
    QTest::addColumn<QString>("formula");
    QTest::addColumn<QVariantMap>("variables");
    QTest::addColumn<double>("expected");

    QTest::newRow("precedence") << "2 + 3 * 4" << QVariantMap() << 14.0;
    QTest::newRow("parenthesised variable") << "(x + 1) * 2" << QVariantMap{{"x", 3}} << 8.0;
    QTest::newRow("weighted score")
        << "{korean} * 0.4 + ${math} * 0.6" << QVariantMap{{"korean", 90}, {"math", 80}}
        << 84.0;
    QTest::newRow("left associative") << "10 - 4 - 3" << QVariantMap() << 3.0;
    QTest::newRow("right associative power") << "2 ^ 3 ^ 2" << QVariantMap() << 512.0;
    QTest::newRow("modulo") << "7 % 3" << QVariantMap() << 1.0;
    QTest::newRow("unary minus") << "-x ^ 2" << QVariantMap{{"x", 3}} << 9.0;
    QTest::newRow("if picks then") << "IF({days} >= 5, 10, 15)" << QVariantMap{{"days", 6}}
                                   << 10.0;
    QTest::newRow("if picks else") << "IF({days} >= 5, 10, 15)" << QVariantMap{{"days", 2}}
                                   << 15.0;

    QTest::newRow("round") << "ROUND(3.14159, 2)" << QVariantMap() << 3.14;
    QTest::newRow("round no digits") << "round(2.5)" << QVariantMap() << 3.0;
    QTest::newRow("max") << "MAX(1, 5, 3)" << QVariantMap() << 5.0;
    QTest::newRow("min") << "MIN(4, -2, 8)" << QVariantMap() << -2.0;
    QTest::newRow("sum") << "SUM(1, 2, 3, 4)" << QVariantMap() << 10.0;
    QTest::newRow("average alias") << "AVERAGE(2, 4)" << QVariantMap() << 3.0;
    QTest::newRow("sqrt lower case") << "sqrt(16)" << QVariantMap() << 4.0;
    QTest::newRow("ceiling alias") << "CEILING(1.2)" << QVariantMap() << 2.0;
    QTest::newRow("sign") << "SIGN(-7)" << QVariantMap() << -1.0;
    QTest::newRow("pow") << "POW(2, 10)" << QVariantMap() << 1024.0;
    QTest::newRow("log10") << "LOG10(1000)" << QVariantMap() << 3.0;
    QTest::newRow("mod") << "MOD(17, 5)" << QVariantMap() << 2.0;
    QTest::newRow("gcd") << "GCD(12, 18)" << QVariantMap() << 6.0;
    QTest::newRow("lcm") << "LCM(4, 6)" << QVariantMap() << 12.0;
    QTest::newRow("factorial") << "FACTORIAL(5)" << QVariantMap() << 120.0;
    QTest::newRow("combination") << "COMB(5, 2)" << QVariantMap() << 10.0;
    QTest::newRow("permutation") << "PERM(5, 2)" << QVariantMap() << 20.0;
    QTest::newRow("degrees") << "DEGREES(PI())" << QVariantMap() << 180.0;
    QTest::newRow("nested calls") << "ABS(MIN({a}, -{b}))" << QVariantMap{{"a", 1}, {"b", 4}}
                                  << 4.0;
}

void TestEvaluator::testNumericResults() {
    QFETCH(QString, formula);
    QFETCH(QVariantMap, variables);
    QFETCH(double, expected);

    EvaluationResult r = run(formula, variables);
    QVERIFY2(r.success, qPrintable(r.errorMessage()));
    QCOMPARE(r.value.userType(), int(QMetaType::Double));
    QCOMPARE(r.value.toDouble(), expected);
}

void TestEvaluator::testBooleanResults_data() {
    QTest::addColumn<QString>("formula");
    QTest::addColumn<bool>("expected");

    QTest::newRow("less") << "1 < 2" << true;
    QTest::newRow("greater equal") << "2 >= 3" << false;
    QTest::newRow("tolerant equality") << "0.1 + 0.2 == 0.3" << true;
    QTest::newRow("not equal") << "4 != 4" << false;
    QTest::newRow("bool equals number") << "TRUE == 1" << true;
    QTest::newRow("keyword logic") << "NOT FALSE AND TRUE" << true;
    QTest::newRow("or") << "FALSE || 2 > 1" << true;
    QTest::newRow("nested comparison") << "1 < 2 == TRUE" << true;
}

void TestEvaluator::testBooleanResults() {
    QFETCH(QString, formula);
    QFETCH(bool, expected);

    EvaluationResult r = run(formula);
    QVERIFY2(r.success, qPrintable(r.errorMessage()));
    QCOMPARE(r.value.userType(), int(QMetaType::Bool));
    QCOMPARE(r.value.toBool(), expected);
}

void TestEvaluator::testShortCircuit() {
    EvaluationResult r = run("FALSE && {missing}");
    QVERIFY2(r.success, qPrintable(r.errorMessage()));
    QCOMPARE(r.value.toBool(), false);
    QVERIFY(r.touchedVariables.isEmpty());

    r = run("TRUE || {missing}");
    QVERIFY(r.success);
    QCOMPARE(r.value.toBool(), true);

    // Only the selected branch of IF runs
    r = run("IF(TRUE, 1, 1 / 0)");
    QVERIFY2(r.success, qPrintable(r.errorMessage()));
    QCOMPARE(r.value.toDouble(), 1.0);
}

void TestEvaluator::testTouchedNames() {
    EvaluationResult r = run("MAX({a}, b) + ROUND({a}, 1)", QVariantMap{{"a", 1.25}, {"b", 2}});
    QVERIFY(r.success);
    QCOMPARE(r.touchedVariables, (QStringList{"a", "b"}));
    QCOMPARE(r.touchedFunctions, (QStringList{"MAX", "ROUND"}));
}

// ═══════════════════════════════════════════════════════════
// Failures
// ═══════════════════════════════════════════════════════════

void TestEvaluator::testDivisionByZero() {
    EvaluationResult r = run("a / b", QVariantMap{{"a", 1}, {"b", 0}});
    QVERIFY(!r.success);
    QVERIFY(!r.value.isValid());
    QCOMPARE(r.error.kind, FormulaError::Kind::DivisionByZero);
    QCOMPARE(r.error.offendingText, QString("/"));

    r = run("5 % 0");
    QCOMPARE(r.error.kind, FormulaError::Kind::DivisionByZero);
}

void TestEvaluator::testUndefinedVariable() {
    EvaluationResult r = run("unknownVar + 1");
    QVERIFY(!r.success);
    QCOMPARE(r.error.kind, FormulaError::Kind::UndefinedVariable);
    QCOMPARE(r.error.offendingText, QString("unknownVar"));
    QVERIFY(r.errorMessage().contains("unknownVar"));
}

void TestEvaluator::testErrors_data() {
    QTest::addColumn<QString>("formula");
    QTest::addColumn<int>("kind");
    QTest::addColumn<QString>("offending");

    QTest::newRow("unknown function")
        << "FOO(1)" << int(FormulaError::Kind::UnsupportedFunction) << "FOO";
    QTest::newRow("too few arguments")
        << "ROUND()" << int(FormulaError::Kind::WrongArgumentCount) << "ROUND";
    QTest::newRow("too many arguments")
        << "abs(1, 2)" << int(FormulaError::Kind::WrongArgumentCount) << "abs";
    QTest::newRow("sqrt of negative") << "SQRT(-1)" << int(FormulaError::Kind::MathError) << "SQRT";
    QTest::newRow("log of zero") << "LOG(0)" << int(FormulaError::Kind::MathError) << "LOG";
    QTest::newRow("factorial too large")
        << "FACTORIAL(21)" << int(FormulaError::Kind::MathError) << "FACTORIAL";
    QTest::newRow("mod by zero") << "MOD(1, 0)" << int(FormulaError::Kind::DivisionByZero) << "MOD";
    QTest::newRow("overflow") << "10 ^ 400" << int(FormulaError::Kind::MathError) << "^";
    QTest::newRow("asin domain") << "ASIN(2)" << int(FormulaError::Kind::MathError) << "ASIN";
    QTest::newRow("gcd beyond exact integers")
        << "GCD(10 ^ 300, 5)" << int(FormulaError::Kind::MathError) << "GCD";
    QTest::newRow("lcm beyond exact integers")
        << "LCM(-(2 ^ 63), 3)" << int(FormulaError::Kind::MathError) << "LCM";
}

void TestEvaluator::testErrors() {
    QFETCH(QString, formula);
    QFETCH(int, kind);
    QFETCH(QString, offending);

    EvaluationResult r = run(formula);
    QVERIFY(!r.success);
    QCOMPARE(int(r.error.kind), kind);
    QCOMPARE(r.error.offendingText, offending);
}

void TestEvaluator::testDepthGuard() {
    AstNodePtr ast = compile("---1");
    QVERIFY(ast);
    QCOMPARE(ast->depth(), 4);

    Evaluator evaluator(m_engine->functions());
    EvaluationResult r = evaluator.evaluate(*ast, m_engine->defaultContext().withMaxDepth(3));
    QVERIFY(!r.success);
    QCOMPARE(r.error.kind, FormulaError::Kind::TooDeep);
    QCOMPARE(r.error.limit, qint64(3));
    QCOMPARE(r.error.observed, qint64(4));

    r = evaluator.evaluate(*ast, m_engine->defaultContext().withMaxDepth(4));
    QVERIFY2(r.success, qPrintable(r.errorMessage()));
    QCOMPARE(r.value.toDouble(), -1.0);
}

void TestEvaluator::testVariableCountGuard() {
    FormulaError err;
    EvaluationContext context =
        EvaluationContext::fromVariables(QVariantMap{{"a", 1}, {"b", 2}, {"c", 3}}, 2, &err);
    QCOMPARE(err.kind, FormulaError::Kind::TooManyVariables);
    QCOMPARE(context.variableCount(), 0);

    // A context whose limit is lowered after binding is rejected at evaluation
    context = EvaluationContext().withVariables(QVariantMap{{"a", 1}, {"b", 2}, {"c", 3}});
    AstNodePtr ast = compile("a + b");
    QVERIFY(ast);

    Evaluator evaluator(m_engine->functions());
    EvaluationResult r = evaluator.evaluate(*ast, context.withMaxVariables(2));
    QCOMPARE(r.error.kind, FormulaError::Kind::TooManyVariables);
    QCOMPARE(r.error.observed, qint64(3));
}

// ═══════════════════════════════════════════════════════════
// Coercion
// ═══════════════════════════════════════════════════════════

void TestEvaluator::testStringAndBooleanCoercion() {
    EvaluationResult r = run("s + 1", QVariantMap{{"s", QString(" 12 ")}});
    QVERIFY2(r.success, qPrintable(r.errorMessage()));
    QCOMPARE(r.value.toDouble(), 13.0);

    r = run("t + 1", QVariantMap{{"t", true}});
    QVERIFY(r.success);
    QCOMPARE(r.value.toDouble(), 2.0);

    r = run("s + 1", QVariantMap{{"s", QString("abc")}});
    QCOMPARE(r.error.kind, FormulaError::Kind::NumberConversionError);

    r = run("n + 1", QVariantMap{{"n", QVariant()}});
    QCOMPARE(r.error.kind, FormulaError::Kind::UnsupportedType);

    // Strings compare as strings
    r = run("a == b", QVariantMap{{"a", QString("x")}, {"b", QString("x")}});
    QVERIFY(r.success);
    QCOMPARE(r.value.toBool(), true);

    r = run("n == m", QVariantMap{{"n", QVariant()}, {"m", 0}});
    QVERIFY(r.success);
    QCOMPARE(r.value.toBool(), false);
}

void TestEvaluator::testStrictMode() {
    EvaluationResult r = run("s + 1", QVariantMap{{"s", QString("12")}}, true);
    QVERIFY(!r.success);
    QCOMPARE(r.error.kind, FormulaError::Kind::UnsupportedType);

    r = run("t + 1", QVariantMap{{"t", true}}, true);
    QCOMPARE(r.error.kind, FormulaError::Kind::UnsupportedType);

    r = run("IF(s, 1, 2)", QVariantMap{{"s", QString("yes")}}, true);
    QCOMPARE(r.error.kind, FormulaError::Kind::UnsupportedType);

    // TRUE/FALSE strings are still booleans
    r = run("IF(s, 1, 2)", QVariantMap{{"s", QString("false")}}, true);
    QVERIFY2(r.success, qPrintable(r.errorMessage()));
    QCOMPARE(r.value.toDouble(), 2.0);

    r = run("x * 2", QVariantMap{{"x", 4}}, true);
    QVERIFY(r.success);
    QCOMPARE(r.value.toDouble(), 8.0);
}

void TestEvaluator::testTruthiness_data() {
    QTest::addColumn<QVariant>("flag");
    QTest::addColumn<double>("expected");

    QTest::newRow("true") << QVariant(true) << 1.0;
    QTest::newRow("zero") << QVariant(0) << 2.0;
    QTest::newRow("non-zero") << QVariant(0.5) << 1.0;
    QTest::newRow("FALSE string") << QVariant(QString("False")) << 2.0;
    QTest::newRow("other string") << QVariant(QString("yes")) << 1.0;
    QTest::newRow("empty string") << QVariant(QString("")) << 2.0;
    QTest::newRow("null") << QVariant() << 2.0;
}

void TestEvaluator::testTruthiness() {
    QFETCH(QVariant, flag);
    QFETCH(double, expected);

    EvaluationResult r = run("IF(flag, 1, 2)", QVariantMap{{"flag", flag}});
    QVERIFY2(r.success, qPrintable(r.errorMessage()));
    QCOMPARE(r.value.toDouble(), expected);
}

void TestEvaluator::testConstants() {
    EvaluationResult r = run("PI * 2");
    QVERIFY(r.success);
    QCOMPARE(r.value.toDouble(), 2 * M_PI);

    r = run("E() - E");
    QVERIFY(r.success);
    QCOMPARE(r.value.toDouble() + 1.0, 1.0);

    // A binding wins over the constant
    r = run("PI * 2", QVariantMap{{"PI", 3}});
    QCOMPARE(r.value.toDouble(), 6.0);

    r = run("PI * 2", QVariantMap(), true);
    QCOMPARE(r.error.kind, FormulaError::Kind::UndefinedVariable);
}

// ═══════════════════════════════════════════════════════════
// Purity and caching
// ═══════════════════════════════════════════════════════════

void TestEvaluator::testContextIsNotModified() {
    AstNodePtr ast = compile("IF({a} > 1, {a} * 2, {b})");
    QVERIFY(ast);
    const QString before = ast->toString();

    EvaluationContext context =
        m_engine->defaultContext().withCaching(false).withVariables(QVariantMap{{"a", 2}, {"b", 7}});
    const QString fingerprint = context.fingerprint();

    Evaluator evaluator(m_engine->functions());
    EvaluationResult first = evaluator.evaluate(*ast, context);
    EvaluationResult second = evaluator.evaluate(*ast, context);
    QVERIFY(first.success);
    QVERIFY(first.sameOutcome(second));
    QCOMPARE(context.fingerprint(), fingerprint);
    QCOMPARE(ast->toString(), before);
    QCOMPARE(evaluator.cacheSize(), 0);
}

void TestEvaluator::testCache() {
    AstNodePtr ast = compile("{a} * 3");
    QVERIFY(ast);

    EvaluationContext context = m_engine->defaultContext().withVariable("a", 2);
    Evaluator evaluator(m_engine->functions());

    EvaluationResult first = evaluator.evaluate(*ast, context);
    EvaluationResult second = evaluator.evaluate(*ast, context);
    QVERIFY(first.sameOutcome(second));
    QCOMPARE(evaluator.cacheSize(), 1);
    QCOMPARE(evaluator.cacheHits(), 1);

    // Different bindings are different entries
    EvaluationResult third = evaluator.evaluate(*ast, context.withVariable("a", 5));
    QCOMPARE(third.value.toDouble(), 15.0);
    QCOMPARE(evaluator.cacheSize(), 2);
    QCOMPARE(evaluator.cacheHits(), 1);

    evaluator.clearCache();
    QCOMPARE(evaluator.cacheSize(), 0);
}

void TestEvaluator::testCacheKeyKeepsBindingsApart() {
    AstNodePtr ast = compile("{a}");
    QVERIFY(ast);

    // Separator characters inside a value must not merge two bindings
    EvaluationContext packed =
        m_engine->defaultContext().withVariable("a", QString("x;b:10=y"));
    EvaluationContext split = m_engine->defaultContext()
                                  .withVariable("a", QString("x"))
                                  .withVariable("b", QString("y"));
    QVERIFY(packed.fingerprint() != split.fingerprint());

    EvaluationContext percent = m_engine->defaultContext().withVariable("a%1", 1);
    EvaluationContext plain = m_engine->defaultContext().withVariable("a1", 1);
    QVERIFY(percent.fingerprint() != plain.fingerprint());

    Evaluator evaluator(m_engine->functions());
    EvaluationResult first = evaluator.evaluate(*ast, packed);
    EvaluationResult second = evaluator.evaluate(*ast, split);
    QVERIFY(first.success);
    QVERIFY(second.success);
    QCOMPARE(first.value.toString(), QString("x;b:10=y"));
    QCOMPARE(second.value.toString(), QString("x"));
    QCOMPARE(evaluator.cacheHits(), 0);
    QCOMPARE(evaluator.cacheSize(), 2);
}

QTEST_MAIN(TestEvaluator)
#include "test_evaluator.moc"
