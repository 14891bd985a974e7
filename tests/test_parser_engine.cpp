#include <QtTest>
#include "engine/ParserEngine.h"
#include "evaluator/Evaluator.h"

class TestParserEngine : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();

    // Construction
    void testCreateDefault();
    void testInvalidConfiguration();

    // Front end
    void testLengthGuardRunsBeforeLexer();
    void testConstantFolding();
    void testFoldingKeepsFailingSubtrees();
    void testOptimizationDisabled();
    void testFoldingFollowsCallerContext();
    void testFoldingRespectsDepthLimit();

    // Convenience API
    void testEvaluateWithVariables();
    void testEvaluateReportsCompileErrors();
    void testIsValidFormula();
    void testExtractVariables();
    void testSharedEvaluatorCache();

private:
    std::shared_ptr<const ParserEngine> m_engine;
};

void TestParserEngine::initTestCase() {
    FormulaError err;
    m_engine = ParserEngine::create(EngineConfig(), &err);
    QVERIFY2(m_engine, qPrintable(err.toString()));
}

// ═══════════════════════════════════════════════════════════
// Construction
// ═══════════════════════════════════════════════════════════

void TestParserEngine::testCreateDefault() {
    QCOMPARE(m_engine->grammar().productions().size(), 34);
    QVERIFY(m_engine->table().stateCount() > 0);
    QCOMPARE(m_engine->builders().size(), 35);
    QVERIFY(m_engine->functions().contains("round"));
    QCOMPARE(m_engine->config().maxFormulaLength, 5000);

    EvaluationContext ctx = m_engine->defaultContext();
    QCOMPARE(ctx.maxDepth(), 100);
    QCOMPARE(ctx.maxVariables(), 100);
    QVERIFY(!ctx.strictMode());
    QVERIFY(ctx.cachingEnabled());
}

void TestParserEngine::testInvalidConfiguration() {
    EngineConfig config;
    config.maxStackDepth = 0;

    FormulaError err;
    QVERIFY(!ParserEngine::create(config, &err));
    QCOMPARE(err.kind, FormulaError::Kind::InvalidConfiguration);
    QVERIFY(err.message.contains("max_stack_depth"));
}

// ═══════════════════════════════════════════════════════════
// Front end
// ═══════════════════════════════════════════════════════════

void TestParserEngine::testLengthGuardRunsBeforeLexer() {
    EngineConfig config;
    config.maxFormulaLength = 10;
    std::shared_ptr<const ParserEngine> engine = ParserEngine::create(config);
    QVERIFY(engine);

    EvaluationResult r = engine->evaluate("1 + 2 + 3 + 4", engine->defaultContext());
    QVERIFY(!r.success);
    QCOMPARE(r.error.kind, FormulaError::Kind::TooLarge);
    QCOMPARE(r.error.limit, qint64(10));
    QCOMPARE(r.error.observed, qint64(13));

    // Characters the lexer would reject are never examined
    FormulaError err;
    QVERIFY(!engine->compile("############", &err));
    QCOMPARE(err.kind, FormulaError::Kind::TooLarge);

    QVERIFY(engine->compile("1 + 2", &err));
}

void TestParserEngine::testConstantFolding() {
    FormulaError err;
    AstNodePtr ast = m_engine->compile("2 * 3 + {x}", &err);
    QVERIFY2(ast, qPrintable(err.toString()));
    QCOMPARE(ast->toString(), QString("(+ 6 x)"));

    ast = m_engine->compile("IF(1 > 2, 10, 20)");
    QVERIFY(ast);
    QCOMPARE(ast->toString(), QString("20"));

    ast = m_engine->compile("NOT TRUE || {flag}");
    QVERIFY(ast);
    QCOMPARE(ast->toString(), QString("(|| FALSE flag)"));

    ast = m_engine->compile("ROUND({score} * (1 + 0.5), 2 - 1)");
    QVERIFY(ast);
    QCOMPARE(ast->toString(), QString("(ROUND (* score 1.5) 1)"));
}

void TestParserEngine::testFoldingKeepsFailingSubtrees() {
    AstNodePtr ast = m_engine->compile("1 / 0 + {x}");
    QVERIFY(ast);
    QCOMPARE(ast->toString(), QString("(+ (/ 1 0) x)"));

    EvaluationResult r = m_engine->evaluate("1 / 0 + {x}", QVariantMap{{"x", 1}});
    QCOMPARE(r.error.kind, FormulaError::Kind::DivisionByZero);
}

void TestParserEngine::testOptimizationDisabled() {
    EngineConfig config;
    config.enableOptimization = false;
    std::shared_ptr<const ParserEngine> engine = ParserEngine::create(config);
    QVERIFY(engine);

    AstNodePtr ast = engine->compile("2 * 3 + {x}");
    QVERIFY(ast);
    QCOMPARE(ast->toString(), QString("(+ (* 2 3) x)"));

    // Both engines agree on the value
    QVariantMap vars{{"x", 4}};
    QCOMPARE(engine->evaluate("2 * 3 + {x}", vars).value.toDouble(), 10.0);
    QCOMPARE(m_engine->evaluate("2 * 3 + {x}", vars).value.toDouble(), 10.0);
}

void TestParserEngine::testFoldingFollowsCallerContext() {
    EvaluationContext strict = m_engine->defaultContext().withStrictMode(true);

    EvaluationResult r = m_engine->evaluate("TRUE + 1", strict);
    QVERIFY(!r.success);
    QCOMPARE(r.error.kind, FormulaError::Kind::UnsupportedType);

    r = m_engine->evaluate("TRUE + 1", m_engine->defaultContext());
    QVERIFY2(r.success, qPrintable(r.errorMessage()));
    QCOMPARE(r.value.toDouble(), 2.0);

    AstNodePtr ast = m_engine->compile("TRUE + 1", strict);
    QVERIFY(ast);
    QCOMPARE(ast->toString(), QString("(+ TRUE 1)"));

    ast = m_engine->compile("2 * 3 + {x}", m_engine->defaultContext().withOptimization(false));
    QVERIFY(ast);
    QCOMPARE(ast->toString(), QString("(+ (* 2 3) x)"));

    // Validation and extraction never fold
    FormulaError err;
    QVERIFY(m_engine->parse("2 * 3", &err));
    QCOMPARE(m_engine->parse("2 * 3")->toString(), QString("(* 2 3)"));
}

void TestParserEngine::testFoldingRespectsDepthLimit() {
    EngineConfig config;
    config.maxEvaluationDepth = 5;
    std::shared_ptr<const ParserEngine> engine = ParserEngine::create(config);
    QVERIFY(engine);
    QVERIFY(engine->config().enableOptimization);

    // Six signs put the literal at depth 7
    EvaluationResult r = engine->evaluate("------1", engine->defaultContext());
    QVERIFY(!r.success);
    QCOMPARE(r.error.kind, FormulaError::Kind::TooDeep);
    QCOMPARE(r.error.limit, qint64(5));
    QCOMPARE(r.error.observed, qint64(7));
    QCOMPARE(engine->compile("------1")->toString(), engine->parse("------1")->toString());

    // A constant subtree below a variable-dependent node keeps its position
    EvaluationContext shallow = engine->defaultContext().withMaxDepth(4).withVariable("x", 1);
    r = engine->evaluate("{x} + ---1", shallow);
    QVERIFY(!r.success);
    QCOMPARE(r.error.kind, FormulaError::Kind::TooDeep);
    QCOMPARE(r.error.observed, qint64(5));

    // Subtrees that fit are still folded
    r = engine->evaluate("{x} + --1", shallow);
    QVERIFY2(r.success, qPrintable(r.errorMessage()));
    QCOMPARE(r.value.toDouble(), 2.0);
    QCOMPARE(engine->compile("{x} + --1", shallow)->toString(), QString("(+ x 1)"));
}

// ═══════════════════════════════════════════════════════════
// Convenience API
// ═══════════════════════════════════════════════════════════

void TestParserEngine::testEvaluateWithVariables() {
    EvaluationResult r =
        m_engine->evaluate("{korean} * 0.4 + {math} * 0.6",
                           QVariantMap{{"korean", 90}, {"math", 80}});
    QVERIFY2(r.success, qPrintable(r.errorMessage()));
    QCOMPARE(r.value.toDouble(), 84.0);
    QVERIFY(r.evaluationTimeNs >= 0);

    QJsonObject json = r.toJson();
    QCOMPARE(json["success"].toBool(), true);
    QCOMPARE(json["value"].toDouble(), 84.0);
    QVERIFY(!json.contains("error"));

    EngineConfig config;
    config.maxVariables = 2;
    std::shared_ptr<const ParserEngine> small = ParserEngine::create(config);
    QVERIFY(small);
    r = small->evaluate("a + b + c", QVariantMap{{"a", 1}, {"b", 2}, {"c", 3}});
    QVERIFY(!r.success);
    QCOMPARE(r.error.kind, FormulaError::Kind::TooManyVariables);
    QCOMPARE(r.error.limit, qint64(2));
}

void TestParserEngine::testEvaluateReportsCompileErrors() {
    EvaluationResult r = m_engine->evaluate("2 +", m_engine->defaultContext());
    QVERIFY(!r.success);
    QCOMPARE(r.error.kind, FormulaError::Kind::UnexpectedToken);

    r = m_engine->evaluate("{rate", m_engine->defaultContext());
    QCOMPARE(r.error.kind, FormulaError::Kind::UnclosedVariable);

    QJsonObject json = r.toJson();
    QCOMPARE(json["success"].toBool(), false);
    QCOMPARE(json["error"].toObject()["kind"].toString(), QString("UnclosedVariable"));
}

void TestParserEngine::testIsValidFormula() {
    FormulaError err;
    QVERIFY(m_engine->isValidFormula("IF({a} > 1, MAX({a}, 2), 0)", &err));
    QVERIFY(!err.isError());

    QVERIFY(!m_engine->isValidFormula("2 +", &err));
    QCOMPARE(err.kind, FormulaError::Kind::InvalidFormula);
    QVERIFY(err.cause);
    QCOMPARE(err.cause->kind, FormulaError::Kind::UnexpectedToken);

    QVERIFY(!m_engine->isValidFormula("1 + #", &err));
    QCOMPARE(err.kind, FormulaError::Kind::InvalidFormula);
    QCOMPARE(err.rootCause().kind, FormulaError::Kind::UnexpectedCharacter);
    QCOMPARE(err.rootCause().offendingText, QString("#"));
    QCOMPARE(err.rootCause().position.index, 4);

    // Unknown functions are an evaluation concern, not a syntax error
    QVERIFY(m_engine->isValidFormula("NOPE(1)"));
}

void TestParserEngine::testExtractVariables() {
    FormulaError err;
    QStringList vars = m_engine->extractVariables("{a} + b * IF(c, ${a}, PI)", &err);
    QVERIFY2(!err.isError(), qPrintable(err.toString()));
    QCOMPARE(vars, (QStringList{"a", "b", "c", "PI"}));

    QVERIFY(m_engine->extractVariables("1 + 2").isEmpty());

    vars = m_engine->extractVariables("(a + ", &err);
    QVERIFY(vars.isEmpty());
    QCOMPARE(err.kind, FormulaError::Kind::VariableExtractionFailed);
    QVERIFY(err.cause);
    QCOMPARE(err.cause->kind, FormulaError::Kind::UnexpectedToken);
}

void TestParserEngine::testSharedEvaluatorCache() {
    Evaluator evaluator(m_engine->functions());
    EvaluationContext ctx = m_engine->defaultContext().withVariable("x", 2);

    EvaluationResult first = m_engine->evaluate("{x} ^ 2", ctx, evaluator);
    EvaluationResult second = m_engine->evaluate("{x} ^ 2", ctx, evaluator);
    QVERIFY(first.success);
    QVERIFY(first.sameOutcome(second));
    QCOMPARE(first.value.toDouble(), 4.0);
    QCOMPARE(evaluator.cacheHits(), 1);
}

QTEST_MAIN(TestParserEngine)
#include "test_parser_engine.moc"
