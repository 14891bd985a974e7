#include <QtTest>
#include "formula/FormulaOrchestrator.h"
#include "formula/FormulaSetParser.h"
#include <QFile>
#include <QJsonArray>
#include <QTemporaryDir>

class TestOrchestrator : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();

    // Execution
    void testTwoStepSet();
    void testNestedConditionalStep_data();
    void testNestedConditionalStep();
    void testConditionSkipsStep();
    void testSkippedFinalVariableFails();
    void testFinalScoreStepShadowsFinalResult();
    void testFailingStepStopsRun();
    void testFailingCondition();
    void testStepsRunInOrder();

    // Guards
    void testEmptySet();
    void testInvalidSet();
    void testTooManySteps();
    void testTooManyInputs();

    // Multi-step helper
    void testCalculateMultiStep();
    void testCalculateMultiStepStopsOnFailure();

    // Audit record
    void testExecutionJson();

    // Formula set documents
    void testParseJson();
    void testParseDefaults();
    void testParseFailures_data();
    void testParseFailures();
    void testJsonRoundTrip();
    void testLoadFile();

private:
    static Formula formula(int order, const QString &expression, const QString &result,
                           const QString &condition = QString());
    static FormulaSet makeSet(const QVector<Formula> &formulas,
                              const QString &finalResult = QString());

    std::shared_ptr<const ParserEngine> m_engine;
};

void TestOrchestrator::initTestCase() {
    FormulaError err;
    m_engine = ParserEngine::create(EngineConfig(), &err);
    QVERIFY2(m_engine, qPrintable(err.toString()));
}

Formula TestOrchestrator::formula(int order, const QString &expression,
                                  const QString &result, const QString &condition) {
    Formula f;
    f.order = order;
    f.id = QString("f%1").arg(order);
    f.name = QString("step %1").arg(order);
    f.expression = expression;
    f.resultVariable = result;
    f.executionCondition = condition;
    return f;
}

FormulaSet TestOrchestrator::makeSet(const QVector<Formula> &formulas,
                                     const QString &finalResult) {
    FormulaSet set;
    set.id = "test-set";
    set.name = "Test set";
    set.type = "SCORE_CALCULATION";
    set.finalResultVariable = finalResult;
    set.formulas = formulas;
    return set;
}

// ═══════════════════════════════════════════════════════════
// Execution
// ═══════════════════════════════════════════════════════════

void TestOrchestrator::testTwoStepSet() {
    FormulaOrchestrator orchestrator(m_engine);
    FormulaSet set = makeSet({formula(1, "a+b", "step1"), formula(2, "step1*2", "final")});

    FormulaExecution exec = orchestrator.execute(set, QVariantMap{{"a", 2}, {"b", 3}});
    QVERIFY2(exec.isSuccess(), qPrintable(exec.error().toString()));
    QCOMPARE(exec.status(), FormulaExecution::Status::Success);
    QCOMPARE(exec.formulaSetId(), QString("test-set"));
    QVERIFY(!exec.executionId().isEmpty());

    QCOMPARE(exec.steps().size(), 2);
    QCOMPARE(exec.steps()[0].resultValue.toDouble(), 5.0);
    QCOMPARE(exec.steps()[0].resultVariableName, QString("step1"));
    QCOMPARE(exec.steps()[1].resultValue.toDouble(), 10.0);
    QCOMPARE(exec.finalResult().toDouble(), 10.0);
    QVERIFY(exec.skippedFormulas().isEmpty());

    QCOMPARE(exec.result("step1").toDouble(), 5.0);
    QCOMPARE(exec.result("a").toInt(), 2);
    QCOMPARE(exec.result("final_score").toDouble(), 10.0);
    QVERIFY(!exec.result("nothing").isValid());

    QVariantMap all = exec.allResults();
    QCOMPARE(all.size(), 5);
    QCOMPARE(all.value("final").toDouble(), 10.0);
    QCOMPARE(all.value("final_score").toDouble(), 10.0);

    QVERIFY(exec.step(2));
    QCOMPARE(exec.step(2)->formulaId, QString("f2"));
    QVERIFY(!exec.step(3));
}

void TestOrchestrator::testNestedConditionalStep_data() {
    QTest::addColumn<int>("days");
    QTest::addColumn<double>("score");

    QTest::newRow("no absence") << 0 << 15.0;
    QTest::newRow("one day") << 1 << 14.0;
    QTest::newRow("three days") << 3 << 12.0;
    QTest::newRow("five days") << 5 << 10.0;
}

void TestOrchestrator::testNestedConditionalStep() {
    QFETCH(int, days);
    QFETCH(double, score);

    FormulaOrchestrator orchestrator(m_engine);
    FormulaSet set = makeSet(
        {formula(1, "IF({days} >= 5, 10, IF({days} >= 3, 12, IF({days} >= 1, 14, 15)))",
                 "attendance_score")},
        "attendance_score");

    FormulaExecution exec = orchestrator.execute(set, QVariantMap{{"days", days}});
    QVERIFY2(exec.isSuccess(), qPrintable(exec.error().toString()));
    QCOMPARE(exec.finalResult().toDouble(), score);
}

void TestOrchestrator::testConditionSkipsStep() {
    FormulaOrchestrator orchestrator(m_engine);
    FormulaSet set = makeSet({formula(1, "{korean} + {math}", "grade_sum"),
                              formula(2, "grade_sum * 1.1", "bonus_sum", "{has_bonus}"),
                              formula(3, "grade_sum / 2", "average")});
    set.formulas[1].name = "bonus";

    QVariantMap inputs{{"korean", 90}, {"math", 70}, {"has_bonus", false}};
    FormulaExecution exec = orchestrator.execute(set, inputs);
    QCOMPARE(exec.status(), FormulaExecution::Status::Partial);
    QVERIFY(!exec.isSuccess());
    QCOMPARE(exec.skippedFormulas(), QStringList{"bonus"});
    QCOMPARE(exec.steps().size(), 2);
    QCOMPARE(exec.finalResult().toDouble(), 80.0);
    QVERIFY(!exec.error().isError());

    inputs["has_bonus"] = true;
    exec = orchestrator.execute(set, inputs);
    QCOMPARE(exec.status(), FormulaExecution::Status::Success);
    QCOMPARE(exec.result("bonus_sum").toDouble(), 176.0);
}

void TestOrchestrator::testSkippedFinalVariableFails() {
    FormulaOrchestrator orchestrator(m_engine);
    FormulaSet set = makeSet({formula(1, "x + 1", "base"),
                              formula(2, "base * 2", "final_score", "x > 10")},
                             "final_score");

    FormulaExecution exec = orchestrator.execute(set, QVariantMap{{"x", 1}});
    QCOMPARE(exec.status(), FormulaExecution::Status::Failed);
    QCOMPARE(exec.error().kind, FormulaError::Kind::UndefinedVariable);
    QCOMPARE(exec.error().offendingText, QString("final_score"));
    QCOMPARE(exec.steps().size(), 1);
}

void TestOrchestrator::testFinalScoreStepShadowsFinalResult() {
    FormulaOrchestrator orchestrator(m_engine);
    FormulaSet set = makeSet({formula(1, "x + 1", "final_score"), formula(2, "x * 10", "other")},
                             "other");

    FormulaExecution exec = orchestrator.execute(set, QVariantMap{{"x", 2}});
    QVERIFY2(exec.isSuccess(), qPrintable(exec.error().toString()));
    QCOMPARE(exec.finalResult().toDouble(), 20.0);
    QCOMPARE(exec.allResults().value("final_score").toDouble(), 3.0);
    QCOMPARE(exec.result("final_score").toDouble(), 3.0);
}

void TestOrchestrator::testFailingStepStopsRun() {
    FormulaOrchestrator orchestrator(m_engine);
    FormulaSet set = makeSet({formula(1, "total * 2", "doubled"),
                              formula(2, "doubled / zero", "ratio"),
                              formula(3, "ratio + 1", "final")});

    FormulaExecution exec = orchestrator.execute(set, QVariantMap{{"total", 4}, {"zero", 0}});
    QCOMPARE(exec.status(), FormulaExecution::Status::Failed);
    QVERIFY(!exec.finalResult().isValid());

    const FormulaError &err = exec.error();
    QCOMPARE(err.kind, FormulaError::Kind::StepExecutionError);
    QCOMPARE(err.stepIndex, 1);
    QCOMPARE(err.offendingText, QString("f2"));
    QVERIFY(err.cause);
    QCOMPARE(err.cause->kind, FormulaError::Kind::DivisionByZero);

    // Steps completed before the failure are kept
    QCOMPARE(exec.steps().size(), 1);
    QCOMPARE(exec.result("doubled").toDouble(), 8.0);
}

void TestOrchestrator::testFailingCondition() {
    FormulaOrchestrator orchestrator(m_engine);
    FormulaSet set = makeSet({formula(1, "1", "one", "{missing} > 1")});

    FormulaExecution exec = orchestrator.execute(set, QVariantMap());
    QCOMPARE(exec.status(), FormulaExecution::Status::Failed);
    QCOMPARE(exec.error().kind, FormulaError::Kind::StepExecutionError);
    QCOMPARE(exec.error().stepIndex, 0);
    QCOMPARE(exec.error().rootCause().kind, FormulaError::Kind::UndefinedVariable);
}

void TestOrchestrator::testStepsRunInOrder() {
    FormulaOrchestrator orchestrator(m_engine);
    // Declared out of order; step 2 depends on step 1
    FormulaSet set = makeSet({formula(2, "first + 1", "second"), formula(1, "10", "first")});

    FormulaExecution exec = orchestrator.execute(set, QVariantMap());
    QVERIFY2(exec.isSuccess(), qPrintable(exec.error().toString()));
    QCOMPARE(exec.steps()[0].stepOrder, 1);
    QCOMPARE(exec.steps()[1].stepOrder, 2);
    QCOMPARE(exec.finalResult().toDouble(), 11.0);
}

// ═══════════════════════════════════════════════════════════
// Guards
// ═══════════════════════════════════════════════════════════

void TestOrchestrator::testEmptySet() {
    FormulaOrchestrator orchestrator(m_engine);
    FormulaExecution exec = orchestrator.execute(makeSet({}), QVariantMap());
    QCOMPARE(exec.status(), FormulaExecution::Status::Failed);
    QCOMPARE(exec.error().kind, FormulaError::Kind::EmptySteps);
    QVERIFY(exec.steps().isEmpty());
}

void TestOrchestrator::testInvalidSet() {
    FormulaOrchestrator orchestrator(m_engine);

    FormulaSet duplicateOrder = makeSet({formula(1, "1", "a"), formula(1, "2", "b")});
    FormulaExecution exec = orchestrator.execute(duplicateOrder, QVariantMap());
    QCOMPARE(exec.error().kind, FormulaError::Kind::InvalidFormulaSet);

    FormulaSet gap = makeSet({formula(1, "1", "a"), formula(3, "2", "b")});
    exec = orchestrator.execute(gap, QVariantMap());
    QCOMPARE(exec.error().kind, FormulaError::Kind::InvalidFormulaSet);

    FormulaSet sameResult = makeSet({formula(1, "1", "a"), formula(2, "2", "a")});
    exec = orchestrator.execute(sameResult, QVariantMap());
    QCOMPARE(exec.error().kind, FormulaError::Kind::InvalidFormulaSet);
    QCOMPARE(exec.error().offendingText, QString("a"));

    FormulaSet padded = makeSet({formula(1, "1", " total"), formula(2, "total", "b")});
    exec = orchestrator.execute(padded, QVariantMap());
    QCOMPARE(exec.error().kind, FormulaError::Kind::InvalidFormulaSet);
    QCOMPARE(exec.error().offendingText, QString("f1"));
    QVERIFY(exec.steps().isEmpty());

    FormulaSet unnamed = makeSet({formula(1, "1", "a")});
    unnamed.name.clear();
    exec = orchestrator.execute(unnamed, QVariantMap());
    QCOMPARE(exec.error().kind, FormulaError::Kind::InvalidFormulaSet);
}

void TestOrchestrator::testTooManySteps() {
    EngineConfig config;
    config.maxSteps = 2;
    std::shared_ptr<const ParserEngine> engine = ParserEngine::create(config);
    QVERIFY(engine);

    FormulaOrchestrator orchestrator(engine);
    FormulaSet set = makeSet({formula(1, "1", "a"), formula(2, "2", "b"), formula(3, "3", "c")});
    FormulaExecution exec = orchestrator.execute(set, QVariantMap());
    QCOMPARE(exec.status(), FormulaExecution::Status::Failed);
    QCOMPARE(exec.error().kind, FormulaError::Kind::TooManySteps);
    QCOMPARE(exec.error().limit, qint64(2));
    QCOMPARE(exec.error().observed, qint64(3));
}

void TestOrchestrator::testTooManyInputs() {
    EngineConfig config;
    config.maxVariables = 2;
    std::shared_ptr<const ParserEngine> engine = ParserEngine::create(config);
    QVERIFY(engine);

    FormulaOrchestrator orchestrator(engine);
    FormulaExecution exec = orchestrator.execute(makeSet({formula(1, "a", "r")}),
                                                 QVariantMap{{"a", 1}, {"b", 2}, {"c", 3}});
    QCOMPARE(exec.error().kind, FormulaError::Kind::TooManyVariables);

    // Step results count towards the limit as well
    exec = orchestrator.execute(makeSet({formula(1, "a + b", "r")}),
                                QVariantMap{{"a", 1}, {"b", 2}});
    QCOMPARE(exec.error().kind, FormulaError::Kind::StepExecutionError);
    QCOMPARE(exec.error().rootCause().kind, FormulaError::Kind::TooManyVariables);
}

// ═══════════════════════════════════════════════════════════
// Multi-step helper
// ═══════════════════════════════════════════════════════════

void TestOrchestrator::testCalculateMultiStep() {
    FormulaOrchestrator orchestrator(m_engine);
    QVector<EvaluationResult> results = orchestrator.calculateMultiStep(
        {"2 + 3", "step1 * 4", "step2 - x"}, QVariantMap{{"x", 1}});

    QCOMPARE(results.size(), 3);
    QCOMPARE(results[0].value.toDouble(), 5.0);
    QCOMPARE(results[1].value.toDouble(), 20.0);
    QCOMPARE(results[2].value.toDouble(), 19.0);
    QCOMPARE(results[2].touchedVariables, (QStringList{"step2", "x"}));
}

void TestOrchestrator::testCalculateMultiStepStopsOnFailure() {
    FormulaOrchestrator orchestrator(m_engine);
    QVector<EvaluationResult> results =
        orchestrator.calculateMultiStep({"1", "step5", "2"}, QVariantMap());

    QCOMPARE(results.size(), 2);
    QVERIFY(results[0].success);
    QVERIFY(!results[1].success);
    QCOMPARE(results[1].error.kind, FormulaError::Kind::UndefinedVariable);
}

// ═══════════════════════════════════════════════════════════
// Audit record
// ═══════════════════════════════════════════════════════════

void TestOrchestrator::testExecutionJson() {
    FormulaOrchestrator orchestrator(m_engine);
    FormulaSet set = makeSet({formula(1, "a+b", "step1"), formula(2, "step1*2", "final")});

    QJsonObject json = orchestrator.execute(set, QVariantMap{{"a", 2}, {"b", 3}}).toJson();
    QCOMPARE(json["status"].toString(), QString("SUCCESS"));
    QCOMPARE(json["formula_set_id"].toString(), QString("test-set"));
    QCOMPARE(json["final_result"].toDouble(), 10.0);
    QCOMPARE(json["input_variables"].toObject()["a"].toInt(), 2);
    QCOMPARE(json["steps"].toArray().size(), 2);
    QVERIFY(!json.contains("error"));

    QJsonObject step = json["steps"].toArray().at(0).toObject();
    QCOMPARE(step["step_order"].toInt(), 1);
    QCOMPARE(step["result_variable"].toString(), QString("step1"));
    QCOMPARE(step["result_value"].toDouble(), 5.0);

    set.formulas[1].expression = "step1 / 0";
    json = orchestrator.execute(set, QVariantMap{{"a", 2}, {"b", 3}}).toJson();
    QCOMPARE(json["status"].toString(), QString("FAILED"));
    QJsonObject error = json["error"].toObject();
    QCOMPARE(error["kind"].toString(), QString("StepExecutionError"));
    QCOMPARE(error["step_index"].toInt(), 1);
    QCOMPARE(error["cause"].toObject()["kind"].toString(), QString("DivisionByZero"));
}

// ═══════════════════════════════════════════════════════════
// Formula set documents
// ═══════════════════════════════════════════════════════════

void TestOrchestrator::testParseJson() {
    const QByteArray text = R"({
        "formula_set_id": "gpa-general",
        "name": "General admission score",
        "type": "SCORE_CALCULATION",
        "final_result_variable": "final_score",
        "criteria": { "application_type": "EARLY", "region": "SEOUL" },
        "formulas": [
            { "order": 1, "formula_id": "grades", "name": "Grade sum",
              "expression": "{korean} + {math}", "result_variable": "grade_sum" },
            { "order": 2, "formula_id": "bonus", "name": "Bonus",
              "expression": "grade_sum * 1.1", "result_variable": "final_score",
              "execution_condition": "{has_bonus}" }
        ]
    })";

    QString errorMsg;
    FormulaSet set = FormulaSetParser::parseJsonText(text, errorMsg);
    QVERIFY2(errorMsg.isEmpty(), qPrintable(errorMsg));
    QCOMPARE(set.id, QString("gpa-general"));
    QCOMPARE(set.criteria.applicationType, QString("EARLY"));
    QCOMPARE(set.criteria.region, QString("SEOUL"));
    QVERIFY(set.isActive);
    QCOMPARE(set.formulas.size(), 2);
    QCOMPARE(set.formulas[1].executionCondition, QString("{has_bonus}"));
    QVERIFY(set.validate());

    FormulaOrchestrator orchestrator(m_engine);
    FormulaExecution exec = orchestrator.execute(
        set, QVariantMap{{"korean", 50}, {"math", 50}, {"has_bonus", true}});
    QVERIFY2(exec.isSuccess(), qPrintable(exec.error().toString()));
    QCOMPARE(exec.result("final_score").toDouble(), 110.0);
}

void TestOrchestrator::testParseDefaults() {
    QString errorMsg;
    FormulaSet set = FormulaSetParser::parseJsonText(
        R"({"name": "Defaults", "formulas": [{"expression": "1", "result_variable": "r"}]})",
        errorMsg);
    QVERIFY2(errorMsg.isEmpty(), qPrintable(errorMsg));
    QCOMPARE(set.type, QString("SCORE_CALCULATION"));
    QCOMPARE(set.formulas.size(), 1);
    QCOMPARE(set.formulas[0].order, 1);
    QCOMPARE(set.formulas[0].id, QString("formula_1"));
    QCOMPARE(set.formulas[0].name, QString("formula_1"));
    QVERIFY(!set.formulas[0].hasCondition());
}

void TestOrchestrator::testParseFailures_data() {
    QTest::addColumn<QByteArray>("text");

    QTest::newRow("not json") << QByteArray("{ name: ");
    QTest::newRow("array document") << QByteArray("[1, 2]");
    QTest::newRow("missing name") << QByteArray(R"({"formulas": []})");
    QTest::newRow("formulas not an array") << QByteArray(R"({"name": "x", "formulas": 3})");
    QTest::newRow("formula not an object") << QByteArray(R"({"name": "x", "formulas": [7]})");
    QTest::newRow("missing expression")
        << QByteArray(R"({"name": "x", "formulas": [{"result_variable": "r"}]})");
}

void TestOrchestrator::testParseFailures() {
    QFETCH(QByteArray, text);

    QString errorMsg;
    FormulaSet set = FormulaSetParser::parseJsonText(text, errorMsg);
    QVERIFY(!errorMsg.isEmpty());
    QVERIFY(set.formulas.isEmpty());
}

void TestOrchestrator::testJsonRoundTrip() {
    FormulaSet set = makeSet({formula(1, "a+b", "step1"),
                              formula(2, "step1*2", "final", "step1 > 0")},
                             "final");
    set.description = "Two steps";
    set.criteria.educationalStatus = "GRADUATE";

    QString errorMsg;
    FormulaSet copy = FormulaSetParser::parseJson(FormulaSetParser::toJson(set), errorMsg);
    QVERIFY2(errorMsg.isEmpty(), qPrintable(errorMsg));
    QCOMPARE(copy.id, set.id);
    QCOMPARE(copy.description, set.description);
    QCOMPARE(copy.finalResultVariable, QString("final"));
    QCOMPARE(copy.criteria.educationalStatus, QString("GRADUATE"));
    QCOMPARE(copy.formulas.size(), 2);
    QCOMPARE(copy.formulas[1].id, QString("f2"));
    QCOMPARE(copy.formulas[1].executionCondition, QString("step1 > 0"));
    QCOMPARE(FormulaSetParser::toJson(copy), FormulaSetParser::toJson(set));
}

void TestOrchestrator::testLoadFile() {
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath("set.json");

    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write(R"({"formula_set_id": "file-set", "name": "From disk",
                  "formulas": [{"order": 1, "expression": "x * 3", "result_variable": "y"}]})");
    file.close();

    QString errorMsg;
    FormulaSet set = FormulaSetParser::loadFile(path, errorMsg);
    QVERIFY2(errorMsg.isEmpty(), qPrintable(errorMsg));
    QCOMPARE(set.id, QString("file-set"));

    FormulaOrchestrator orchestrator(m_engine);
    QCOMPARE(orchestrator.execute(set, QVariantMap{{"x", 2}}).finalResult().toDouble(), 6.0);

    FormulaSetParser::loadFile(dir.filePath("missing.json"), errorMsg);
    QVERIFY(!errorMsg.isEmpty());
}

QTEST_MAIN(TestOrchestrator)
#include "test_orchestrator.moc"
