#include <QtTest>
#include <QSignalSpy>
#include "services/FormulaLoader.h"
#include "services/FormulaRunner.h"
#include <memory>

class TestFormulaLoaderRunner : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    // Loader
    void testRegisterValidExpression();
    void testRegisterInvalidExpression();
    void testFailedRegistrationKeepsPrevious();
    void testRegisterFormulas();
    void testRemoveFormula();
    void testClearAll();
    void testRequiredInputsIgnoreLocals();
    void testUnknownIdLookups();

    // Runner
    void testEvaluateWithMapInputs();
    void testEvaluateWithPairInputs();
    void testPairInputsWithoutPooling();
    void testPooledMapIsResetBetweenCalls();
    void testMissingFormula();
    void testMissingInput();
    void testEvaluateBatch();
    void testEvaluateBatchStopsAtFailure();
    void testEvaluateMultiple();
    void testTryEvaluate();
    void testPrepareAndClearPools();
    void testPrepareMissingFormula();
    void testPoolingToggle();

private:
    std::unique_ptr<FormulaLoader> m_loader;
    std::unique_ptr<FormulaRunner> m_runner;
};

void TestFormulaLoaderRunner::init() {
    m_loader.reset(new FormulaLoader(std::make_shared<FixedRandomProvider>(0.5)));
    m_runner.reset(new FormulaRunner(m_loader.get()));
}

void TestFormulaLoaderRunner::cleanup() {
    m_runner.reset();
    m_loader.reset();
}

// ═══════════════════════════════════════════════════════════════════
// Loader
// ═══════════════════════════════════════════════════════════════════

void TestFormulaLoaderRunner::testRegisterValidExpression() {
    QVERIFY(m_loader->registerFormula("sum", "a + b * 2"));

    FormulaPtr f = m_loader->formula("sum");
    QVERIFY(f);
    QCOMPARE(f->source(), QString("a + b * 2"));
    QCOMPARE(f->requiredInputs(), (QSet<QString>{"a", "b"}));
    QVERIFY(m_loader->hasFormula("sum"));
    QCOMPARE(m_loader->formulaCount(), 1);
    QCOMPARE(m_loader->formulaExpression("sum"), QString("a + b * 2"));
}

void TestFormulaLoaderRunner::testRegisterInvalidExpression() {
    QSignalSpy errors(m_loader.get(), &FormulaLoader::errorOccurred);

    ParseError err;
    QVERIFY(!m_loader->registerFormula("invalid", "a +", &err));
    QCOMPARE(err.kind, ParseError::UnexpectedEnd);
    QVERIFY(!m_loader->hasFormula("invalid"));

    QCOMPARE(errors.count(), 1);
    QString message = errors.takeFirst().at(0).toString();
    QVERIFY(message.startsWith("Failed to register formula 'invalid': "));
}

void TestFormulaLoaderRunner::testFailedRegistrationKeepsPrevious() {
    QVERIFY(m_loader->registerFormula("f", "x + 1"));
    QVERIFY(!m_loader->registerFormula("f", "x +"));
    QCOMPARE(m_loader->formulaExpression("f"), QString("x + 1"));

    // Successful re-registration replaces
    QVERIFY(m_loader->registerFormula("f", "x + 2"));
    QCOMPARE(m_runner->evaluate("f", FormulaBindings{{"x", 1}}), 3.0);
}

void TestFormulaLoaderRunner::testRegisterFormulas() {
    QSignalSpy logs(m_loader.get(), &FormulaLoader::logMessage);

    QVector<FormulaDefinition> defs{{"a", "1 + 1"}, {"b", "oops("}, {"c", "x * 2"}};
    QCOMPARE(m_loader->registerFormulas(defs), 2);
    QCOMPARE(m_loader->formulaIds(), (QStringList{"a", "c"}));
    QCOMPARE(logs.count(), 1);
}

void TestFormulaLoaderRunner::testRemoveFormula() {
    m_loader->registerFormula("sum", "a + b");
    QVERIFY(m_loader->removeFormula("sum"));
    QVERIFY(!m_loader->hasFormula("sum"));
    QVERIFY(!m_loader->removeFormula("sum"));
}

void TestFormulaLoaderRunner::testClearAll() {
    QSignalSpy logs(m_loader.get(), &FormulaLoader::logMessage);

    m_loader->registerFormula("sum", "a + b");
    m_loader->registerFormula("diff", "a - b");
    m_loader->clearAll();

    QCOMPARE(m_loader->formulaCount(), 0);
    QVERIFY(m_loader->formulaIds().isEmpty());
    QCOMPARE(logs.count(), 1);
    QCOMPARE(logs.takeFirst().at(0).toString(), QString("All formulas cleared"));
}

void TestFormulaLoaderRunner::testRequiredInputsIgnoreLocals() {
    m_loader->registerFormula("locals", "let temp = a * 2; temp + b");
    QCOMPARE(m_loader->requiredInputs("locals"), (QSet<QString>{"a", "b"}));
}

void TestFormulaLoaderRunner::testUnknownIdLookups() {
    QVERIFY(!m_loader->formula("nope"));
    QVERIFY(m_loader->requiredInputs("nope").isEmpty());
    QVERIFY(m_loader->formulaExpression("nope").isNull());
}

// ═══════════════════════════════════════════════════════════════════
// Runner
// ═══════════════════════════════════════════════════════════════════

void TestFormulaLoaderRunner::testEvaluateWithMapInputs() {
    m_loader->registerFormula("sum", "a + b * 2");

    FormulaBindings inputs{{"a", 3}, {"b", 4}};
    QCOMPARE(m_runner->evaluate("sum", inputs), 11.0);
    QCOMPARE(inputs.size(), 2);
}

void TestFormulaLoaderRunner::testEvaluateWithPairInputs() {
    m_loader->registerFormula("conditional", "if (a > b) { a } else { b }");

    FormulaInputPairs pairs{{"a", 5}, {"b", 2}};
    QCOMPARE(m_runner->evaluate("conditional", pairs), 5.0);
    QCOMPARE(m_runner->stats().pooledFormulaCount, 1);
}

void TestFormulaLoaderRunner::testPairInputsWithoutPooling() {
    m_loader->registerFormula("sum", "a + b");
    m_runner->setUseInputPooling(false);

    QSignalSpy errors(m_runner.get(), &FormulaRunner::errorOccurred);
    QCOMPARE(m_runner->evaluate("sum", FormulaInputPairs{{"a", 1}, {"b", 2}}), 3.0);
    QCOMPARE(m_runner->stats().pooledFormulaCount, 0);

    // Without the pool there is no zero preset for missing inputs
    QCOMPARE(m_runner->evaluate("sum", FormulaInputPairs{{"a", 1}}), 0.0);
    QCOMPARE(errors.count(), 1);
}

void TestFormulaLoaderRunner::testPooledMapIsResetBetweenCalls() {
    m_loader->registerFormula("acc", "let total = a + b; total");

    QCOMPARE(m_runner->evaluate("acc", FormulaInputPairs{{"a", 1}, {"b", 2}}), 3.0);
    // b is preset to 0 by the pool, not carried over from the last call
    QCOMPARE(m_runner->evaluate("acc", FormulaInputPairs{{"a", 10}}), 10.0);
}

void TestFormulaLoaderRunner::testMissingFormula() {
    QSignalSpy errors(m_runner.get(), &FormulaRunner::errorOccurred);

    QCOMPARE(m_runner->evaluate("missing", FormulaBindings()), 0.0);
    QCOMPARE(errors.count(), 1);
    QCOMPARE(errors.takeFirst().at(0).toString(), QString("Formula 'missing' not found"));

    QCOMPARE(m_runner->evaluate("missing", FormulaInputPairs()), 0.0);
    QCOMPARE(errors.count(), 1);
}

void TestFormulaLoaderRunner::testMissingInput() {
    m_loader->registerFormula("sum", "a + b");
    QSignalSpy errors(m_runner.get(), &FormulaRunner::errorOccurred);

    QCOMPARE(m_runner->evaluate("sum", FormulaBindings{{"a", 2}}), 0.0);
    QCOMPARE(errors.count(), 1);
    QString message = errors.takeFirst().at(0).toString();
    QVERIFY(message.startsWith("Error evaluating formula 'sum': "));
    QVERIFY(message.contains("Variable 'b'"));
}

void TestFormulaLoaderRunner::testEvaluateBatch() {
    m_loader->registerFormula("sum", "a + b");

    QVector<FormulaBindings> batch{FormulaBindings{{"a", 1}, {"b", 2}},
                                   FormulaBindings{{"a", 3}, {"b", 4}}};
    QVector<double> results = m_runner->evaluateBatch("sum", batch);
    QCOMPARE(results.size(), 2);
    QCOMPARE(results[0], 3.0);
    QCOMPARE(results[1], 7.0);

    QVector<double> none = m_runner->evaluateBatch("missing", batch);
    QCOMPARE(none, (QVector<double>{0.0, 0.0}));
}

void TestFormulaLoaderRunner::testEvaluateBatchStopsAtFailure() {
    m_loader->registerFormula("sum", "a + b");
    QSignalSpy errors(m_runner.get(), &FormulaRunner::errorOccurred);

    QVector<FormulaBindings> batch{FormulaBindings{{"a", 1}, {"b", 1}},
                                   FormulaBindings{{"a", 1}},
                                   FormulaBindings{{"a", 5}, {"b", 5}}};
    QVector<double> results = m_runner->evaluateBatch("sum", batch);
    QCOMPARE(results, (QVector<double>{2.0, 0.0, 0.0}));
    QCOMPARE(errors.count(), 1);
}

void TestFormulaLoaderRunner::testEvaluateMultiple() {
    m_loader->registerFormula("double", "value * 2");
    m_loader->registerFormula("triple", "value * 3");

    QHash<QString, double> results =
        m_runner->evaluateMultiple({"double", "triple"}, FormulaBindings{{"value", 4}});
    QCOMPARE(results.size(), 2);
    QCOMPARE(results.value("double"), 8.0);
    QCOMPARE(results.value("triple"), 12.0);
}

void TestFormulaLoaderRunner::testTryEvaluate() {
    m_loader->registerFormula("sum", "a + b");
    QSignalSpy errors(m_runner.get(), &FormulaRunner::errorOccurred);

    double result = -1.0;
    QVERIFY(m_runner->tryEvaluate("sum", FormulaBindings{{"a", 1}, {"b", 2}}, &result));
    QCOMPARE(result, 3.0);

    QVERIFY(!m_runner->tryEvaluate("sum", FormulaBindings{{"a", 1}}, &result));
    QCOMPARE(result, 0.0);

    result = -1.0;
    QVERIFY(!m_runner->tryEvaluate("missing", FormulaBindings(), &result));
    QCOMPARE(result, 0.0);

    QCOMPARE(errors.count(), 0);
}

void TestFormulaLoaderRunner::testPrepareAndClearPools() {
    m_loader->registerFormula("sum", "a + b");
    m_runner->prepareFormula("sum");
    m_runner->prepareFormula("sum");

    RunnerStats stats = m_runner->stats();
    QCOMPARE(stats.pooledFormulaCount, 1);
    QVERIFY(stats.poolingEnabled);
    QCOMPARE(stats.toString(), QString("Pooled: 1, Pooling: Enabled"));

    m_runner->clearPools();
    QCOMPARE(m_runner->stats().pooledFormulaCount, 0);
}

void TestFormulaLoaderRunner::testPrepareMissingFormula() {
    QSignalSpy errors(m_runner.get(), &FormulaRunner::errorOccurred);
    m_runner->prepareFormula("ghost");
    QCOMPARE(errors.count(), 1);
    QCOMPARE(m_runner->stats().pooledFormulaCount, 0);
}

void TestFormulaLoaderRunner::testPoolingToggle() {
    m_runner->setUseInputPooling(false);
    QVERIFY(!m_runner->useInputPooling());
    QCOMPARE(m_runner->stats().toString(), QString("Pooled: 0, Pooling: Disabled"));

    m_runner->setUseInputPooling(true);
    QVERIFY(m_runner->stats().poolingEnabled);
}

QTEST_MAIN(TestFormulaLoaderRunner)
#include "test_formula_loader_runner.moc"
