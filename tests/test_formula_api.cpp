#include <QtTest>
#include "services/FormulaApi.h"
#include <QThread>
#include <algorithm>
#include <cmath>
#include <vector>

class TestFormulaApi : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testRunCachesByExpressionHash();
    void testBuilderSet();
    void testBuilderWithInputsCopies();
    void testWithCacheReplacesStaleExpression();
    void testComplexFormula();
    void testConditionalSequence();
    void testClearCache();
    void testRejectedRequests();
    void testParseAndEvalFailures();
    void testConcurrentRuns();
};

void TestFormulaApi::init() { FormulaApi::clearCache(); }

void TestFormulaApi::cleanup() { FormulaApi::clearCache(); }

void TestFormulaApi::testRunCachesByExpressionHash() {
    bool ok = false;
    double result = FormulaApi::run("a + b * 2", {{"a", 2}, {"b", 3}}, QString(), &ok);
    QVERIFY(ok);
    QCOMPARE(result, 8.0);

    QHash<QString, QString> cached = FormulaApi::allFormulas();
    QCOMPARE(cached.size(), 1);
    const QString id = FormulaApi::cacheIdFor("a + b * 2");
    QCOMPARE(id.size(), 64);
    QCOMPARE(cached.value(id), QString("a + b * 2"));

    // Same expression, same cache entry
    FormulaApi::run("a + b * 2", {{"a", 0}, {"b", 0}});
    QCOMPARE(FormulaApi::allFormulas().size(), 1);
}

void TestFormulaApi::testBuilderSet() {
    bool ok = false;
    double result = FormulaApi::request("let temp = x * 2; temp + y")
                        .set("x", 2)
                        .set("y", 3)
                        .evaluate(&ok);
    QVERIFY(ok);
    QCOMPARE(result, 7.0);
}

void TestFormulaApi::testBuilderWithInputsCopies() {
    FormulaBindings provided{{"value", 4}};
    FormulaApi::FormulaRequest request = FormulaApi::request("value * 2");
    request.withInputs(provided);

    provided["value"] = 10;

    QCOMPARE(request.evaluate(), 8.0);
    QCOMPARE(request.inputs().value("value"), 4.0);
}

void TestFormulaApi::testWithCacheReplacesStaleExpression() {
    bool ok = false;
    double first = FormulaApi::request("a + b").set("a", 1).set("b", 2).withCache("customId", &ok);
    QVERIFY(ok);
    QCOMPARE(first, 3.0);

    double second = FormulaApi::request("a * b").set("a", 3).set("b", 4).withCache("customId", &ok);
    QVERIFY(ok);
    QCOMPARE(second, 12.0);

    QHash<QString, QString> cached = FormulaApi::allFormulas();
    QCOMPARE(cached.size(), 1);
    QVERIFY(cached.contains("customId"));
    QCOMPARE(cached.value("customId"), QString("a * b"));
}

void TestFormulaApi::testComplexFormula() {
    const QString expression =
        "\n"
        "let basePower = pow(strength + weaponBonus * multiplier, 2);\n"
        "let trig = sin(angle) + cos(angle);\n"
        "let clamped = clamp(basePower * trig, minLimit, maxLimit);\n"
        "let adjusted = clamped > threshold ? clamped : threshold - abs(clamped - threshold);\n"
        "let normalized = (adjusted + lerp(minLimit, maxLimit, 0.25)) / max(1, round(magnitude));\n"
        "normalized";

    FormulaBindings in{{"strength", 4},    {"weaponBonus", 1.5}, {"multiplier", 2.25},
                       {"angle", 0.35},    {"minLimit", 10},     {"maxLimit", 50},
                       {"threshold", 30},  {"magnitude", 3.6}};

    bool ok = false;
    double result = FormulaApi::run(expression, in, QString(), &ok);
    QVERIFY(ok);

    double basePower = std::pow(4 + 1.5 * 2.25, 2);
    double trig = std::sin(0.35) + std::cos(0.35);
    double clamped = std::max(10.0, std::min(basePower * trig, 50.0));
    double adjusted = clamped > 30 ? clamped : 30 - std::abs(clamped - 30);
    double lerpValue = 10 + (50 - 10) * 0.25;
    double denominator = std::max(1.0, std::nearbyint(3.6));
    double expected = (adjusted + lerpValue) / denominator;

    QVERIFY2(std::abs(result - expected) < 1e-9,
             qPrintable(QString("%1 != %2").arg(result).arg(expected)));
}

void TestFormulaApi::testConditionalSequence() {
    const QString expression =
        "\n"
        "let normalizedChance = clamp01(criticalChance);\n"
        "let baseValue = (primaryDamage + secondaryDamage * 0.5) / (normalizedChance + 0.1);\n"
        "let penalty = 0;\n"
        "if (resistance > 0.5) { penalty = resistance * 2; } else { penalty = resistance * 0.75; }\n"
        "let total = baseValue;\n"
        "total += min(penalty, 5);\n"
        "total -= sign(total - target) * 1.25;\n"
        "if (total > target) { total - (total - target) * 0.3 } else { total + (target - total) * 0.6 }";

    bool ok = false;
    double result = FormulaApi::request(expression)
                        .set("primaryDamage", 18)
                        .set("secondaryDamage", 6)
                        .set("criticalChance", 0.65)
                        .set("resistance", 0.7)
                        .set("target", 12)
                        .evaluate(&ok);
    QVERIFY(ok);

    double baseValue = (18 + 6 * 0.5) / (0.65 + 0.1);
    double penalty = 0.7 * 2;
    double total = baseValue + std::min(penalty, 5.0);
    total -= (total - 12 >= 0 ? 1.0 : -1.0) * 1.25;
    double expected = total > 12 ? total - (total - 12) * 0.3 : total + (12 - total) * 0.6;

    QVERIFY2(std::abs(result - expected) < 1e-9,
             qPrintable(QString("%1 != %2").arg(result).arg(expected)));
}

void TestFormulaApi::testClearCache() {
    FormulaApi::run("a + b", {{"a", 2}, {"b", 3}});
    QCOMPARE(FormulaApi::allFormulas().size(), 1);

    FormulaApi::clearCache();
    QVERIFY(FormulaApi::allFormulas().isEmpty());
}

void TestFormulaApi::testRejectedRequests() {
    bool ok = true;
    QString error;

    QCOMPARE(FormulaApi::run("   ", {}, QString(), &ok, &error), 0.0);
    QVERIFY(!ok);
    QVERIFY(error.contains("Expression"));

    ok = true;
    FormulaApi::request("x").set("", 1).set("x", 2).evaluate(&ok, &error);
    QVERIFY(!ok);
    QVERIFY(error.contains("key"));

    ok = true;
    FormulaApi::request("1 + 1").withCache(" ", &ok, &error);
    QVERIFY(!ok);
    QVERIFY(error.contains("Cache identifier"));

    QVERIFY(FormulaApi::allFormulas().isEmpty());
}

void TestFormulaApi::testParseAndEvalFailures() {
    bool ok = true;
    QString error;

    QCOMPARE(FormulaApi::run("a +", {{"a", 1}}, QString(), &ok, &error), 0.0);
    QVERIFY(!ok);
    QVERIFY(error.startsWith("Failed to register formula 'a +'"));
    QVERIFY(FormulaApi::allFormulas().isEmpty());

    ok = true;
    QCOMPARE(FormulaApi::run("a + b", {{"a", 1}}, QString(), &ok, &error), 0.0);
    QVERIFY(!ok);
    QCOMPARE(error, QString("Variable 'b' not found"));
}

void TestFormulaApi::testConcurrentRuns() {
    std::vector<int> wrong(4, 0);
    QVector<QThread *> threads;
    for (int t = 0; t < 4; ++t) {
        threads.append(QThread::create([t, &wrong]() {
            for (int i = 0; i < 200; ++i) {
                bool ok = false;
                double v = FormulaApi::run("x * k + 1", {{"x", double(i)}, {"k", double(t)}},
                                           QString(), &ok);
                if (!ok || v != i * t + 1)
                    ++wrong[t];
            }
        }));
    }
    for (QThread *thread : threads)
        thread->start();
    for (QThread *thread : threads) {
        QVERIFY(thread->wait(10000));
        delete thread;
    }

    for (int count : wrong)
        QCOMPARE(count, 0);
    QCOMPARE(FormulaApi::allFormulas().size(), 1);
}

QTEST_MAIN(TestFormulaApi)
#include "test_formula_api.moc"
