#include <QtTest>
#include <QProcess>
#include <QTemporaryDir>
#include <QTextStream>
#include <memory>

#ifndef FORMULA_CONSOLE_PATH
#error "FORMULA_CONSOLE_PATH must point at the formula_console binary"
#endif

class TestFormulaConsole : public QObject {
    Q_OBJECT

private slots:
    void init();

    void testEvalWithPoolingPresetsMissingInputs();
    void testEvalWithoutPoolingReportsMissingInput();
    void testEvalWithAllInputs();
    void testExpression();
    void testUnknownFormula();

private:
    QString writeConfig(bool pooling);
    int runConsole(const QStringList &args, QString *stdOut, QString *stdErr);

    std::unique_ptr<QTemporaryDir> m_dir;
};

void TestFormulaConsole::init() {
    m_dir.reset(new QTemporaryDir);
    QVERIFY(m_dir->isValid());

    QFile library(m_dir->filePath("formulas.json"));
    QVERIFY(library.open(QIODevice::WriteOnly | QIODevice::Text));
    library.write(R"({"formulas": [{"id": "sum", "expression": "a + b"}]})");
}

QString TestFormulaConsole::writeConfig(bool pooling) {
    QString path = m_dir->filePath(pooling ? "pooled.ini" : "unpooled.ini");
    QFile file(path);
    if (file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        QTextStream stream(&file);
        stream << "[RUNNER]\n"
               << "use_input_pooling = " << (pooling ? "true" : "false") << "\n"
               << "[LOGGING]\n"
               << "log_dir = " << m_dir->filePath("logs") << "\n"
               << "[LIBRARY]\n"
               << "path = " << m_dir->filePath("formulas.json") << "\n";
    }
    return path;
}

int TestFormulaConsole::runConsole(const QStringList &args, QString *stdOut,
                                   QString *stdErr) {
    QProcess process;
    process.start(QStringLiteral(FORMULA_CONSOLE_PATH), args);
    if (!process.waitForFinished(30000))
        return -1;
    *stdOut = QString::fromLocal8Bit(process.readAllStandardOutput());
    *stdErr = QString::fromLocal8Bit(process.readAllStandardError());
    return process.exitCode();
}

void TestFormulaConsole::testEvalWithPoolingPresetsMissingInputs() {
    QString out, err;
    int code = runConsole({"--config", writeConfig(true), "--eval", "sum", "a=2"}, &out, &err);
    QVERIFY2(code == 0, qPrintable(err));
    QVERIFY2(out.contains("sum = 2"), qPrintable(out));
}

void TestFormulaConsole::testEvalWithoutPoolingReportsMissingInput() {
    QString out, err;
    int code = runConsole({"--config", writeConfig(false), "--eval", "sum", "a=2"}, &out, &err);
    QCOMPARE(code, 1);
    QVERIFY(!out.contains("sum ="));
    QVERIFY2(err.contains("Variable 'b' not found"), qPrintable(err));
}

void TestFormulaConsole::testEvalWithAllInputs() {
    for (bool pooling : {true, false}) {
        QString out, err;
        int code = runConsole({"--config", writeConfig(pooling), "--eval", "sum", "a=2", "b=3.5"},
                              &out, &err);
        QVERIFY2(code == 0, qPrintable(err));
        QVERIFY2(out.contains("sum = 5.5"), qPrintable(out));
    }
}

void TestFormulaConsole::testExpression() {
    QString out, err;
    int code = runConsole({"--config", writeConfig(true), "--expr", "let y = x * 2; y + 1", "x=4"},
                          &out, &err);
    QVERIFY2(code == 0, qPrintable(err));
    QCOMPARE(out.trimmed(), QString("9"));
}

void TestFormulaConsole::testUnknownFormula() {
    QString out, err;
    int code = runConsole({"--config", writeConfig(true), "--eval", "ghost"}, &out, &err);
    QCOMPARE(code, 1);
    QVERIFY(err.contains("Formula 'ghost' not found"));
}

QTEST_MAIN(TestFormulaConsole)
#include "test_formula_console.moc"
