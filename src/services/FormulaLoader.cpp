#include "services/FormulaLoader.h"
#include <QDebug>
#include <algorithm>

FormulaLoader::FormulaLoader(RandomProviderPtr randomProvider, QObject *parent)
    : QObject(parent)
    , m_parser(std::move(randomProvider)) {}

// ═══════════════════════════════════════════════════════════════════
// REGISTRATION
// ═══════════════════════════════════════════════════════════════════

bool FormulaLoader::registerFormula(const QString &id, const QString &expression,
                                    ParseError *error) {
    ParseError err;
    FormulaPtr compiled = m_parser.parse(expression, &err);
    if (error)
        *error = err;
    if (!compiled) {
        QString msg = QString("Failed to register formula '%1': %2").arg(id, err.toString());
        qWarning().noquote() << "[FormulaLoader]" << msg;
        emit errorOccurred(msg);
        return false;
    }

    m_formulas.insert(id, compiled);
    qDebug() << "[FormulaLoader] Registered" << id
             << "inputs:" << compiled->requiredInputs().values();
    return true;
}

int FormulaLoader::registerFormulas(const QVector<FormulaDefinition> &definitions) {
    int registered = 0;
    for (const FormulaDefinition &def : definitions) {
        if (registerFormula(def.id, def.expression))
            ++registered;
    }
    emit logMessage(QString("Registered %1 of %2 formulas")
                        .arg(registered)
                        .arg(definitions.size()));
    return registered;
}

// ═══════════════════════════════════════════════════════════════════
// LOOKUP
// ═══════════════════════════════════════════════════════════════════

FormulaPtr FormulaLoader::formula(const QString &id) const {
    return m_formulas.value(id);
}

bool FormulaLoader::hasFormula(const QString &id) const {
    return m_formulas.contains(id);
}

QSet<QString> FormulaLoader::requiredInputs(const QString &id) const {
    FormulaPtr f = m_formulas.value(id);
    return f ? f->requiredInputs() : QSet<QString>();
}

QStringList FormulaLoader::formulaIds() const {
    QStringList ids = m_formulas.keys();
    std::sort(ids.begin(), ids.end());
    return ids;
}

int FormulaLoader::formulaCount() const { return m_formulas.size(); }

QString FormulaLoader::formulaExpression(const QString &id) const {
    FormulaPtr f = m_formulas.value(id);
    return f ? f->source() : QString();
}

// ═══════════════════════════════════════════════════════════════════
// REMOVAL
// ═══════════════════════════════════════════════════════════════════

bool FormulaLoader::removeFormula(const QString &id) {
    return m_formulas.remove(id) > 0;
}

void FormulaLoader::clearAll() {
    m_formulas.clear();
    qDebug() << "[FormulaLoader] All formulas cleared";
    emit logMessage("All formulas cleared");
}
