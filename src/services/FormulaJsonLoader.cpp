#include "services/FormulaJsonLoader.h"
#include <QDebug>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>

FormulaJsonLoader::FormulaJsonLoader(FormulaLoader *loader, QObject *parent)
    : QObject(parent)
    , m_loader(loader) {}

void FormulaJsonLoader::reportError(const QString &message) {
    qWarning().noquote() << "[FormulaJson]" << message;
    emit errorOccurred(message);
}

// ═══════════════════════════════════════════════════════════════════
// IMPORT
// ═══════════════════════════════════════════════════════════════════

QVector<FormulaDefinition> FormulaJsonLoader::parseDefinitions(const QByteArray &json,
                                                               QString *errorMsg) {
    QVector<FormulaDefinition> definitions;

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        if (errorMsg)
            *errorMsg = QString("Invalid JSON at offset %1: %2")
                            .arg(parseError.offset)
                            .arg(parseError.errorString());
        return definitions;
    }
    if (!doc.isObject()) {
        if (errorMsg)
            *errorMsg = "Invalid JSON format: expected an object";
        return definitions;
    }

    QJsonValue formulas = doc.object().value("formulas");
    if (!formulas.isArray()) {
        if (errorMsg)
            *errorMsg = "Missing 'formulas' array";
        return definitions;
    }

    for (const QJsonValue &entry : formulas.toArray()) {
        QJsonObject obj = entry.toObject();
        QString id = obj.value("id").toString();
        QString expression = obj.value("expression").toString();
        if (id.isEmpty() || expression.isEmpty())
            continue;
        definitions.append(FormulaDefinition(id, expression));
    }

    if (errorMsg)
        errorMsg->clear();
    return definitions;
}

int FormulaJsonLoader::loadFromJson(const QByteArray &json) {
    QString error;
    QVector<FormulaDefinition> definitions = parseDefinitions(json, &error);
    if (!error.isEmpty()) {
        reportError(QString("Failed to load formulas from JSON: %1").arg(error));
        return 0;
    }

    int registered = m_loader->registerFormulas(definitions);
    qDebug() << "[FormulaJson] Loaded" << registered << "of" << definitions.size()
             << "formulas";
    return registered;
}

int FormulaJsonLoader::loadFromFile(const QString &filePath) {
    QFile file(filePath);
    if (!file.exists()) {
        reportError(QString("Formula file not found: %1").arg(filePath));
        return 0;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        reportError(QString("Failed to load formulas from file '%1': %2")
                        .arg(filePath, file.errorString()));
        return 0;
    }
    return loadFromJson(file.readAll());
}

// ═══════════════════════════════════════════════════════════════════
// EXPORT
// ═══════════════════════════════════════════════════════════════════

QByteArray FormulaJsonLoader::exportToJson(const QStringList &ids) const {
    const QStringList selected = ids.isEmpty() ? m_loader->formulaIds() : ids;

    QJsonArray formulas;
    for (const QString &id : selected) {
        QString expression = m_loader->formulaExpression(id);
        if (expression.isNull())
            continue;

        QJsonObject entry;
        entry["id"] = id;
        entry["expression"] = expression;
        formulas.append(entry);
    }

    QJsonObject root;
    root["formulas"] = formulas;
    return QJsonDocument(root).toJson(QJsonDocument::Indented);
}

bool FormulaJsonLoader::exportToFile(const QString &filePath, const QStringList &ids) {
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        reportError(QString("Failed to export formulas to file '%1': %2")
                        .arg(filePath, file.errorString()));
        return false;
    }

    QByteArray json = exportToJson(ids);
    if (file.write(json) != json.size()) {
        reportError(QString("Failed to export formulas to file '%1': %2")
                        .arg(filePath, file.errorString()));
        return false;
    }
    return true;
}
