#ifndef FORMULA_JSON_LOADER_H
#define FORMULA_JSON_LOADER_H

#include "services/FormulaLoader.h"
#include <QByteArray>
#include <QObject>
#include <QStringList>

/**
 * @brief JSON import/export of formula libraries.
 *
 * Format:
 *   {
 *     "formulas": [
 *       { "id": "damage", "expression": "baseDamage * (1 + strength * 0.1)" }
 *     ]
 *   }
 *
 * Entries without a non-empty "id" and "expression" are skipped.
 */
class FormulaJsonLoader : public QObject {
    Q_OBJECT

public:
    explicit FormulaJsonLoader(FormulaLoader *loader, QObject *parent = nullptr);

    // ── Import (returns the number of formulas registered) ──
    int loadFromJson(const QByteArray &json);
    int loadFromFile(const QString &filePath);

    // ── Export (all formulas when ids is empty; unknown ids are skipped) ──
    QByteArray exportToJson(const QStringList &ids = QStringList()) const;
    bool exportToFile(const QString &filePath,
                      const QStringList &ids = QStringList());

    // Parses a library document without registering anything
    static QVector<FormulaDefinition> parseDefinitions(const QByteArray &json,
                                                       QString *errorMsg = nullptr);

signals:
    void errorOccurred(const QString &message);

private:
    void reportError(const QString &message);

    FormulaLoader *m_loader;
};

#endif // FORMULA_JSON_LOADER_H
