#ifndef FORMULA_SET_PARSER_H
#define FORMULA_SET_PARSER_H

#include "formula/FormulaSet.h"
#include <QByteArray>
#include <QJsonObject>
#include <QString>

/**
 * @brief Reads and writes formula sets as JSON
 *
 * Handles:
 *   - JSON → FormulaSet (parseJson)
 *   - FormulaSet → JSON (toJson)
 *   - Loading a set from a file on disk (loadFile)
 *
 * Structural checks (orders, result variables) are left to
 * FormulaSet::validate(); the parser only rejects malformed documents.
 */
class FormulaSetParser {
public:
    /// Parse a JSON object into a FormulaSet
    /// Returns an empty set on failure; errorMsg contains details
    static FormulaSet parseJson(const QJsonObject &json, QString &errorMsg);

    /// Parse raw JSON text
    static FormulaSet parseJsonText(const QByteArray &text, QString &errorMsg);

    /// Read and parse a JSON file
    static FormulaSet loadFile(const QString &filePath, QString &errorMsg);

    /// Convert a FormulaSet back to JSON
    static QJsonObject toJson(const FormulaSet &set);

private:
    static Formula parseFormula(const QJsonObject &json, int index);
    static QJsonObject formulaToJson(const Formula &formula);
};

#endif // FORMULA_SET_PARSER_H
