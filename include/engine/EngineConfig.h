#ifndef ENGINE_CONFIG_H
#define ENGINE_CONFIG_H

#include <QJsonObject>
#include <QString>

class ConfigLoader;
struct LexerOptions;
struct ParserLimits;
class EvaluationContext;

/**
 * Every tunable of the engine. Defaults apply when a key is missing from
 * the [ENGINE] section of engine.ini.
 */
struct EngineConfig {
    int  maxFormulaLength   = 5000;
    int  maxVariables       = 100;
    int  maxParsingDepth    = 100;
    int  maxParsingSteps    = 100000;
    int  maxStackDepth      = 10000;
    int  maxTokenCount      = 10000;
    int  maxEvaluationDepth = 100;
    int  maxSteps           = 50;     // formulas per formula set
    bool strictMode         = false;
    bool enableOptimization = true;
    bool enableCaching      = true;

    static EngineConfig fromLoader(const ConfigLoader &loader,
                                   const QString &section = "ENGINE");

    // Rejects non-positive limits; fills *errorMsg with the first offender
    bool validate(QString *errorMsg = nullptr) const;

    LexerOptions lexerOptions() const;
    ParserLimits parserLimits() const;
    EvaluationContext evaluationContext() const;

    QJsonObject toJson() const;
};

#endif // ENGINE_CONFIG_H
