#include "engine/EngineConfig.h"
#include "evaluator/EvaluationContext.h"
#include "lexer/Lexer.h"
#include "parser/LRParser.h"
#include "utils/ConfigLoader.h"

EngineConfig EngineConfig::fromLoader(const ConfigLoader &loader, const QString &section) {
  EngineConfig c;
  c.maxFormulaLength = loader.getInt(section, "max_formula_length", c.maxFormulaLength);
  c.maxVariables = loader.getInt(section, "max_variables", c.maxVariables);
  c.maxParsingDepth = loader.getInt(section, "max_parsing_depth", c.maxParsingDepth);
  c.maxParsingSteps = loader.getInt(section, "max_parsing_steps", c.maxParsingSteps);
  c.maxStackDepth = loader.getInt(section, "max_stack_depth", c.maxStackDepth);
  c.maxTokenCount = loader.getInt(section, "max_token_count", c.maxTokenCount);
  c.maxEvaluationDepth = loader.getInt(section, "max_evaluation_depth", c.maxEvaluationDepth);
  c.maxSteps = loader.getInt(section, "max_steps", c.maxSteps);
  c.strictMode = loader.getBool(section, "strict_mode", c.strictMode);
  c.enableOptimization = loader.getBool(section, "enable_optimization", c.enableOptimization);
  c.enableCaching = loader.getBool(section, "enable_caching", c.enableCaching);
  return c;
}

bool EngineConfig::validate(QString *errorMsg) const {
  const struct {
    const char *key;
    int value;
  } limits[] = {
      {"max_formula_length", maxFormulaLength},
      {"max_variables", maxVariables},
      {"max_parsing_depth", maxParsingDepth},
      {"max_parsing_steps", maxParsingSteps},
      {"max_stack_depth", maxStackDepth},
      {"max_token_count", maxTokenCount},
      {"max_evaluation_depth", maxEvaluationDepth},
      {"max_steps", maxSteps},
  };

  for (const auto &limit : limits) {
    if (limit.value <= 0) {
      if (errorMsg)
        *errorMsg = QString("%1 must be positive (got %2)").arg(limit.key).arg(limit.value);
      return false;
    }
  }
  return true;
}

LexerOptions EngineConfig::lexerOptions() const {
  LexerOptions options;
  options.maxFormulaLength = maxFormulaLength;
  options.maxTokenCount = maxTokenCount;
  return options;
}

ParserLimits EngineConfig::parserLimits() const {
  ParserLimits limits;
  limits.maxParsingSteps = maxParsingSteps;
  limits.maxStackDepth = maxStackDepth;
  limits.maxParsingDepth = maxParsingDepth;
  return limits;
}

EvaluationContext EngineConfig::evaluationContext() const {
  return EvaluationContext()
      .withMaxDepth(maxEvaluationDepth)
      .withMaxVariables(maxVariables)
      .withStrictMode(strictMode)
      .withCaching(enableCaching)
      .withOptimization(enableOptimization);
}

QJsonObject EngineConfig::toJson() const {
  QJsonObject json;
  json["max_formula_length"] = maxFormulaLength;
  json["max_variables"] = maxVariables;
  json["max_parsing_depth"] = maxParsingDepth;
  json["max_parsing_steps"] = maxParsingSteps;
  json["max_stack_depth"] = maxStackDepth;
  json["max_token_count"] = maxTokenCount;
  json["max_evaluation_depth"] = maxEvaluationDepth;
  json["max_steps"] = maxSteps;
  json["strict_mode"] = strictMode;
  json["enable_optimization"] = enableOptimization;
  json["enable_caching"] = enableCaching;
  return json;
}
