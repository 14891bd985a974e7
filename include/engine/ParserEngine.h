#ifndef PARSER_ENGINE_H
#define PARSER_ENGINE_H

/**
 * @file ParserEngine.h
 * @brief Immutable bundle of grammar, LALR table, AST builders and functions
 *
 * Build once, share everywhere:
 *
 *   FormulaError err;
 *   std::shared_ptr<const ParserEngine> engine = ParserEngine::create(config, &err);
 *   if (!engine)
 *       qCritical() << err.toString();      // grammar/table problems are fatal
 *
 *   EvaluationResult r = engine->evaluate("2 + 3 * 4", engine->defaultContext());
 *
 * After create() nothing inside the engine changes, so one instance can
 * serve any number of threads. parse() is the front end proper
 * (length guard → lexer → LR parser); compile() adds constant folding
 * under the rules of the context the tree will be evaluated in.
 */

#include "ast/AstBuilderRegistry.h"
#include "ast/AstNode.h"
#include "core/FormulaError.h"
#include "engine/EngineConfig.h"
#include "evaluator/EvaluationContext.h"
#include "evaluator/EvaluationResult.h"
#include "evaluator/FunctionRegistry.h"
#include "parser/Grammar.h"
#include "parser/ParseTable.h"
#include <QStringList>
#include <QVariantMap>
#include <memory>

class Evaluator;

class ParserEngine {
public:
    // Returns nullptr when the configuration, grammar, table or builder
    // registry is invalid.
    static std::shared_ptr<const ParserEngine> create(const EngineConfig &config = EngineConfig(),
                                                      FormulaError *error = nullptr);

    // Text → AST. nullptr with *error on lexer/parser/builder failures.
    AstNodePtr parse(const QString &text, FormulaError *error = nullptr) const;
    // parse() followed by folding when context.optimizationEnabled();
    // the one-argument form folds under defaultContext().
    AstNodePtr compile(const QString &text, FormulaError *error = nullptr) const;
    AstNodePtr compile(const QString &text, const EvaluationContext &context,
                       FormulaError *error = nullptr) const;

    EvaluationResult evaluate(const QString &text, const EvaluationContext &context) const;
    EvaluationResult evaluate(const QString &text, const QVariantMap &variables) const;
    // Uses `evaluator` (and its cache) instead of a fresh one
    EvaluationResult evaluate(const QString &text, const EvaluationContext &context,
                              const Evaluator &evaluator) const;

    // Failures are reported as InvalidFormula / VariableExtractionFailed
    // with the original error kept as `cause`.
    bool isValidFormula(const QString &text, FormulaError *error = nullptr) const;
    QStringList extractVariables(const QString &text, FormulaError *error = nullptr) const;

    EvaluationContext defaultContext() const;

    const EngineConfig &config() const { return m_config; }
    const Grammar &grammar() const { return m_grammar; }
    const ParseTable &table() const { return *m_table; }
    const AstBuilderRegistry &builders() const { return m_builders; }
    const FunctionRegistry &functions() const { return m_functions; }

private:
    ParserEngine(const EngineConfig &config, const Grammar &grammar);

    EngineConfig m_config;
    Grammar m_grammar;
    std::shared_ptr<const ParseTable> m_table;
    AstBuilderRegistry m_builders;
    FunctionRegistry m_functions;
};

#endif // PARSER_ENGINE_H
