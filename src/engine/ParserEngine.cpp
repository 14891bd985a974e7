#include "engine/ParserEngine.h"
#include "ast/TreeOptimizer.h"
#include "evaluator/Evaluator.h"
#include "lexer/Lexer.h"
#include "parser/LRParser.h"
#include <QDebug>
#include <QElapsedTimer>

ParserEngine::ParserEngine(const EngineConfig &config, const Grammar &grammar)
    : m_config(config), m_grammar(grammar),
      m_builders(AstBuilderRegistry::expressionBuilders()),
      m_functions(FunctionRegistry::createDefault()) {}

std::shared_ptr<const ParserEngine> ParserEngine::create(const EngineConfig &config,
                                                         FormulaError *error) {
  QString configError;
  if (!config.validate(&configError)) {
    reportError(error, FormulaError::make(FormulaError::Kind::InvalidConfiguration,
                                          configError));
    return nullptr;
  }

  QElapsedTimer timer;
  timer.start();

  // The builder below keeps a reference to the engine's own grammar
  std::shared_ptr<ParserEngine> engine(
      new ParserEngine(config, Grammar::expressionGrammar()));

  FormulaError err;
  engine->m_table = ParseTableBuilder(engine->m_grammar).build(&err);
  if (!engine->m_table) {
    qCritical().noquote() << "[ParserEngine] parse table construction failed:"
                          << err.toString();
    reportError(error, err);
    return nullptr;
  }

  if (!engine->m_builders.validateFor(engine->m_grammar, &err)) {
    qCritical().noquote() << "[ParserEngine] AST builder registry incomplete:"
                          << err.toString();
    reportError(error, err);
    return nullptr;
  }

  qDebug() << "[ParserEngine] ready:" << engine->m_grammar.productions().size()
           << "productions," << engine->m_table->stateCount() << "states,"
           << engine->m_functions.size() << "functions in" << timer.elapsed() << "ms";
  return engine;
}

// ═══════════════════════════════════════════════════════════════════
// Front end
// ═══════════════════════════════════════════════════════════════════

AstNodePtr ParserEngine::parse(const QString &text, FormulaError *error) const {
  // Reject oversized input before the lexer sees it
  if (text.length() > m_config.maxFormulaLength) {
    reportError(error, FormulaError::limitExceeded(FormulaError::Kind::TooLarge,
                                                   "Formula length",
                                                   m_config.maxFormulaLength,
                                                   text.length()));
    return nullptr;
  }

  Lexer lexer(m_config.lexerOptions());
  QVector<Token> tokens = lexer.tokenize(text, error);
  if (tokens.isEmpty())
    return nullptr;

  LRParser parser(m_grammar, *m_table, m_builders);
  return parser.parse(tokens, m_config.parserLimits(), error);
}

AstNodePtr ParserEngine::compile(const QString &text, FormulaError *error) const {
  return compile(text, defaultContext(), error);
}

AstNodePtr ParserEngine::compile(const QString &text, const EvaluationContext &context,
                                 FormulaError *error) const {
  AstNodePtr ast = parse(text, error);
  if (!ast || !context.optimizationEnabled())
    return ast;

  // Folded literals carry the coercion rules and depth budget of `context`
  TreeOptimizer optimizer(m_functions);
  return optimizer.optimize(*ast, context);
}

EvaluationResult ParserEngine::evaluate(const QString &text,
                                        const EvaluationContext &context,
                                        const Evaluator &evaluator) const {
  QElapsedTimer timer;
  timer.start();

  FormulaError err;
  AstNodePtr ast = compile(text, context, &err);
  if (!ast) {
    EvaluationResult failed = EvaluationResult::failure(err);
    failed.evaluationTimeNs = timer.nsecsElapsed();
    return failed;
  }

  EvaluationResult result = evaluator.evaluate(*ast, context);
  result.evaluationTimeNs = timer.nsecsElapsed();
  return result;
}

EvaluationResult ParserEngine::evaluate(const QString &text,
                                        const EvaluationContext &context) const {
  Evaluator evaluator(m_functions);
  return evaluate(text, context, evaluator);
}

EvaluationResult ParserEngine::evaluate(const QString &text,
                                        const QVariantMap &variables) const {
  FormulaError err;
  EvaluationContext context = defaultContext().withVariables(variables, &err);
  if (err.isError())
    return EvaluationResult::failure(err);
  return evaluate(text, context);
}

bool ParserEngine::isValidFormula(const QString &text, FormulaError *error) const {
  FormulaError err;
  if (parse(text, &err))
    return true;
  reportError(error, FormulaError::wrap(FormulaError::Kind::InvalidFormula,
                                        QString("Formula is not valid: %1").arg(err.message),
                                        err));
  return false;
}

QStringList ParserEngine::extractVariables(const QString &text, FormulaError *error) const {
  FormulaError err;
  AstNodePtr ast = parse(text, &err);
  if (!ast) {
    reportError(error, FormulaError::wrap(FormulaError::Kind::VariableExtractionFailed,
                                          QString("Cannot extract variables: %1")
                                              .arg(err.message),
                                          err));
    return QStringList();
  }
  return ast->variables();
}

EvaluationContext ParserEngine::defaultContext() const {
  return m_config.evaluationContext();
}
