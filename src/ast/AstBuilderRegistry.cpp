#include "ast/AstBuilderRegistry.h"
#include <QDebug>

// ═══════════════════════════════════════════════════════════════════
// PARSE VALUE
// ═══════════════════════════════════════════════════════════════════

ParseValue ParseValue::fromToken(const ::Token &token) {
  ParseValue v;
  v.kind = Kind::Token;
  v.token = token;
  return v;
}

ParseValue ParseValue::fromNode(AstNodePtr node) {
  ParseValue v;
  v.kind = Kind::Node;
  v.node = std::move(node);
  return v;
}

ParseValue ParseValue::fromArguments(std::vector<AstNodePtr> arguments) {
  ParseValue v;
  v.kind = Kind::Arguments;
  v.arguments = std::move(arguments);
  return v;
}

QString ParseValue::describe() const {
  switch (kind) {
  case Kind::Token:
    return QString("token %1 '%2'").arg(::Token::typeName(token.type), token.text);
  case Kind::Node:
    return node ? QString("node %1").arg(AstNode::kindName(node->kind)) : "empty node";
  case Kind::Arguments:
    return QString("argument list (%1)").arg(arguments.size());
  }
  return "unknown";
}

// ═══════════════════════════════════════════════════════════════════
// Child checks
// ═══════════════════════════════════════════════════════════════════

namespace {

bool typeMismatch(const QString &builder, int index, const QString &expected,
                  const ParseValue &actual, FormulaError *error) {
  FormulaError err = FormulaError::make(
      FormulaError::Kind::ChildTypeMismatch,
      QString("%1: child %2 should be %3 but is %4")
          .arg(builder)
          .arg(index)
          .arg(expected, actual.describe()));
  if (actual.kind == ParseValue::Kind::Token) {
    err.offendingText = actual.token.text;
    err.position = actual.token.position;
    err.hasPosition = true;
  }
  reportError(error, err);
  return false;
}

bool expectNode(const QString &builder, std::vector<ParseValue> &children, int index,
                FormulaError *error) {
  const ParseValue &v = children[index];
  if (v.kind != ParseValue::Kind::Node || !v.node)
    return typeMismatch(builder, index, "an expression", v, error);
  return true;
}

bool expectToken(const QString &builder, std::vector<ParseValue> &children, int index,
                 std::initializer_list<Token::Type> types, FormulaError *error) {
  const ParseValue &v = children[index];
  if (v.kind == ParseValue::Kind::Token) {
    for (Token::Type t : types)
      if (v.token.type == t)
        return true;
  }
  QStringList names;
  for (Token::Type t : types)
    names << Token::typeName(t);
  return typeMismatch(builder, index, "token " + names.join('|'), v, error);
}

bool expectArguments(const QString &builder, std::vector<ParseValue> &children,
                     int index, FormulaError *error) {
  const ParseValue &v = children[index];
  if (v.kind != ParseValue::Kind::Arguments)
    return typeMismatch(builder, index, "an argument list", v, error);
  return true;
}

} // namespace

// ═══════════════════════════════════════════════════════════════════
// Standard builders
// ═══════════════════════════════════════════════════════════════════

AstBuilder AstBuilder::identity() {
  return AstBuilder{"Identity", 1,
                    [](std::vector<ParseValue> &c, ParseValue *result, FormulaError *error) {
                      if (!expectNode("Identity", c, 0, error))
                        return false;
                      *result = ParseValue::fromNode(std::move(c[0].node));
                      return true;
                    }};
}

AstBuilder AstBuilder::start() {
  return AstBuilder{"Start", 2,
                    [](std::vector<ParseValue> &c, ParseValue *result, FormulaError *error) {
                      if (!expectNode("Start", c, 0, error) ||
                          !expectToken("Start", c, 1, {Token::End}, error))
                        return false;
                      *result = ParseValue::fromNode(std::move(c[0].node));
                      return true;
                    }};
}

AstBuilder AstBuilder::binaryOp(const QString &op) {
  const QString name = QString("BinaryOp(%1)").arg(op);
  return AstBuilder{name, 3,
                    [name, op](std::vector<ParseValue> &c, ParseValue *result,
                               FormulaError *error) {
                      if (!expectNode(name, c, 0, error) || !expectNode(name, c, 2, error))
                        return false;
                      if (c[1].kind != ParseValue::Kind::Token)
                        return typeMismatch(name, 1, "an operator token", c[1], error);
                      *result = ParseValue::fromNode(AstNode::binaryOp(
                          op, std::move(c[0].node), std::move(c[2].node)));
                      return true;
                    }};
}

AstBuilder AstBuilder::unaryOp(const QString &op, int operandIndex) {
  const QString name = QString("UnaryOp(%1)").arg(op);
  return AstBuilder{name, 2,
                    [name, op, operandIndex](std::vector<ParseValue> &c, ParseValue *result,
                                             FormulaError *error) {
                      if (operandIndex < 0 || operandIndex >= int(c.size())) {
                        reportError(error, FormulaError::make(
                                               FormulaError::Kind::ChildCountMismatch,
                                               QString("%1: operand index %2 outside %3 children")
                                                   .arg(name)
                                                   .arg(operandIndex)
                                                   .arg(c.size())));
                        return false;
                      }
                      if (!expectNode(name, c, operandIndex, error))
                        return false;
                      *result = ParseValue::fromNode(
                          AstNode::unaryOp(op, std::move(c[operandIndex].node)));
                      return true;
                    }};
}

AstBuilder AstBuilder::parenthesized() {
  return AstBuilder{"Parenthesized", 3,
                    [](std::vector<ParseValue> &c, ParseValue *result, FormulaError *error) {
                      if (!expectToken("Parenthesized", c, 0, {Token::LParen}, error) ||
                          !expectNode("Parenthesized", c, 1, error) ||
                          !expectToken("Parenthesized", c, 2, {Token::RParen}, error))
                        return false;
                      *result = ParseValue::fromNode(std::move(c[1].node));
                      return true;
                    }};
}

AstBuilder AstBuilder::number() {
  return AstBuilder{"Number", 1,
                    [](std::vector<ParseValue> &c, ParseValue *result, FormulaError *error) {
                      if (!expectToken("Number", c, 0, {Token::Number}, error))
                        return false;
                      bool ok = false;
                      double value = c[0].token.value.toDouble(&ok);
                      if (!ok) {
                        reportError(error, FormulaError::at(
                                               FormulaError::Kind::InvalidNumberFormat,
                                               "Number literal cannot be converted",
                                               c[0].token.text, c[0].token.position));
                        return false;
                      }
                      *result = ParseValue::fromNode(AstNode::number(value));
                      return true;
                    }};
}

AstBuilder AstBuilder::variable() {
  return AstBuilder{"Variable", 1,
                    [](std::vector<ParseValue> &c, ParseValue *result, FormulaError *error) {
                      if (!expectToken("Variable", c, 0,
                                       {Token::Variable, Token::Identifier}, error))
                        return false;
                      *result = ParseValue::fromNode(AstNode::variable(c[0].token.value));
                      return true;
                    }};
}

AstBuilder AstBuilder::booleanTrue() {
  return AstBuilder{"BooleanTrue", 1,
                    [](std::vector<ParseValue> &c, ParseValue *result, FormulaError *error) {
                      if (!expectToken("BooleanTrue", c, 0, {Token::True}, error))
                        return false;
                      *result = ParseValue::fromNode(AstNode::boolean(true));
                      return true;
                    }};
}

AstBuilder AstBuilder::booleanFalse() {
  return AstBuilder{"BooleanFalse", 1,
                    [](std::vector<ParseValue> &c, ParseValue *result, FormulaError *error) {
                      if (!expectToken("BooleanFalse", c, 0, {Token::False}, error))
                        return false;
                      *result = ParseValue::fromNode(AstNode::boolean(false));
                      return true;
                    }};
}

AstBuilder AstBuilder::functionCall() {
  return AstBuilder{"FunctionCall", 4,
                    [](std::vector<ParseValue> &c, ParseValue *result, FormulaError *error) {
                      if (!expectToken("FunctionCall", c, 0, {Token::Identifier}, error) ||
                          !expectToken("FunctionCall", c, 1, {Token::LParen}, error) ||
                          !expectArguments("FunctionCall", c, 2, error) ||
                          !expectToken("FunctionCall", c, 3, {Token::RParen}, error))
                        return false;
                      *result = ParseValue::fromNode(AstNode::functionCall(
                          c[0].token.value, std::move(c[2].arguments)));
                      return true;
                    }};
}

AstBuilder AstBuilder::functionCallEmpty() {
  return AstBuilder{"FunctionCallEmpty", 3,
                    [](std::vector<ParseValue> &c, ParseValue *result, FormulaError *error) {
                      if (!expectToken("FunctionCallEmpty", c, 0, {Token::Identifier}, error) ||
                          !expectToken("FunctionCallEmpty", c, 1, {Token::LParen}, error) ||
                          !expectToken("FunctionCallEmpty", c, 2, {Token::RParen}, error))
                        return false;
                      *result = ParseValue::fromNode(
                          AstNode::functionCall(c[0].token.value, std::vector<AstNodePtr>()));
                      return true;
                    }};
}

AstBuilder AstBuilder::ifExpression() {
  return AstBuilder{"If", 8,
                    [](std::vector<ParseValue> &c, ParseValue *result, FormulaError *error) {
                      if (!expectToken("If", c, 0, {Token::If}, error) ||
                          !expectToken("If", c, 1, {Token::LParen}, error) ||
                          !expectNode("If", c, 2, error) ||
                          !expectToken("If", c, 3, {Token::Comma}, error) ||
                          !expectNode("If", c, 4, error) ||
                          !expectToken("If", c, 5, {Token::Comma}, error) ||
                          !expectNode("If", c, 6, error) ||
                          !expectToken("If", c, 7, {Token::RParen}, error))
                        return false;
                      *result = ParseValue::fromNode(AstNode::ifNode(
                          std::move(c[2].node), std::move(c[4].node), std::move(c[6].node)));
                      return true;
                    }};
}

AstBuilder AstBuilder::argsSingle() {
  return AstBuilder{"ArgsSingle", 1,
                    [](std::vector<ParseValue> &c, ParseValue *result, FormulaError *error) {
                      if (!expectNode("ArgsSingle", c, 0, error))
                        return false;
                      std::vector<AstNodePtr> args;
                      args.push_back(std::move(c[0].node));
                      *result = ParseValue::fromArguments(std::move(args));
                      return true;
                    }};
}

AstBuilder AstBuilder::argsMultiple() {
  return AstBuilder{"ArgsMultiple", 3,
                    [](std::vector<ParseValue> &c, ParseValue *result, FormulaError *error) {
                      if (!expectArguments("ArgsMultiple", c, 0, error) ||
                          !expectToken("ArgsMultiple", c, 1, {Token::Comma}, error) ||
                          !expectNode("ArgsMultiple", c, 2, error))
                        return false;
                      std::vector<AstNodePtr> args = std::move(c[0].arguments);
                      args.push_back(std::move(c[2].node));
                      *result = ParseValue::fromArguments(std::move(args));
                      return true;
                    }};
}

// ═══════════════════════════════════════════════════════════════════
// REGISTRY
// ═══════════════════════════════════════════════════════════════════

AstBuilderRegistry AstBuilderRegistry::expressionBuilders() {
  AstBuilderRegistry r;
  r.registerBuilder(Grammar::AugmentedProductionId, AstBuilder::start());

  r.registerBuilder(0, AstBuilder::binaryOp("||"));
  r.registerBuilder(1, AstBuilder::identity());
  r.registerBuilder(2, AstBuilder::binaryOp("&&"));
  r.registerBuilder(3, AstBuilder::identity());
  r.registerBuilder(4, AstBuilder::binaryOp("=="));
  r.registerBuilder(5, AstBuilder::binaryOp("!="));
  r.registerBuilder(6, AstBuilder::binaryOp("<"));
  r.registerBuilder(7, AstBuilder::binaryOp("<="));
  r.registerBuilder(8, AstBuilder::binaryOp(">"));
  r.registerBuilder(9, AstBuilder::binaryOp(">="));
  r.registerBuilder(10, AstBuilder::identity());
  r.registerBuilder(11, AstBuilder::binaryOp("+"));
  r.registerBuilder(12, AstBuilder::binaryOp("-"));
  r.registerBuilder(13, AstBuilder::identity());
  r.registerBuilder(14, AstBuilder::binaryOp("*"));
  r.registerBuilder(15, AstBuilder::binaryOp("/"));
  r.registerBuilder(16, AstBuilder::binaryOp("%"));
  r.registerBuilder(17, AstBuilder::identity());
  r.registerBuilder(18, AstBuilder::binaryOp("^"));
  r.registerBuilder(19, AstBuilder::identity());
  r.registerBuilder(20, AstBuilder::parenthesized());
  r.registerBuilder(21, AstBuilder::unaryOp("-", 1));
  r.registerBuilder(22, AstBuilder::unaryOp("+", 1));
  r.registerBuilder(23, AstBuilder::unaryOp("!", 1));
  r.registerBuilder(24, AstBuilder::number());
  r.registerBuilder(25, AstBuilder::variable());
  r.registerBuilder(26, AstBuilder::variable());
  r.registerBuilder(27, AstBuilder::booleanTrue());
  r.registerBuilder(28, AstBuilder::booleanFalse());
  r.registerBuilder(29, AstBuilder::functionCall());
  r.registerBuilder(30, AstBuilder::functionCallEmpty());
  r.registerBuilder(31, AstBuilder::ifExpression());
  r.registerBuilder(32, AstBuilder::argsSingle());
  r.registerBuilder(33, AstBuilder::argsMultiple());
  return r;
}

void AstBuilderRegistry::registerBuilder(int productionId, const AstBuilder &builder) {
  if (m_builders.contains(productionId))
    qWarning() << "[AstBuilderRegistry] replacing builder for production" << productionId;
  m_builders.insert(productionId, builder);
}

const AstBuilder *AstBuilderRegistry::builder(int productionId) const {
  auto it = m_builders.constFind(productionId);
  return it == m_builders.constEnd() ? nullptr : &it.value();
}

bool AstBuilderRegistry::validateFor(const Grammar &grammar, FormulaError *error) const {
  QVector<Production> all = grammar.productions();
  all.prepend(grammar.augmentedProduction());

  for (const Production &p : all) {
    const AstBuilder *b = builder(p.id);
    if (!b) {
      reportError(error, FormulaError::make(
                             FormulaError::Kind::MissingBuilder,
                             QString("No AST builder registered for production %1 (%2)")
                                 .arg(p.id)
                                 .arg(grammar.productionToString(p))));
      return false;
    }
    if (b->childCount != p.length()) {
      reportError(error, FormulaError::make(
                             FormulaError::Kind::ChildCountMismatch,
                             QString("Builder %1 expects %2 children but production %3 has %4")
                                 .arg(b->name)
                                 .arg(b->childCount)
                                 .arg(p.id)
                                 .arg(p.length())));
      return false;
    }
  }
  return true;
}

bool AstBuilderRegistry::build(int productionId, std::vector<ParseValue> &children,
                               ParseValue *result, FormulaError *error) const {
  const AstBuilder *b = builder(productionId);
  if (!b) {
    reportError(error, FormulaError::make(
                           FormulaError::Kind::MissingBuilder,
                           QString("No AST builder registered for production %1")
                               .arg(productionId)));
    return false;
  }
  if (int(children.size()) != b->childCount) {
    reportError(error, FormulaError::make(
                           FormulaError::Kind::ChildCountMismatch,
                           QString("%1 expects %2 children, got %3")
                               .arg(b->name)
                               .arg(b->childCount)
                               .arg(children.size())));
    return false;
  }
  return b->build(children, result, error);
}
