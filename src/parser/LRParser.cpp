#include "parser/LRParser.h"
#include <QDebug>
#include <QStringList>

LRParser::LRParser(const Grammar &grammar, const ParseTable &table,
                   const AstBuilderRegistry &builders)
    : m_grammar(grammar), m_table(table), m_builders(builders) {}

FormulaError LRParser::unexpectedToken(int state, const Token &token) const {
  QStringList expected;
  for (GrammarSymbol t : m_table.expectedTerminals(state))
    expected << m_grammar.symbolName(t);

  QString found = token.type == Token::End ? QString("end of input")
                                           : QString("'%1'").arg(token.text);
  return FormulaError::at(FormulaError::Kind::UnexpectedToken,
                          QString("Unexpected %1, expected one of: %2")
                              .arg(found, expected.join(' ')),
                          token.text, token.position);
}

AstNodePtr LRParser::parse(const QVector<Token> &input, const ParserLimits &limits,
                           FormulaError *error) const {
  QVector<Token> tokens = input;
  if (tokens.isEmpty() || tokens.last().type != Token::End) {
    Token end;
    end.type = Token::End;
    if (!tokens.isEmpty()) {
      const Token &last = tokens.last();
      end.position = last.position;
      end.position.index += last.text.length();
      end.position.column += last.text.length();
    }
    tokens.append(end);
  }

  std::vector<int> states;
  std::vector<ParseValue> values;
  states.push_back(0);

  int pos = 0;
  int steps = 0;
  int parenDepth = 0;

  while (true) {
    if (++steps > limits.maxParsingSteps) {
      reportError(error, FormulaError::limitExceeded(FormulaError::Kind::TooManySteps,
                                                     "Parsing steps",
                                                     limits.maxParsingSteps, steps));
      return nullptr;
    }

    const Token &token = tokens[pos];
    int state = states.back();
    LRAction action = m_table.action(state, token.type);

    switch (action.type) {
    case LRAction::Shift: {
      if (token.type == Token::LParen && ++parenDepth > limits.maxParsingDepth) {
        FormulaError err = FormulaError::limitExceeded(FormulaError::Kind::TooDeep,
                                                       "Parenthesis nesting",
                                                       limits.maxParsingDepth, parenDepth);
        err.offendingText = token.text;
        err.position = token.position;
        err.hasPosition = true;
        reportError(error, err);
        return nullptr;
      }
      if (token.type == Token::RParen)
        --parenDepth;

      if (int(states.size()) + 1 > limits.maxStackDepth) {
        reportError(error, FormulaError::limitExceeded(FormulaError::Kind::TooDeep,
                                                       "Parser stack depth",
                                                       limits.maxStackDepth,
                                                       qint64(states.size()) + 1));
        return nullptr;
      }
      states.push_back(action.target);
      values.push_back(ParseValue::fromToken(token));
      ++pos;
      break;
    }

    case LRAction::Reduce: {
      const Production *production = m_grammar.production(action.target);
      if (!production) {
        reportError(error, FormulaError::make(
                               FormulaError::Kind::InvalidGrammar,
                               QString("Parse table reduces by unknown production %1")
                                   .arg(action.target)));
        return nullptr;
      }

      int n = production->length();
      if (int(values.size()) < n) {
        reportError(error, FormulaError::make(
                               FormulaError::Kind::ChildCountMismatch,
                               QString("Reduce by %1 needs %2 values, stack holds %3")
                                   .arg(m_grammar.productionToString(*production))
                                   .arg(n)
                                   .arg(values.size())));
        return nullptr;
      }

      std::vector<ParseValue> children;
      children.reserve(n);
      for (size_t i = values.size() - n; i < values.size(); ++i)
        children.push_back(std::move(values[i]));
      values.resize(values.size() - n);
      states.resize(states.size() - n);

      ParseValue reduced;
      if (!m_builders.build(production->id, children, &reduced, error))
        return nullptr;

      int next = m_table.gotoState(states.back(), production->left);
      if (next < 0) {
        reportError(error, unexpectedToken(states.back(), token));
        return nullptr;
      }
      states.push_back(next);
      values.push_back(std::move(reduced));
      break;
    }

    case LRAction::Accept: {
      // START → EXPR $ : the value stack holds exactly the EXPR result
      std::vector<ParseValue> children;
      for (ParseValue &v : values)
        children.push_back(std::move(v));
      children.push_back(ParseValue::fromToken(token));

      ParseValue root;
      if (!m_builders.build(Grammar::AugmentedProductionId, children, &root, error))
        return nullptr;
      if (root.kind != ParseValue::Kind::Node || !root.node) {
        reportError(error, FormulaError::make(FormulaError::Kind::ChildTypeMismatch,
                                              "Parse did not produce an expression"));
        return nullptr;
      }
      return std::move(root.node);
    }

    case LRAction::Error:
      reportError(error, unexpectedToken(state, token));
      return nullptr;
    }
  }
}
