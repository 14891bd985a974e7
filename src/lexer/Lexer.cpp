/**
 * @file Lexer.cpp
 * @brief Tokenizer implementation
 *
 * Lexical rules:
 *   number      := digits ('.' digits)? ([eE] [+-]? digits)?  |  '.' digits ...
 *   identifier  := (letter | '_') (letter | digit | '_')*
 *   variable    := '{' identifier '}'  |  '${' identifier '}'
 *   keywords    := IF TRUE FALSE AND OR NOT   (case-insensitive)
 *   operators   := + - * / % ^ == = != < <= > >= && || ! ( ) ,
 */

#include "lexer/Lexer.h"
#include <QDebug>

// ═══════════════════════════════════════════════════════════════════
// TOKEN
// ═══════════════════════════════════════════════════════════════════

QString Token::typeName(Type type) {
  switch (type) {
  case Number:
    return "NUMBER";
  case Identifier:
    return "IDENTIFIER";
  case Variable:
    return "VARIABLE";
  case Plus:
    return "PLUS";
  case Minus:
    return "MINUS";
  case Multiply:
    return "MULTIPLY";
  case Divide:
    return "DIVIDE";
  case Modulo:
    return "MODULO";
  case Power:
    return "POWER";
  case Equal:
    return "EQUAL";
  case NotEqual:
    return "NOT_EQUAL";
  case Less:
    return "LESS";
  case LessEqual:
    return "LESS_EQUAL";
  case Greater:
    return "GREATER";
  case GreaterEqual:
    return "GREATER_EQUAL";
  case And:
    return "AND";
  case Or:
    return "OR";
  case Not:
    return "NOT";
  case LParen:
    return "LEFT_PAREN";
  case RParen:
    return "RIGHT_PAREN";
  case Comma:
    return "COMMA";
  case If:
    return "IF";
  case True:
    return "TRUE";
  case False:
    return "FALSE";
  case End:
    return "$";
  case TypeCount:
    break;
  }
  return "UNKNOWN";
}

QString Token::symbolText(Type type) {
  switch (type) {
  case Plus:
    return "+";
  case Minus:
    return "-";
  case Multiply:
    return "*";
  case Divide:
    return "/";
  case Modulo:
    return "%";
  case Power:
    return "^";
  case Equal:
    return "==";
  case NotEqual:
    return "!=";
  case Less:
    return "<";
  case LessEqual:
    return "<=";
  case Greater:
    return ">";
  case GreaterEqual:
    return ">=";
  case And:
    return "&&";
  case Or:
    return "||";
  case Not:
    return "!";
  case LParen:
    return "(";
  case RParen:
    return ")";
  case Comma:
    return ",";
  default:
    return typeName(type);
  }
}

// ═══════════════════════════════════════════════════════════════════
// TOKEN STREAM
// ═══════════════════════════════════════════════════════════════════

TokenStream::TokenStream(const QString &input, const LexerOptions &options)
    : m_input(input), m_options(options) {}

QChar TokenStream::peek(int offset) const {
  int i = m_index + offset;
  return (i < m_input.length()) ? m_input[i] : QChar();
}

void TokenStream::advance() {
  if (m_index >= m_input.length())
    return;
  if (m_input[m_index] == '\n') {
    ++m_line;
    m_column = 1;
  } else {
    ++m_column;
  }
  ++m_index;
}

SourcePosition TokenStream::position() const {
  SourcePosition pos;
  pos.index = m_index;
  pos.line = m_line;
  pos.column = m_column;
  return pos;
}

bool TokenStream::isIdentifierStart(QChar ch) {
  return ch.isLetter() || ch == '_';
}

bool TokenStream::isIdentifierPart(QChar ch) {
  return ch.isLetterOrNumber() || ch == '_';
}

bool TokenStream::fail(const FormulaError &err, FormulaError *error) {
  m_finished = true;
  reportError(error, err);
  return false;
}

bool TokenStream::next(Token *token, FormulaError *error) {
  if (m_finished) {
    return fail(FormulaError::make(FormulaError::Kind::InvalidTokenSequence,
                                   "Token stream is already exhausted"),
                error);
  }

  if (!m_started) {
    m_started = true;
    // Length guard runs before a single character is examined
    if (m_input.length() > m_options.maxFormulaLength) {
      return fail(FormulaError::limitExceeded(FormulaError::Kind::TooLarge,
                                              "Formula length",
                                              m_options.maxFormulaLength,
                                              m_input.length()),
                  error);
    }
  }

  Token tok;
  int wsStart = m_index;
  while (m_index < m_input.length() && m_input[m_index].isSpace())
    advance();
  tok.leadingWhitespace = m_input.mid(wsStart, m_index - wsStart);
  tok.position = position();

  if (m_index >= m_input.length()) {
    tok.type = Token::End;
    m_finished = true;
    *token = tok;
    return true;
  }

  if (m_tokenCount >= m_options.maxTokenCount) {
    return fail(FormulaError::limitExceeded(FormulaError::Kind::TooLarge,
                                            "Token count",
                                            m_options.maxTokenCount,
                                            m_tokenCount + 1),
                error);
  }

  QChar ch = peek();
  bool ok = false;
  if (ch.isDigit() || (ch == '.' && peek(1).isDigit()))
    ok = lexNumber(&tok, error);
  else if (isIdentifierStart(ch))
    ok = lexIdentifier(&tok);
  else if (ch == '{' || (ch == '$' && peek(1) == '{'))
    ok = lexVariable(&tok, error);
  else
    ok = lexOperator(&tok, error);

  if (!ok)
    return false;

  ++m_tokenCount;
  *token = tok;
  return true;
}

// ── Numbers ──

bool TokenStream::lexNumber(Token *token, FormulaError *error) {
  SourcePosition start = position();
  int begin = m_index;
  bool seenDot = false;
  bool malformed = false;

  while (m_index < m_input.length()) {
    QChar c = peek();
    if (c.isDigit()) {
      advance();
    } else if (c == '.') {
      if (seenDot)
        malformed = true;
      seenDot = true;
      advance();
    } else {
      break;
    }
  }

  if (peek() == 'e' || peek() == 'E') {
    advance();
    if (peek() == '+' || peek() == '-')
      advance();
    if (!peek().isDigit()) {
      malformed = true;
    }
    while (peek().isDigit())
      advance();
  }

  QString text = m_input.mid(begin, m_index - begin);
  if (malformed || text.endsWith('.')) {
    return fail(FormulaError::at(FormulaError::Kind::InvalidNumberFormat,
                                 QString("Malformed number literal '%1'").arg(text),
                                 text, start),
                error);
  }

  // "2x" or "3{a}": a number glued to a name is never a valid sequence
  QChar after = peek();
  if (isIdentifierStart(after) || after == '{') {
    QString glued = text + after;
    return fail(FormulaError::at(FormulaError::Kind::InvalidTokenSequence,
                                 QString("Number '%1' is immediately followed by '%2'")
                                     .arg(text, QString(after)),
                                 glued, start),
                error);
  }

  token->type = Token::Number;
  token->text = text;
  token->value = text;
  token->position = start;
  return true;
}

// ── Identifiers and keywords ──

bool TokenStream::lexIdentifier(Token *token) {
  SourcePosition start = position();
  int begin = m_index;
  while (m_index < m_input.length() && isIdentifierPart(peek()))
    advance();

  QString text = m_input.mid(begin, m_index - begin);
  QString upper = text.toUpper();

  token->text = text;
  token->value = text;
  token->position = start;

  if (upper == "IF")
    token->type = Token::If;
  else if (upper == "TRUE")
    token->type = Token::True;
  else if (upper == "FALSE")
    token->type = Token::False;
  else if (upper == "AND")
    token->type = Token::And;
  else if (upper == "OR")
    token->type = Token::Or;
  else if (upper == "NOT")
    token->type = Token::Not;
  else
    token->type = Token::Identifier;
  return true;
}

// ── Variables: {name} / ${name} ──

bool TokenStream::lexVariable(Token *token, FormulaError *error) {
  SourcePosition start = position();
  int begin = m_index;
  if (peek() == '$')
    advance();
  advance(); // '{'

  int nameBegin = m_index;
  while (true) {
    if (m_index >= m_input.length()) {
      QString text = m_input.mid(begin);
      return fail(FormulaError::at(FormulaError::Kind::UnclosedVariable,
                                   QString("Variable '%1' is not closed before end of input")
                                       .arg(text),
                                   text, start),
                  error);
    }
    QChar c = peek();
    if (c == '}')
      break;
    if (!isIdentifierPart(c)) {
      return fail(FormulaError::at(FormulaError::Kind::UnexpectedCharacter,
                                   QString("Unexpected character '%1' in variable name")
                                       .arg(c),
                                   QString(c), position()),
                  error);
    }
    advance();
  }

  QString name = m_input.mid(nameBegin, m_index - nameBegin);
  advance(); // '}'
  QString text = m_input.mid(begin, m_index - begin);

  if (name.isEmpty()) {
    return fail(FormulaError::at(FormulaError::Kind::InvalidTokenSequence,
                                 "Empty variable name", text, start),
                error);
  }

  token->type = Token::Variable;
  token->text = text;
  token->value = name;
  token->position = start;
  return true;
}

// ── Operators and punctuation ──

bool TokenStream::lexOperator(Token *token, FormulaError *error) {
  SourcePosition start = position();
  QChar c = peek();
  QChar n = peek(1);
  Token::Type type = Token::End;
  int length = 1;

  switch (c.unicode()) {
  case '+':
    type = Token::Plus;
    break;
  case '-':
    type = Token::Minus;
    break;
  case '*':
    type = Token::Multiply;
    break;
  case '/':
    type = Token::Divide;
    break;
  case '%':
    type = Token::Modulo;
    break;
  case '^':
    type = Token::Power;
    break;
  case '(':
    type = Token::LParen;
    break;
  case ')':
    type = Token::RParen;
    break;
  case ',':
    type = Token::Comma;
    break;
  case '=':
    type = Token::Equal;
    if (n == '=')
      length = 2;
    break;
  case '!':
    type = Token::Not;
    if (n == '=') {
      type = Token::NotEqual;
      length = 2;
    }
    break;
  case '<':
    type = Token::Less;
    if (n == '=') {
      type = Token::LessEqual;
      length = 2;
    }
    break;
  case '>':
    type = Token::Greater;
    if (n == '=') {
      type = Token::GreaterEqual;
      length = 2;
    }
    break;
  case '&':
  case '|':
    if (n != c) {
      return fail(FormulaError::at(FormulaError::Kind::InvalidTokenSequence,
                                   QString("Single '%1' is not an operator, use '%1%1'")
                                       .arg(c),
                                   QString(c), start),
                  error);
    }
    type = (c == '&') ? Token::And : Token::Or;
    length = 2;
    break;
  default:
    return fail(FormulaError::at(FormulaError::Kind::UnexpectedCharacter,
                                 QString("Unexpected character '%1'").arg(c),
                                 QString(c), start),
                error);
  }

  int begin = m_index;
  for (int i = 0; i < length; ++i)
    advance();

  token->type = type;
  token->text = m_input.mid(begin, length);
  token->value = token->text;
  token->position = start;
  return true;
}

// ═══════════════════════════════════════════════════════════════════
// LEXER
// ═══════════════════════════════════════════════════════════════════

Lexer::Lexer(const LexerOptions &options) : m_options(options) {}

QVector<Token> Lexer::tokenize(const QString &input,
                               FormulaError *error) const {
  QVector<Token> tokens;
  TokenStream stream(input, m_options);

  while (!stream.atEnd()) {
    Token token;
    FormulaError err;
    if (!stream.next(&token, &err)) {
      qDebug() << "[Lexer] tokenize failed:" << err.toString();
      reportError(error, err);
      return QVector<Token>();
    }
    tokens.append(token);
  }
  return tokens;
}

QString Lexer::reconstruct(const QVector<Token> &tokens) {
  QString out;
  for (const Token &token : tokens)
    out += token.leadingWhitespace + token.text;
  return out;
}
