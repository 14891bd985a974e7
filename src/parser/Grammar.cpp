#include "parser/Grammar.h"
#include "lexer/Token.h"
#include <QStringList>
#include <algorithm>

Grammar::Grammar(const QVector<Production> &productions,
                 const QVector<GrammarSymbol> &terminals,
                 const QVector<GrammarSymbol> &nonTerminals,
                 GrammarSymbol startSymbol, GrammarSymbol augmentedStart,
                 GrammarSymbol endMarker,
                 const QHash<GrammarSymbol, QString> &names)
    : m_productions(productions), m_terminals(terminals),
      m_nonTerminals(nonTerminals), m_startSymbol(startSymbol),
      m_augmentedStart(augmentedStart), m_endMarker(endMarker),
      m_names(names) {
  std::sort(m_terminals.begin(), m_terminals.end());
  std::sort(m_nonTerminals.begin(), m_nonTerminals.end());
  for (GrammarSymbol t : m_terminals)
    m_terminalSet.insert(t);
  for (GrammarSymbol n : m_nonTerminals)
    m_nonTerminalSet.insert(n);

  for (int i = 0; i < m_productions.size(); ++i)
    m_indexById.insert(m_productions[i].id, i);

  m_augmented.id = AugmentedProductionId;
  m_augmented.left = m_augmentedStart;
  m_augmented.right = {m_startSymbol, m_endMarker};

  computeFirstSets();
}

// ═══════════════════════════════════════════════════════════════════
// EXPRESSION GRAMMAR
// ═══════════════════════════════════════════════════════════════════

Grammar Grammar::expressionGrammar() {
  struct Rule {
    GrammarSymbol left;
    QVector<GrammarSymbol> right;
  };

  // Order defines the production ids 0..33
  const QVector<Rule> rules = {
      {SymExpr, {SymExpr, Token::Or, SymAndExpr}},                  //  0
      {SymExpr, {SymAndExpr}},                                      //  1
      {SymAndExpr, {SymAndExpr, Token::And, SymCompExpr}},          //  2
      {SymAndExpr, {SymCompExpr}},                                  //  3
      {SymCompExpr, {SymCompExpr, Token::Equal, SymArithExpr}},     //  4
      {SymCompExpr, {SymCompExpr, Token::NotEqual, SymArithExpr}},  //  5
      {SymCompExpr, {SymCompExpr, Token::Less, SymArithExpr}},      //  6
      {SymCompExpr, {SymCompExpr, Token::LessEqual, SymArithExpr}}, //  7
      {SymCompExpr, {SymCompExpr, Token::Greater, SymArithExpr}},   //  8
      {SymCompExpr, {SymCompExpr, Token::GreaterEqual, SymArithExpr}}, // 9
      {SymCompExpr, {SymArithExpr}},                                // 10
      {SymArithExpr, {SymArithExpr, Token::Plus, SymTerm}},         // 11
      {SymArithExpr, {SymArithExpr, Token::Minus, SymTerm}},        // 12
      {SymArithExpr, {SymTerm}},                                    // 13
      {SymTerm, {SymTerm, Token::Multiply, SymFactor}},             // 14
      {SymTerm, {SymTerm, Token::Divide, SymFactor}},               // 15
      {SymTerm, {SymTerm, Token::Modulo, SymFactor}},               // 16
      {SymTerm, {SymFactor}},                                       // 17
      {SymFactor, {SymPrimary, Token::Power, SymFactor}},           // 18
      {SymFactor, {SymPrimary}},                                    // 19
      {SymPrimary, {Token::LParen, SymExpr, Token::RParen}},        // 20
      {SymPrimary, {Token::Minus, SymPrimary}},                     // 21
      {SymPrimary, {Token::Plus, SymPrimary}},                      // 22
      {SymPrimary, {Token::Not, SymPrimary}},                       // 23
      {SymPrimary, {Token::Number}},                                // 24
      {SymPrimary, {Token::Variable}},                              // 25
      {SymPrimary, {Token::Identifier}},                            // 26
      {SymPrimary, {Token::True}},                                  // 27
      {SymPrimary, {Token::False}},                                 // 28
      {SymPrimary, {Token::Identifier, Token::LParen, SymArgs, Token::RParen}}, // 29
      {SymPrimary, {Token::Identifier, Token::LParen, Token::RParen}},          // 30
      {SymPrimary, {Token::If, Token::LParen, SymExpr, Token::Comma, SymExpr,
                    Token::Comma, SymExpr, Token::RParen}},         // 31
      {SymArgs, {SymExpr}},                                         // 32
      {SymArgs, {SymArgs, Token::Comma, SymExpr}},                  // 33
  };

  QVector<Production> productions;
  for (int i = 0; i < rules.size(); ++i) {
    Production p;
    p.id = i;
    p.left = rules[i].left;
    p.right = rules[i].right;
    productions.append(p);
  }

  QVector<GrammarSymbol> terminals;
  QHash<GrammarSymbol, QString> names;
  for (int t = 0; t < Token::TypeCount; ++t) {
    terminals.append(t);
    names.insert(t, Token::symbolText(static_cast<Token::Type>(t)));
  }

  const QVector<GrammarSymbol> nonTerminals = {
      SymStart, SymExpr, SymAndExpr, SymCompExpr, SymArithExpr,
      SymTerm, SymFactor, SymPrimary, SymArgs};
  names.insert(SymStart, "START");
  names.insert(SymExpr, "EXPR");
  names.insert(SymAndExpr, "AND_EXPR");
  names.insert(SymCompExpr, "COMP_EXPR");
  names.insert(SymArithExpr, "ARITH_EXPR");
  names.insert(SymTerm, "TERM");
  names.insert(SymFactor, "FACTOR");
  names.insert(SymPrimary, "PRIMARY");
  names.insert(SymArgs, "ARGS");

  return Grammar(productions, terminals, nonTerminals, SymExpr, SymStart,
                 Token::End, names);
}

// ═══════════════════════════════════════════════════════════════════
// VALIDATION
// ═══════════════════════════════════════════════════════════════════

bool Grammar::validate(FormulaError *error) const {
  auto invalid = [&](const QString &msg, const QString &text) {
    reportError(error,
                FormulaError::make(FormulaError::Kind::InvalidGrammar, msg, text));
    return false;
  };

  for (GrammarSymbol t : m_terminals) {
    if (m_nonTerminalSet.contains(t))
      return invalid(QString("Symbol %1 is declared both terminal and nonterminal")
                         .arg(symbolName(t)),
                     symbolName(t));
  }

  if (!isNonTerminal(m_startSymbol))
    return invalid("Start symbol is not a nonterminal", symbolName(m_startSymbol));
  if (!isNonTerminal(m_augmentedStart))
    return invalid("Augmented start symbol is not a nonterminal",
                   symbolName(m_augmentedStart));
  if (!isTerminal(m_endMarker))
    return invalid("End marker is not a terminal", symbolName(m_endMarker));
  if (productionsFor(m_startSymbol).isEmpty())
    return invalid("Start symbol has no productions", symbolName(m_startSymbol));

  QSet<int> ids;
  for (const Production &p : m_productions) {
    if (p.id < 0 || ids.contains(p.id))
      return invalid(QString("Production id %1 is negative or duplicated").arg(p.id),
                     productionToString(p));
    ids.insert(p.id);

    if (!isNonTerminal(p.left))
      return invalid(QString("Left-hand side of production %1 is not a nonterminal")
                         .arg(p.id),
                     symbolName(p.left));
    if (p.left == m_augmentedStart)
      return invalid("Augmented start symbol must not appear in user productions",
                     productionToString(p));

    for (GrammarSymbol s : p.right) {
      if (!isTerminal(s) && !isNonTerminal(s))
        return invalid(QString("Production %1 references undeclared symbol %2")
                           .arg(p.id)
                           .arg(s),
                       QString::number(s));
      if (s == m_augmentedStart || s == m_endMarker)
        return invalid(QString("Production %1 uses a reserved symbol").arg(p.id),
                       symbolName(s));
    }
  }

  for (GrammarSymbol n : m_nonTerminals) {
    if (n != m_augmentedStart && productionsFor(n).isEmpty())
      return invalid(QString("Nonterminal %1 has no productions").arg(symbolName(n)),
                     symbolName(n));
  }
  return true;
}

// ═══════════════════════════════════════════════════════════════════
// QUERIES
// ═══════════════════════════════════════════════════════════════════

const Production *Grammar::production(int id) const {
  if (id == AugmentedProductionId)
    return &m_augmented;
  auto it = m_indexById.constFind(id);
  if (it == m_indexById.constEnd())
    return nullptr;
  return &m_productions[it.value()];
}

QVector<Production> Grammar::productionsFor(GrammarSymbol nonTerminal) const {
  QVector<Production> out;
  for (const Production &p : m_productions)
    if (p.left == nonTerminal)
      out.append(p);
  return out;
}

QVector<Production> Grammar::leftRecursiveProductions() const {
  QVector<Production> out;
  for (const Production &p : m_productions)
    if (p.isLeftRecursive())
      out.append(p);
  return out;
}

QVector<Production> Grammar::rightRecursiveProductions() const {
  QVector<Production> out;
  for (const Production &p : m_productions)
    if (p.isRightRecursive())
      out.append(p);
  return out;
}

QVector<Production> Grammar::epsilonProductions() const {
  QVector<Production> out;
  for (const Production &p : m_productions)
    if (p.isEpsilon())
      out.append(p);
  return out;
}

// ═══════════════════════════════════════════════════════════════════
// FIRST SETS
// ═══════════════════════════════════════════════════════════════════

void Grammar::computeFirstSets() {
  for (GrammarSymbol t : m_terminals)
    m_first[t].insert(t);

  bool changed = true;
  while (changed) {
    changed = false;
    for (const Production &p : m_productions) {
      QSet<GrammarSymbol> &target = m_first[p.left];
      int before = target.size();
      bool allNullable = true;

      for (GrammarSymbol s : p.right) {
        if (m_terminalSet.contains(s)) {
          target.insert(s);
          allNullable = false;
          break;
        }
        target.unite(m_first.value(s));
        if (!m_nullable.contains(s)) {
          allNullable = false;
          break;
        }
      }

      if (allNullable && !m_nullable.contains(p.left)) {
        m_nullable.insert(p.left);
        changed = true;
      }
      if (target.size() != before)
        changed = true;
    }
  }
}

QSet<GrammarSymbol> Grammar::first(GrammarSymbol symbol) const {
  return m_first.value(symbol);
}

QSet<GrammarSymbol> Grammar::firstOfSequence(const QVector<GrammarSymbol> &symbols,
                                             int from,
                                             GrammarSymbol lookahead) const {
  QSet<GrammarSymbol> out;
  for (int i = from; i < symbols.size(); ++i) {
    GrammarSymbol s = symbols[i];
    if (m_terminalSet.contains(s)) {
      out.insert(s);
      return out;
    }
    out.unite(m_first.value(s));
    if (!m_nullable.contains(s))
      return out;
  }
  out.insert(lookahead);
  return out;
}

// ═══════════════════════════════════════════════════════════════════
// PRESENTATION
// ═══════════════════════════════════════════════════════════════════

QString Grammar::symbolName(GrammarSymbol symbol) const {
  auto it = m_names.constFind(symbol);
  if (it != m_names.constEnd())
    return it.value();
  return QString("#%1").arg(symbol);
}

QString Grammar::productionToString(const Production &production) const {
  QStringList rhs;
  for (GrammarSymbol s : production.right)
    rhs << symbolName(s);
  if (rhs.isEmpty())
    rhs << "ε";
  return QString("%1 → %2").arg(symbolName(production.left), rhs.join(' '));
}

QString Grammar::toBnf() const {
  QStringList lines;
  lines << QString("%1: %2").arg(m_augmented.id).arg(productionToString(m_augmented));
  for (const Production &p : m_productions)
    lines << QString("%1: %2").arg(p.id).arg(productionToString(p));
  return lines.join('\n');
}
