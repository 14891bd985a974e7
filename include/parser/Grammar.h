#ifndef GRAMMAR_H
#define GRAMMAR_H

/**
 * @file Grammar.h
 * @brief Context-free grammar model used by the LALR(1) table builder
 *
 * Symbols are plain integers. For the expression grammar the terminals are
 * `Token::Type` values and the nonterminals are the `ExprSymbol` values
 * below. Operator precedence and associativity are encoded purely by the
 * shape of the productions:
 *
 *   EXPR       → EXPR || AND_EXPR | AND_EXPR
 *   AND_EXPR   → AND_EXPR && COMP_EXPR | COMP_EXPR
 *   COMP_EXPR  → COMP_EXPR (== != < <= > >=) ARITH_EXPR | ARITH_EXPR
 *   ARITH_EXPR → ARITH_EXPR (+ -) TERM | TERM
 *   TERM       → TERM (* / %) FACTOR | FACTOR
 *   FACTOR     → PRIMARY ^ FACTOR | PRIMARY
 *   PRIMARY    → ( EXPR ) | - PRIMARY | + PRIMARY | ! PRIMARY
 *              | NUMBER | VARIABLE | IDENTIFIER | TRUE | FALSE
 *              | IDENTIFIER ( ARGS ) | IDENTIFIER ( )
 *              | IF ( EXPR , EXPR , EXPR )
 *   ARGS       → EXPR | ARGS , EXPR
 *
 * The augmented production `START → EXPR $` is derived from the start
 * symbol and carries the id `Grammar::AugmentedProductionId`.
 */

#include "core/FormulaError.h"
#include <QHash>
#include <QSet>
#include <QString>
#include <QVector>

using GrammarSymbol = int;

// Nonterminals of the expression grammar
enum ExprSymbol : GrammarSymbol {
    SymStart = 100,
    SymExpr,
    SymAndExpr,
    SymCompExpr,
    SymArithExpr,
    SymTerm,
    SymFactor,
    SymPrimary,
    SymArgs
};

// ═══════════════════════════════════════════════════════════════════
// PRODUCTION
// ═══════════════════════════════════════════════════════════════════

struct Production {
    int id = -1;
    GrammarSymbol left = -1;
    QVector<GrammarSymbol> right;

    int length() const { return right.size(); }
    bool isEpsilon() const { return right.isEmpty(); }
    bool isLeftRecursive() const { return !right.isEmpty() && right.first() == left; }
    bool isRightRecursive() const { return !right.isEmpty() && right.last() == left; }

    bool operator==(const Production &other) const {
        return id == other.id && left == other.left && right == other.right;
    }
};

// ═══════════════════════════════════════════════════════════════════
// GRAMMAR
// ═══════════════════════════════════════════════════════════════════

class Grammar {
public:
    static constexpr int AugmentedProductionId = -1;

    Grammar(const QVector<Production> &productions,
            const QVector<GrammarSymbol> &terminals,
            const QVector<GrammarSymbol> &nonTerminals,
            GrammarSymbol startSymbol,
            GrammarSymbol augmentedStart,
            GrammarSymbol endMarker,
            const QHash<GrammarSymbol, QString> &names = QHash<GrammarSymbol, QString>());

    // The 34-production score formula grammar
    static Grammar expressionGrammar();

    // Checks declarations. Returns false and fills *error with
    // InvalidGrammar when a symbol is undeclared or misclassified.
    bool validate(FormulaError *error = nullptr) const;

    // ── Symbols ──
    const QVector<GrammarSymbol> &terminals() const { return m_terminals; }
    const QVector<GrammarSymbol> &nonTerminals() const { return m_nonTerminals; }
    GrammarSymbol startSymbol() const { return m_startSymbol; }
    GrammarSymbol augmentedStartSymbol() const { return m_augmentedStart; }
    GrammarSymbol endMarker() const { return m_endMarker; }
    bool isTerminal(GrammarSymbol symbol) const { return m_terminalSet.contains(symbol); }
    bool isNonTerminal(GrammarSymbol symbol) const { return m_nonTerminalSet.contains(symbol); }

    // ── Productions ──
    const QVector<Production> &productions() const { return m_productions; }
    const Production &augmentedProduction() const { return m_augmented; }
    // Lookup by id; AugmentedProductionId yields the augmented production.
    // Returns nullptr for unknown ids.
    const Production *production(int id) const;
    QVector<Production> productionsFor(GrammarSymbol nonTerminal) const;
    QVector<Production> leftRecursiveProductions() const;
    QVector<Production> rightRecursiveProductions() const;
    QVector<Production> epsilonProductions() const;

    // ── FIRST sets ──
    QSet<GrammarSymbol> first(GrammarSymbol symbol) const;
    bool isNullable(GrammarSymbol symbol) const { return m_nullable.contains(symbol); }
    // FIRST(symbols[from..] lookahead)
    QSet<GrammarSymbol> firstOfSequence(const QVector<GrammarSymbol> &symbols,
                                        int from,
                                        GrammarSymbol lookahead) const;

    // ── Presentation ──
    QString symbolName(GrammarSymbol symbol) const;
    QString productionToString(const Production &production) const;
    QString toBnf() const;

private:
    void computeFirstSets();

    QVector<Production>     m_productions;
    QHash<int, int>         m_indexById;
    Production              m_augmented;
    QVector<GrammarSymbol>  m_terminals;
    QVector<GrammarSymbol>  m_nonTerminals;
    QSet<GrammarSymbol>     m_terminalSet;
    QSet<GrammarSymbol>     m_nonTerminalSet;
    GrammarSymbol           m_startSymbol;
    GrammarSymbol           m_augmentedStart;
    GrammarSymbol           m_endMarker;
    QHash<GrammarSymbol, QString> m_names;

    QHash<GrammarSymbol, QSet<GrammarSymbol>> m_first;
    QSet<GrammarSymbol>     m_nullable;
};

#endif // GRAMMAR_H
