#ifndef PARSE_TABLE_H
#define PARSE_TABLE_H

/**
 * @file ParseTable.h
 * @brief LALR(1) ACTION/GOTO table and its builder
 *
 *   Grammar grammar = Grammar::expressionGrammar();
 *   FormulaError err;
 *   std::shared_ptr<const ParseTable> table =
 *       ParseTableBuilder(grammar).build(&err);
 *
 * Construction steps:
 *   1. closure of [START → • EXPR $, $]
 *   2. GOTO over every symbol until fixpoint (canonical LR(1) collection)
 *   3. fold each state onto its core, merge same-core states when
 *      CompressedLRState::canMergeLALR allows it
 *   4. split merged states whose members disagree on a GOTO target
 *   5. fill ACTION/GOTO; any cell with two actions is a conflict and the
 *      whole build fails with GrammarConflict
 */

#include "core/FormulaError.h"
#include "parser/CompressedLRState.h"
#include "parser/Grammar.h"
#include <QHash>
#include <QVector>
#include <map>
#include <memory>

// ═══════════════════════════════════════════════════════════════════
// ACTION
// ═══════════════════════════════════════════════════════════════════

struct LRAction {
    enum Type {
        Error,
        Shift,    // target = next state
        Reduce,   // target = production id
        Accept
    };

    Type type = Error;
    int target = -1;

    static LRAction shift(int state) { return LRAction{Shift, state}; }
    static LRAction reduce(int productionId) { return LRAction{Reduce, productionId}; }
    static LRAction accept() { return LRAction{Accept, -1}; }

    bool operator==(const LRAction &other) const {
        return type == other.type && target == other.target;
    }
    bool operator!=(const LRAction &other) const { return !(*this == other); }

    QString toString() const;
};

struct ParseConflict {
    enum Kind { ShiftReduce, ReduceReduce };

    int state = -1;
    GrammarSymbol lookahead = 0;
    Kind kind = ShiftReduce;
    LRAction existing;
    LRAction incoming;

    QString toString(const Grammar &grammar) const;
};

// ═══════════════════════════════════════════════════════════════════
// PARSE TABLE
// ═══════════════════════════════════════════════════════════════════

class ParseTable {
public:
    LRAction action(int state, GrammarSymbol terminal) const;
    // -1 when no transition exists
    int gotoState(int state, GrammarSymbol nonTerminal) const;

    int stateCount() const { return m_actions.size(); }
    int canonicalStateCount() const { return m_canonicalStateCount; }
    int rejectedMerges() const { return m_rejectedMerges; }

    // Terminals with a non-error action in `state`, ascending
    QVector<GrammarSymbol> expectedTerminals(int state) const;

    // Action/goto content only; counters are diagnostics
    bool operator==(const ParseTable &other) const;
    bool operator!=(const ParseTable &other) const { return !(*this == other); }

    QString dump(const Grammar &grammar) const;

private:
    friend class ParseTableBuilder;

    QVector<QHash<GrammarSymbol, LRAction>> m_actions;
    QVector<QHash<GrammarSymbol, int>>      m_gotos;
    int m_canonicalStateCount = 0;
    int m_rejectedMerges = 0;
};

// ═══════════════════════════════════════════════════════════════════
// PARSE TABLE BUILDER
// ═══════════════════════════════════════════════════════════════════

class ParseTableBuilder {
public:
    explicit ParseTableBuilder(const Grammar &grammar);

    // Returns nullptr on InvalidGrammar / GrammarConflict. When `conflicts`
    // is given it receives every conflicting cell.
    std::shared_ptr<const ParseTable> build(FormulaError *error = nullptr,
                                            QVector<ParseConflict> *conflicts = nullptr) const;

    LRItemSet closure(const LRItemSet &items) const;
    LRItemSet gotoItems(const LRItemSet &items, GrammarSymbol symbol) const;

    // Canonical LR(1) collection; transitions[i] maps symbol → state index
    void canonicalCollection(QVector<LRItemSet> *states,
                             QVector<std::map<GrammarSymbol, int>> *transitions) const;

private:
    GrammarSymbol symbolAfterDot(const LRItem &item, bool *complete) const;

    const Grammar &m_grammar;
    QHash<GrammarSymbol, QVector<const Production *>> m_byLeft;
};

#endif // PARSE_TABLE_H
