#ifndef COMPRESSED_LR_STATE_H
#define COMPRESSED_LR_STATE_H

/**
 * @file CompressedLRState.h
 * @brief LR(1) state folded onto its core, used for LALR merging
 *
 * A compressed state keeps one entry per core item (production, dot) with
 * the union of the lookaheads seen for that core. Its signature is the
 * sorted list of cores ("prodId:dot" joined by '|') and depends on nothing
 * else, so two canonical states with the same signature are LALR merge
 * candidates.
 *
 * A merge is legal only when the union does not introduce a conflict
 * (lookahead, shift/reduce or reduce/reduce) that neither source state
 * already had.
 */

#include "core/FormulaError.h"
#include "parser/LRItem.h"
#include <QString>
#include <map>
#include <set>

class CompressedLRState {
public:
    struct CoreEntry {
        GrammarSymbol nextSymbol = 0;
        bool complete = false;          // dot at the end of the production
        bool nextIsTerminal = false;
        std::set<GrammarSymbol> lookaheads;
    };

    CompressedLRState() = default;

    // Fails with EmptyCoreItems for an empty item set, InvalidGrammar for an
    // item that names an unknown production.
    static CompressedLRState fromItems(const LRItemSet &items,
                                       const Grammar &grammar,
                                       FormulaError *error = nullptr);

    static QString signatureOf(const std::set<LRCore> &cores);

    const std::map<LRCore, CoreEntry> &entries() const { return m_entries; }
    std::set<LRCore> coreItems() const;
    LRItemSet items() const;
    const QString &signature() const { return m_signature; }
    bool isEmpty() const { return m_entries.empty(); }

    bool isFullyBuilt() const { return m_fullyBuilt; }
    void markFullyBuilt() { m_fullyBuilt = true; }

    bool hasSameCore(const CompressedLRState &other) const {
        return m_signature == other.m_signature;
    }

    // Conflicts present in this state, as "SR:<lookahead>" / "RR:<lookahead>"
    std::set<QString> conflicts() const;

    static bool canMergeLALR(const CompressedLRState &a,
                             const CompressedLRState &b,
                             QString *reason = nullptr);

    // Checked merge: LalrMergeRejected when canMergeLALR does not hold.
    static CompressedLRState mergeLALR(const CompressedLRState &a,
                                       const CompressedLRState &b,
                                       FormulaError *error = nullptr);

    // Unchecked lookahead union of two states with the same core.
    CompressedLRState united(const CompressedLRState &other) const;

private:
    std::map<LRCore, CoreEntry> m_entries;
    QString m_signature;
    bool m_fullyBuilt = false;
};

#endif // COMPRESSED_LR_STATE_H
