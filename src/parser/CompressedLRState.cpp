#include "parser/CompressedLRState.h"
#include <QStringList>

QString LRItem::toString(const Grammar &grammar) const {
  const Production *p = grammar.production(productionId);
  if (!p)
    return QString("[?%1]").arg(productionId);

  QStringList rhs;
  for (int i = 0; i < p->right.size(); ++i) {
    if (i == dot)
      rhs << "•";
    rhs << grammar.symbolName(p->right[i]);
  }
  if (dot >= p->right.size())
    rhs << "•";
  return QString("[%1 → %2, %3]")
      .arg(grammar.symbolName(p->left), rhs.join(' '),
           grammar.symbolName(lookahead));
}

// ═══════════════════════════════════════════════════════════════════
// CONSTRUCTION
// ═══════════════════════════════════════════════════════════════════

CompressedLRState CompressedLRState::fromItems(const LRItemSet &items,
                                               const Grammar &grammar,
                                               FormulaError *error) {
  CompressedLRState state;
  if (items.empty()) {
    reportError(error, FormulaError::make(FormulaError::Kind::EmptyCoreItems,
                                          "Cannot compress an empty item set"));
    return state;
  }

  for (const LRItem &item : items) {
    const Production *p = grammar.production(item.productionId);
    if (!p || item.dot < 0 || item.dot > p->length()) {
      reportError(error, FormulaError::make(
                             FormulaError::Kind::InvalidGrammar,
                             QString("Item refers to unknown production %1 or dot %2")
                                 .arg(item.productionId)
                                 .arg(item.dot)));
      return CompressedLRState();
    }

    CoreEntry &entry = state.m_entries[item.core()];
    entry.complete = item.dot == p->length();
    if (!entry.complete) {
      entry.nextSymbol = p->right[item.dot];
      entry.nextIsTerminal = grammar.isTerminal(entry.nextSymbol);
    }
    entry.lookaheads.insert(item.lookahead);
  }

  state.m_signature = signatureOf(state.coreItems());
  return state;
}

QString CompressedLRState::signatureOf(const std::set<LRCore> &cores) {
  QStringList parts;
  for (const LRCore &core : cores)
    parts << QString("%1:%2").arg(core.productionId).arg(core.dot);
  return parts.join('|');
}

std::set<LRCore> CompressedLRState::coreItems() const {
  std::set<LRCore> cores;
  for (const auto &kv : m_entries)
    cores.insert(kv.first);
  return cores;
}

LRItemSet CompressedLRState::items() const {
  LRItemSet out;
  for (const auto &kv : m_entries)
    for (GrammarSymbol la : kv.second.lookaheads)
      out.insert(LRItem{kv.first.productionId, kv.first.dot, la});
  return out;
}

// ═══════════════════════════════════════════════════════════════════
// CONFLICTS
// ═══════════════════════════════════════════════════════════════════

std::set<QString> CompressedLRState::conflicts() const {
  std::map<GrammarSymbol, int> reducers;
  std::set<GrammarSymbol> shifts;

  for (const auto &kv : m_entries) {
    const CoreEntry &entry = kv.second;
    if (entry.complete) {
      for (GrammarSymbol la : entry.lookaheads)
        ++reducers[la];
    } else if (entry.nextIsTerminal) {
      shifts.insert(entry.nextSymbol);
    }
  }

  std::set<QString> out;
  for (const auto &kv : reducers) {
    if (kv.second > 1)
      out.insert(QString("RR:%1").arg(kv.first));
    if (shifts.count(kv.first))
      out.insert(QString("SR:%1").arg(kv.first));
  }
  return out;
}

// ═══════════════════════════════════════════════════════════════════
// LALR MERGE
// ═══════════════════════════════════════════════════════════════════

CompressedLRState CompressedLRState::united(const CompressedLRState &other) const {
  CompressedLRState merged = *this;
  for (const auto &kv : other.m_entries) {
    auto it = merged.m_entries.find(kv.first);
    if (it == merged.m_entries.end()) {
      merged.m_entries.insert(kv);
    } else {
      it->second.lookaheads.insert(kv.second.lookaheads.begin(),
                                   kv.second.lookaheads.end());
    }
  }
  merged.m_signature = signatureOf(merged.coreItems());
  merged.m_fullyBuilt = m_fullyBuilt && other.m_fullyBuilt;
  return merged;
}

bool CompressedLRState::canMergeLALR(const CompressedLRState &a,
                                     const CompressedLRState &b,
                                     QString *reason) {
  if (a.isEmpty() || b.isEmpty()) {
    if (reason)
      *reason = "empty state";
    return false;
  }
  if (!a.hasSameCore(b)) {
    if (reason)
      *reason = QString("core mismatch (%1 vs %2)").arg(a.m_signature, b.m_signature);
    return false;
  }

  std::set<QString> existing = a.conflicts();
  std::set<QString> fromB = b.conflicts();
  existing.insert(fromB.begin(), fromB.end());

  QStringList introduced;
  for (const QString &c : a.united(b).conflicts())
    if (!existing.count(c))
      introduced << c;

  if (!introduced.isEmpty()) {
    if (reason)
      *reason = QString("merge introduces %1").arg(introduced.join(", "));
    return false;
  }
  return true;
}

CompressedLRState CompressedLRState::mergeLALR(const CompressedLRState &a,
                                               const CompressedLRState &b,
                                               FormulaError *error) {
  QString reason;
  if (!canMergeLALR(a, b, &reason)) {
    reportError(error, FormulaError::make(FormulaError::Kind::LalrMergeRejected,
                                          QString("LALR merge rejected: %1").arg(reason),
                                          a.m_signature));
    return CompressedLRState();
  }
  return a.united(b);
}
