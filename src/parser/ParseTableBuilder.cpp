/**
 * @file ParseTableBuilder.cpp
 * @brief Canonical LR(1) collection, LALR state merging and table filling
 */

#include "parser/ParseTable.h"
#include <QDebug>
#include <QQueue>
#include <QStringList>
#include <algorithm>
#include <vector>

// ═══════════════════════════════════════════════════════════════════
// ACTION / CONFLICT
// ═══════════════════════════════════════════════════════════════════

QString LRAction::toString() const {
  switch (type) {
  case Shift:
    return QString("s%1").arg(target);
  case Reduce:
    return QString("r%1").arg(target);
  case Accept:
    return "acc";
  case Error:
    break;
  }
  return "err";
}

QString ParseConflict::toString(const Grammar &grammar) const {
  return QString("state %1, lookahead %2: %3 conflict (%4 vs %5)")
      .arg(state)
      .arg(grammar.symbolName(lookahead))
      .arg(kind == ShiftReduce ? "shift/reduce" : "reduce/reduce")
      .arg(existing.toString(), incoming.toString());
}

// ═══════════════════════════════════════════════════════════════════
// PARSE TABLE
// ═══════════════════════════════════════════════════════════════════

LRAction ParseTable::action(int state, GrammarSymbol terminal) const {
  if (state < 0 || state >= m_actions.size())
    return LRAction();
  return m_actions[state].value(terminal, LRAction());
}

int ParseTable::gotoState(int state, GrammarSymbol nonTerminal) const {
  if (state < 0 || state >= m_gotos.size())
    return -1;
  return m_gotos[state].value(nonTerminal, -1);
}

QVector<GrammarSymbol> ParseTable::expectedTerminals(int state) const {
  QVector<GrammarSymbol> out;
  if (state < 0 || state >= m_actions.size())
    return out;
  for (auto it = m_actions[state].constBegin(); it != m_actions[state].constEnd(); ++it)
    out.append(it.key());
  std::sort(out.begin(), out.end());
  return out;
}

bool ParseTable::operator==(const ParseTable &other) const {
  return m_actions == other.m_actions && m_gotos == other.m_gotos;
}

QString ParseTable::dump(const Grammar &grammar) const {
  QStringList lines;
  for (int s = 0; s < m_actions.size(); ++s) {
    QStringList cells;
    for (GrammarSymbol t : expectedTerminals(s))
      cells << QString("%1=%2").arg(grammar.symbolName(t), m_actions[s].value(t).toString());

    QList<GrammarSymbol> nts = m_gotos[s].keys();
    std::sort(nts.begin(), nts.end());
    for (GrammarSymbol n : nts)
      cells << QString("%1→%2").arg(grammar.symbolName(n)).arg(m_gotos[s].value(n));
    lines << QString("%1: %2").arg(s).arg(cells.join("  "));
  }
  return lines.join('\n');
}

// ═══════════════════════════════════════════════════════════════════
// BUILDER: item sets
// ═══════════════════════════════════════════════════════════════════

ParseTableBuilder::ParseTableBuilder(const Grammar &grammar) : m_grammar(grammar) {
  for (const Production &p : m_grammar.productions())
    m_byLeft[p.left].append(&p);
}

GrammarSymbol ParseTableBuilder::symbolAfterDot(const LRItem &item,
                                                bool *complete) const {
  const Production *p = m_grammar.production(item.productionId);
  if (!p || item.dot >= p->length()) {
    *complete = true;
    return -1;
  }
  *complete = false;
  return p->right[item.dot];
}

LRItemSet ParseTableBuilder::closure(const LRItemSet &items) const {
  LRItemSet result = items;
  QQueue<LRItem> pending;
  for (const LRItem &item : items)
    pending.enqueue(item);

  while (!pending.isEmpty()) {
    LRItem item = pending.dequeue();
    bool complete = false;
    GrammarSymbol next = symbolAfterDot(item, &complete);
    if (complete || !m_grammar.isNonTerminal(next))
      continue;

    const Production *p = m_grammar.production(item.productionId);
    QSet<GrammarSymbol> lookaheads =
        m_grammar.firstOfSequence(p->right, item.dot + 1, item.lookahead);

    for (const Production *candidate : m_byLeft.value(next)) {
      for (GrammarSymbol la : lookaheads) {
        LRItem added{candidate->id, 0, la};
        if (result.insert(added).second)
          pending.enqueue(added);
      }
    }
  }
  return result;
}

LRItemSet ParseTableBuilder::gotoItems(const LRItemSet &items,
                                       GrammarSymbol symbol) const {
  LRItemSet kernel;
  for (const LRItem &item : items) {
    bool complete = false;
    GrammarSymbol next = symbolAfterDot(item, &complete);
    if (!complete && next == symbol)
      kernel.insert(LRItem{item.productionId, item.dot + 1, item.lookahead});
  }
  if (kernel.empty())
    return kernel;
  return closure(kernel);
}

void ParseTableBuilder::canonicalCollection(
    QVector<LRItemSet> *states,
    QVector<std::map<GrammarSymbol, int>> *transitions) const {
  std::map<LRItemSet, int> index;

  LRItemSet start = closure(
      {LRItem{Grammar::AugmentedProductionId, 0, m_grammar.endMarker()}});
  states->append(start);
  transitions->append(std::map<GrammarSymbol, int>());
  index[start] = 0;

  // FIFO over states, symbols in ascending order: numbering is stable
  for (int current = 0; current < states->size(); ++current) {
    std::set<GrammarSymbol> symbols;
    for (const LRItem &item : states->at(current)) {
      bool complete = false;
      GrammarSymbol next = symbolAfterDot(item, &complete);
      if (!complete && next != m_grammar.endMarker())
        symbols.insert(next);
    }

    for (GrammarSymbol symbol : symbols) {
      LRItemSet target = gotoItems(states->at(current), symbol);
      if (target.empty())
        continue;
      auto found = index.find(target);
      int targetIndex = 0;
      if (found == index.end()) {
        targetIndex = states->size();
        index[target] = targetIndex;
        states->append(target);
        transitions->append(std::map<GrammarSymbol, int>());
      } else {
        targetIndex = found->second;
      }
      (*transitions)[current][symbol] = targetIndex;
    }
  }
}

// ═══════════════════════════════════════════════════════════════════
// BUILDER: LALR merge + table
// ═══════════════════════════════════════════════════════════════════

namespace {

struct MergedState {
  CompressedLRState state;
  QVector<int> members; // canonical state indices, ascending
};

} // namespace

std::shared_ptr<const ParseTable>
ParseTableBuilder::build(FormulaError *error,
                         QVector<ParseConflict> *conflicts) const {
  if (!m_grammar.validate(error))
    return nullptr;

  QVector<LRItemSet> canonical;
  QVector<std::map<GrammarSymbol, int>> transitions;
  canonicalCollection(&canonical, &transitions);

  // ── Compress every canonical state onto its core ──
  QVector<CompressedLRState> compressed;
  for (const LRItemSet &items : canonical) {
    FormulaError err;
    CompressedLRState state = CompressedLRState::fromItems(items, m_grammar, &err);
    if (err.isError()) {
      reportError(error, err);
      return nullptr;
    }
    state.markFullyBuilt();
    compressed.append(state);
  }

  // ── Greedy LALR merge inside each core group ──
  QVector<MergedState> merged;
  QHash<QString, QVector<int>> bucketsBySignature;
  int rejected = 0;

  for (int i = 0; i < compressed.size(); ++i) {
    const CompressedLRState &state = compressed[i];
    QVector<int> &candidates = bucketsBySignature[state.signature()];
    bool placed = false;

    for (int b : candidates) {
      QString reason;
      if (CompressedLRState::canMergeLALR(merged[b].state, state, &reason)) {
        merged[b].state = merged[b].state.united(state);
        merged[b].members.append(i);
        placed = true;
        break;
      }
      qDebug() << "[ParseTableBuilder] LALR merge of canonical state" << i
               << "into merged state" << b << "rejected:" << reason;
    }

    if (!placed) {
      if (!candidates.isEmpty())
        ++rejected;
      candidates.append(merged.size());
      merged.append(MergedState{state, {i}});
    }
  }

  // ── Split merged states until GOTO targets agree ──
  QVector<int> bucketOf(canonical.size(), -1);
  for (int b = 0; b < merged.size(); ++b)
    for (int m : merged[b].members)
      bucketOf[m] = b;

  bool changed = true;
  while (changed) {
    changed = false;
    for (int b = 0; b < merged.size(); ++b) {
      std::map<std::vector<int>, QVector<int>> groups;
      QVector<std::vector<int>> order;
      for (int m : merged[b].members) {
        std::vector<int> key;
        for (const auto &kv : transitions[m]) {
          key.push_back(kv.first);
          key.push_back(bucketOf[kv.second]);
        }
        if (!groups.count(key))
          order.append(key);
        groups[key].append(m);
      }
      if (order.size() <= 1)
        continue;

      changed = true;
      for (int g = 1; g < order.size(); ++g) {
        MergedState split;
        for (int m : groups[order[g]]) {
          split.state = split.members.isEmpty() ? compressed[m]
                                                : split.state.united(compressed[m]);
          split.members.append(m);
          bucketOf[m] = merged.size();
        }
        merged.append(split);
      }

      MergedState kept;
      for (int m : groups[order[0]]) {
        kept.state = kept.members.isEmpty() ? compressed[m]
                                            : kept.state.united(compressed[m]);
        kept.members.append(m);
      }
      merged[b] = kept;
    }
  }

  // ── Renumber by lowest canonical member so the start state is 0 ──
  QVector<int> order(merged.size());
  for (int b = 0; b < merged.size(); ++b)
    order[b] = b;
  std::sort(order.begin(), order.end(), [&](int x, int y) {
    return merged[x].members.first() < merged[y].members.first();
  });
  QVector<int> finalId(merged.size());
  for (int pos = 0; pos < order.size(); ++pos)
    finalId[order[pos]] = pos;

  // ── Fill ACTION / GOTO ──
  auto table = std::make_shared<ParseTable>();
  table->m_actions.resize(merged.size());
  table->m_gotos.resize(merged.size());
  table->m_canonicalStateCount = canonical.size();
  table->m_rejectedMerges = rejected;

  QVector<ParseConflict> found;
  auto setAction = [&](int state, GrammarSymbol terminal, const LRAction &action) {
    QHash<GrammarSymbol, LRAction> &row = table->m_actions[state];
    auto it = row.find(terminal);
    if (it == row.end()) {
      row.insert(terminal, action);
      return;
    }
    if (it.value() == action)
      return;
    ParseConflict conflict;
    conflict.state = state;
    conflict.lookahead = terminal;
    conflict.kind = (it.value().type == LRAction::Reduce && action.type == LRAction::Reduce)
                        ? ParseConflict::ReduceReduce
                        : ParseConflict::ShiftReduce;
    conflict.existing = it.value();
    conflict.incoming = action;
    found.append(conflict);
  };

  for (int b = 0; b < merged.size(); ++b) {
    int state = finalId[b];
    const MergedState &ms = merged[b];
    int representative = ms.members.first();

    for (const auto &kv : transitions[representative]) {
      int target = finalId[bucketOf[kv.second]];
      if (m_grammar.isTerminal(kv.first))
        setAction(state, kv.first, LRAction::shift(target));
      else
        table->m_gotos[state].insert(kv.first, target);
    }

    for (const auto &kv : ms.state.entries()) {
      const LRCore &core = kv.first;
      const CompressedLRState::CoreEntry &entry = kv.second;

      if (core.productionId == Grammar::AugmentedProductionId && !entry.complete &&
          entry.nextSymbol == m_grammar.endMarker()) {
        setAction(state, m_grammar.endMarker(), LRAction::accept());
        continue;
      }
      if (!entry.complete)
        continue;
      for (GrammarSymbol la : entry.lookaheads)
        setAction(state, la, LRAction::reduce(core.productionId));
    }
  }

  if (!found.isEmpty()) {
    QStringList lines;
    for (const ParseConflict &c : found) {
      lines << c.toString(m_grammar);
      qCritical().noquote() << "[ParseTableBuilder] conflict:" << c.toString(m_grammar);
    }
    if (conflicts)
      *conflicts = found;
    reportError(error, FormulaError::make(
                           FormulaError::Kind::GrammarConflict,
                           QString("Grammar is not LALR(1): %1 conflict(s): %2")
                               .arg(found.size())
                               .arg(lines.join("; "))));
    return nullptr;
  }

  qDebug() << "[ParseTableBuilder] built" << table->stateCount() << "LALR states from"
           << table->m_canonicalStateCount << "canonical LR(1) states," << rejected
           << "merge(s) rejected";
  return table;
}
