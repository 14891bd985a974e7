#ifndef LR_ITEM_H
#define LR_ITEM_H

#include "parser/Grammar.h"
#include <set>

// Core of an LR item: production + dot position, lookahead stripped
struct LRCore {
    int productionId = 0;
    int dot = 0;

    bool operator<(const LRCore &other) const {
        if (productionId != other.productionId)
            return productionId < other.productionId;
        return dot < other.dot;
    }
    bool operator==(const LRCore &other) const {
        return productionId == other.productionId && dot == other.dot;
    }
};

// [A → α • β, lookahead]
struct LRItem {
    int productionId = 0;
    int dot = 0;
    GrammarSymbol lookahead = 0;

    LRCore core() const { return LRCore{productionId, dot}; }

    bool operator<(const LRItem &other) const {
        if (productionId != other.productionId)
            return productionId < other.productionId;
        if (dot != other.dot)
            return dot < other.dot;
        return lookahead < other.lookahead;
    }
    bool operator==(const LRItem &other) const {
        return productionId == other.productionId && dot == other.dot &&
               lookahead == other.lookahead;
    }

    QString toString(const Grammar &grammar) const;
};

using LRItemSet = std::set<LRItem>;

#endif // LR_ITEM_H
