#ifndef AST_BUILDER_REGISTRY_H
#define AST_BUILDER_REGISTRY_H

/**
 * @file AstBuilderRegistry.h
 * @brief Per-production reduce actions that turn parser children into AST nodes
 *
 * When the LR parser reduces by production p it pops |rhs(p)| values off its
 * value stack and hands them to the builder registered for p. A builder
 * checks the child count and child kinds before constructing anything, so a
 * mismatch between grammar and builder is reported as ChildCountMismatch /
 * ChildTypeMismatch instead of producing a malformed tree.
 */

#include "ast/AstNode.h"
#include "core/FormulaError.h"
#include "lexer/Token.h"
#include "parser/Grammar.h"
#include <QHash>
#include <functional>
#include <vector>

// ═══════════════════════════════════════════════════════════════════
// PARSE VALUE: element of the parser value stack
// ═══════════════════════════════════════════════════════════════════

struct ParseValue {
    enum class Kind {
        Token,       // shifted terminal
        Node,        // reduced expression
        Arguments    // reduced ARGS list
    };

    Kind kind = Kind::Token;
    ::Token token;
    AstNodePtr node;
    std::vector<AstNodePtr> arguments;

    static ParseValue fromToken(const ::Token &token);
    static ParseValue fromNode(AstNodePtr node);
    static ParseValue fromArguments(std::vector<AstNodePtr> arguments);

    QString describe() const;
};

// ═══════════════════════════════════════════════════════════════════
// AST BUILDER
// ═══════════════════════════════════════════════════════════════════

struct AstBuilder {
    using BuildFn = std::function<bool(std::vector<ParseValue> &children,
                                       ParseValue *result,
                                       FormulaError *error)>;

    QString name;
    int childCount = 0;
    BuildFn build;

    // ── Standard builders ──
    static AstBuilder identity();
    static AstBuilder start();
    static AstBuilder binaryOp(const QString &op);
    static AstBuilder unaryOp(const QString &op, int operandIndex);
    static AstBuilder parenthesized();
    static AstBuilder number();
    static AstBuilder variable();
    static AstBuilder booleanTrue();
    static AstBuilder booleanFalse();
    static AstBuilder functionCall();
    static AstBuilder functionCallEmpty();
    static AstBuilder ifExpression();
    static AstBuilder argsSingle();
    static AstBuilder argsMultiple();
};

// ═══════════════════════════════════════════════════════════════════
// REGISTRY
// ═══════════════════════════════════════════════════════════════════

class AstBuilderRegistry {
public:
    AstBuilderRegistry() = default;

    // Registry for Grammar::expressionGrammar()
    static AstBuilderRegistry expressionBuilders();

    void registerBuilder(int productionId, const AstBuilder &builder);
    bool hasBuilder(int productionId) const { return m_builders.contains(productionId); }
    const AstBuilder *builder(int productionId) const;
    int size() const { return m_builders.size(); }

    // Every production of `grammar`, the augmented one included, must have
    // a builder whose child count equals the production length.
    bool validateFor(const Grammar &grammar, FormulaError *error = nullptr) const;

    // Runs the builder of `productionId` on `children` (consumed).
    bool build(int productionId, std::vector<ParseValue> &children,
               ParseValue *result, FormulaError *error = nullptr) const;

private:
    QHash<int, AstBuilder> m_builders;
};

#endif // AST_BUILDER_REGISTRY_H
