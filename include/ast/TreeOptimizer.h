#ifndef TREE_OPTIMIZER_H
#define TREE_OPTIMIZER_H

#include "ast/AstNode.h"
#include "evaluator/EvaluationContext.h"
#include "evaluator/FunctionRegistry.h"

/**
 * Folds variable-free subtrees into literals: (+ 2 (* 3 4)) becomes 14.
 * A subtree whose evaluation fails (division by zero, unknown function)
 * is kept as written so the failure is reported when the formula runs.
 * Folding never lifts a subtree out of the evaluation depth limit: one
 * that is too deep at its position stays unfolded along with its children.
 */
class TreeOptimizer {
public:
    explicit TreeOptimizer(const FunctionRegistry &functions);

    // Returns a new tree; `root` is left untouched.
    AstNodePtr optimize(const AstNode &root, const EvaluationContext &context) const;

    int foldedCount() const { return m_folded; }

private:
    // `depth` is the node's evaluation depth in the full tree (root = 1)
    AstNodePtr fold(const AstNode &node, const EvaluationContext &context, int depth) const;

    const FunctionRegistry &m_functions;
    mutable int m_folded = 0;
};

#endif // TREE_OPTIMIZER_H
