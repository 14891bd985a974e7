#include "ast/TreeOptimizer.h"
#include "evaluator/Evaluator.h"

TreeOptimizer::TreeOptimizer(const FunctionRegistry &functions) : m_functions(functions) {}

AstNodePtr TreeOptimizer::optimize(const AstNode &root,
                                   const EvaluationContext &context) const {
  m_folded = 0;
  // Constant subtrees must not see the caller's bindings
  EvaluationContext constants = EvaluationContext()
                                    .withStrictMode(context.strictMode())
                                    .withMaxDepth(context.maxDepth())
                                    .withCaching(false);
  return fold(root, constants, 1);
}

AstNodePtr TreeOptimizer::fold(const AstNode &node, const EvaluationContext &context,
                               int depth) const {
  if (node.isLiteral())
    return node.clone();

  if (!node.referencesVariables()) {
    // The subtree is evaluated from depth 1; give it only the budget left
    // at its position in the full tree
    Evaluator evaluator(m_functions);
    EvaluationResult result =
        evaluator.evaluate(node, context.withMaxDepth(context.maxDepth() - depth + 1));
    if (!result.success && result.error.kind == FormulaError::Kind::TooDeep)
      return node.clone();
    if (result.success) {
      if (result.value.userType() == QMetaType::Bool) {
        ++m_folded;
        return AstNode::boolean(result.value.toBool());
      }
      if (Evaluator::isNumeric(result.value)) {
        ++m_folded;
        return AstNode::number(result.value.toDouble());
      }
    }
  }

  switch (node.kind) {
  case AstNode::Kind::UnaryOp:
    return AstNode::unaryOp(node.name, fold(*node.left, context, depth + 1));
  case AstNode::Kind::BinaryOp:
    return AstNode::binaryOp(node.name, fold(*node.left, context, depth + 1),
                             fold(*node.right, context, depth + 1));
  case AstNode::Kind::FunctionCall: {
    std::vector<AstNodePtr> args;
    for (const AstNodePtr &arg : node.args)
      args.push_back(fold(*arg, context, depth + 1));
    return AstNode::functionCall(node.name, std::move(args));
  }
  case AstNode::Kind::If:
    return AstNode::ifNode(fold(*node.left, context, depth + 1),
                           fold(*node.middle, context, depth + 1),
                           fold(*node.right, context, depth + 1));
  case AstNode::Kind::Number:
  case AstNode::Kind::Boolean:
  case AstNode::Kind::Variable:
    break;
  }
  return node.clone();
}
