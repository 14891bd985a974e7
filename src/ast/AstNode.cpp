#include "ast/AstNode.h"
#include <algorithm>

// ═══════════════════════════════════════════════════════════════════
// Factories
// ═══════════════════════════════════════════════════════════════════

AstNodePtr AstNode::number(double value) {
  auto node = std::make_unique<AstNode>();
  node->kind = Kind::Number;
  node->value = value;
  return node;
}

AstNodePtr AstNode::boolean(bool value) {
  auto node = std::make_unique<AstNode>();
  node->kind = Kind::Boolean;
  node->boolValue = value;
  return node;
}

AstNodePtr AstNode::variable(const QString &name) {
  auto node = std::make_unique<AstNode>();
  node->kind = Kind::Variable;
  node->name = name;
  return node;
}

AstNodePtr AstNode::unaryOp(const QString &op, AstNodePtr operand) {
  auto node = std::make_unique<AstNode>();
  node->kind = Kind::UnaryOp;
  node->name = op;
  node->left = std::move(operand);
  return node;
}

AstNodePtr AstNode::binaryOp(const QString &op, AstNodePtr left, AstNodePtr right) {
  auto node = std::make_unique<AstNode>();
  node->kind = Kind::BinaryOp;
  node->name = op;
  node->left = std::move(left);
  node->right = std::move(right);
  return node;
}

AstNodePtr AstNode::functionCall(const QString &name, std::vector<AstNodePtr> args) {
  auto node = std::make_unique<AstNode>();
  node->kind = Kind::FunctionCall;
  node->name = name;
  node->args = std::move(args);
  return node;
}

AstNodePtr AstNode::ifNode(AstNodePtr condition, AstNodePtr thenBranch,
                           AstNodePtr elseBranch) {
  auto node = std::make_unique<AstNode>();
  node->kind = Kind::If;
  node->name = "IF";
  node->left = std::move(condition);
  node->middle = std::move(thenBranch);
  node->right = std::move(elseBranch);
  return node;
}

AstNodePtr AstNode::clone() const {
  auto copy = std::make_unique<AstNode>();
  copy->kind = kind;
  copy->value = value;
  copy->boolValue = boolValue;
  copy->name = name;
  if (left)
    copy->left = left->clone();
  if (middle)
    copy->middle = middle->clone();
  if (right)
    copy->right = right->clone();
  for (const AstNodePtr &arg : args)
    copy->args.push_back(arg->clone());
  return copy;
}

// ═══════════════════════════════════════════════════════════════════
// Introspection
// ═══════════════════════════════════════════════════════════════════

QString AstNode::kindName(Kind kind) {
  switch (kind) {
  case Kind::Number:
    return "Number";
  case Kind::Boolean:
    return "Boolean";
  case Kind::Variable:
    return "Variable";
  case Kind::UnaryOp:
    return "UnaryOp";
  case Kind::BinaryOp:
    return "BinaryOp";
  case Kind::FunctionCall:
    return "FunctionCall";
  case Kind::If:
    return "If";
  }
  return "Unknown";
}

QString AstNode::toString() const {
  switch (kind) {
  case Kind::Number:
    return QString::number(value, 'g', 17);
  case Kind::Boolean:
    return boolValue ? "TRUE" : "FALSE";
  case Kind::Variable:
    return name;
  case Kind::UnaryOp:
    return QString("(%1 %2)").arg(name, left->toString());
  case Kind::BinaryOp:
    return QString("(%1 %2 %3)").arg(name, left->toString(), right->toString());
  case Kind::FunctionCall: {
    QStringList parts;
    parts << name;
    for (const AstNodePtr &arg : args)
      parts << arg->toString();
    return "(" + parts.join(' ') + ")";
  }
  case Kind::If:
    return QString("(IF %1 %2 %3)")
        .arg(left->toString(), middle->toString(), right->toString());
  }
  return QString();
}

bool AstNode::structurallyEquals(const AstNode &other) const {
  if (kind != other.kind || name != other.name || args.size() != other.args.size())
    return false;
  if (kind == Kind::Number && value != other.value)
    return false;
  if (kind == Kind::Boolean && boolValue != other.boolValue)
    return false;

  auto same = [](const AstNodePtr &a, const AstNodePtr &b) {
    if (!a || !b)
      return !a && !b;
    return a->structurallyEquals(*b);
  };
  if (!same(left, other.left) || !same(middle, other.middle) || !same(right, other.right))
    return false;
  for (size_t i = 0; i < args.size(); ++i)
    if (!same(args[i], other.args[i]))
      return false;
  return true;
}

int AstNode::depth() const {
  int deepest = 0;
  for (const AstNode *child : {left.get(), middle.get(), right.get()})
    if (child)
      deepest = std::max(deepest, child->depth());
  for (const AstNodePtr &arg : args)
    deepest = std::max(deepest, arg->depth());
  return deepest + 1;
}

int AstNode::nodeCount() const {
  int count = 1;
  for (const AstNode *child : {left.get(), middle.get(), right.get()})
    if (child)
      count += child->nodeCount();
  for (const AstNodePtr &arg : args)
    count += arg->nodeCount();
  return count;
}

bool AstNode::referencesVariables() const {
  if (kind == Kind::Variable)
    return true;
  for (const AstNode *child : {left.get(), middle.get(), right.get()})
    if (child && child->referencesVariables())
      return true;
  for (const AstNodePtr &arg : args)
    if (arg->referencesVariables())
      return true;
  return false;
}

QStringList AstNode::variables() const {
  QStringList out;
  collectVariables(out);
  return out;
}

QStringList AstNode::functions() const {
  QStringList out;
  collectFunctions(out);
  return out;
}

void AstNode::collectVariables(QStringList &out) const {
  if (kind == Kind::Variable && !out.contains(name))
    out << name;
  for (const AstNode *child : {left.get(), middle.get(), right.get()})
    if (child)
      child->collectVariables(out);
  for (const AstNodePtr &arg : args)
    arg->collectVariables(out);
}

void AstNode::collectFunctions(QStringList &out) const {
  if (kind == Kind::FunctionCall && !out.contains(name.toUpper()))
    out << name.toUpper();
  for (const AstNode *child : {left.get(), middle.get(), right.get()})
    if (child)
      child->collectFunctions(out);
  for (const AstNodePtr &arg : args)
    arg->collectFunctions(out);
}
