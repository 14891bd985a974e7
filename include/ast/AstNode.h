#ifndef AST_NODE_H
#define AST_NODE_H

/**
 * @file AstNode.h
 * @brief Immutable expression tree produced by the AST builders
 *
 * One tagged struct covers every node kind; the evaluator switches over
 * `kind` exhaustively. Children are owned exclusively by their parent.
 *
 *   Number        value
 *   Boolean       boolValue
 *   Variable      name
 *   UnaryOp       name = operator, left = operand
 *   BinaryOp      name = operator, left, right
 *   FunctionCall  name = function, args
 *   If            left = condition, middle = then, right = else
 */

#include <QString>
#include <QStringList>
#include <memory>
#include <vector>

struct AstNode;
using AstNodePtr = std::unique_ptr<const AstNode>;

struct AstNode {
    enum class Kind {
        Number,
        Boolean,
        Variable,
        UnaryOp,
        BinaryOp,
        FunctionCall,
        If
    };

    Kind kind = Kind::Number;
    double value = 0.0;
    bool boolValue = false;
    QString name;
    AstNodePtr left;
    AstNodePtr middle;
    AstNodePtr right;
    std::vector<AstNodePtr> args;

    // ── Factories ──
    static AstNodePtr number(double value);
    static AstNodePtr boolean(bool value);
    static AstNodePtr variable(const QString &name);
    static AstNodePtr unaryOp(const QString &op, AstNodePtr operand);
    static AstNodePtr binaryOp(const QString &op, AstNodePtr left, AstNodePtr right);
    static AstNodePtr functionCall(const QString &name, std::vector<AstNodePtr> args);
    static AstNodePtr ifNode(AstNodePtr condition, AstNodePtr thenBranch,
                             AstNodePtr elseBranch);

    AstNodePtr clone() const;

    // Canonical prefix form: (+ 2 (* 3 4)), (IF (> days 5) 10 15)
    QString toString() const;
    bool structurallyEquals(const AstNode &other) const;

    int depth() const;
    int nodeCount() const;
    bool isLiteral() const { return kind == Kind::Number || kind == Kind::Boolean; }
    bool referencesVariables() const;

    // Names in first-appearance order, without duplicates. Bare identifiers
    // used as values are reported as variables too.
    QStringList variables() const;
    QStringList functions() const;

    static QString kindName(Kind kind);

private:
    void collectVariables(QStringList &out) const;
    void collectFunctions(QStringList &out) const;
};

#endif // AST_NODE_H
