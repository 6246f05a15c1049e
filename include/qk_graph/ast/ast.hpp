// qk_graph/ast/ast.hpp - AST node class definitions for JavaScript/TypeScript
//
// A closed set of node classes lowered from the tree-sitter concrete syntax
// tree, following the LLVM/Clang style with classof() for RTTI support.
// Parentheses are dropped during lowering; constructs without analytic
// meaning become OpaqueExpr/OpaqueType/EmptyStmt.
//
#pragma once

#include <gsl/span>
#include <string_view>

#include "qk_graph/ast/ast_enums.hpp"
#include "qk_graph/basic/casting.hpp"
#include "qk_graph/basic/source_manager.hpp"

namespace qk_graph
{

struct Binding;  // Local binding attached by LocalBindingResolver
class CallExpr;

// ============================================================================
// Base Classes
// ============================================================================

/**
 * Base class for all AST nodes.
 *
 * Every node carries its NodeKind and a SourceRange. The range includes the
 * FileId, so the origin file of any sub-expression is always known.
 */
class AstNode
{
public:
  const NodeKind kind;
  SourceRange range_;

  AstNode(const AstNode &) = delete;
  AstNode & operator=(const AstNode &) = delete;
  AstNode(AstNode &&) = delete;
  AstNode & operator=(AstNode &&) = delete;

  [[nodiscard]] NodeKind get_kind() const noexcept { return kind; }
  [[nodiscard]] SourceRange get_range() const noexcept { return range_; }
  [[nodiscard]] FileId file_id() const noexcept { return range_.file_id(); }

protected:
  explicit AstNode(NodeKind k, SourceRange r = {}) : kind(k), range_(r) {}
  ~AstNode() = default;
};

/**
 * CRTP base class that implements classof() for a concrete kind.
 */
template <typename Derived, typename Base, NodeKind K>
class NodeBase : public Base
{
public:
  static constexpr NodeKind kind = K;

  static bool classof(const AstNode * node) { return node->get_kind() == K; }

protected:
  explicit NodeBase(SourceRange r = {}) : Base(K, r) {}
};

// ============================================================================
// Category Base Classes
// ============================================================================

class Expr : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_expr_kind(node->kind); }

protected:
  explicit Expr(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

/// Binding target of a declaration, parameter or destructuring assignment.
class Pattern : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_pattern_kind(node->kind); }

protected:
  explicit Pattern(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

class TypeNode : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_type_kind(node->kind); }

protected:
  explicit TypeNode(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

class Stmt : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_stmt_kind(node->kind); }

protected:
  explicit Stmt(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

class Decl : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_decl_kind(node->kind); }

protected:
  explicit Decl(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

// Forward declarations used by node fields
class TypeMember;
class SwitchCase;
class CatchClause;
class BlockStmt;
class VariableDeclarator;
class ImportSpecifier;
class ExportSpecifier;
class Property;

// ============================================================================
// Expression Nodes
// ============================================================================

/// Identifier reference (also used for non-computed member/property names).
class Identifier : public NodeBase<Identifier, Expr, NodeKind::Identifier>
{
public:
  std::string_view name;

  /// Set by LocalBindingResolver for references; nullptr for globals and names
  const Binding * binding = nullptr;

  explicit Identifier(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

/// String literal; `value` holds the cooked (unescaped) text.
class StringLiteral : public NodeBase<StringLiteral, Expr, NodeKind::StringLiteral>
{
public:
  std::string_view value;

  explicit StringLiteral(std::string_view v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

/// Numeric or bigint literal.
class NumberLiteral : public NodeBase<NumberLiteral, Expr, NodeKind::NumberLiteral>
{
public:
  std::string_view raw;
  double value;
  bool isBigInt = false;

  NumberLiteral(std::string_view raw_text, double v, SourceRange r = {})
  : NodeBase(r), raw(raw_text), value(v)
  {
  }
};

class BooleanLiteral : public NodeBase<BooleanLiteral, Expr, NodeKind::BooleanLiteral>
{
public:
  bool value;

  explicit BooleanLiteral(bool v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

class NullLiteral : public NodeBase<NullLiteral, Expr, NodeKind::NullLiteral>
{
public:
  explicit NullLiteral(SourceRange r = {}) : NodeBase(r) {}
};

/// Template literal: quasis.size() == expressions.size() + 1.
class TemplateLiteral : public NodeBase<TemplateLiteral, Expr, NodeKind::TemplateLiteral>
{
public:
  gsl::span<std::string_view> quasis;
  gsl::span<Expr *> expressions;

  TemplateLiteral(gsl::span<std::string_view> q, gsl::span<Expr *> e, SourceRange r = {})
  : NodeBase(r), quasis(q), expressions(e)
  {
  }
};

/// Array literal. Holes are stored as nullptr.
class ArrayExpr : public NodeBase<ArrayExpr, Expr, NodeKind::ArrayExpr>
{
public:
  gsl::span<Expr *> elements;

  explicit ArrayExpr(gsl::span<Expr *> elems, SourceRange r = {}) : NodeBase(r), elements(elems)
  {
  }
};

/// Object literal. Members are Property or SpreadElement nodes.
class ObjectExpr : public NodeBase<ObjectExpr, Expr, NodeKind::ObjectExpr>
{
public:
  gsl::span<AstNode *> properties;

  explicit ObjectExpr(gsl::span<AstNode *> props, SourceRange r = {})
  : NodeBase(r), properties(props)
  {
  }
};

/// `...argument` inside arrays, objects and call arguments.
class SpreadElement : public NodeBase<SpreadElement, Expr, NodeKind::SpreadElement>
{
public:
  Expr * argument;

  explicit SpreadElement(Expr * arg, SourceRange r = {}) : NodeBase(r), argument(arg) {}
};

/// `object.property`, `object[property]`, `object?.property`.
class MemberExpr : public NodeBase<MemberExpr, Expr, NodeKind::MemberExpr>
{
public:
  Expr * object;
  Expr * property;  ///< Identifier when !computed
  bool computed;
  bool optional;

  MemberExpr(Expr * obj, Expr * prop, bool is_computed, bool is_optional, SourceRange r = {})
  : NodeBase(r), object(obj), property(prop), computed(is_computed), optional(is_optional)
  {
  }
};

class CallExpr : public NodeBase<CallExpr, Expr, NodeKind::CallExpr>
{
public:
  Expr * callee;
  gsl::span<Expr *> arguments;
  gsl::span<TypeNode *> typeArguments;
  bool optional;

  CallExpr(Expr * c, gsl::span<Expr *> args, bool is_optional, SourceRange r = {})
  : NodeBase(r), callee(c), arguments(args), optional(is_optional)
  {
  }
};

class NewExpr : public NodeBase<NewExpr, Expr, NodeKind::NewExpr>
{
public:
  Expr * callee;
  gsl::span<Expr *> arguments;

  NewExpr(Expr * c, gsl::span<Expr *> args, SourceRange r = {})
  : NodeBase(r), callee(c), arguments(args)
  {
  }
};

/**
 * Function expression, arrow function, or method body.
 *
 * `body` is a BlockStmt, or an Expr for expression-bodied arrows.
 * FunctionDecl wraps one of these.
 */
class FunctionExpr : public NodeBase<FunctionExpr, Expr, NodeKind::FunctionExpr>
{
public:
  std::string_view name;
  gsl::span<AstNode *> params;  ///< Pattern nodes
  AstNode * body = nullptr;
  TypeNode * returnType = nullptr;
  bool isArrow = false;
  bool isAsync = false;

  /// Call that receives this function directly as an argument (set by LocalBindingResolver)
  const CallExpr * enclosingCall = nullptr;

  FunctionExpr(gsl::span<AstNode *> p, AstNode * b, bool arrow, SourceRange r = {})
  : NodeBase(r), params(p), body(b), isArrow(arrow)
  {
  }
};

/// Class expression; members are Property nodes (methods, accessors, fields).
class ClassExpr : public NodeBase<ClassExpr, Expr, NodeKind::ClassExpr>
{
public:
  std::string_view name;
  Expr * superClass = nullptr;
  gsl::span<Property *> members;

  explicit ClassExpr(gsl::span<Property *> m, SourceRange r = {}) : NodeBase(r), members(m) {}
};

/// Unary operators, including `typeof`, `void`, `delete`.
class UnaryExpr : public NodeBase<UnaryExpr, Expr, NodeKind::UnaryExpr>
{
public:
  std::string_view op;
  Expr * argument;

  UnaryExpr(std::string_view o, Expr * arg, SourceRange r = {}) : NodeBase(r), op(o), argument(arg)
  {
  }
};

class UpdateExpr : public NodeBase<UpdateExpr, Expr, NodeKind::UpdateExpr>
{
public:
  std::string_view op;
  bool prefix;
  Expr * argument;

  UpdateExpr(std::string_view o, bool is_prefix, Expr * arg, SourceRange r = {})
  : NodeBase(r), op(o), prefix(is_prefix), argument(arg)
  {
  }
};

/// Arithmetic, comparison, `in` and `instanceof`.
class BinaryExpr : public NodeBase<BinaryExpr, Expr, NodeKind::BinaryExpr>
{
public:
  std::string_view op;
  Expr * left;
  Expr * right;

  BinaryExpr(std::string_view o, Expr * l, Expr * rhs, SourceRange r = {})
  : NodeBase(r), op(o), left(l), right(rhs)
  {
  }
};

/// `&&`, `||`, `??`.
class LogicalExpr : public NodeBase<LogicalExpr, Expr, NodeKind::LogicalExpr>
{
public:
  std::string_view op;
  Expr * left;
  Expr * right;

  LogicalExpr(std::string_view o, Expr * l, Expr * rhs, SourceRange r = {})
  : NodeBase(r), op(o), left(l), right(rhs)
  {
  }
};

class ConditionalExpr : public NodeBase<ConditionalExpr, Expr, NodeKind::ConditionalExpr>
{
public:
  Expr * test;
  Expr * consequent;
  Expr * alternate;

  ConditionalExpr(Expr * t, Expr * c, Expr * a, SourceRange r = {})
  : NodeBase(r), test(t), consequent(c), alternate(a)
  {
  }
};

/// `left op= right`; left is an Expr or a Pattern (destructuring assignment).
class AssignmentExpr : public NodeBase<AssignmentExpr, Expr, NodeKind::AssignmentExpr>
{
public:
  std::string_view op;
  AstNode * left;
  Expr * right;

  AssignmentExpr(std::string_view o, AstNode * l, Expr * rhs, SourceRange r = {})
  : NodeBase(r), op(o), left(l), right(rhs)
  {
  }
};

class SequenceExpr : public NodeBase<SequenceExpr, Expr, NodeKind::SequenceExpr>
{
public:
  gsl::span<Expr *> expressions;

  explicit SequenceExpr(gsl::span<Expr *> e, SourceRange r = {}) : NodeBase(r), expressions(e) {}
};

/// `x as T`, `x satisfies T`, `x!`, `<T>x`.
class TsCastExpr : public NodeBase<TsCastExpr, Expr, NodeKind::TsCastExpr>
{
public:
  CastKind castKind;
  Expr * expression;
  TypeNode * type = nullptr;

  TsCastExpr(CastKind k, Expr * e, TypeNode * t, SourceRange r = {})
  : NodeBase(r), castKind(k), expression(e), type(t)
  {
  }
};

/// `await x` or `yield x`.
class AwaitExpr : public NodeBase<AwaitExpr, Expr, NodeKind::AwaitExpr>
{
public:
  Expr * argument;
  bool isYield = false;

  AwaitExpr(Expr * arg, bool yield, SourceRange r = {})
  : NodeBase(r), argument(arg), isYield(yield)
  {
  }
};

class ThisExpr : public NodeBase<ThisExpr, Expr, NodeKind::ThisExpr>
{
public:
  explicit ThisExpr(SourceRange r = {}) : NodeBase(r) {}
};

/// JSX element or fragment. Attributes are JsxAttribute or SpreadElement.
class JsxElement : public NodeBase<JsxElement, Expr, NodeKind::JsxElement>
{
public:
  std::string_view name;  ///< Empty for fragments
  gsl::span<AstNode *> attributes;
  gsl::span<Expr *> children;

  JsxElement(
    std::string_view n, gsl::span<AstNode *> attrs, gsl::span<Expr *> kids, SourceRange r = {})
  : NodeBase(r), name(n), attributes(attrs), children(kids)
  {
  }
};

/**
 * Expression without analytic meaning (regex, tagged template, import(),
 * `super`, `import.meta`, parse-error fragments).
 *
 * Nested nodes are kept in `children` so calls inside are still visited.
 */
class OpaqueExpr : public NodeBase<OpaqueExpr, Expr, NodeKind::OpaqueExpr>
{
public:
  std::string_view label;  ///< tree-sitter node type
  gsl::span<AstNode *> children;

  OpaqueExpr(std::string_view l, gsl::span<AstNode *> kids, SourceRange r = {})
  : NodeBase(r), label(l), children(kids)
  {
  }
};

// ============================================================================
// Pattern Nodes
// ============================================================================

class BindingIdentifier : public NodeBase<BindingIdentifier, Pattern, NodeKind::BindingIdentifier>
{
public:
  std::string_view name;
  TypeNode * type = nullptr;
  const Binding * binding = nullptr;

  explicit BindingIdentifier(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

/// `{ a, b: c, ...rest }`; members are PatternProperty or RestElement.
class ObjectPattern : public NodeBase<ObjectPattern, Pattern, NodeKind::ObjectPattern>
{
public:
  gsl::span<AstNode *> properties;
  TypeNode * type = nullptr;

  explicit ObjectPattern(gsl::span<AstNode *> props, SourceRange r = {})
  : NodeBase(r), properties(props)
  {
  }
};

/// `[a, , b]`; holes are nullptr.
class ArrayPattern : public NodeBase<ArrayPattern, Pattern, NodeKind::ArrayPattern>
{
public:
  gsl::span<AstNode *> elements;
  TypeNode * type = nullptr;

  explicit ArrayPattern(gsl::span<AstNode *> elems, SourceRange r = {})
  : NodeBase(r), elements(elems)
  {
  }
};

/// `left = right` default value.
class AssignmentPattern : public NodeBase<AssignmentPattern, Pattern, NodeKind::AssignmentPattern>
{
public:
  AstNode * left;
  Expr * right;

  AssignmentPattern(AstNode * l, Expr * rhs, SourceRange r = {}) : NodeBase(r), left(l), right(rhs)
  {
  }
};

class RestElement : public NodeBase<RestElement, Pattern, NodeKind::RestElement>
{
public:
  AstNode * argument;
  TypeNode * type = nullptr;

  explicit RestElement(AstNode * arg, SourceRange r = {}) : NodeBase(r), argument(arg) {}
};

// ============================================================================
// Type Nodes
// ============================================================================

/// `A`, `ns.A`, `A<T, U>`; `path` holds the dotted entity name segments.
class TypeReference : public NodeBase<TypeReference, TypeNode, NodeKind::TypeReference>
{
public:
  gsl::span<std::string_view> path;
  gsl::span<TypeNode *> typeArguments;

  TypeReference(gsl::span<std::string_view> p, gsl::span<TypeNode *> args, SourceRange r = {})
  : NodeBase(r), path(p), typeArguments(args)
  {
  }
};

/// `typeof a.b`
class TypeQuery : public NodeBase<TypeQuery, TypeNode, NodeKind::TypeQuery>
{
public:
  gsl::span<std::string_view> path;

  explicit TypeQuery(gsl::span<std::string_view> p, SourceRange r = {}) : NodeBase(r), path(p) {}
};

/// Union (`A | B`) or intersection (`A & B`).
class CompositeType : public NodeBase<CompositeType, TypeNode, NodeKind::CompositeType>
{
public:
  gsl::span<TypeNode *> types;
  bool isIntersection;

  CompositeType(gsl::span<TypeNode *> t, bool intersection, SourceRange r = {})
  : NodeBase(r), types(t), isIntersection(intersection)
  {
  }
};

/// `{ a: A; b?: B }`
class TypeLiteral : public NodeBase<TypeLiteral, TypeNode, NodeKind::TypeLiteral>
{
public:
  gsl::span<TypeMember *> members;

  explicit TypeLiteral(gsl::span<TypeMember *> m, SourceRange r = {}) : NodeBase(r), members(m) {}
};

class OpaqueType : public NodeBase<OpaqueType, TypeNode, NodeKind::OpaqueType>
{
public:
  explicit OpaqueType(SourceRange r = {}) : NodeBase(r) {}
};

// ============================================================================
// Statement Nodes
// ============================================================================

class BlockStmt : public NodeBase<BlockStmt, Stmt, NodeKind::BlockStmt>
{
public:
  gsl::span<AstNode *> body;

  explicit BlockStmt(gsl::span<AstNode *> b, SourceRange r = {}) : NodeBase(r), body(b) {}
};

class ExprStmt : public NodeBase<ExprStmt, Stmt, NodeKind::ExprStmt>
{
public:
  Expr * expression;

  explicit ExprStmt(Expr * e, SourceRange r = {}) : NodeBase(r), expression(e) {}
};

class ReturnStmt : public NodeBase<ReturnStmt, Stmt, NodeKind::ReturnStmt>
{
public:
  Expr * argument;  ///< nullptr for bare `return;`

  explicit ReturnStmt(Expr * arg, SourceRange r = {}) : NodeBase(r), argument(arg) {}
};

class IfStmt : public NodeBase<IfStmt, Stmt, NodeKind::IfStmt>
{
public:
  Expr * test;
  AstNode * consequent;
  AstNode * alternate;  ///< nullptr when there is no else branch

  IfStmt(Expr * t, AstNode * c, AstNode * a, SourceRange r = {})
  : NodeBase(r), test(t), consequent(c), alternate(a)
  {
  }
};

class ForStmt : public NodeBase<ForStmt, Stmt, NodeKind::ForStmt>
{
public:
  AstNode * init;  ///< VariableDecl, Expr or nullptr
  Expr * test;
  Expr * update;
  AstNode * body;

  ForStmt(AstNode * i, Expr * t, Expr * u, AstNode * b, SourceRange r = {})
  : NodeBase(r), init(i), test(t), update(u), body(b)
  {
  }
};

/// `for (left in right)` / `for (left of right)`
class ForInOfStmt : public NodeBase<ForInOfStmt, Stmt, NodeKind::ForInOfStmt>
{
public:
  AstNode * left;  ///< VariableDecl, Pattern or Expr
  Expr * right;
  AstNode * body;
  bool isOf;

  ForInOfStmt(AstNode * l, Expr * rhs, AstNode * b, bool of, SourceRange r = {})
  : NodeBase(r), left(l), right(rhs), body(b), isOf(of)
  {
  }
};

/// `while (test) body` or `do body while (test)`
class WhileStmt : public NodeBase<WhileStmt, Stmt, NodeKind::WhileStmt>
{
public:
  Expr * test;
  AstNode * body;
  bool isDoWhile;

  WhileStmt(Expr * t, AstNode * b, bool do_while, SourceRange r = {})
  : NodeBase(r), test(t), body(b), isDoWhile(do_while)
  {
  }
};

class SwitchStmt : public NodeBase<SwitchStmt, Stmt, NodeKind::SwitchStmt>
{
public:
  Expr * discriminant;
  gsl::span<SwitchCase *> cases;

  SwitchStmt(Expr * d, gsl::span<SwitchCase *> c, SourceRange r = {})
  : NodeBase(r), discriminant(d), cases(c)
  {
  }
};

class TryStmt : public NodeBase<TryStmt, Stmt, NodeKind::TryStmt>
{
public:
  BlockStmt * block;
  CatchClause * handler;   ///< may be nullptr
  BlockStmt * finalizer;   ///< may be nullptr

  TryStmt(BlockStmt * b, CatchClause * h, BlockStmt * f, SourceRange r = {})
  : NodeBase(r), block(b), handler(h), finalizer(f)
  {
  }
};

class LabeledStmt : public NodeBase<LabeledStmt, Stmt, NodeKind::LabeledStmt>
{
public:
  std::string_view label;
  AstNode * body;

  LabeledStmt(std::string_view l, AstNode * b, SourceRange r = {}) : NodeBase(r), label(l), body(b)
  {
  }
};

class ThrowStmt : public NodeBase<ThrowStmt, Stmt, NodeKind::ThrowStmt>
{
public:
  Expr * argument;

  explicit ThrowStmt(Expr * arg, SourceRange r = {}) : NodeBase(r), argument(arg) {}
};

/// `;`, `break`, `continue`, `debugger` and TypeScript-only statements.
class EmptyStmt : public NodeBase<EmptyStmt, Stmt, NodeKind::EmptyStmt>
{
public:
  explicit EmptyStmt(SourceRange r = {}) : NodeBase(r) {}
};

// ============================================================================
// Declaration Nodes
// ============================================================================

class VariableDecl : public NodeBase<VariableDecl, Decl, NodeKind::VariableDecl>
{
public:
  VariableKind declKind;
  gsl::span<VariableDeclarator *> declarators;

  VariableDecl(VariableKind k, gsl::span<VariableDeclarator *> d, SourceRange r = {})
  : NodeBase(r), declKind(k), declarators(d)
  {
  }
};

/// `function name(...) {...}`; the function itself is a FunctionExpr.
class FunctionDecl : public NodeBase<FunctionDecl, Decl, NodeKind::FunctionDecl>
{
public:
  BindingIdentifier * id;
  FunctionExpr * function;

  FunctionDecl(BindingIdentifier * i, FunctionExpr * f, SourceRange r = {})
  : NodeBase(r), id(i), function(f)
  {
  }

  [[nodiscard]] std::string_view name() const noexcept
  {
    return id != nullptr ? id->name : std::string_view{};
  }
};

class ClassDecl : public NodeBase<ClassDecl, Decl, NodeKind::ClassDecl>
{
public:
  BindingIdentifier * id;
  ClassExpr * klass;

  ClassDecl(BindingIdentifier * i, ClassExpr * k, SourceRange r = {})
  : NodeBase(r), id(i), klass(k)
  {
  }
};

/// `import ... from 'source'` (also side-effect imports without specifiers).
class ImportDecl : public NodeBase<ImportDecl, Decl, NodeKind::ImportDecl>
{
public:
  std::string_view source;
  gsl::span<ImportSpecifier *> specifiers;
  bool typeOnly = false;

  ImportDecl(std::string_view s, gsl::span<ImportSpecifier *> specs, SourceRange r = {})
  : NodeBase(r), source(s), specifiers(specs)
  {
  }
};

/**
 * `export <declaration>`, `export { a as b }`, `export { a } from 'x'`.
 *
 * Exactly one of `declaration` and `specifiers` is used.
 */
class ExportNamedDecl : public NodeBase<ExportNamedDecl, Decl, NodeKind::ExportNamedDecl>
{
public:
  AstNode * declaration = nullptr;
  gsl::span<ExportSpecifier *> specifiers;
  std::string_view source;
  bool hasSource = false;

  explicit ExportNamedDecl(SourceRange r = {}) : NodeBase(r) {}
};

/// `export default <expr | function | class>`
class ExportDefaultDecl : public NodeBase<ExportDefaultDecl, Decl, NodeKind::ExportDefaultDecl>
{
public:
  AstNode * declaration;

  explicit ExportDefaultDecl(AstNode * d, SourceRange r = {}) : NodeBase(r), declaration(d) {}
};

/// `export * from 'x'` / `export * as ns from 'x'`
class ExportAllDecl : public NodeBase<ExportAllDecl, Decl, NodeKind::ExportAllDecl>
{
public:
  std::string_view source;
  std::string_view exported;  ///< Empty unless `* as name`

  ExportAllDecl(std::string_view s, std::string_view e, SourceRange r = {})
  : NodeBase(r), source(s), exported(e)
  {
  }
};

// ============================================================================
// Supporting Nodes
// ============================================================================

/// Object-literal or class member.
class Property : public NodeBase<Property, AstNode, NodeKind::Property>
{
public:
  PropertyKind propKind;
  Expr * key;    ///< Identifier when !computed (or a literal)
  Expr * value;  ///< FunctionExpr for methods/accessors; may be nullptr for fields
  bool computed = false;
  bool shorthand = false;
  bool isStatic = false;

  Property(PropertyKind k, Expr * key_expr, Expr * v, SourceRange r = {})
  : NodeBase(r), propKind(k), key(key_expr), value(v)
  {
  }
};

/// `key: pattern` member of an ObjectPattern.
class PatternProperty : public NodeBase<PatternProperty, AstNode, NodeKind::PatternProperty>
{
public:
  Expr * key;
  AstNode * value;  ///< Pattern
  bool computed = false;
  bool shorthand = false;

  PatternProperty(Expr * k, AstNode * v, SourceRange r = {}) : NodeBase(r), key(k), value(v) {}
};

class VariableDeclarator
: public NodeBase<VariableDeclarator, AstNode, NodeKind::VariableDeclarator>
{
public:
  AstNode * id;  ///< Pattern
  Expr * init;   ///< may be nullptr

  VariableDeclarator(AstNode * i, Expr * in, SourceRange r = {}) : NodeBase(r), id(i), init(in) {}
};

class ImportSpecifier : public NodeBase<ImportSpecifier, AstNode, NodeKind::ImportSpecifier>
{
public:
  ImportKind importKind;
  std::string_view imported;  ///< Exported name in the source module (Named only)
  BindingIdentifier * local;

  ImportSpecifier(ImportKind k, std::string_view imp, BindingIdentifier * l, SourceRange r = {})
  : NodeBase(r), importKind(k), imported(imp), local(l)
  {
  }
};

class ExportSpecifier : public NodeBase<ExportSpecifier, AstNode, NodeKind::ExportSpecifier>
{
public:
  std::string_view local;
  std::string_view exported;

  ExportSpecifier(std::string_view l, std::string_view e, SourceRange r = {})
  : NodeBase(r), local(l), exported(e)
  {
  }
};

/// `case test:` (test is nullptr for `default:`)
class SwitchCase : public NodeBase<SwitchCase, AstNode, NodeKind::SwitchCase>
{
public:
  Expr * test;
  gsl::span<AstNode *> consequent;

  SwitchCase(Expr * t, gsl::span<AstNode *> c, SourceRange r = {})
  : NodeBase(r), test(t), consequent(c)
  {
  }
};

class CatchClause : public NodeBase<CatchClause, AstNode, NodeKind::CatchClause>
{
public:
  AstNode * param;  ///< Pattern or nullptr
  BlockStmt * body;

  CatchClause(AstNode * p, BlockStmt * b, SourceRange r = {}) : NodeBase(r), param(p), body(b) {}
};

/// `name={value}` or `name="value"`; value is nullptr for bare attributes.
class JsxAttribute : public NodeBase<JsxAttribute, AstNode, NodeKind::JsxAttribute>
{
public:
  std::string_view name;
  Expr * value;

  JsxAttribute(std::string_view n, Expr * v, SourceRange r = {}) : NodeBase(r), name(n), value(v)
  {
  }
};

/// Property signature inside a TypeLiteral.
class TypeMember : public NodeBase<TypeMember, AstNode, NodeKind::TypeMember>
{
public:
  std::string_view name;
  TypeNode * type;  ///< may be nullptr

  TypeMember(std::string_view n, TypeNode * t, SourceRange r = {}) : NodeBase(r), name(n), type(t)
  {
  }
};

// ============================================================================
// Top-level
// ============================================================================

class Program : public NodeBase<Program, AstNode, NodeKind::Program>
{
public:
  gsl::span<AstNode *> body;

  explicit Program(gsl::span<AstNode *> b, SourceRange r = {}) : NodeBase(r), body(b) {}
};

// ============================================================================
// Helpers
// ============================================================================

[[nodiscard]] inline SourceRange get_range(const AstNode * node) noexcept
{
  return node != nullptr ? node->get_range() : SourceRange{};
}

/// Strip TypeScript casts (`as`, `satisfies`, `!`, `<T>`).
[[nodiscard]] inline const Expr * unwrap_expr(const Expr * e) noexcept
{
  while (const auto * cast_expr = dyn_cast<TsCastExpr>(e)) {
    e = cast_expr->expression;
  }
  return e;
}

[[nodiscard]] inline Expr * unwrap_expr(Expr * e) noexcept
{
  while (auto * cast_expr = dyn_cast<TsCastExpr>(e)) {
    e = cast_expr->expression;
  }
  return e;
}

/// dyn_cast<T> applied after unwrap_expr
template <typename T, typename E>
[[nodiscard]] inline auto unwrap_as(E * e) noexcept
{
  return dyn_cast<T>(unwrap_expr(e));
}

}  // namespace qk_graph
