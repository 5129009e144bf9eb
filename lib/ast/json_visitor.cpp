// xmas/ast/json_visitor.cpp - JSON serialization implementation
//
#include "xmas/ast/json_visitor.hpp"

#include <cstdint>
#include <gsl/span>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

#include "xmas/ast/ast.hpp"
#include "xmas/ast/ast_enums.hpp"
#include "xmas/basic/casting.hpp"
#include "xmas/basic/source_manager.hpp"

namespace xmas
{
namespace
{

using nlohmann::json;

// ============================================================================
// Helper functions
// ============================================================================

uint32_t begin_off(SourceRange r) { return r.get_begin().get_offset(); }
uint32_t end_off(SourceRange r) { return r.get_end().get_offset(); }

json j_range(SourceRange r)
{
  if (r.is_invalid()) {
    return json{{"start", nullptr}, {"end", nullptr}};
  }
  return json{{"start", begin_off(r)}, {"end", end_off(r)}};
}

json j_expr(const Expr * e);
json j_stmt(const Stmt * s);

json j_exprs(gsl::span<Expr * const> exprs)
{
  json arr = json::array();
  for (const auto * e : exprs) arr.push_back(j_expr(e));
  return arr;
}

json j_stmts(gsl::span<Stmt * const> stmts)
{
  json arr = json::array();
  for (const auto * s : stmts) arr.push_back(j_stmt(s));
  return arr;
}

json j_index_component(const IndexComponent * c)
{
  if (!c->is_range) {
    return json{
      {"type", "IndexComponent"},
      {"range", j_range(c->get_range())},
      {"kind", "single"},
      {"index", j_expr(c->single)}};
  }
  return json{
    {"type", "IndexComponent"},
    {"range", j_range(c->get_range())},
    {"kind", "range"},
    {"start", c->start ? j_expr(c->start) : json(nullptr)},
    {"end", c->end ? j_expr(c->end) : json(nullptr)}};
}

// ============================================================================
// Expression serialization
// ============================================================================

json j_expr(const Expr * e)
{
  if (!e) return json{{"type", "MissingExpr"}, {"range", j_range({})}};

  if (isa<NumberLiteralExpr>(e)) {
    const auto * lit = cast<NumberLiteralExpr>(e);
    return json{
      {"type", "NumberLiteralExpr"}, {"range", j_range(lit->get_range())}, {"value", lit->value}};
  }

  if (isa<BoolLiteralExpr>(e)) {
    const auto * lit = cast<BoolLiteralExpr>(e);
    return json{
      {"type", "BoolLiteralExpr"}, {"range", j_range(lit->get_range())}, {"value", lit->value}};
  }

  if (isa<StringLiteralExpr>(e)) {
    const auto * lit = cast<StringLiteralExpr>(e);
    return json{
      {"type", "StringLiteralExpr"},
      {"range", j_range(lit->get_range())},
      {"value", std::string(lit->value)}};
  }

  if (isa<VarRefExpr>(e)) {
    const auto * ref = cast<VarRefExpr>(e);
    return json{
      {"type", "VarRefExpr"},
      {"range", j_range(ref->get_range())},
      {"name", std::string(ref->name)}};
  }

  if (isa<InputRefExpr>(e)) {
    return json{{"type", "InputRefExpr"}, {"range", j_range(e->get_range())}};
  }

  if (isa<ReturnValueExpr>(e)) {
    return json{{"type", "ReturnValueExpr"}, {"range", j_range(e->get_range())}};
  }

  if (isa<ArrayLiteralExpr>(e)) {
    const auto * arr = cast<ArrayLiteralExpr>(e);
    return json{
      {"type", "ArrayLiteralExpr"},
      {"range", j_range(arr->get_range())},
      {"elements", j_exprs(arr->elements)}};
  }

  if (isa<RangeLiteralExpr>(e)) {
    const auto * rng = cast<RangeLiteralExpr>(e);
    return json{
      {"type", "RangeLiteralExpr"},
      {"range", j_range(rng->get_range())},
      {"start", j_expr(rng->start)},
      {"end", j_expr(rng->end)}};
  }

  if (isa<UnaryExpr>(e)) {
    const auto * un = cast<UnaryExpr>(e);
    return json{
      {"type", "UnaryExpr"},
      {"range", j_range(un->get_range())},
      {"op", std::string(to_string(un->op))},
      {"operand", j_expr(un->operand)}};
  }

  if (isa<BinaryExpr>(e)) {
    const auto * bin = cast<BinaryExpr>(e);
    return json{
      {"type", "BinaryExpr"},
      {"range", j_range(bin->get_range())},
      {"op", std::string(to_string(bin->op))},
      {"lhs", j_expr(bin->lhs)},
      {"rhs", j_expr(bin->rhs)}};
  }

  if (isa<PipeExpr>(e)) {
    const auto * pipe = cast<PipeExpr>(e);
    return json{
      {"type", "PipeExpr"},
      {"range", j_range(pipe->get_range())},
      {"lhs", j_expr(pipe->lhs)},
      {"rhs", j_expr(pipe->rhs)}};
  }

  if (isa<CallExpr>(e)) {
    const auto * call = cast<CallExpr>(e);
    return json{
      {"type", "CallExpr"},
      {"range", j_range(call->get_range())},
      {"callee", std::string(call->callee)},
      {"args", j_exprs(call->args)}};
  }

  if (isa<IndexExpr>(e)) {
    const auto * idx = cast<IndexExpr>(e);
    json comps = json::array();
    for (const auto * c : idx->components) comps.push_back(j_index_component(c));
    return json{
      {"type", "IndexExpr"},
      {"range", j_range(idx->get_range())},
      {"base", j_expr(idx->base)},
      {"components", comps}};
  }

  if (isa<BuiltinExpr>(e)) {
    const auto * b = cast<BuiltinExpr>(e);
    json j{
      {"type", "BuiltinExpr"},
      {"range", j_range(b->get_range())},
      {"builtin", std::string(to_string(b->builtin))},
      {"args", j_exprs(b->args)}};
    if (b->builtin == BuiltinKind::For) {
      j["loopVar"] = std::string(b->loop_var);
    }
    return j;
  }

  if (isa<MethodCallExpr>(e)) {
    const auto * m = cast<MethodCallExpr>(e);
    return json{
      {"type", "MethodCallExpr"},
      {"range", j_range(m->get_range())},
      {"object", j_expr(m->object)},
      {"method", std::string(m->method)},
      {"args", j_exprs(m->args)}};
  }

  if (isa<BlockExpr>(e)) {
    const auto * blk = cast<BlockExpr>(e);
    return json{
      {"type", "BlockExpr"},
      {"range", j_range(blk->get_range())},
      {"statements", j_stmts(blk->statements)}};
  }

  return json{{"type", "UnknownExpr"}, {"range", j_range(e->get_range())}};
}

// ============================================================================
// Statement serialization
// ============================================================================

json j_stmt(const Stmt * s)
{
  if (!s) return json{{"type", "MissingStmt"}, {"range", j_range({})}};

  if (isa<AssignStmt>(s)) {
    const auto * as = cast<AssignStmt>(s);
    return json{
      {"type", "AssignStmt"},
      {"range", j_range(as->get_range())},
      {"name", std::string(as->name)},
      {"value", j_expr(as->value)}};
  }

  if (isa<CompoundAssignStmt>(s)) {
    const auto * ca = cast<CompoundAssignStmt>(s);
    return json{
      {"type", "CompoundAssignStmt"},
      {"range", j_range(ca->get_range())},
      {"target", std::string(ca->target)},
      {"op", std::string(to_assign_string(ca->op))},
      {"value", j_expr(ca->value)}};
  }

  if (isa<ReturnStmt>(s)) {
    const auto * ret = cast<ReturnStmt>(s);
    json j{
      {"type", "ReturnStmt"}, {"range", j_range(ret->get_range())}, {"value", j_expr(ret->value)}};
    j["name"] = ret->name ? json(std::string(*ret->name)) : json(nullptr);
    return j;
  }

  if (isa<FunctionDefStmt>(s)) {
    const auto * fn = cast<FunctionDefStmt>(s);
    json params = json::array();
    for (const auto & p : fn->params) params.push_back(std::string(p));
    return json{
      {"type", "FunctionDefStmt"},
      {"range", j_range(fn->get_range())},
      {"name", std::string(fn->name)},
      {"params", params},
      {"body", j_expr(fn->body)}};
  }

  if (isa<ExprStmt>(s)) {
    const auto * es = cast<ExprStmt>(s);
    return json{
      {"type", "ExprStmt"}, {"range", j_range(es->get_range())}, {"expr", j_expr(es->expr)}};
  }

  return json{{"type", "UnknownStmt"}, {"range", j_range(s->get_range())}};
}

}  // namespace

// ============================================================================
// Public API
// ============================================================================

nlohmann::json to_json(const AstNode * node)
{
  if (!node) return nlohmann::json{{"type", "null"}, {"range", j_range({})}};

  if (isa<Program>(node)) {
    return to_json(cast<Program>(node));
  }
  if (isa<Stmt>(node)) {
    return j_stmt(cast<Stmt>(node));
  }
  if (isa<Expr>(node)) {
    return j_expr(cast<Expr>(node));
  }
  if (isa<IndexComponent>(node)) {
    return j_index_component(cast<IndexComponent>(node));
  }

  return nlohmann::json{{"type", "UnknownNode"}, {"range", j_range(node->get_range())}};
}

nlohmann::json to_json(const Program * program)
{
  if (!program)
    return nlohmann::json{
      {"type", "Program"}, {"range", j_range({})}, {"statements", nlohmann::json::array()}};

  return nlohmann::json{
    {"type", "Program"},
    {"range", j_range(program->get_range())},
    {"statements", j_stmts(program->statements)}};
}

}  // namespace xmas
