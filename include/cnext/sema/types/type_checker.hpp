// cnext/sema/types/type_checker.hpp - Expression typing and type checks
//
// Annotates every expression with its TypeInfo and classifies index and
// member expressions whose meaning depends on the operand type.
// Runs after NameResolver.
//
#pragma once

#include <map>
#include <string>
#include <string_view>

#include "cnext/ast/ast.hpp"
#include "cnext/basic/diagnostic.hpp"
#include "cnext/sema/resolution/module_info.hpp"
#include "cnext/symbols/symbol_table.hpp"

namespace cnext
{

/**
 * Type checker for one module.
 *
 * Typing is bidirectional in a small way: literals and aggregate
 * initializers take the type expected by their context (declaration,
 * assignment target, parameter, other operand), everything else is
 * synthesized bottom-up.
 *
 * Reports E0304 (mismatch / invalid operand), E0306 (string literal longer
 * than the string capacity) and E0307 (argument count). Bit and slice
 * checks are left to BitAccessChecker, which reads the classification
 * made here.
 */
class TypeChecker
{
public:
  TypeChecker(ModuleInfo & module, const SymbolTable & table, DiagnosticBag & diags)
  : module_(module), table_(table), diags_(diags)
  {
  }

  /// Returns true if no errors occurred.
  bool check();

  [[nodiscard]] size_t error_count() const noexcept { return errorCount_; }

private:
  // Declarations
  void check_decl(Decl * decl);
  void check_function(FunctionDecl * fn);

  // Statements
  void check_stmt(Stmt * stmt);
  void check_block(BlockStmt * block);
  void check_condition(Expr * cond);
  void check_assign(AssignStmt * stmt);
  void check_return(ReturnStmt * stmt);
  void check_switch(SwitchStmt * stmt);

  // Expressions
  const TypeInfo * infer(Expr * expr, const TypeInfo * expected = nullptr);
  const TypeInfo * infer_ref(VarRefExpr * ref);
  const TypeInfo * infer_binary(BinaryExpr * bin, const TypeInfo * expected);
  const TypeInfo * infer_unary(UnaryExpr * un, const TypeInfo * expected);
  const TypeInfo * infer_member(MemberExpr * mem);
  const TypeInfo * infer_index(IndexExpr * idx);
  const TypeInfo * infer_call(CallExpr * call);
  const TypeInfo * infer_int_literal(IntLiteralExpr * lit, const TypeInfo * expected);
  void check_array_literal(ArrayLiteralExpr * lit, const TypeInfo & target);
  void check_struct_literal(StructLiteralExpr * lit, const TypeInfo & target);

  /// Checks `value` against a declared target type (init, assignment, argument, return).
  void check_value(const TypeInfo & target, Expr * value, std::string_view what);
  [[nodiscard]] bool compatible(const TypeInfo & target, const TypeInfo & value) const;
  [[nodiscard]] static const TypeInfo * decl_type(const AstNode * decl);

  const TypeInfo * store(TypeInfo t) { return module_.types.add(std::move(t)); }
  const TypeInfo * named_primitive(std::string_view name);

  void report(SourceRange range, std::string code, std::string message, std::string help = "");

  ModuleInfo & module_;
  const SymbolTable & table_;
  DiagnosticBag & diags_;

  std::map<std::string, const TypeInfo *, std::less<>> primitives_;
  const FunctionDecl * currentFunction_ = nullptr;
  size_t errorCount_ = 0;
};

}  // namespace cnext
