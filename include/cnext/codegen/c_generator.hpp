// cnext/codegen/c_generator.hpp - C implementation file generator
#pragma once

#include <set>
#include <string>
#include <string_view>
#include <utility>

#include "cnext/ast/ast.hpp"
#include "cnext/codegen/c_types.hpp"
#include "cnext/codegen/code_writer.hpp"
#include "cnext/sema/resolution/module_info.hpp"

namespace cnext
{

/**
 * Emits the `.c` file of one analyzed module.
 *
 * Runs only on modules that passed every check, so it trusts the
 * annotations left by the sema passes and reports nothing itself.
 *
 * Lowering:
 * - `x[i]`, `x[s, w]` and bitmap fields become shift/mask expressions
 *   sized by the operand width; writes become read-modify-write of the
 *   whole operand.
 * - `arr[offset, length] <- v` becomes a byte memcpy.
 * - string assignment and comparison go through <string.h>.
 * - `T.MIN` / `T.MAX` print the <stdint.h> or <float.h> macro.
 * - `+<-`, `-<-` and `*<-` on an integer variable not declared `wrap`
 *   call a saturating `cnx_clamp_<op>_<type>` helper emitted at the top
 *   of the file.
 * - comments before functions, globals and statements are copied in
 *   front of their C counterparts.
 * - parameters written by the callee pass by pointer; the caller passes
 *   `&arg`, or a compound literal for non-lvalue arguments.
 */
class CGenerator
{
public:
  explicit CGenerator(const ModuleInfo & module) : module_(module) {}

  /// Contents of `<stem>.c`.
  [[nodiscard]] std::string generate();

private:
  // Declarations
  void emit_decl(const Decl * decl);
  void emit_global(const GlobalVarDecl * global);
  void emit_function(const FunctionDecl * fn);

  // Statements
  void emit_block_body(const BlockStmt * block);
  void emit_stmt(const Stmt * stmt);
  void emit_if(const IfStmt * stmt);
  void emit_switch(const SwitchStmt * stmt);
  void emit_case_body(const BlockStmt * body);
  /// Statement text without `;` (also used for `for` clauses).
  [[nodiscard]] std::string simple_stmt(const Stmt * stmt);
  [[nodiscard]] std::string var_decl(const VarDeclStmt * decl);
  [[nodiscard]] std::string assignment(const AssignStmt * stmt);
  [[nodiscard]] static std::string bit_write(
    const std::string & operand, const TypeInfo & operand_type, const std::string & start,
    const std::string & mask, const std::string & value);
  [[nodiscard]] std::string bit_range_mask(const Expr * width, uint32_t bits);
  [[nodiscard]] std::string slice_write(const IndexExpr * slice, const Expr * value);
  [[nodiscard]] std::string string_assign(const Expr * target, const Expr * value);
  /// Integer type of a clamped compound target, or nullptr.
  [[nodiscard]] static const TypeInfo * clamp_target(const AssignStmt * stmt);
  [[nodiscard]] std::string clamped_assign(const AssignStmt * stmt, const TypeInfo & type);
  void emit_clamp_helpers(CodeWriter & w) const;
  void emit_comments_before(const AstNode * node);

  // Expressions
  [[nodiscard]] std::string expr(const Expr * e);
  /// Like expr(), but aggregate literals print as brace initializers.
  [[nodiscard]] std::string initializer(const Expr * e);
  [[nodiscard]] std::string int_literal(const IntLiteralExpr * lit, const TypeInfo * type);
  [[nodiscard]] std::string negated_literal(const IntLiteralExpr * lit, const TypeInfo * type);
  [[nodiscard]] std::string float_literal(const FloatLiteralExpr * lit);
  [[nodiscard]] std::string var_ref(const VarRefExpr * ref);
  [[nodiscard]] std::string binary(const BinaryExpr * bin);
  [[nodiscard]] std::string unary(const UnaryExpr * un);
  [[nodiscard]] std::string member(const MemberExpr * mem);
  [[nodiscard]] std::string index(const IndexExpr * idx);
  [[nodiscard]] std::string call(const CallExpr * call);
  [[nodiscard]] std::string call_argument(const CallExpr * call, size_t i);
  [[nodiscard]] std::string array_literal(const ArrayLiteralExpr * lit, bool braces_only);
  [[nodiscard]] std::string struct_literal(const StructLiteralExpr * lit, bool braces_only);
  [[nodiscard]] std::string boundary(const TypeInfo & t, bool is_max);

  /// Composite literal `&(T){value}` or `&value`.
  [[nodiscard]] std::string address_of(const Expr * value, const TypeInfo & type);
  [[nodiscard]] static bool is_lvalue(const Expr * e);

  void require(std::string_view header) { headers_.emplace(header); }

  const ModuleInfo & module_;
  CodeWriter out_;
  CommentCursor comments_;
  /// System headers the body needs beyond those the .h includes
  std::set<std::string, std::less<>> headers_;
  /// (operation, C-Next type) pairs such as ("add", "u8")
  std::set<std::pair<std::string, std::string>> clampHelpers_;
};

}  // namespace cnext
