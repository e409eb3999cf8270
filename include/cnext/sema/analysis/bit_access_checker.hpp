// cnext/sema/analysis/bit_access_checker.hpp - Bit, slice and index bounds checks
//
// Runs after TypeChecker, which classifies every IndexExpr.
//
#pragma once

#include "cnext/ast/ast.hpp"
#include "cnext/ast/visitor.hpp"
#include "cnext/basic/diagnostic.hpp"

namespace cnext
{

/**
 * Bit access checker (E0601 to E0607).
 *
 * Constant bit positions are checked against the operand width.
 * Array slices (`buf[offset, length] <- value`) compile to memcpy and are
 * only accepted as assignment targets of one-dimensional arrays, with
 * constant offset and length that fit both the array and the source value.
 */
class BitAccessChecker : public ConstRecursiveAstVisitor<BitAccessChecker>
{
public:
  explicit BitAccessChecker(DiagnosticBag & diags) : diags_(diags) {}

  /// Returns true if no errors occurred.
  bool check(const Program & program);

  [[nodiscard]] size_t error_count() const noexcept { return errorCount_; }

  // Visitor hooks
  bool visit_assign_stmt(const AssignStmt * node);
  bool visit_index_expr(const IndexExpr * node);

private:
  void check_bit_index(const IndexExpr * node, uint32_t width);
  void check_bit_range(const IndexExpr * node, uint32_t width);
  void check_slice_target(const IndexExpr * node, const Expr * value);
  void check_array_index(const IndexExpr * node);

  void report(SourceRange range, std::string code, std::string message, std::string help = "");

  DiagnosticBag & diags_;
  /// Slice that is the target of the assignment being visited
  const IndexExpr * sliceTarget_ = nullptr;
  const Expr * sliceValue_ = nullptr;
  size_t errorCount_ = 0;
};

}  // namespace cnext
