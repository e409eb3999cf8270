// cnext/sema/analysis/switch_checker.hpp - Switch exhaustiveness checks
#pragma once

#include <string_view>

#include "cnext/ast/ast.hpp"
#include "cnext/ast/visitor.hpp"
#include "cnext/basic/diagnostic.hpp"
#include "cnext/symbols/symbol_table.hpp"

namespace cnext
{

/**
 * Switch checker (E0801 to E0806).
 *
 * Enum switches must name every variant, either with cases alone or with
 * cases plus `default(n)` where n is the number of variants left over.
 * A plain `default` on an enum would silently absorb variants added later,
 * so it is rejected. Other switches need a plain `default`.
 *
 * Runs after TypeChecker.
 */
class SwitchChecker : public ConstRecursiveAstVisitor<SwitchChecker>
{
public:
  SwitchChecker(const SymbolTable & table, DiagnosticBag & diags) : table_(table), diags_(diags) {}

  /// Returns true if no errors occurred.
  bool check(const Program & program);

  [[nodiscard]] size_t error_count() const noexcept { return errorCount_; }

  // Visitor hooks
  bool visit_switch_stmt(const SwitchStmt * node);

private:
  void check_enum_switch(const SwitchStmt * node, const EnumInfo & info, std::string_view name);
  void check_value_switch(const SwitchStmt * node);

  /// Variant named by a case label ("RED" for `Color.RED`), or empty.
  [[nodiscard]] static std::string_view label_member(const Expr * label);

  void report(SourceRange range, std::string code, std::string message, std::string help = "");

  const SymbolTable & table_;
  DiagnosticBag & diags_;
  size_t errorCount_ = 0;
};

}  // namespace cnext
