// cnext/sema/switch_checker.cpp - Switch checker implementation
//
#include "cnext/sema/analysis/switch_checker.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <map>
#include <set>
#include <string>
#include <vector>

#include "cnext/basic/casting.hpp"
#include "cnext/sema/types/const_evaluator.hpp"
#include "cnext/symbols/symbol.hpp"
#include "cnext/symbols/type_info.hpp"

namespace cnext
{

bool SwitchChecker::check(const Program & program)
{
  errorCount_ = 0;
  visit(&program);
  return errorCount_ == 0;
}

bool SwitchChecker::visit_switch_stmt(const SwitchStmt * node)
{
  const TypeInfo * subject = node->subject->resolvedType;
  const EnumInfo * info = nullptr;
  if (subject != nullptr && subject->kind == TypeKind::Enum && !subject->isArray) {
    if (const Symbol * sym = table_.lookup_type(subject->baseType)) {
      info = sym->as<EnumInfo>();
    }
  }

  if (info != nullptr) {
    check_enum_switch(node, *info, subject->baseType);
  } else if (subject != nullptr) {
    check_value_switch(node);
  }
  return ConstRecursiveAstVisitor<SwitchChecker>::visit_switch_stmt(node);
}

std::string_view SwitchChecker::label_member(const Expr * label)
{
  if (const auto * mem = dyn_cast<MemberExpr>(label)) {
    if (mem->accessKind == MemberAccessKind::EnumMember) {
      return mem->member;
    }
  } else if (const auto * ref = dyn_cast<VarRefExpr>(label)) {
    // Foreign enumerators are referenced unqualified.
    if (ref->resolvedSymbol != nullptr && ref->resolvedSymbol->kind() == SymbolKind::Enum) {
      return ref->name;
    }
  }
  return {};
}

void SwitchChecker::check_enum_switch(
  const SwitchStmt * node, const EnumInfo & info, std::string_view name)
{
  std::set<std::string_view> covered;
  for (const SwitchCase * c : node->cases) {
    for (const Expr * label : c->labels) {
      const std::string_view member = label_member(label);
      if (member.empty()) {
        // TypeChecker already rejected a label of another type.
        continue;
      }
      if (!covered.insert(member).second) {
        report(
          label->get_range(), "E0803", fmt::format("duplicate case label '{}.{}'", name, member),
          "each variant may appear in one case only");
      }
    }
  }

  std::vector<std::string> missing;
  for (const auto & m : info.members) {
    if (covered.count(m.name) == 0) {
      missing.push_back(fmt::format("{}.{}", name, m.name));
    }
  }
  const auto remaining = static_cast<int64_t>(missing.size());

  const DefaultCase * dflt = node->defaultCase;
  if (dflt == nullptr) {
    if (!missing.empty()) {
      report(
        node->subject->get_range(), "E0801",
        fmt::format("switch on '{}' does not cover {}", name, fmt::join(missing, ", ")),
        fmt::format("add the missing cases or 'default({})'", remaining));
    }
    return;
  }

  if (remaining == 0) {
    report(
      dflt->get_range(), "E0805",
      fmt::format("every variant of '{}' is already covered", name), "remove the default");
    return;
  }
  if (!dflt->hasCount) {
    report(
      dflt->get_range(), "E0804",
      fmt::format("plain 'default' is not allowed on enum '{}'", name),
      fmt::format("write 'default({})' for the {} remaining variant(s)", remaining, remaining));
    return;
  }
  if (dflt->count != remaining) {
    report(
      dflt->get_range(), "E0802",
      fmt::format("'default({})' does not match the {} uncovered variant(s) of '{}'", dflt->count,
                  remaining, name),
      fmt::format("uncovered: {}", fmt::join(missing, ", ")));
  }
}

void SwitchChecker::check_value_switch(const SwitchStmt * node)
{
  std::map<int64_t, const Expr *> seen;
  for (const SwitchCase * c : node->cases) {
    for (const Expr * label : c->labels) {
      const auto value = evaluate_constant(label);
      if (!value) {
        report(
          label->get_range(), "E0304", "case label must be a compile-time constant");
        continue;
      }
      if (!seen.emplace(*value, label).second) {
        report(
          label->get_range(), "E0803", fmt::format("duplicate case label {}", *value),
          "each value may appear in one case only");
      }
    }
  }

  if (node->defaultCase == nullptr) {
    report(
      node->subject->get_range(), "E0801", "switch on a non-enum value needs a 'default' case");
  } else if (node->defaultCase->hasCount) {
    report(
      node->defaultCase->get_range(), "E0806",
      "'default(n)' is only meaningful on an enum switch", "write plain 'default'");
  }
}

void SwitchChecker::report(
  SourceRange range, std::string code, std::string message, std::string help)
{
  auto diag = diags_.report_error(range, std::move(message));
  diag.with_code(std::move(code));
  if (!help.empty()) {
    diag.with_help(std::move(help));
  }
  ++errorCount_;
}

}  // namespace cnext
