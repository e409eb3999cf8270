// cnext/symbols/cpp_collector.cpp - Declaration extractor for C++ headers
#include "cnext/symbols/cpp_collector.hpp"

namespace cnext
{

std::string CppHeaderCollector::tag_spelling(
  std::string_view /*keyword*/, std::string_view name) const
{
  return std::string(name);
}

void CppHeaderCollector::read_extension(ts_ll::Node item)
{
  // Templates, using-directives and static assertions declare nothing C-Next can use.
  const std::string_view kind = item.kind();
  if (kind == "namespace_definition") {
    read_namespace(item);
  } else if (kind == "alias_declaration") {
    read_alias(item);
  }
}

void CppHeaderCollector::read_member_extension(ts_ll::Node member, bool & public_access)
{
  if (member.kind() == "access_specifier") {
    public_access = text(member).substr(0, 6) == "public";
  }
}

void CppHeaderCollector::read_namespace(ts_ll::Node ns)
{
  const ts_ll::Node name = ns.child_by_field("name");
  namespaces_.push_back(name.is_null() ? std::string() : compact(text(name)));
  read_items(ns.child_by_field("body"));
  namespaces_.pop_back();
}

void CppHeaderCollector::read_alias(ts_ll::Node alias)
{
  const ts_ll::Node name = alias.child_by_field("name");
  const ts_ll::Node type = alias.child_by_field("type");
  if (name.is_null() || type.is_null()) return;

  auto spec = read_base_spec(type);
  if (!spec) {
    error(alias, "cannot read the type of alias '" + std::string(text(name)) + "'");
    return;
  }
  spec->isTypedef = true;
  Declarator decl = read_declarator(type.child_by_field("declarator"));
  decl.name = std::string(text(name));
  decl.line = line_of(name);
  emit_typedef(*spec, decl);
}

}  // namespace cnext
