// cnext/symbols/cpp_collector.hpp - Declaration extractor for C++ headers
#pragma once

#include "cnext/symbols/c_collector.hpp"

namespace cnext
{

/**
 * C++ flavour of the header collector, parsed with tree-sitter-cpp.
 *
 * Adds namespaces (names are stored qualified, `hal::Pin`), classes with
 * access specifiers (only public data members become fields), scoped and
 * typed enums, `using X = T;` aliases and overloaded functions. Templates
 * are skipped whole.
 */
class CppHeaderCollector : public CHeaderCollector
{
public:
  using CHeaderCollector::CHeaderCollector;

protected:
  [[nodiscard]] const TSLanguage * grammar() const override { return ts_ll::tree_sitter_cpp(); }
  [[nodiscard]] SourceLanguage language() const noexcept override { return SourceLanguage::Cpp; }
  [[nodiscard]] std::string tag_spelling(
    std::string_view keyword, std::string_view name) const override;

  void read_extension(ts_ll::Node item) override;
  void read_member_extension(ts_ll::Node member, bool & public_access) override;

private:
  void read_namespace(ts_ll::Node ns);
  void read_alias(ts_ll::Node alias);
};

}  // namespace cnext
