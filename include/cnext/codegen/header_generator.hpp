// cnext/codegen/header_generator.hpp - C declarations file generator
#pragma once

#include <string>

#include "cnext/ast/ast.hpp"
#include "cnext/codegen/c_types.hpp"
#include "cnext/codegen/code_writer.hpp"
#include "cnext/sema/resolution/module_info.hpp"

namespace cnext
{

/**
 * Emits the include-guarded `.h` file of one analyzed module: the
 * module's includes, flag defines, type definitions, register macros,
 * `extern` declarations of public globals and prototypes of public
 * functions.
 *
 * Comments in front of type definitions and registers are copied too;
 * those of functions and globals go to the `.c` file.
 *
 * Prototypes come from c_function_prototype(), the same routine the
 * definitions use, so const qualification always agrees.
 */
class HeaderGenerator
{
public:
  explicit HeaderGenerator(const ModuleInfo & module) : module_(module) {}

  /// Contents of `<stem>.h`.
  [[nodiscard]] std::string generate();

private:
  void emit_includes();
  void emit_decl(const Decl * decl);
  void emit_struct(const StructDecl * decl);
  void emit_enum(const EnumDecl * decl);
  void emit_bitmap(const BitmapDecl * decl);
  void emit_register(const RegisterDecl * decl);
  void emit_global(const GlobalVarDecl * decl);
  void emit_prototype(const FunctionDecl * decl);

  const ModuleInfo & module_;
  CodeWriter out_;
  CommentCursor comments_;
};

}  // namespace cnext
