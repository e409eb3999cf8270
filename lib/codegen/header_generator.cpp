// cnext/codegen/header_generator.cpp - C declarations file generator
//
#include "cnext/codegen/header_generator.hpp"

#include <fmt/format.h>

#include <filesystem>

#include "cnext/basic/casting.hpp"
#include "cnext/codegen/c_types.hpp"
#include "cnext/symbols/type_info.hpp"

namespace cnext
{

std::string HeaderGenerator::generate()
{
  out_ = CodeWriter{};
  const std::string guard = include_guard(module_.stem());

  out_.line(fmt::format(
    "/* Generated by cnextc from {}. Do not edit. */", module_.path.filename().string()));
  out_.line(fmt::format("#ifndef {}", guard));
  out_.line(fmt::format("#define {}", guard));
  out_.line("");
  emit_includes();

  comments_ = CommentCursor{};
  if (module_.program != nullptr) {
    comments_ = CommentCursor(module_.program->comments);
    for (const Decl * decl : module_.program->decls) {
      emit_decl(decl);
    }
  }

  out_.blank();
  out_.line(fmt::format("#endif /* {} */", guard));
  return out_.take();
}

void HeaderGenerator::emit_includes()
{
  out_.line("#include <stdbool.h>");
  out_.line("#include <stddef.h>");
  out_.line("#include <stdint.h>");
  if (module_.program == nullptr) {
    out_.line("");
    return;
  }

  for (const IncludeDecl * inc : module_.program->includes) {
    if (inc->isSystem) {
      out_.line(fmt::format("#include <{}>", inc->path));
      continue;
    }
    std::filesystem::path path(std::string(inc->path));
    if (path.extension() == ".cnx") {
      path.replace_extension(".h");
    }
    out_.line(fmt::format("#include \"{}\"", path.generic_string()));
  }
  for (const DefineDecl * def : module_.program->defines) {
    out_.line(fmt::format("#define {}", def->name));
  }
  out_.line("");
}

void HeaderGenerator::emit_decl(const Decl * decl)
{
  if (isa<StructDecl>(decl) || isa<EnumDecl>(decl) || isa<BitmapDecl>(decl) ||
      isa<RegisterDecl>(decl)) {
    comments_.write_before(out_, decl->get_range().get_begin().offset());
  }
  if (!isa<ScopeDecl>(decl)) {
    comments_.skip_before(decl->get_range().get_end().offset());
  }

  if (const auto * s = dyn_cast<StructDecl>(decl)) {
    emit_struct(s);
  } else if (const auto * e = dyn_cast<EnumDecl>(decl)) {
    emit_enum(e);
  } else if (const auto * b = dyn_cast<BitmapDecl>(decl)) {
    emit_bitmap(b);
  } else if (const auto * r = dyn_cast<RegisterDecl>(decl)) {
    emit_register(r);
  } else if (const auto * g = dyn_cast<GlobalVarDecl>(decl)) {
    emit_global(g);
  } else if (const auto * fn = dyn_cast<FunctionDecl>(decl)) {
    emit_prototype(fn);
  } else if (const auto * scope = dyn_cast<ScopeDecl>(decl)) {
    for (const Decl * member : scope->members) {
      emit_decl(member);
    }
  }
}

void HeaderGenerator::emit_struct(const StructDecl * decl)
{
  out_.open(fmt::format("typedef struct {}", decl->name));
  for (const FieldDecl * field : decl->fields) {
    if (field->resolvedType != nullptr) {
      out_.line(c_declarator(*field->resolvedType, field->name) + ";");
    }
  }
  out_.close(fmt::format(" {};", decl->name));
  out_.blank();
}

void HeaderGenerator::emit_enum(const EnumDecl * decl)
{
  out_.open("typedef enum");
  for (size_t i = 0; i < decl->members.size(); ++i) {
    const EnumMember * m = decl->members[i];
    out_.line(fmt::format(
      "{}_{} = {}{}", decl->name, m->name, m->resolvedValue,
      i + 1 < decl->members.size() ? "," : ""));
  }
  out_.close(fmt::format(" {};", decl->name));
  out_.blank();
}

void HeaderGenerator::emit_bitmap(const BitmapDecl * decl)
{
  out_.line(fmt::format("/* {}:", decl->name));
  for (const BitmapField * f : decl->fields) {
    if (f->width == 1) {
      out_.line(fmt::format(" *   {} bit {}", f->name, f->offset));
    } else {
      out_.line(
        fmt::format(" *   {} bits {}..{}", f->name, f->offset, f->offset + f->width - 1));
    }
  }
  out_.line(" */");
  out_.line(fmt::format("typedef uint{}_t {};", decl->bitSize, decl->name));
  out_.blank();
}

void HeaderGenerator::emit_register(const RegisterDecl * decl)
{
  const std::string_view base = module_.text_of(decl->baseAddress->get_range());
  for (const RegisterField * field : decl->fields) {
    if (field->resolvedType == nullptr) continue;
    out_.line(fmt::format(
      "#define {}_{} (*(volatile {}*)({} + {})) /* {} */", decl->name, field->name,
      c_type_name(field->resolvedType->scalar_type()), base,
      module_.text_of(field->offset->get_range()), to_string(field->access)));
  }
  out_.blank();
}

void HeaderGenerator::emit_global(const GlobalVarDecl * decl)
{
  if (!decl->isPublic || decl->resolvedType == nullptr) return;
  out_.line(fmt::format("extern {};", c_declarator(*decl->resolvedType, decl->cName)));
}

void HeaderGenerator::emit_prototype(const FunctionDecl * decl)
{
  if (!decl->isPublic || is_entry_point(*decl)) return;
  out_.line(c_function_prototype(*decl) + ";");
}

}  // namespace cnext
