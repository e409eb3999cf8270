// cnext/codegen/c_types.hpp - C spellings shared by the .c and .h generators
//
// Declarations and definitions are both printed through these helpers so
// a prototype in the header can never disagree with its definition.
//
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "cnext/ast/ast.hpp"
#include "cnext/codegen/code_writer.hpp"
#include "cnext/symbols/type_info.hpp"

namespace cnext
{

/// How a C-Next parameter travels in the generated C.
enum class ParamPassing : uint8_t {
  Value,    ///< scalar never written by the callee
  Pointer,  ///< struct, or scalar written by the callee (`T *p`, uses print `(*p)`)
  Array,    ///< array or string, passed as the decayed C array
};

[[nodiscard]] ParamPassing param_passing(const ParamDecl & param) noexcept;

/// Parameters are const unless written in the body or by a callee.
[[nodiscard]] inline bool is_const_param(const ParamDecl & param) noexcept
{
  return param.isConst || !param.isMutated;
}

/**
 * C declarator for a variable of type `t`: `const uint8_t buf[16]`,
 * `char name[33]`, `FILE* c_log`.
 */
[[nodiscard]] std::string c_declarator(const TypeInfo & t, std::string_view name);

/// C declarator of one parameter, const qualification included.
[[nodiscard]] std::string c_param_declaration(const ParamDecl & param);

/**
 * Full C prototype without the trailing `;`, e.g.
 * `static void Motor_stop(const uint32_t reason)`.
 */
[[nodiscard]] std::string c_function_prototype(const FunctionDecl & fn);

/// True when `fn` is the program entry point, which C requires to return int.
[[nodiscard]] bool is_entry_point(const FunctionDecl & fn) noexcept;

/// Zero initializer matching `t`: `0`, `false`, `NULL`, `0.0` or `{0}`.
[[nodiscard]] std::string c_zero_value(const TypeInfo & t);

/// Integer suffix for a literal of type `t` holding `value` (`U`, `ULL`, `LL`).
[[nodiscard]] std::string_view c_literal_suffix(const TypeInfo & t, uint64_t value) noexcept;

/// Mask with the low `width` bits set, spelled for an operand of `bits` bits.
[[nodiscard]] std::string c_bit_mask(uint32_t width, uint32_t bits);

/// `FOO_H` style include guard for an output stem.
[[nodiscard]] std::string include_guard(std::string_view stem);

/**
 * Copies source comments into generated C.
 *
 * Walks the program's comments in source order so each is written at
 * most once: a generator asks for everything before the construct it is
 * about to print, and skips the comments of constructs it leaves out.
 */
class CommentCursor
{
public:
  CommentCursor() = default;
  explicit CommentCursor(gsl::span<const Comment> comments) : comments_(comments) {}

  /// Writes the remaining comments that start before `offset`.
  void write_before(CodeWriter & w, uint32_t offset);
  /// Drops the remaining comments that start before `offset`.
  void skip_before(uint32_t offset);

private:
  gsl::span<const Comment> comments_;
  size_t next_ = 0;
};

}  // namespace cnext
