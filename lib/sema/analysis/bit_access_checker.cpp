// cnext/sema/bit_access_checker.cpp - Bit access checker implementation
//
#include "cnext/sema/analysis/bit_access_checker.hpp"

#include <fmt/format.h>

#include "cnext/basic/casting.hpp"
#include "cnext/sema/types/const_evaluator.hpp"
#include "cnext/symbols/type_info.hpp"

namespace cnext
{

bool BitAccessChecker::check(const Program & program)
{
  errorCount_ = 0;
  visit(&program);
  return errorCount_ == 0;
}

// ============================================================================
// Visitor hooks
// ============================================================================

bool BitAccessChecker::visit_assign_stmt(const AssignStmt * node)
{
  const auto * idx = dyn_cast<IndexExpr>(node->target);
  if (idx != nullptr && idx->accessKind == IndexAccessKind::Slice) {
    if (node->op != AssignOp::Assign) {
      report(
        node->get_range(), "E0606", "a slice can only be assigned with '<-'",
        "compound operators would read the slice");
    }
    sliceTarget_ = idx;
    sliceValue_ = node->value;
  }
  const bool result = ConstRecursiveAstVisitor<BitAccessChecker>::visit_assign_stmt(node);
  sliceTarget_ = nullptr;
  sliceValue_ = nullptr;
  return result;
}

bool BitAccessChecker::visit_index_expr(const IndexExpr * node)
{
  const TypeInfo * base = node->base->resolvedType;

  switch (node->accessKind) {
    case IndexAccessKind::BitIndex:
      check_bit_index(node, base->bitWidth == 0 ? 32 : base->bitWidth);
      break;
    case IndexAccessKind::BitRange:
      check_bit_range(node, base->bitWidth == 0 ? 32 : base->bitWidth);
      break;
    case IndexAccessKind::Slice:
      if (node == sliceTarget_) {
        check_slice_target(node, sliceValue_);
      } else {
        report(
          node->get_range(), "E0606", "an array slice can only be the target of '<-'",
          "read the elements individually");
      }
      break;
    case IndexAccessKind::ArrayElement:
      check_array_index(node);
      break;
    case IndexAccessKind::Unresolved:
      if (base != nullptr) {
        report(
          node->get_range(), "E0603",
          fmt::format("cannot index a value of type '{}'", base->to_string()),
          "bit access needs an integer or bitmap operand; element access needs an array");
      }
      break;
  }
  return ConstRecursiveAstVisitor<BitAccessChecker>::visit_index_expr(node);
}

// ============================================================================
// Checks
// ============================================================================

void BitAccessChecker::check_bit_index(const IndexExpr * node, uint32_t width)
{
  const auto bit = evaluate_constant(node->index);
  if (!bit) return;
  if (*bit < 0 || *bit >= static_cast<int64_t>(width)) {
    report(
      node->index->get_range(), "E0601",
      fmt::format("bit {} is out of range for a {}-bit value", *bit, width),
      fmt::format("valid bits are 0 to {}", width - 1));
  }
}

void BitAccessChecker::check_bit_range(const IndexExpr * node, uint32_t width)
{
  const auto start = evaluate_constant(node->index);
  const auto count = evaluate_constant(node->width);
  if (count && *count <= 0) {
    report(
      node->width->get_range(), "E0602", "bit range width must be at least 1",
      "use x[bit] for a single bit");
    return;
  }
  if (start && *start < 0) {
    report(
      node->index->get_range(), "E0602", fmt::format("bit range starts at {}", *start));
    return;
  }
  if (start && count && *start + *count > static_cast<int64_t>(width)) {
    report(
      node->get_range(), "E0602",
      fmt::format("bits {} to {} are out of range for a {}-bit value", *start,
                  *start + *count - 1, width),
      fmt::format("start + width must not exceed {}", width));
  }
}

void BitAccessChecker::check_slice_target(const IndexExpr * node, const Expr * value)
{
  const TypeInfo * base = node->base->resolvedType;
  if (base->arrayDims.size() > 1) {
    report(
      node->get_range(), "E0605",
      fmt::format("slice assignment needs a one-dimensional array, '{}' has {} dimensions",
                  base->to_string(), base->arrayDims.size()),
      "index the outer dimensions first, e.g. grid[row][offset, length]");
    return;
  }

  const auto offset = evaluate_constant(node->index);
  const auto length = evaluate_constant(node->width);
  if (!offset || !length) {
    report(
      node->get_range(), "E0604", "slice offset and length must be compile-time constants",
      "use literals, const globals or enum members");
    return;
  }

  const uint64_t capacity = base->storage_bytes();
  if (*offset < 0 || *length <= 0 ||
      (capacity != 0 && static_cast<uint64_t>(*offset + *length) > capacity)) {
    report(
      node->get_range(), "E0605",
      fmt::format("slice [{}, {}] does not fit in '{}' ({} bytes)", *offset, *length,
                  base->to_string(), capacity),
      "offset + length must not exceed the array size");
    return;
  }

  if (value == nullptr) return;
  uint64_t source_bytes = 0;
  if (const auto * lit = dyn_cast<StringLiteralExpr>(value)) {
    source_bytes = lit->decoded_length() + 1;
  } else if (const TypeInfo * vt = value->resolvedType) {
    if (vt->kind == TypeKind::CString && !vt->isArray) {
      report(
        value->get_range(), "E0605",
        "slice source has no compile-time size",
        "copy from an array, a string<N> or a scalar");
      return;
    }
    source_bytes = vt->storage_bytes();
  }
  if (source_bytes != 0 && static_cast<uint64_t>(*length) > source_bytes) {
    report(
      node->get_range(), "E0605",
      fmt::format("slice length {} exceeds the {}-byte source '{}'", *length, source_bytes,
                  value->resolvedType != nullptr ? value->resolvedType->to_string() : "string"),
      fmt::format("copy at most {} bytes", source_bytes));
  }
}

void BitAccessChecker::check_array_index(const IndexExpr * node)
{
  const TypeInfo * base = node->base->resolvedType;
  if (base == nullptr) return;

  uint64_t bound = 0;
  if (base->isArray) {
    bound = base->arrayDims.front();
  } else if (base->kind == TypeKind::String) {
    bound = uint64_t{base->stringCapacity} + 1;
  } else {
    return;
  }

  const auto index = evaluate_constant(node->index);
  if (index && (*index < 0 || static_cast<uint64_t>(*index) >= bound)) {
    report(
      node->index->get_range(), "E0607",
      fmt::format("index {} is out of bounds for '{}'", *index, base->to_string()),
      fmt::format("valid indices are 0 to {}", bound - 1));
  }
}

void BitAccessChecker::report(
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
