// cnext/symbols/ts_ll.hpp - Low-level Tree-sitter wrapper (C/C++ header CST access)
#pragma once

#include <tree_sitter/api.h>

#include <cstdint>
#include <string_view>

#include "cnext/basic/source_manager.hpp"

namespace cnext::ts_ll
{

// Language entry points of the installed tree-sitter-c and tree-sitter-cpp
// grammar libraries (see CMakeLists.txt).
extern "C" const TSLanguage * tree_sitter_c();
extern "C" const TSLanguage * tree_sitter_cpp();

//------------------------------------------------------------------------------
// Node - thin wrapper around TSNode
//------------------------------------------------------------------------------
class Node
{
public:
  Node() : node_{} {}
  explicit Node(TSNode n) : node_(n) {}

  [[nodiscard]] bool is_null() const noexcept { return ts_node_is_null(node_); }
  [[nodiscard]] bool has_error() const noexcept { return ts_node_has_error(node_); }
  [[nodiscard]] bool is_error() const noexcept { return ts_node_is_error(node_); }
  [[nodiscard]] bool is_missing() const noexcept { return ts_node_is_missing(node_); }
  [[nodiscard]] bool is_named() const noexcept { return ts_node_is_named(node_); }

  [[nodiscard]] std::string_view kind() const noexcept
  {
    if (is_null()) return {};
    const char * t = ts_node_type(node_);
    return t ? std::string_view(t) : std::string_view();
  }

  [[nodiscard]] uint32_t start_byte() const noexcept { return ts_node_start_byte(node_); }
  [[nodiscard]] uint32_t end_byte() const noexcept { return ts_node_end_byte(node_); }

  [[nodiscard]] SourceRange range(FileId file) const noexcept
  {
    return {file, start_byte(), end_byte()};
  }

  /// Text of the node in the buffer the tree was parsed from.
  [[nodiscard]] std::string_view text(std::string_view source) const noexcept
  {
    const uint32_t begin = start_byte();
    if (begin >= source.size()) return {};
    return source.substr(begin, end_byte() - begin);
  }

  [[nodiscard]] uint32_t child_count() const noexcept
  {
    return is_null() ? 0 : ts_node_child_count(node_);
  }
  [[nodiscard]] uint32_t named_child_count() const noexcept
  {
    return is_null() ? 0 : ts_node_named_child_count(node_);
  }

  [[nodiscard]] Node child(uint32_t i) const noexcept { return Node(ts_node_child(node_, i)); }
  [[nodiscard]] Node named_child(uint32_t i) const noexcept
  {
    return Node(ts_node_named_child(node_, i));
  }

  /// Null when this node is null or has no such field.
  [[nodiscard]] Node child_by_field(std::string_view field) const noexcept
  {
    if (is_null()) return Node();
    return Node(
      ts_node_child_by_field_name(node_, field.data(), static_cast<uint32_t>(field.size())));
  }

  [[nodiscard]] TSNode raw() const noexcept { return node_; }

private:
  TSNode node_;
};

//------------------------------------------------------------------------------
// Cursor - wrapper around TSTreeCursor (named/un-named iteration)
//------------------------------------------------------------------------------
class Cursor
{
public:
  explicit Cursor(Node n) : cursor_(ts_tree_cursor_new(n.raw())) {}
  Cursor(const Cursor &) = delete;
  Cursor & operator=(const Cursor &) = delete;

  Cursor(Cursor && other) noexcept : cursor_(other.cursor_) { other.cursor_ = {}; }
  Cursor & operator=(Cursor && other) noexcept
  {
    if (this != &other) {
      ts_tree_cursor_delete(&cursor_);
      cursor_ = other.cursor_;
      other.cursor_ = {};
    }
    return *this;
  }

  ~Cursor() { ts_tree_cursor_delete(&cursor_); }

  [[nodiscard]] Node current_node() const noexcept
  {
    return Node(ts_tree_cursor_current_node(&cursor_));
  }

  /// Grammar field of the current node ("declarator", "type"), empty when it has none.
  [[nodiscard]] std::string_view field_name() const noexcept
  {
    const char * f = ts_tree_cursor_current_field_name(&cursor_);
    return f ? std::string_view(f) : std::string_view();
  }

  [[nodiscard]] bool goto_first_child() noexcept
  {
    return ts_tree_cursor_goto_first_child(&cursor_);
  }
  [[nodiscard]] bool goto_next_sibling() noexcept
  {
    return ts_tree_cursor_goto_next_sibling(&cursor_);
  }
  [[nodiscard]] bool goto_parent() noexcept { return ts_tree_cursor_goto_parent(&cursor_); }

private:
  TSTreeCursor cursor_;
};

/// Calls fn(child, field_name) for every direct child of n, in source order.
template <typename Fn>
void for_each_child(Node n, Fn && fn)
{
  if (n.is_null()) return;
  Cursor cursor(n);
  if (!cursor.goto_first_child()) return;
  do {
    fn(cursor.current_node(), cursor.field_name());
  } while (cursor.goto_next_sibling());
}

//------------------------------------------------------------------------------
// Parser/Tree - RAII wrappers
//------------------------------------------------------------------------------
class Parser
{
public:
  explicit Parser(const TSLanguage * language);
  Parser(const Parser &) = delete;
  Parser & operator=(const Parser &) = delete;
  ~Parser();

  /// False when the grammar library does not match the tree-sitter runtime.
  [[nodiscard]] bool is_ready() const noexcept { return ready_; }

  [[nodiscard]] TSTree * parse_string(std::string_view source) const;

private:
  TSParser * parser_ = nullptr;
  bool ready_ = false;
};

class Tree
{
public:
  explicit Tree(TSTree * t = nullptr) : tree_(t) {}
  Tree(const Tree &) = delete;
  Tree & operator=(const Tree &) = delete;

  Tree(Tree && other) noexcept : tree_(other.tree_) { other.tree_ = nullptr; }
  Tree & operator=(Tree && other) noexcept
  {
    if (this != &other) {
      reset();
      tree_ = other.tree_;
      other.tree_ = nullptr;
    }
    return *this;
  }

  ~Tree() { reset(); }

  void reset(TSTree * t = nullptr)
  {
    if (tree_) ts_tree_delete(tree_);
    tree_ = t;
  }

  [[nodiscard]] bool is_null() const noexcept { return tree_ == nullptr; }

  [[nodiscard]] Node root_node() const noexcept
  {
    return tree_ ? Node(ts_tree_root_node(tree_)) : Node();
  }

private:
  TSTree * tree_ = nullptr;
};

}  // namespace cnext::ts_ll
