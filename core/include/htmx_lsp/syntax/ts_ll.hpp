// htmx_lsp/syntax/ts_ll.hpp - Low-level Tree-sitter wrapper (CST access and queries)
#pragma once

#include <tree_sitter/api.h>

#include <cstdint>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include "htmx_lsp/basic/source_manager.hpp"

namespace htmx_lsp::ts_ll
{

[[nodiscard]] inline TSPoint to_ts_point(TextPoint p) noexcept { return TSPoint{p.line, p.column}; }
[[nodiscard]] inline TextPoint to_text_point(TSPoint p) noexcept { return {p.row, p.column}; }

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

  [[nodiscard]] std::string_view kind() const noexcept
  {
    const char * t = ts_node_type(node_);
    return t ? std::string_view(t) : std::string_view();
  }

  [[nodiscard]] uint32_t start_byte() const noexcept { return ts_node_start_byte(node_); }
  [[nodiscard]] uint32_t end_byte() const noexcept { return ts_node_end_byte(node_); }

  [[nodiscard]] TextPoint start_point() const noexcept
  {
    return to_text_point(ts_node_start_point(node_));
  }
  [[nodiscard]] TextPoint end_point() const noexcept
  {
    return to_text_point(ts_node_end_point(node_));
  }
  [[nodiscard]] TextRange range() const noexcept { return {start_point(), end_point()}; }

  /// Text covered by this node; empty when the source does not match the tree
  [[nodiscard]] std::string_view text(std::string_view source) const noexcept
  {
    const uint32_t b = start_byte();
    const uint32_t e = end_byte();
    if (e < b || e > source.size()) {
      return {};
    }
    return source.substr(b, e - b);
  }

  [[nodiscard]] uint32_t child_count() const noexcept { return ts_node_child_count(node_); }
  [[nodiscard]] uint32_t named_child_count() const noexcept
  {
    return ts_node_named_child_count(node_);
  }

  [[nodiscard]] Node child(uint32_t i) const noexcept { return Node(ts_node_child(node_, i)); }
  [[nodiscard]] Node named_child(uint32_t i) const noexcept
  {
    return Node(ts_node_named_child(node_, i));
  }
  [[nodiscard]] Node parent() const noexcept { return Node(ts_node_parent(node_)); }

  /// Smallest node (named or anonymous) that spans the empty range [p, p]
  [[nodiscard]] Node descendant_for_point(TextPoint p) const noexcept
  {
    const TSPoint tp = to_ts_point(p);
    return Node(ts_node_descendant_for_point_range(node_, tp, tp));
  }

  [[nodiscard]] TSNode raw() const noexcept { return node_; }

private:
  TSNode node_;
};

//------------------------------------------------------------------------------
// Parser/Tree - RAII wrappers
//------------------------------------------------------------------------------
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

  /// Shallow copy; each thread reading a shared tree works on its own copy
  [[nodiscard]] Tree clone() const { return Tree(tree_ ? ts_tree_copy(tree_) : nullptr); }

private:
  TSTree * tree_ = nullptr;
};

class Parser
{
public:
  /// @throws std::runtime_error when the grammar ABI is incompatible
  explicit Parser(const TSLanguage * language);
  Parser(const Parser &) = delete;
  Parser & operator=(const Parser &) = delete;
  ~Parser();

  /// Switch grammars; returns false (keeping the old grammar) on ABI mismatch
  bool set_language(const TSLanguage * language) noexcept;

  [[nodiscard]] const TSLanguage * language() const noexcept { return language_; }

  [[nodiscard]] Tree parse_string(std::string_view source) const;

private:
  TSParser * parser_ = nullptr;
  const TSLanguage * language_ = nullptr;
};

//------------------------------------------------------------------------------
// Query - compiled pattern with text predicates
//------------------------------------------------------------------------------

struct QueryCapture
{
  Node node;
  uint32_t index = 0;
};

struct QueryMatch
{
  uint32_t pattern_index = 0;
  std::vector<QueryCapture> captures;

  /// First node captured as `index`, if any
  [[nodiscard]] std::optional<Node> node_for(uint32_t index) const noexcept;
};

/**
 * Owning wrapper around TSQuery.
 *
 * The C library parses but does not evaluate text predicates, so this class
 * evaluates `#eq?`, `#not-eq?`, `#match?` and `#not-match?` itself. A
 * predicate that refers to a capture missing from a match is satisfied.
 * Regular expressions are searched (not anchored). Other predicates are
 * ignored.
 */
class Query
{
public:
  /**
   * Compile `source` against `language`.
   *
   * @param error receives a message on failure (syntax error offset or
   *        invalid regular expression)
   */
  [[nodiscard]] static std::optional<Query> compile(
    const TSLanguage * language, std::string_view source, std::string * error = nullptr);

  Query(const Query &) = delete;
  Query & operator=(const Query &) = delete;
  Query(Query && other) noexcept;
  Query & operator=(Query && other) noexcept;
  ~Query();

  [[nodiscard]] uint32_t capture_count() const noexcept;
  [[nodiscard]] std::string_view capture_name(uint32_t index) const noexcept;
  [[nodiscard]] std::optional<uint32_t> capture_index(std::string_view name) const noexcept;

  /// All matches under `node` whose predicates hold, in match order
  [[nodiscard]] std::vector<QueryMatch> matches(Node node, std::string_view source) const;

  [[nodiscard]] bool satisfies_predicates(const QueryMatch & match, std::string_view source) const;

private:
  struct Predicate
  {
    enum class Op { Eq, Match };

    Op op = Op::Eq;
    bool positive = true;
    uint32_t capture = 0;
    std::optional<uint32_t> other_capture;  // #eq? @a @b
    std::string literal;                    // #eq? @a "text"
    std::regex regex;                       // #match? @a "re"
  };

  explicit Query(TSQuery * query) : query_(query) {}

  /// Read the predicate steps of every pattern; false on malformed input
  bool load_predicates(std::string * error);

  TSQuery * query_ = nullptr;
  std::vector<std::vector<Predicate>> predicates_;  // per pattern
};

}  // namespace htmx_lsp::ts_ll
