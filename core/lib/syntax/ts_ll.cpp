// htmx_lsp/syntax/ts_ll.cpp - Low-level Tree-sitter wrapper implementation
#include "htmx_lsp/syntax/ts_ll.hpp"

#include <stdexcept>
#include <utility>

namespace htmx_lsp::ts_ll
{

// ============================================================================
// Parser
// ============================================================================

Parser::Parser(const TSLanguage * language)
{
  parser_ = ts_parser_new();
  if (parser_ == nullptr) {
    throw std::runtime_error("ts_parser_new() failed");
  }
  if (language == nullptr || !ts_parser_set_language(parser_, language)) {
    ts_parser_delete(parser_);
    parser_ = nullptr;
    throw std::runtime_error("ts_parser_set_language() failed");
  }
  language_ = language;
}

Parser::~Parser()
{
  if (parser_) ts_parser_delete(parser_);
  parser_ = nullptr;
}

bool Parser::set_language(const TSLanguage * language) noexcept
{
  if (language == nullptr || !ts_parser_set_language(parser_, language)) {
    return false;
  }
  language_ = language;
  return true;
}

Tree Parser::parse_string(std::string_view source) const
{
  // Tree-sitter consumes bytes; the grammars expect UTF-8.
  return Tree(ts_parser_parse_string(
    parser_, /*old_tree*/ nullptr, source.data(), static_cast<uint32_t>(source.size())));
}

// ============================================================================
// QueryMatch
// ============================================================================

std::optional<Node> QueryMatch::node_for(uint32_t index) const noexcept
{
  for (const auto & c : captures) {
    if (c.index == index) {
      return c.node;
    }
  }
  return std::nullopt;
}

// ============================================================================
// Query
// ============================================================================

std::optional<Query> Query::compile(
  const TSLanguage * language, std::string_view source, std::string * error)
{
  uint32_t err_off = 0;
  TSQueryError err_type = TSQueryErrorNone;
  TSQuery * q = ts_query_new(
    language, source.data(), static_cast<uint32_t>(source.size()), &err_off, &err_type);
  if (q == nullptr) {
    if (error != nullptr) {
      *error = "query error " + std::to_string(static_cast<int>(err_type)) + " at offset " +
               std::to_string(err_off);
    }
    return std::nullopt;
  }

  Query query(q);
  if (!query.load_predicates(error)) {
    return std::nullopt;
  }
  return std::optional<Query>(std::move(query));
}

Query::Query(Query && other) noexcept
: query_(other.query_), predicates_(std::move(other.predicates_))
{
  other.query_ = nullptr;
}

Query & Query::operator=(Query && other) noexcept
{
  if (this != &other) {
    if (query_) ts_query_delete(query_);
    query_ = other.query_;
    predicates_ = std::move(other.predicates_);
    other.query_ = nullptr;
  }
  return *this;
}

Query::~Query()
{
  if (query_) ts_query_delete(query_);
  query_ = nullptr;
}

uint32_t Query::capture_count() const noexcept { return ts_query_capture_count(query_); }

std::string_view Query::capture_name(uint32_t index) const noexcept
{
  uint32_t len = 0;
  const char * name = ts_query_capture_name_for_id(query_, index, &len);
  return name ? std::string_view(name, len) : std::string_view();
}

std::optional<uint32_t> Query::capture_index(std::string_view name) const noexcept
{
  const uint32_t n = capture_count();
  for (uint32_t i = 0; i < n; ++i) {
    if (capture_name(i) == name) {
      return i;
    }
  }
  return std::nullopt;
}

bool Query::load_predicates(std::string * error)
{
  auto fail = [&](std::string msg) {
    if (error != nullptr) {
      *error = std::move(msg);
    }
    return false;
  };

  const uint32_t pattern_count = ts_query_pattern_count(query_);
  predicates_.assign(pattern_count, {});

  for (uint32_t p = 0; p < pattern_count; ++p) {
    uint32_t step_count = 0;
    const TSQueryPredicateStep * steps = ts_query_predicates_for_pattern(query_, p, &step_count);

    // Steps form groups terminated by TSQueryPredicateStepTypeDone:
    //   String(name) Capture|String ...
    uint32_t i = 0;
    while (i < step_count) {
      uint32_t end = i;
      while (end < step_count && steps[end].type != TSQueryPredicateStepTypeDone) {
        ++end;
      }
      const uint32_t argc = end - i;
      if (argc > 0 && steps[i].type == TSQueryPredicateStepTypeString) {
        uint32_t len = 0;
        const char * op_str = ts_query_string_value_for_id(query_, steps[i].value_id, &len);
        const std::string_view op(op_str, len);

        const bool is_eq = (op == "eq?" || op == "not-eq?");
        const bool is_match = (op == "match?" || op == "not-match?");
        if (is_eq || is_match) {
          if (argc != 3 || steps[i + 1].type != TSQueryPredicateStepTypeCapture) {
            return fail("predicate #" + std::string(op) + " expects a capture and one argument");
          }

          Predicate pred;
          pred.op = is_eq ? Predicate::Op::Eq : Predicate::Op::Match;
          pred.positive = (op == "eq?" || op == "match?");
          pred.capture = steps[i + 1].value_id;

          const TSQueryPredicateStep & arg = steps[i + 2];
          if (arg.type == TSQueryPredicateStepTypeCapture) {
            if (is_match) {
              return fail("predicate #match? expects a string argument");
            }
            pred.other_capture = arg.value_id;
          } else {
            uint32_t arg_len = 0;
            const char * arg_str = ts_query_string_value_for_id(query_, arg.value_id, &arg_len);
            pred.literal.assign(arg_str, arg_len);
            if (is_match) {
              try {
                pred.regex = std::regex(pred.literal, std::regex::ECMAScript);
              } catch (const std::regex_error & e) {
                return fail("invalid regular expression '" + pred.literal + "': " + e.what());
              }
            }
          }
          predicates_[p].push_back(std::move(pred));
        }
      }
      i = end + 1;
    }
  }
  return true;
}

bool Query::satisfies_predicates(const QueryMatch & match, std::string_view source) const
{
  if (match.pattern_index >= predicates_.size()) {
    return true;
  }

  for (const auto & pred : predicates_[match.pattern_index]) {
    const auto node = match.node_for(pred.capture);
    if (!node) {
      continue;
    }
    const std::string_view text = node->text(source);

    bool holds = false;
    if (pred.op == Predicate::Op::Match) {
      holds = std::regex_search(text.begin(), text.end(), pred.regex);
    } else if (pred.other_capture) {
      const auto other = match.node_for(*pred.other_capture);
      if (!other) {
        continue;
      }
      holds = (text == other->text(source));
    } else {
      holds = (text == pred.literal);
    }

    if (holds != pred.positive) {
      return false;
    }
  }
  return true;
}

std::vector<QueryMatch> Query::matches(Node node, std::string_view source) const
{
  std::vector<QueryMatch> out;
  if (node.is_null()) {
    return out;
  }

  TSQueryCursor * cursor = ts_query_cursor_new();
  if (cursor == nullptr) {
    return out;
  }

  ts_query_cursor_exec(cursor, query_, node.raw());

  TSQueryMatch raw;
  while (ts_query_cursor_next_match(cursor, &raw)) {
    QueryMatch m;
    m.pattern_index = raw.pattern_index;
    m.captures.reserve(raw.capture_count);
    for (uint32_t i = 0; i < raw.capture_count; ++i) {
      m.captures.push_back(QueryCapture{Node(raw.captures[i].node), raw.captures[i].index});
    }
    if (satisfies_predicates(m, source)) {
      out.push_back(std::move(m));
    }
  }

  ts_query_cursor_delete(cursor);
  return out;
}

}  // namespace htmx_lsp::ts_ll
