#include <shx/sparql_parser.hpp>
#include <shx/vocabulary.hpp>

#include "text_util.hpp"

#include <cctype>
#include <unordered_map>
#include <utility>
#include <vector>

namespace shx::sparql {

  namespace {

    // -----------------------------------------------------------------------
    // Token types
    // -----------------------------------------------------------------------

    enum class token_kind {
      eof,
      iri_ref,     // <...>
      pname,       // prefix:local
      var,         // ?name or $name
      blank_label, // _:label
      string,      // "..." or '...' (including triple-quoted), unescaped
      lang_tag,    // @en
      integer,
      decimal,
      double_,
      word,        // keyword or function name
      lbrace,      // {
      rbrace,      // }
      lparen,      // (
      rparen,      // )
      lbracket,    // [
      rbracket,    // ]
      dot,         // .
      semicolon,   // ;
      comma,       // ,
      star,        // *
      slash,       // /
      plus,        // +
      minus,       // -
      bang,        // !
      eq,          // =
      ne,          // !=
      lt,          // <
      le,          // <=
      gt,          // >
      ge,          // >=
      and_and,     // &&
      or_or,       // ||
      caret_caret, // ^^
    };

    struct token {
      token_kind kind = token_kind::eof;
      std::string value;
    };

    // -----------------------------------------------------------------------
    // Built-in functions: name -> (min args, max args)
    // -----------------------------------------------------------------------

    struct arity {
      std::size_t min;
      std::size_t max;
    };

    constexpr std::size_t variadic = static_cast<std::size_t>(-1);

    const std::unordered_map<std::string, arity> builtins = {
        {"BOUND", {1, 1}},       {"ISIRI", {1, 1}},
        {"ISURI", {1, 1}},       {"ISBLANK", {1, 1}},
        {"ISLITERAL", {1, 1}},   {"ISNUMERIC", {1, 1}},
        {"STR", {1, 1}},         {"LANG", {1, 1}},
        {"DATATYPE", {1, 1}},    {"STRLEN", {1, 1}},
        {"UCASE", {1, 1}},       {"LCASE", {1, 1}},
        {"CONTAINS", {2, 2}},    {"STRSTARTS", {2, 2}},
        {"STRENDS", {2, 2}},     {"REGEX", {2, 3}},
        {"SAMETERM", {2, 2}},    {"IF", {3, 3}},
        {"COALESCE", {0, variadic}}, {"LANGMATCHES", {2, 2}},
    };

    const std::unordered_map<std::string, aggregate_function> aggregates = {
        {"COUNT", aggregate_function::count},
        {"SUM", aggregate_function::sum},
        {"MIN", aggregate_function::min},
        {"MAX", aggregate_function::max},
        {"AVG", aggregate_function::avg},
        {"SAMPLE", aggregate_function::sample},
    };

    // -----------------------------------------------------------------------
    // Lexer
    // -----------------------------------------------------------------------

    bool
    is_name_start(char c) {
      return std::isalpha(static_cast<unsigned char>(c)) || c == '_' ||
             static_cast<unsigned char>(c) >= 0x80;
    }

    bool
    is_name_char(char c) {
      return std::isalnum(static_cast<unsigned char>(c)) || c == '_' ||
             c == '-' || static_cast<unsigned char>(c) >= 0x80;
    }

    bool
    is_digit(char c) {
      return c >= '0' && c <= '9';
    }

    class lexer {
    public:
      explicit lexer(const std::string& source) : src_(source), pos_(0) {}

      int
      line_number() const {
        int line = 1;
        for (std::size_t i = 0; i < pos_ && i < src_.size(); ++i)
          if (src_[i] == '\n') ++line;
        return line;
      }

      token
      next() {
        skip_whitespace_and_comments();
        if (pos_ >= src_.size()) return {token_kind::eof, ""};

        char c = src_[pos_];

        if (c == '"' || c == '\'') return read_string();
        if (c == '<') return read_iri_or_less();
        if ((c == '?' || c == '$') && pos_ + 1 < src_.size() &&
            is_name_char(src_[pos_ + 1])) {
          ++pos_;
          return {token_kind::var, read_name(false)};
        }
        if (c == '_' && pos_ + 1 < src_.size() && src_[pos_ + 1] == ':') {
          pos_ += 2;
          auto label = read_name(true);
          if (label.empty()) throw_error("empty blank node label");
          return {token_kind::blank_label, label};
        }
        if (c == '@' && pos_ + 1 < src_.size() &&
            std::isalpha(static_cast<unsigned char>(src_[pos_ + 1]))) {
          ++pos_;
          std::string tag;
          while (pos_ < src_.size() &&
                 (std::isalnum(static_cast<unsigned char>(src_[pos_])) ||
                  src_[pos_] == '-')) {
            tag += src_[pos_++];
          }
          return {token_kind::lang_tag, tag};
        }
        if (is_digit(c) ||
            (c == '.' && pos_ + 1 < src_.size() && is_digit(src_[pos_ + 1]))) {
          return read_number();
        }
        if (is_name_start(c) || c == ':') return read_name_or_pname();

        ++pos_;
        switch (c) {
          case '{':
            return {token_kind::lbrace, "{"};
          case '}':
            return {token_kind::rbrace, "}"};
          case '(':
            return {token_kind::lparen, "("};
          case ')':
            return {token_kind::rparen, ")"};
          case '[':
            return {token_kind::lbracket, "["};
          case ']':
            return {token_kind::rbracket, "]"};
          case '.':
            return {token_kind::dot, "."};
          case ';':
            return {token_kind::semicolon, ";"};
          case ',':
            return {token_kind::comma, ","};
          case '*':
            return {token_kind::star, "*"};
          case '/':
            return {token_kind::slash, "/"};
          case '+':
            return {token_kind::plus, "+"};
          case '-':
            return {token_kind::minus, "-"};
          case '=':
            return {token_kind::eq, "="};
          case '!':
            if (match_char('=')) return {token_kind::ne, "!="};
            return {token_kind::bang, "!"};
          case '>':
            if (match_char('=')) return {token_kind::ge, ">="};
            return {token_kind::gt, ">"};
          case '&':
            if (match_char('&')) return {token_kind::and_and, "&&"};
            break;
          case '|':
            if (match_char('|')) return {token_kind::or_or, "||"};
            break;
          case '^':
            if (match_char('^')) return {token_kind::caret_caret, "^^"};
            break;
          default:
            break;
        }
        throw_error(std::string("unexpected character: '") + c + "'");
      }

      token
      peek() {
        auto saved = pos_;
        auto tok = next();
        pos_ = saved;
        return tok;
      }

    private:
      const std::string& src_;
      std::size_t pos_;

      [[noreturn]] void
      throw_error(const std::string& msg) const {
        throw query_error("sparql parse error (line " +
                          std::to_string(line_number()) + "): " + msg);
      }

      bool
      match_char(char c) {
        if (pos_ < src_.size() && src_[pos_] == c) {
          ++pos_;
          return true;
        }
        return false;
      }

      void
      skip_whitespace_and_comments() {
        while (pos_ < src_.size()) {
          char c = src_[pos_];
          if (std::isspace(static_cast<unsigned char>(c))) {
            ++pos_;
            continue;
          }
          if (c == '#') {
            while (pos_ < src_.size() && src_[pos_] != '\n')
              ++pos_;
            continue;
          }
          break;
        }
      }

      // Name characters, plus '.' when it is followed by another name
      // character (a name never ends in '.'). Local names of prefixed names
      // may also contain ':'.
      std::string
      read_name(bool allow_dots, bool allow_colons = false) {
        std::string name;
        while (pos_ < src_.size()) {
          char c = src_[pos_];
          if (is_name_char(c) || (allow_colons && c == ':')) {
            name += c;
            ++pos_;
          } else if (c == '\\' && allow_colons && pos_ + 1 < src_.size()) {
            name += src_[pos_ + 1];
            pos_ += 2;
          } else if (c == '.' && allow_dots && pos_ + 1 < src_.size() &&
                     is_name_char(src_[pos_ + 1])) {
            name += c;
            ++pos_;
          } else {
            break;
          }
        }
        return name;
      }

      token
      read_name_or_pname() {
        std::string prefix = src_[pos_] == ':' ? "" : read_name(true);
        if (pos_ < src_.size() && src_[pos_] == ':') {
          ++pos_;
          auto local = read_name(true, true);
          return {token_kind::pname, prefix + ":" + local};
        }
        return {token_kind::word, prefix};
      }

      token
      read_iri_or_less() {
        std::size_t end = pos_ + 1;
        while (end < src_.size()) {
          char c = src_[end];
          if (c == '>') break;
          if (c == '<' || c == '"' || c == '{' || c == '}' || c == '|' ||
              c == '^' || c == '`' || c == '\\' ||
              static_cast<unsigned char>(c) <= 0x20) {
            end = src_.size();
            break;
          }
          ++end;
        }
        if (end < src_.size()) {
          std::string value = src_.substr(pos_ + 1, end - pos_ - 1);
          pos_ = end + 1;
          return {token_kind::iri_ref, value};
        }
        ++pos_;
        if (match_char('=')) return {token_kind::le, "<="};
        return {token_kind::lt, "<"};
      }

      token
      read_number() {
        std::string text;
        while (pos_ < src_.size() && is_digit(src_[pos_]))
          text += src_[pos_++];

        token_kind kind = token_kind::integer;
        if (pos_ + 1 < src_.size() && src_[pos_] == '.' &&
            is_digit(src_[pos_ + 1])) {
          kind = token_kind::decimal;
          text += src_[pos_++];
          while (pos_ < src_.size() && is_digit(src_[pos_]))
            text += src_[pos_++];
        }
        if (pos_ < src_.size() && (src_[pos_] == 'e' || src_[pos_] == 'E')) {
          std::size_t save = pos_;
          std::string exponent(1, src_[pos_++]);
          if (pos_ < src_.size() && (src_[pos_] == '+' || src_[pos_] == '-'))
            exponent += src_[pos_++];
          if (pos_ < src_.size() && is_digit(src_[pos_])) {
            while (pos_ < src_.size() && is_digit(src_[pos_]))
              exponent += src_[pos_++];
            text += exponent;
            kind = token_kind::double_;
          } else {
            pos_ = save;
          }
        }
        return {kind, text};
      }

      token
      read_string() {
        char quote = src_[pos_++];
        bool long_form = pos_ + 1 < src_.size() && src_[pos_] == quote &&
                         src_[pos_ + 1] == quote;
        if (long_form) pos_ += 2;

        std::string value;
        while (true) {
          if (pos_ >= src_.size()) throw_error("unterminated string literal");
          char c = src_[pos_];
          if (long_form) {
            if (c == quote && pos_ + 2 < src_.size() &&
                src_[pos_ + 1] == quote && src_[pos_ + 2] == quote) {
              pos_ += 3;
              break;
            }
          } else if (c == quote) {
            ++pos_;
            break;
          } else if (c == '\n' || c == '\r') {
            throw_error("line break in string literal");
          }

          if (c == '\\') {
            read_escape(value);
          } else {
            value += c;
            ++pos_;
          }
        }
        return {token_kind::string, value};
      }

      void
      read_escape(std::string& out) {
        ++pos_;
        if (pos_ >= src_.size()) throw_error("dangling escape");
        char c = src_[pos_++];
        switch (c) {
          case 't':
            out += '\t';
            return;
          case 'n':
            out += '\n';
            return;
          case 'r':
            out += '\r';
            return;
          case 'b':
            out += '\b';
            return;
          case 'f':
            out += '\f';
            return;
          case '"':
          case '\'':
          case '\\':
            out += c;
            return;
          case 'u':
          case 'U': {
            std::size_t n = c == 'u' ? 4 : 8;
            if (pos_ + n > src_.size()) throw_error("truncated escape");
            try {
              detail::append_utf8(out, detail::parse_hex(
                                           std::string_view(src_).substr(pos_, n)));
            } catch (const std::invalid_argument& e) {
              throw_error(e.what());
            }
            pos_ += n;
            return;
          }
          default:
            throw_error(std::string("unknown escape '\\") + c + "'");
        }
      }
    };

    // -----------------------------------------------------------------------
    // Parser
    // -----------------------------------------------------------------------

    class parser {
    public:
      explicit parser(const std::string& source) : lex_(source) { advance(); }

      select_query
      parse_query() {
        parse_prologue();

        select_query q;
        expect_keyword("SELECT");
        if (match_keyword("DISTINCT")) {
          q.distinct = true;
        } else if (match_keyword("REDUCED")) {
          q.reduced = true;
        }
        parse_projection(q);

        match_keyword("WHERE");
        q.where = parse_group();

        parse_solution_modifiers(q);

        if (current_.kind != token_kind::eof) {
          error("unexpected '" + current_.value + "' after query");
        }
        return q;
      }

    private:
      lexer lex_;
      token current_;
      std::string base_;
      std::unordered_map<std::string, std::string> prefixes_;
      std::size_t anonymous_ = 0;

      void
      advance() {
        current_ = lex_.next();
      }

      [[noreturn]] void
      error(const std::string& msg) {
        throw query_error("sparql parse error (line " +
                          std::to_string(lex_.line_number()) + "): " + msg);
      }

      std::string
      describe_current() const {
        return current_.kind == token_kind::eof ? "end of input"
                                                : "'" + current_.value + "'";
      }

      void
      expect(token_kind k, const std::string& what) {
        if (current_.kind != k) {
          error("expected " + what + ", got " + describe_current());
        }
        advance();
      }

      bool
      match(token_kind k) {
        if (current_.kind == k) {
          advance();
          return true;
        }
        return false;
      }

      bool
      is_keyword(const char* keyword) const {
        return current_.kind == token_kind::word &&
               detail::to_upper(current_.value) == keyword;
      }

      bool
      match_keyword(const char* keyword) {
        if (is_keyword(keyword)) {
          advance();
          return true;
        }
        return false;
      }

      void
      expect_keyword(const char* keyword) {
        if (!match_keyword(keyword)) {
          error(std::string("expected ") + keyword + ", got " +
                describe_current());
        }
      }

      std::string
      expect_var() {
        if (current_.kind != token_kind::var) {
          error("expected variable, got " + describe_current());
        }
        auto name = current_.value;
        advance();
        return name;
      }

      // -------------------------------------------------------------------
      // Prologue
      // -------------------------------------------------------------------

      void
      parse_prologue() {
        while (true) {
          if (match_keyword("PREFIX")) {
            if (current_.kind != token_kind::pname ||
                current_.value.back() != ':') {
              error("expected prefix name, got " + describe_current());
            }
            auto prefix = current_.value.substr(0, current_.value.size() - 1);
            advance();
            if (current_.kind != token_kind::iri_ref) {
              error("expected IRI after PREFIX " + prefix + ":");
            }
            prefixes_[prefix] = resolve(current_.value);
            advance();
          } else if (match_keyword("BASE")) {
            if (current_.kind != token_kind::iri_ref) {
              error("expected IRI after BASE");
            }
            base_ = current_.value;
            advance();
          } else {
            break;
          }
        }
      }

      std::string
      resolve(const std::string& value) const {
        if (base_.empty()) return value;
        auto colon = value.find(':');
        auto delimiter = value.find_first_of("/?#");
        if (colon != std::string::npos &&
            (delimiter == std::string::npos || colon < delimiter)) {
          return value;
        }
        return base_ + value;
      }

      iri
      expand_pname(const std::string& pname) {
        auto colon = pname.find(':');
        auto prefix = pname.substr(0, colon);
        auto it = prefixes_.find(prefix);
        if (it == prefixes_.end()) error("undefined prefix '" + prefix + "'");
        return iri(it->second + pname.substr(colon + 1));
      }

      // -------------------------------------------------------------------
      // SELECT clause and solution modifiers
      // -------------------------------------------------------------------

      void
      parse_projection(select_query& q) {
        if (match(token_kind::star)) {
          q.select_all = true;
          return;
        }
        while (true) {
          if (current_.kind == token_kind::var) {
            q.projections.push_back({expect_var(), nullptr});
          } else if (match(token_kind::lparen)) {
            auto value = parse_expression();
            expect_keyword("AS");
            auto name = expect_var();
            expect(token_kind::rparen, "')'");
            q.projections.push_back({std::move(name), std::move(value)});
          } else {
            break;
          }
        }
        if (q.projections.empty()) {
          error("expected projection, got " + describe_current());
        }
      }

      void
      parse_solution_modifiers(select_query& q) {
        if (match_keyword("GROUP")) {
          expect_keyword("BY");
          do {
            q.group_by.push_back(parse_group_condition());
          } while (current_.kind == token_kind::var ||
                   current_.kind == token_kind::lparen ||
                   (current_.kind == token_kind::word && is_call_start()));
        }

        if (match_keyword("HAVING")) {
          do {
            q.having.push_back(parse_constraint());
          } while (current_.kind == token_kind::lparen ||
                   (current_.kind == token_kind::word && is_call_start()));
        }

        if (match_keyword("ORDER")) {
          expect_keyword("BY");
          do {
            q.order_by.push_back(parse_order_condition());
          } while (current_.kind == token_kind::var ||
                   current_.kind == token_kind::lparen ||
                   is_keyword("ASC") || is_keyword("DESC") ||
                   (current_.kind == token_kind::word && is_call_start()));
        }

        for (int i = 0; i < 2; ++i) {
          if (match_keyword("LIMIT")) {
            q.limit = parse_count("LIMIT");
          } else if (match_keyword("OFFSET")) {
            q.offset = parse_count("OFFSET");
          }
        }
      }

      bool
      is_call_start() const {
        auto name = detail::to_upper(current_.value);
        return builtins.count(name) != 0 || aggregates.count(name) != 0 ||
               name == "NOT" || name == "EXISTS";
      }

      std::size_t
      parse_count(const std::string& clause) {
        if (current_.kind != token_kind::integer) {
          error("expected integer after " + clause);
        }
        auto value = static_cast<std::size_t>(std::stoull(current_.value));
        advance();
        return value;
      }

      group_condition
      parse_group_condition() {
        if (current_.kind == token_kind::var) {
          auto name = expect_var();
          return {std::make_unique<expression>(variable_expr{name}), name};
        }
        if (match(token_kind::lparen)) {
          auto key = parse_expression();
          std::optional<std::string> name;
          if (match_keyword("AS")) name = expect_var();
          expect(token_kind::rparen, "')'");
          return {std::move(key), std::move(name)};
        }
        return {parse_primary(), std::nullopt};
      }

      order_condition
      parse_order_condition() {
        if (is_keyword("ASC") || is_keyword("DESC")) {
          bool descending = is_keyword("DESC");
          advance();
          expect(token_kind::lparen, "'('");
          auto key = parse_expression();
          expect(token_kind::rparen, "')'");
          return {std::move(key), descending};
        }
        if (current_.kind == token_kind::var) {
          return {std::make_unique<expression>(variable_expr{expect_var()}),
                  false};
        }
        return {parse_constraint(), false};
      }

      // FILTER / HAVING argument: a bracketted expression or a call.
      expression_ptr
      parse_constraint() {
        if (match(token_kind::lparen)) {
          auto e = parse_expression();
          expect(token_kind::rparen, "')'");
          return e;
        }
        if (current_.kind == token_kind::word) return parse_primary();
        error("expected constraint, got " + describe_current());
      }

      // -------------------------------------------------------------------
      // Group graph patterns
      // -------------------------------------------------------------------

      group_pattern
      parse_group() {
        expect(token_kind::lbrace, "'{'");
        group_pattern g;

        while (current_.kind != token_kind::rbrace) {
          if (current_.kind == token_kind::eof) error("unterminated group");

          if (match_keyword("FILTER")) {
            g.elements.emplace_back(filter_element{parse_constraint()});
          } else if (match_keyword("OPTIONAL")) {
            g.elements.emplace_back(optional_element{
                std::make_unique<group_pattern>(parse_group())});
          } else if (match_keyword("MINUS")) {
            g.elements.emplace_back(
                minus_element{std::make_unique<group_pattern>(parse_group())});
          } else if (match_keyword("BIND")) {
            expect(token_kind::lparen, "'('");
            auto value = parse_expression();
            expect_keyword("AS");
            auto name = expect_var();
            expect(token_kind::rparen, "')'");
            g.elements.emplace_back(bind_element{std::move(value), name});
          } else if (match_keyword("VALUES")) {
            g.elements.emplace_back(parse_values());
          } else if (current_.kind == token_kind::lbrace) {
            union_element u;
            u.alternatives.push_back(
                std::make_unique<group_pattern>(parse_group()));
            while (match_keyword("UNION")) {
              u.alternatives.push_back(
                  std::make_unique<group_pattern>(parse_group()));
            }
            g.elements.emplace_back(std::move(u));
          } else {
            if (g.elements.empty() ||
                !std::holds_alternative<triples_element>(g.elements.back())) {
              g.elements.emplace_back(triples_element{});
            }
            parse_triples(
                std::get<triples_element>(g.elements.back()).patterns);
          }

          match(token_kind::dot);
        }
        advance();
        return g;
      }

      values_element
      parse_values() {
        values_element v;
        if (current_.kind == token_kind::var) {
          v.variables.push_back(expect_var());
          expect(token_kind::lbrace, "'{'");
          while (!match(token_kind::rbrace)) {
            v.rows.push_back({parse_data_value()});
          }
          return v;
        }

        expect(token_kind::lparen, "'(' or variable after VALUES");
        while (!match(token_kind::rparen)) {
          v.variables.push_back(expect_var());
        }
        expect(token_kind::lbrace, "'{'");
        while (!match(token_kind::rbrace)) {
          expect(token_kind::lparen, "'('");
          std::vector<std::optional<term>> row;
          while (!match(token_kind::rparen)) {
            row.push_back(parse_data_value());
          }
          if (row.size() != v.variables.size()) {
            error("VALUES row has " + std::to_string(row.size()) +
                  " values, expected " + std::to_string(v.variables.size()));
          }
          v.rows.push_back(std::move(row));
        }
        return v;
      }

      std::optional<term>
      parse_data_value() {
        if (match_keyword("UNDEF")) return std::nullopt;
        auto node = parse_node();
        if (auto* t = std::get_if<term>(&node)) return *t;
        error("variables are not allowed in VALUES");
      }

      void
      parse_triples(std::vector<triple_pattern>& out) {
        auto subject = parse_node();
        parse_property_list(subject, out);
      }

      bool
      is_verb_start() const {
        return current_.kind == token_kind::var ||
               current_.kind == token_kind::iri_ref ||
               current_.kind == token_kind::pname ||
               (current_.kind == token_kind::word && current_.value == "a");
      }

      void
      parse_property_list(const pattern_node& subject,
                          std::vector<triple_pattern>& out) {
        while (true) {
          pattern_node verb;
          if (current_.kind == token_kind::word && current_.value == "a") {
            advance();
            verb = term{rdf::type};
          } else if (is_verb_start()) {
            verb = parse_node();
          } else {
            error("expected predicate, got " + describe_current());
          }

          do {
            out.push_back({subject, verb, parse_node()});
          } while (match(token_kind::comma));

          if (!match(token_kind::semicolon)) break;
          while (match(token_kind::semicolon)) {}
          if (!is_verb_start()) break;
        }
      }

      pattern_node
      parse_node() {
        switch (current_.kind) {
          case token_kind::var:
            return variable{expect_var()};
          case token_kind::iri_ref: {
            iri value(resolve(current_.value));
            advance();
            return term{std::move(value)};
          }
          case token_kind::pname: {
            auto value = expand_pname(current_.value);
            advance();
            return term{std::move(value)};
          }
          case token_kind::blank_label: {
            blank_node value(current_.value);
            advance();
            return term{std::move(value)};
          }
          case token_kind::lbracket:
            advance();
            expect(token_kind::rbracket, "']'");
            // Written with a '.' so it cannot clash with a query variable.
            return variable{".anon" + std::to_string(anonymous_++)};
          case token_kind::minus:
          case token_kind::plus: {
            bool negative = current_.kind == token_kind::minus;
            advance();
            auto number = parse_literal();
            if (negative) {
              number = literal("-" + number.lexical(), number.datatype());
            }
            return term{std::move(number)};
          }
          default:
            return term{parse_literal()};
        }
      }

      // String, numeric or boolean literal at the current token.
      literal
      parse_literal() {
        switch (current_.kind) {
          case token_kind::string: {
            auto lexical = current_.value;
            advance();
            if (current_.kind == token_kind::lang_tag) {
              auto tag = current_.value;
              advance();
              return literal::lang_string(std::move(lexical), std::move(tag));
            }
            if (match(token_kind::caret_caret)) {
              if (current_.kind == token_kind::iri_ref) {
                iri datatype(resolve(current_.value));
                advance();
                return literal(std::move(lexical), std::move(datatype));
              }
              if (current_.kind == token_kind::pname) {
                auto datatype = expand_pname(current_.value);
                advance();
                return literal(std::move(lexical), std::move(datatype));
              }
              error("expected datatype IRI, got " + describe_current());
            }
            return literal(std::move(lexical));
          }
          case token_kind::integer:
            return numeric_literal(xsd::integer);
          case token_kind::decimal:
            return numeric_literal(xsd::decimal);
          case token_kind::double_:
            return numeric_literal(xsd::double_);
          case token_kind::word:
            if (current_.value == "true" || current_.value == "false") {
              literal value(current_.value, xsd::boolean);
              advance();
              return value;
            }
            break;
          default:
            break;
        }
        error("expected RDF term, got " + describe_current());
      }

      literal
      numeric_literal(const iri& datatype) {
        literal value(current_.value, datatype);
        advance();
        return value;
      }

      // -------------------------------------------------------------------
      // Expressions
      // -------------------------------------------------------------------

      expression_ptr
      parse_expression() {
        return parse_or();
      }

      expression_ptr
      binary(binary_op op, expression_ptr left, expression_ptr right) {
        return std::make_unique<expression>(
            binary_expr{op, std::move(left), std::move(right)});
      }

      expression_ptr
      parse_or() {
        auto left = parse_and();
        while (match(token_kind::or_or)) {
          left = binary(binary_op::logical_or, std::move(left), parse_and());
        }
        return left;
      }

      expression_ptr
      parse_and() {
        auto left = parse_relational();
        while (match(token_kind::and_and)) {
          left = binary(binary_op::logical_and, std::move(left),
                        parse_relational());
        }
        return left;
      }

      expression_ptr
      parse_relational() {
        auto left = parse_additive();

        static const std::unordered_map<token_kind, binary_op> comparisons = {
            {token_kind::eq, binary_op::equal},
            {token_kind::ne, binary_op::not_equal},
            {token_kind::lt, binary_op::less},
            {token_kind::le, binary_op::less_equal},
            {token_kind::gt, binary_op::greater},
            {token_kind::ge, binary_op::greater_equal},
        };
        if (auto it = comparisons.find(current_.kind);
            it != comparisons.end()) {
          advance();
          return binary(it->second, std::move(left), parse_additive());
        }

        bool negated = false;
        if (is_keyword("NOT")) {
          auto next = lex_.peek();
          if (next.kind == token_kind::word &&
              detail::to_upper(next.value) == "IN") {
            advance();
            negated = true;
          }
        }
        if (match_keyword("IN")) {
          in_expr in;
          in.operand = std::move(left);
          in.negated = negated;
          expect(token_kind::lparen, "'('");
          if (!match(token_kind::rparen)) {
            do {
              in.list.push_back(parse_expression());
            } while (match(token_kind::comma));
            expect(token_kind::rparen, "')'");
          }
          return std::make_unique<expression>(std::move(in));
        }
        return left;
      }

      expression_ptr
      parse_additive() {
        auto left = parse_multiplicative();
        while (true) {
          if (match(token_kind::plus)) {
            left = binary(binary_op::add, std::move(left),
                          parse_multiplicative());
          } else if (match(token_kind::minus)) {
            left = binary(binary_op::subtract, std::move(left),
                          parse_multiplicative());
          } else {
            return left;
          }
        }
      }

      expression_ptr
      parse_multiplicative() {
        auto left = parse_unary();
        while (true) {
          if (match(token_kind::star)) {
            left = binary(binary_op::multiply, std::move(left), parse_unary());
          } else if (match(token_kind::slash)) {
            left = binary(binary_op::divide, std::move(left), parse_unary());
          } else {
            return left;
          }
        }
      }

      expression_ptr
      parse_unary() {
        if (match(token_kind::bang)) {
          return std::make_unique<expression>(
              unary_expr{unary_op::logical_not, parse_unary()});
        }
        if (match(token_kind::minus)) {
          return std::make_unique<expression>(
              unary_expr{unary_op::negate, parse_unary()});
        }
        if (match(token_kind::plus)) {
          return std::make_unique<expression>(
              unary_expr{unary_op::plus, parse_unary()});
        }
        return parse_primary();
      }

      expression_ptr
      constant(term value) {
        return std::make_unique<expression>(constant_expr{std::move(value)});
      }

      expression_ptr
      parse_primary() {
        switch (current_.kind) {
          case token_kind::lparen: {
            advance();
            auto e = parse_expression();
            expect(token_kind::rparen, "')'");
            return e;
          }
          case token_kind::var:
            return std::make_unique<expression>(variable_expr{expect_var()});
          case token_kind::iri_ref:
          case token_kind::pname: {
            auto node = parse_node();
            if (current_.kind == token_kind::lparen) {
              error("unsupported function " + to_string(std::get<term>(node)));
            }
            return constant(std::get<term>(std::move(node)));
          }
          case token_kind::string:
          case token_kind::integer:
          case token_kind::decimal:
          case token_kind::double_:
            return constant(parse_literal());
          case token_kind::word:
            return parse_word();
          default:
            error("expected expression, got " + describe_current());
        }
      }

      expression_ptr
      parse_word() {
        if (current_.value == "true" || current_.value == "false") {
          return constant(parse_literal());
        }

        auto name = detail::to_upper(current_.value);
        if (name == "NOT") {
          advance();
          expect_keyword("EXISTS");
          return std::make_unique<expression>(exists_expr{
              std::make_unique<group_pattern>(parse_group()), true});
        }
        if (name == "EXISTS") {
          advance();
          return std::make_unique<expression>(exists_expr{
              std::make_unique<group_pattern>(parse_group()), false});
        }

        if (auto agg = aggregates.find(name); agg != aggregates.end()) {
          advance();
          expect(token_kind::lparen, "'('");
          aggregate_expr a;
          a.function = agg->second;
          a.distinct = match_keyword("DISTINCT");
          if (a.function == aggregate_function::count &&
              match(token_kind::star)) {
            a.argument = nullptr;
          } else {
            a.argument = parse_expression();
          }
          expect(token_kind::rparen, "')'");
          return std::make_unique<expression>(std::move(a));
        }

        auto builtin = builtins.find(name);
        if (builtin == builtins.end()) {
          error("unknown function '" + current_.value + "'");
        }
        advance();

        call_expr call;
        call.name = name;
        expect(token_kind::lparen, "'('");
        if (!match(token_kind::rparen)) {
          do {
            call.args.push_back(parse_expression());
          } while (match(token_kind::comma));
          expect(token_kind::rparen, "')'");
        }

        auto [min, max] = builtin->second;
        if (call.args.size() < min || call.args.size() > max) {
          error(name + " called with " + std::to_string(call.args.size()) +
                " arguments");
        }
        if (name == "BOUND" && !call.args[0]->holds<variable_expr>()) {
          error("BOUND requires a variable");
        }
        return std::make_unique<expression>(std::move(call));
      }
    };

  } // namespace

  select_query
  query_parser::parse(const std::string& source) {
    parser p(source);
    return p.parse_query();
  }

} // namespace shx::sparql
