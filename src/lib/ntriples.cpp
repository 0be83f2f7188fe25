#include <shx/ntriples.hpp>
#include <shx/vocabulary.hpp>

#include <serd/serd.h>

#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <sstream>
#include <stdexcept>

namespace shx {

  namespace {

    std::string
    node_text(const SerdNode* node) {
      return std::string(reinterpret_cast<const char*>(node->buf),
                         node->n_bytes);
    }

    bool
    is_present(const SerdNode* node) {
      return node != nullptr && node->type != SERD_NOTHING;
    }

    term
    to_term(const SerdNode* node, const SerdNode* datatype,
            const SerdNode* language) {
      switch (node->type) {
        case SERD_URI:
          return iri(node_text(node));
        case SERD_BLANK:
          return blank_node(node_text(node));
        case SERD_LITERAL:
          if (is_present(language)) {
            return literal::lang_string(node_text(node), node_text(language));
          }
          if (is_present(datatype)) {
            return literal(node_text(node), iri(node_text(datatype)));
          }
          return literal(node_text(node));
        default:
          break;
      }
      throw std::runtime_error("ntriples parse error: unexpected node " +
                               node_text(node));
    }

    // Exceptions must not unwind through serd's C callbacks. The first
    // failure is recorded here and thrown once the reader returns.
    struct read_state {
      graph& into;
      std::optional<std::string> error;
    };

    SerdStatus
    on_statement(void* handle, SerdStatementFlags, const SerdNode*,
                 const SerdNode* subject, const SerdNode* predicate,
                 const SerdNode* object, const SerdNode* object_datatype,
                 const SerdNode* object_lang) {
      auto* state = static_cast<read_state*>(handle);
      try {
        state->into.add(to_term(subject, nullptr, nullptr),
                        iri(node_text(predicate)),
                        to_term(object, object_datatype, object_lang));
      } catch (const std::exception& e) {
        if (!state->error) { state->error = e.what(); }
        return SERD_ERR_BAD_SYNTAX;
      }
      return SERD_SUCCESS;
    }

    SerdStatus
    on_error(void* handle, const SerdError* error) {
      auto* state = static_cast<read_state*>(handle);
      if (state->error) { return SERD_SUCCESS; }

      char buffer[512];
      va_list args;
      va_copy(args, *error->args);
      std::vsnprintf(buffer, sizeof(buffer), error->fmt, args);
      va_end(args);

      std::string message(buffer);
      while (!message.empty() && message.back() == '\n') {
        message.pop_back();
      }
      state->error = "ntriples parse error (line " +
                     std::to_string(error->line) + "): " + message;
      return SERD_SUCCESS;
    }

    // Owns a SerdReader for the duration of one parse.
    struct reader_handle {
      SerdReader* reader;

      explicit reader_handle(read_state& state)
          : reader(serd_reader_new(SERD_NTRIPLES, &state, nullptr, nullptr,
                                   nullptr, on_statement, nullptr)) {
        if (reader == nullptr) {
          throw std::runtime_error("ntriples: failed to create reader");
        }
        serd_reader_set_strict(reader, true);
        serd_reader_set_error_sink(reader, on_error, &state);
      }

      ~reader_handle() {
        serd_reader_free(reader);
      }

      reader_handle(const reader_handle&) = delete;
      reader_handle&
      operator=(const reader_handle&) = delete;
    };

    std::size_t
    write_to_stream(const void* buf, std::size_t len, void* stream) {
      static_cast<std::ostream*>(stream)->write(
          static_cast<const char*>(buf), static_cast<std::streamsize>(len));
      return len;
    }

    // Owns the environment and writer for one serialization.
    struct writer_handle {
      SerdEnv* env;
      SerdWriter* writer;

      explicit writer_handle(std::ostream& os)
          : env(serd_env_new(nullptr)),
            writer(serd_writer_new(SERD_NTRIPLES, static_cast<SerdStyle>(0),
                                   env, nullptr, write_to_stream, &os)) {
        if (env == nullptr || writer == nullptr) {
          serd_writer_free(writer);
          serd_env_free(env);
          throw std::runtime_error("ntriples: failed to create writer");
        }
      }

      ~writer_handle() {
        serd_writer_free(writer);
        serd_env_free(env);
      }

      writer_handle(const writer_handle&) = delete;
      writer_handle&
      operator=(const writer_handle&) = delete;
    };

    SerdNode
    make_node(SerdType type, const std::string& text) {
      return serd_node_from_substring(
          type, reinterpret_cast<const std::uint8_t*>(text.data()),
          text.size());
    }

    SerdNode
    resource_node(const term& t) {
      if (const auto* i = std::get_if<iri>(&t)) {
        return make_node(SERD_URI, i->value());
      }
      return make_node(SERD_BLANK, std::get<blank_node>(t).id());
    }

    void
    check(SerdStatus status, const char* what) {
      if (status != SERD_SUCCESS) {
        throw std::runtime_error(
            std::string("ntriples: ") + what + ": " +
            reinterpret_cast<const char*>(serd_strerror(status)));
      }
    }

  } // namespace

  void
  ntriples_parser::parse_into(std::string_view source, graph& into) {
    read_state state{into, std::nullopt};
    reader_handle handle(state);

    std::string text(source);
    auto status = serd_reader_read_string(
        handle.reader, reinterpret_cast<const std::uint8_t*>(text.c_str()));

    if (state.error) { throw std::runtime_error(*state.error); }
    if (status > SERD_FAILURE) {
      throw std::runtime_error(
          std::string("ntriples parse error: ") +
          reinterpret_cast<const char*>(serd_strerror(status)));
    }
  }

  graph
  ntriples_parser::parse(std::string_view source) {
    graph g;
    parse_into(source, g);
    return g;
  }

  void
  write_ntriples(std::ostream& os, const graph& g) {
    writer_handle handle(os);

    for (const auto& t : g.triples()) {
      SerdNode subject = resource_node(t.subject);
      SerdNode predicate = make_node(SERD_URI, t.predicate.value());

      const auto* lit = std::get_if<literal>(&t.object);
      if (lit == nullptr) {
        SerdNode object = resource_node(t.object);
        check(serd_writer_write_statement(handle.writer, 0, nullptr, &subject,
                                          &predicate, &object, nullptr,
                                          nullptr),
              "write failed");
        continue;
      }

      SerdNode object = make_node(SERD_LITERAL, lit->lexical());
      auto language = lit->language();
      SerdNode language_node = SERD_NODE_NULL;
      SerdNode datatype_node = SERD_NODE_NULL;
      if (language) {
        language_node = make_node(SERD_LITERAL, *language);
      } else if (lit->datatype() != xsd::string) {
        datatype_node = make_node(SERD_URI, lit->datatype().value());
      }
      check(serd_writer_write_statement(
                handle.writer, 0, nullptr, &subject, &predicate, &object,
                language ? nullptr : &datatype_node,
                language ? &language_node : nullptr),
            "write failed");
    }

    check(serd_writer_finish(handle.writer), "write failed");
  }

  std::string
  to_ntriples(const graph& g) {
    std::ostringstream os;
    write_ntriples(os, g);
    return os.str();
  }

} // namespace shx
