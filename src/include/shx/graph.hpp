#pragma once

#include <shx/term.hpp>

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace shx {

  struct triple {
    term subject;
    iri predicate;
    term object;

    auto
    operator<=>(const triple&) const = default;

    bool
    operator==(const triple&) const = default;
  };

} // namespace shx

template <>
struct std::hash<shx::triple> {
  std::size_t
  operator()(const shx::triple& t) const noexcept {
    std::size_t h1 = std::hash<shx::term>{}(t.subject);
    std::size_t h2 = std::hash<shx::iri>{}(t.predicate);
    std::size_t h3 = std::hash<shx::term>{}(t.object);
    return h1 ^ (h2 << 1) ^ (h3 << 2);
  }
};

namespace shx {

  // A set of triples. Iteration follows insertion order; adding a triple that
  // is already present is a no-op. Lookups go through a subject index and a
  // predicate index.
  class graph {
    std::vector<triple> triples_;
    std::unordered_set<triple> members_;
    std::unordered_map<term, std::vector<std::size_t>> by_subject_;
    std::unordered_map<iri, std::vector<std::size_t>> by_predicate_;

  public:
    graph() = default;

    graph(std::initializer_list<triple> triples);

    // Returns false when the triple was already present. Throws
    // std::invalid_argument for a literal subject.
    bool
    add(triple t);

    bool
    add(term subject, iri predicate, term object);

    void
    merge(const graph& other);

    bool
    contains(const triple& t) const;

    std::size_t
    size() const {
      return triples_.size();
    }

    bool
    empty() const {
      return triples_.empty();
    }

    const std::vector<triple>&
    triples() const {
      return triples_;
    }

    // Triples matching the given subject and/or predicate. With neither
    // given, every triple is returned.
    std::vector<triple>
    triples_with(const std::optional<term>& subject,
                 const std::optional<iri>& predicate) const;

    std::vector<term>
    objects(const term& subject, const iri& predicate) const;

    std::optional<term>
    object(const term& subject, const iri& predicate) const;

    std::vector<term>
    subjects(const iri& predicate, const term& object) const;

    // Visit every triple matching the given pattern without copying.
    // Returning false from the visitor stops the scan.
    void
    for_each_match(const std::optional<term>& subject,
                   const std::optional<iri>& predicate,
                   const std::function<bool(const triple&)>& visitor) const;

    bool
    operator==(const graph& other) const {
      return members_ == other.members_;
    }
  };

} // namespace shx
