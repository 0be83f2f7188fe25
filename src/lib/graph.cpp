#include <shx/graph.hpp>

#include <stdexcept>

namespace shx {

  graph::graph(std::initializer_list<triple> triples) {
    for (const auto& t : triples) {
      add(t);
    }
  }

  bool
  graph::add(triple t) {
    if (is_literal(t.subject)) {
      throw std::invalid_argument("graph: literal in subject position: " +
                                  to_string(t.subject));
    }
    if (members_.count(t)) { return false; }

    std::size_t index = triples_.size();
    by_subject_[t.subject].push_back(index);
    by_predicate_[t.predicate].push_back(index);
    members_.insert(t);
    triples_.push_back(std::move(t));
    return true;
  }

  bool
  graph::add(term subject, iri predicate, term object) {
    return add(triple{std::move(subject), std::move(predicate),
                      std::move(object)});
  }

  void
  graph::merge(const graph& other) {
    for (const auto& t : other.triples_) {
      add(t);
    }
  }

  bool
  graph::contains(const triple& t) const {
    return members_.count(t) != 0;
  }

  void
  graph::for_each_match(
      const std::optional<term>& subject, const std::optional<iri>& predicate,
      const std::function<bool(const triple&)>& visitor) const {
    if (subject) {
      auto it = by_subject_.find(*subject);
      if (it == by_subject_.end()) { return; }
      for (auto index : it->second) {
        const auto& t = triples_[index];
        if (predicate && t.predicate != *predicate) continue;
        if (!visitor(t)) return;
      }
      return;
    }

    if (predicate) {
      auto it = by_predicate_.find(*predicate);
      if (it == by_predicate_.end()) { return; }
      for (auto index : it->second) {
        if (!visitor(triples_[index])) return;
      }
      return;
    }

    for (const auto& t : triples_) {
      if (!visitor(t)) return;
    }
  }

  std::vector<triple>
  graph::triples_with(const std::optional<term>& subject,
                      const std::optional<iri>& predicate) const {
    std::vector<triple> result;
    for_each_match(subject, predicate, [&result](const triple& t) {
      result.push_back(t);
      return true;
    });
    return result;
  }

  std::vector<term>
  graph::objects(const term& subject, const iri& predicate) const {
    std::vector<term> result;
    for_each_match(subject, predicate, [&result](const triple& t) {
      result.push_back(t.object);
      return true;
    });
    return result;
  }

  std::optional<term>
  graph::object(const term& subject, const iri& predicate) const {
    std::optional<term> result;
    for_each_match(subject, predicate, [&result](const triple& t) {
      result = t.object;
      return false;
    });
    return result;
  }

  std::vector<term>
  graph::subjects(const iri& predicate, const term& object) const {
    std::vector<term> result;
    for_each_match(std::nullopt, predicate, [&](const triple& t) {
      if (t.object == object) { result.push_back(t.subject); }
      return true;
    });
    return result;
  }

} // namespace shx
