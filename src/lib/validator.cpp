#include <shx/validator.hpp>

#include <shx/cardinality_validator.hpp>
#include <shx/qualified_validator.hpp>
#include <shx/shape_reader.hpp>
#include <shx/sparql_validator.hpp>
#include <shx/string_validator.hpp>
#include <shx/type_validator.hpp>
#include <shx/value_validator.hpp>
#include <shx/vocabulary.hpp>

#include <algorithm>
#include <future>
#include <mutex>
#include <thread>
#include <unordered_set>

namespace shx {

  namespace {

    void
    append(validation_results& to, validation_results from,
           severity declared) {
      for (auto& r : from) {
        r.severity = declared;
        to.push_back(std::move(r));
      }
    }

    validation_results
    validate_focus(const graph& data, const term& focus,
                   const node_shape& shape, const shape_map& shapes,
                   const validation_options& opts) {
      validation_results results;
      append(results, type_validator::validate_node(data, focus, shape),
             shape.severity);
      append(results, string_validator::validate_node(data, focus, shape),
             shape.severity);
      append(results, value_validator::validate_node(data, focus, shape),
             shape.severity);
      append(results,
             logical_validator::validate_node(data, focus, shape, shapes,
                                              opts.on_warning),
             shape.severity);

      for (const auto& p : shape.property_shapes) {
        append(results, cardinality_validator::validate(data, focus, p),
               p.severity);
        append(results, type_validator::validate(data, focus, p), p.severity);
        append(results, string_validator::validate(data, focus, p),
               p.severity);
        append(results, value_validator::validate(data, focus, p), p.severity);
        append(results, qualified_validator::validate(data, focus, p),
               p.severity);
      }

      sparql::query_options query_opts;
      query_opts.timeout = opts.query_timeout;
      append(results,
             sparql_validator::validate(data, focus, shape.sparql_constraints,
                                        query_opts, opts.on_warning),
             shape.severity);
      return results;
    }

    validation_results
    validate_parallel(const graph& data, const std::vector<node_shape>& shapes,
                      const shape_map& map, const validation_options& opts) {
      // Warnings from concurrent tasks reach the caller's sink one at a time.
      std::mutex sink_mutex;
      validation_options task_opts = opts;
      task_opts.on_warning = [&](const std::string& message) {
        std::lock_guard<std::mutex> lock(sink_mutex);
        warn(opts.on_warning, message);
      };

      std::size_t batch = opts.max_concurrency;
      if (batch == 0) batch = std::max(1u, std::thread::hardware_concurrency());

      validation_results results;
      for (std::size_t start = 0; start < shapes.size(); start += batch) {
        auto end = std::min(shapes.size(), start + batch);
        std::vector<std::future<validation_results>> tasks;
        for (auto i = start; i < end; ++i) {
          tasks.push_back(std::async(std::launch::async, [&, i] {
            return validate_shape(data, shapes[i], map, task_opts);
          }));
        }
        for (auto& task : tasks) {
          auto part = task.get();
          results.insert(results.end(), std::make_move_iterator(part.begin()),
                         std::make_move_iterator(part.end()));
        }
      }
      return results;
    }

  } // namespace

  std::vector<term>
  select_targets(const graph& data, const node_shape& shape) {
    std::vector<term> targets;
    std::unordered_set<term> seen;
    auto add = [&](const term& t) {
      if (seen.insert(t).second) targets.push_back(t);
    };

    for (const auto& c : shape.target_classes) {
      for (const auto& s : data.subjects(rdf::type, term{c})) add(s);
    }
    if (shape.implicit_class_target && is_iri(shape.id)) {
      for (const auto& s : data.subjects(rdf::type, shape.id)) add(s);
    }
    for (const auto& n : shape.target_nodes) add(n);
    for (const auto& p : shape.target_subjects_of) {
      for (const auto& t : data.triples_with(std::nullopt, p)) add(t.subject);
    }
    for (const auto& p : shape.target_objects_of) {
      for (const auto& t : data.triples_with(std::nullopt, p)) add(t.object);
    }
    return targets;
  }

  validation_results
  validate_shape(const graph& data, const node_shape& shape,
                 const shape_map& shapes, const validation_options& opts) {
    validation_results results;
    for (const auto& focus : select_targets(data, shape)) {
      auto part = validate_focus(data, focus, shape, shapes, opts);
      results.insert(results.end(), std::make_move_iterator(part.begin()),
                     std::make_move_iterator(part.end()));
    }
    return results;
  }

  report
  validate(const graph& data, const std::vector<node_shape>& shapes,
           const validation_options& opts) {
    auto map = make_shape_map(shapes);
    if (opts.parallel && shapes.size() > 1) {
      return make_report(validate_parallel(data, shapes, map, opts));
    }

    validation_results results;
    for (const auto& shape : shapes) {
      auto part = validate_shape(data, shape, map, opts);
      results.insert(results.end(), std::make_move_iterator(part.begin()),
                     std::make_move_iterator(part.end()));
    }
    return make_report(std::move(results));
  }

  report
  validate(const graph& data, const graph& shapes_graph,
           const validation_options& opts) {
    return validate(data, read_shapes(shapes_graph), opts);
  }

} // namespace shx
