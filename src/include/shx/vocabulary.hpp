#pragma once

#include <shx/term.hpp>

#include <string>

namespace shx {

  namespace rdf {

    inline const std::string ns = "http://www.w3.org/1999/02/22-rdf-syntax-ns#";

    inline const iri type{ns + "type"};
    inline const iri first{ns + "first"};
    inline const iri rest{ns + "rest"};
    inline const iri nil{ns + "nil"};
    inline const iri lang_string{ns + "langString"};
    inline const iri xml_literal{ns + "XMLLiteral"};

  } // namespace rdf

  namespace rdfs {

    inline const std::string ns = "http://www.w3.org/2000/01/rdf-schema#";

    inline const iri class_{ns + "Class"};

  } // namespace rdfs

  namespace xsd {

    inline const std::string ns = "http://www.w3.org/2001/XMLSchema#";

    inline const iri string{ns + "string"};
    inline const iri boolean{ns + "boolean"};
    inline const iri integer{ns + "integer"};
    inline const iri decimal{ns + "decimal"};
    inline const iri double_{ns + "double"};
    inline const iri float_{ns + "float"};
    inline const iri any_uri{ns + "anyURI"};

  } // namespace xsd

  namespace xml {

    inline const std::string ns = "http://www.w3.org/XML/1998/namespace";

  } // namespace xml

  namespace sh {

    inline const std::string ns = "http://www.w3.org/ns/shacl#";

    // Shapes and targets
    inline const iri node_shape{ns + "NodeShape"};
    inline const iri property_shape{ns + "PropertyShape"};
    inline const iri target_class{ns + "targetClass"};
    inline const iri target_node{ns + "targetNode"};
    inline const iri target_subjects_of{ns + "targetSubjectsOf"};
    inline const iri target_objects_of{ns + "targetObjectsOf"};
    inline const iri property{ns + "property"};
    inline const iri path{ns + "path"};
    inline const iri message{ns + "message"};
    inline const iri severity{ns + "severity"};

    // Constraint parameters
    inline const iri min_count{ns + "minCount"};
    inline const iri max_count{ns + "maxCount"};
    inline const iri datatype{ns + "datatype"};
    inline const iri class_{ns + "class"};
    inline const iri node_kind{ns + "nodeKind"};
    inline const iri pattern{ns + "pattern"};
    inline const iri flags{ns + "flags"};
    inline const iri min_length{ns + "minLength"};
    inline const iri max_length{ns + "maxLength"};
    inline const iri language_in{ns + "languageIn"};
    inline const iri in{ns + "in"};
    inline const iri has_value{ns + "hasValue"};
    inline const iri min_inclusive{ns + "minInclusive"};
    inline const iri max_inclusive{ns + "maxInclusive"};
    inline const iri min_exclusive{ns + "minExclusive"};
    inline const iri max_exclusive{ns + "maxExclusive"};
    inline const iri qualified_value_shape{ns + "qualifiedValueShape"};
    inline const iri qualified_min_count{ns + "qualifiedMinCount"};
    inline const iri and_{ns + "and"};
    inline const iri or_{ns + "or"};
    inline const iri xone{ns + "xone"};
    inline const iri not_{ns + "not"};
    inline const iri sparql{ns + "sparql"};
    inline const iri select{ns + "select"};
    inline const iri prefixes{ns + "prefixes"};
    inline const iri declare{ns + "declare"};
    inline const iri prefix{ns + "prefix"};
    inline const iri namespace_{ns + "namespace"};

    // Node kinds
    inline const iri iri_kind{ns + "IRI"};
    inline const iri blank_node_kind{ns + "BlankNode"};
    inline const iri literal_kind{ns + "Literal"};
    inline const iri blank_node_or_iri{ns + "BlankNodeOrIRI"};
    inline const iri blank_node_or_literal{ns + "BlankNodeOrLiteral"};
    inline const iri iri_or_literal{ns + "IRIOrLiteral"};

    // Severities
    inline const iri violation{ns + "Violation"};
    inline const iri warning{ns + "Warning"};
    inline const iri info{ns + "Info"};

    // Validation report vocabulary
    inline const iri validation_report{ns + "ValidationReport"};
    inline const iri validation_result{ns + "ValidationResult"};
    inline const iri conforms{ns + "conforms"};
    inline const iri result{ns + "result"};
    inline const iri focus_node{ns + "focusNode"};
    inline const iri result_path{ns + "resultPath"};
    inline const iri value{ns + "value"};
    inline const iri result_message{ns + "resultMessage"};
    inline const iri result_severity{ns + "resultSeverity"};
    inline const iri source_shape{ns + "sourceShape"};
    inline const iri source_constraint_component{ns +
                                                 "sourceConstraintComponent"};

    // Constraint components
    inline const iri min_count_component{ns + "MinCountConstraintComponent"};
    inline const iri max_count_component{ns + "MaxCountConstraintComponent"};
    inline const iri datatype_component{ns + "DatatypeConstraintComponent"};
    inline const iri class_component{ns + "ClassConstraintComponent"};
    inline const iri node_kind_component{ns + "NodeKindConstraintComponent"};
    inline const iri pattern_component{ns + "PatternConstraintComponent"};
    inline const iri min_length_component{ns + "MinLengthConstraintComponent"};
    inline const iri max_length_component{ns + "MaxLengthConstraintComponent"};
    inline const iri language_in_component{ns +
                                           "LanguageInConstraintComponent"};
    inline const iri in_component{ns + "InConstraintComponent"};
    inline const iri has_value_component{ns + "HasValueConstraintComponent"};
    inline const iri min_inclusive_component{
        ns + "MinInclusiveConstraintComponent"};
    inline const iri max_inclusive_component{
        ns + "MaxInclusiveConstraintComponent"};
    inline const iri min_exclusive_component{
        ns + "MinExclusiveConstraintComponent"};
    inline const iri max_exclusive_component{
        ns + "MaxExclusiveConstraintComponent"};
    inline const iri qualified_min_count_component{
        ns + "QualifiedMinCountConstraintComponent"};
    inline const iri and_component{ns + "AndConstraintComponent"};
    inline const iri or_component{ns + "OrConstraintComponent"};
    inline const iri xone_component{ns + "XoneConstraintComponent"};
    inline const iri not_component{ns + "NotConstraintComponent"};
    inline const iri sparql_component{ns + "SPARQLConstraintComponent"};

  } // namespace sh

} // namespace shx
