// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#include "tensorir/core/node.hpp"

#include <memory>
#include <sstream>

#include "atomic_guard.hpp"

using namespace std;

namespace {
static const char idx_txt[] = "index '";
static const char out_of_range_txt[] = "' out of range";
}  // namespace

void tir::NodeValidationFailure::create(const char* file,
                                        int line,
                                        const char* check_string,
                                        const Node* node,
                                        const std::string& explanation) {
    throw tir::NodeValidationFailure(
        make_what(file, line, check_string, node_validation_failure_loc_string(node), explanation));
}

std::atomic<size_t> tir::Node::m_next_instance_id(0);

tir::Node::Node() = default;

tir::Node::Node(const OutputVector& arguments, size_t output_size) : Node() {
    set_arguments(arguments);
    set_output_size(output_size);
}

tir::Node::~Node() = default;

void tir::Node::set_arguments(const OutputVector& arguments) {
    for (size_t i = 0; i < arguments.size(); ++i) {
        TENSORIR_ASSERT(arguments[i].get_node() != nullptr, "Argument ", i, " of ", description(), " is a null output");
    }
    m_inputs = arguments;
}

void tir::Node::set_output_size(size_t n) {
    TENSORIR_ASSERT(n >= m_outputs.size(), "shrinking ", m_outputs.size(), " to ", n);
    m_outputs.resize(n);
}

void tir::Node::constructor_validate_and_infer_types() {
    validate_and_infer_types();
}

void tir::Node::validate_and_infer_types() {}

void tir::Node::check_new_args_count(const OutputVector& new_args, size_t expected) const {
    NODE_VALIDATION_CHECK(this,
                          new_args.size() == expected,
                          "clone_with_new_inputs() expected ",
                          expected,
                          " argument",
                          (expected == 1 ? "" : "s"),
                          " but got ",
                          new_args.size());
}

void tir::Node::set_output_type(size_t i, const element::Type& element_type, const PartialShape& pshape) {
    if (i >= m_outputs.size())
        set_output_size(i + 1);
    m_outputs[i].m_element_type = element_type;
    m_outputs[i].m_partial_shape = pshape;
}

std::string tir::Node::description() const {
    return get_type_name();
}

const std::string& tir::Node::get_friendly_name() const {
    if (m_friendly_name.empty()) {
        return get_name();
    }
    return m_friendly_name;
}

const std::string& tir::Node::get_name() const {
    AtomicGuard lock(m_name_changing);
    if (m_unique_name.empty())
        m_unique_name = description() + "_" + std::to_string(m_instance_id);
    return m_unique_name;
}

void tir::Node::set_friendly_name(const string& name) {
    m_friendly_name = name;
}

std::ostream& tir::Node::write_description(std::ostream& out, uint32_t depth) const {
    auto version = get_type_info().version_id;
    if (version && version[0] != '\0')
        out << version << "::" << get_type_info().name << " " << get_friendly_name();
    else
        out << get_type_info().name << " " << get_friendly_name();

    if (depth > 0) {
        out << " (";
        string sep = "";
        for (const auto& arg : m_inputs) {
            out << sep << arg;
            sep = ", ";
        }
        out << ") -> (";
        sep = "";
        for (size_t i = 0; i < get_output_size(); i++) {
            out << sep << get_output_element_type(i) << get_output_partial_shape(i);
            sep = ", ";
        }
        out << ")";
    }
    return out;
}

size_t tir::Node::get_output_size() const {
    return m_outputs.size();
}

const tir::element::Type& tir::Node::get_output_element_type(size_t i) const {
    TENSORIR_ASSERT(i < m_outputs.size(), idx_txt, i, out_of_range_txt);
    return m_outputs[i].m_element_type;
}

const tir::element::Type& tir::Node::get_element_type() const {
    if (get_output_size() != 1) {
        TENSORIR_THROW("get_element_type() must be called on a node with exactly one output.");
    }
    return get_output_element_type(0);
}

tir::Shape tir::Node::get_output_shape(size_t i) const {
    return get_output_partial_shape(i).to_shape();
}

const tir::PartialShape& tir::Node::get_output_partial_shape(size_t i) const {
    TENSORIR_ASSERT(i < m_outputs.size(), idx_txt, i, out_of_range_txt);
    return m_outputs[i].m_partial_shape;
}

size_t tir::Node::get_input_size() const {
    return m_inputs.size();
}

const tir::element::Type& tir::Node::get_input_element_type(size_t i) const {
    return input_value(i).get_element_type();
}

const tir::PartialShape& tir::Node::get_input_partial_shape(size_t i) const {
    return input_value(i).get_partial_shape();
}

const tir::Output<tir::Node>& tir::Node::input_value(size_t i) const {
    TENSORIR_ASSERT(i < m_inputs.size(), idx_txt, i, out_of_range_txt);
    return m_inputs[i];
}

tir::OutputVector tir::Node::input_values() const {
    return m_inputs;
}

tir::Output<tir::Node> tir::Node::output(size_t output_index) {
    TENSORIR_ASSERT(output_index < m_outputs.size(), idx_txt, output_index, out_of_range_txt);
    return Output<Node>(shared_from_this(), output_index);
}

tir::OutputVector tir::Node::outputs() {
    OutputVector result;
    for (size_t i = 0; i < get_output_size(); ++i) {
        result.push_back(output(i));
    }
    return result;
}

namespace tir {
ostream& operator<<(ostream& out, const Node& node) {
    return node.write_description(out, 1);
}
ostream& operator<<(ostream& out, const Node* node) {
    return node->write_description(out, 1);
}
}  // namespace tir

std::string tir::node_validation_failure_loc_string(const Node* node) {
    if (!node)
        return "While validating attributes without a node";
    std::stringstream ss;
    ss << "While validating node '" << *node << "' with friendly_name '" << node->get_friendly_name() << '\'';
    return ss.str();
}

// Output<Node>

tir::Output<tir::Node>::Output(const std::shared_ptr<Node>& node, size_t index) : m_node(node), m_index(index) {}

tir::Node* tir::Output<tir::Node>::get_node() const {
    return m_node.get();
}

std::shared_ptr<tir::Node> tir::Output<tir::Node>::get_node_shared_ptr() const {
    return m_node;
}

size_t tir::Output<tir::Node>::get_index() const {
    return m_index;
}

const tir::element::Type& tir::Output<tir::Node>::get_element_type() const {
    TENSORIR_ASSERT(m_node, "Output is not bound to a node");
    return m_node->get_output_element_type(m_index);
}

const tir::PartialShape& tir::Output<tir::Node>::get_partial_shape() const {
    TENSORIR_ASSERT(m_node, "Output is not bound to a node");
    return m_node->get_output_partial_shape(m_index);
}

tir::Shape tir::Output<tir::Node>::get_shape() const {
    return get_partial_shape().to_shape();
}

bool tir::Output<tir::Node>::operator==(const Output& other) const {
    return m_node == other.m_node && m_index == other.m_index;
}

bool tir::Output<tir::Node>::operator!=(const Output& other) const {
    return !(*this == other);
}

std::ostream& tir::operator<<(std::ostream& out, const Output<Node>& output) {
    return output.get_node()->write_description(out, 0)
           << "[" << output.get_index() << "]:" << output.get_element_type() << output.get_partial_shape();
}
