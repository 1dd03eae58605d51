// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include "tensorir/core/core_visibility.hpp"
#include "tensorir/core/except.hpp"
#include "tensorir/core/partial_shape.hpp"
#include "tensorir/core/shape.hpp"
#include "tensorir/core/type.hpp"
#include "tensorir/core/type/element_type.hpp"

namespace tir {

class Node;

template <typename NodeType>
class Output;

using NodeVector = std::vector<std::shared_ptr<Node>>;
using OutputVector = std::vector<Output<Node>>;

/// \brief A handle for one of a node's outputs.
template <>
class TENSORIR_API Output<Node> {
public:
    /// \brief Constructs a Output.
    /// \param node A pointer to the node for the output handle.
    /// \param index The index of the output.
    Output(const std::shared_ptr<Node>& node, size_t index);

    /// \brief Constructs a Output, referencing the zeroth output of the node.
    /// \param node A `shared_ptr` to the node for the output handle.
    template <typename T>
    Output(const std::shared_ptr<T>& node) : Output(std::static_pointer_cast<Node>(node), 0) {}

    /// A null output
    Output() = default;

    /// \return A pointer to the node referred to by this output handle.
    Node* get_node() const;
    /// \return A `shared_ptr` to the node referred to by this output handle.
    std::shared_ptr<Node> get_node_shared_ptr() const;
    /// \return The index of the output referred to by this output handle.
    size_t get_index() const;
    /// \return The element type of the output referred to by this output handle.
    const element::Type& get_element_type() const;
    /// \return The partial shape of the output referred to by this output handle.
    const PartialShape& get_partial_shape() const;
    /// \return The static shape of the output referred to by this output handle.
    Shape get_shape() const;

    bool operator==(const Output& other) const;
    bool operator!=(const Output& other) const;

private:
    std::shared_ptr<Node> m_node;
    size_t m_index{0};
};

TENSORIR_API
std::ostream& operator<<(std::ostream& out, const Output<Node>& output);

/// \brief An operation in the graph. Inputs are outputs of other nodes. Each output carries
///        an element type and a partial shape set by validate_and_infer_types().
class TENSORIR_API Node : public std::enable_shared_from_this<Node> {
public:
    TENSORIR_RTTI_BASE("Node", "")

    /// \brief Verifies that attributes and inputs are consistent and computes output shapes
    /// and element types. Must be implemented by concrete child classes so that it
    /// can be run any number of times.
    ///
    /// Throws if the node is invalid.
    virtual void validate_and_infer_types();

    virtual ~Node();

    /// \brief Get the string name for the type of the node, such as `AvgPool`
    /// \returns A const reference to the node's type name
    virtual std::string description() const;
    /// \brief Get the unique name of the node.
    /// \returns A const reference to the node's unique name.
    const std::string& get_name() const;

    /// \brief Sets the name reported in validation messages. The unique name is kept.
    void set_friendly_name(const std::string& name);

    /// \returns The friendly name, or the unique name if none was set.
    const std::string& get_friendly_name() const;

    /// Writes a description of a node to a stream
    /// \param os The stream; should be returned
    /// \param depth How many levels of inputs to describe
    /// \returns The provided stream os
    virtual std::ostream& write_description(std::ostream& os, uint32_t depth = 0) const;

    /// Returns the number of outputs from the node.
    size_t get_output_size() const;

    /// Returns the element type for output i
    const element::Type& get_output_element_type(size_t i) const;

    /// Checks that there is exactly one output and returns its element type
    const element::Type& get_element_type() const;

    /// Returns the shape for output i
    Shape get_output_shape(size_t i) const;

    /// Returns the partial shape for output i
    const PartialShape& get_output_partial_shape(size_t i) const;

    /// Returns the number of inputs for the op
    size_t get_input_size() const;

    /// Returns the element type of input i
    const element::Type& get_input_element_type(size_t i) const;

    /// Returns the partial shape of input i
    const PartialShape& get_input_partial_shape(size_t i) const;

    /// Returns the source output connected to input i
    const Output<Node>& input_value(size_t i) const;
    OutputVector input_values() const;

    /// A handle to the i-th output of this node
    Output<Node> output(size_t output_index);
    OutputVector outputs();

    /// \brief Builds a copy of this node with the same attributes bound to new inputs.
    virtual std::shared_ptr<Node> clone_with_new_inputs(const OutputVector& inputs) const = 0;

    std::string get_type_name() const {
        return get_type_info().name;
    }

protected:
    /// \brief Construct an uninitialized Node
    Node();
    /// \brief Construct a node with arguments
    explicit Node(const OutputVector& arguments, size_t output_size = 1);

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    /// \brief Sets/replaces the arguments with new arguments.
    void set_arguments(const OutputVector& arguments);
    /// \brief Sets the number of outputs
    void set_output_size(size_t output_size);
    /// \brief Validates a freshly constructed node. Concrete ops call it last in their constructor.
    void constructor_validate_and_infer_types();

    /// \brief Checks that `new_args` has exactly `expected` values.
    void check_new_args_count(const OutputVector& new_args, size_t expected) const;

public:
    /// \brief Stores the element type and partial shape of output i
    void set_output_type(size_t i, const element::Type& element_type, const PartialShape& pshape);

private:
    struct OutputDescriptor {
        element::Type m_element_type{element::dynamic};
        PartialShape m_partial_shape{PartialShape::dynamic()};
    };

    static std::atomic<size_t> m_next_instance_id;
    size_t m_instance_id{m_next_instance_id.fetch_add(1)};
    std::string m_friendly_name;
    mutable std::string m_unique_name;
    mutable std::atomic_bool m_name_changing{false};
    OutputVector m_inputs;
    std::vector<OutputDescriptor> m_outputs;
};

TENSORIR_API
std::ostream& operator<<(std::ostream&, const Node&);
TENSORIR_API
std::ostream& operator<<(std::ostream&, const Node*);

/// \brief Exception raised when a node fails validation. Carries the node description
///        in its context line.
class TENSORIR_API NodeValidationFailure : public tir::AssertFailure {
public:
    [[noreturn]] static void create(const char* file,
                                    int line,
                                    const char* check_string,
                                    const Node* node,
                                    const std::string& explanation);

protected:
    explicit NodeValidationFailure(const std::string& what_arg) : tir::AssertFailure(what_arg) {}
};

/// \brief Builds the context line "While validating node ..." for a validation failure.
TENSORIR_API std::string node_validation_failure_loc_string(const Node* node);

}  // namespace tir

#define NODE_VALIDATION_CHECK(node, ...) TENSORIR_ASSERT_HELPER(::tir::NodeValidationFailure, (node), __VA_ARGS__)
