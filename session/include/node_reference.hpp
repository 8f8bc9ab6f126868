/**
 * @file node_reference.hpp
 * @brief Identifies one addressable point in a remote address space.
 */
#ifndef NODE_REFERENCE_HPP
#define NODE_REFERENCE_HPP

#include <open62541/types.h>
#include <open62541/types_generated.h>
#include <string>

/**
 * @brief A discovered node with its display name, node class, node id and type definition.
 *
 * Node ids are kept in the canonical open62541 string form (e.g. "ns=1;s=Temperature", "i=85").
 */
struct node_reference {
    public:
        std::string display_name_; /**< the human readable display name. */
        UA_NodeClass node_class_; /**< the node class. */
        std::string node_id_; /**< the node id. */
        std::string type_definition_; /**< the node id of the type definition. */

        /**
         * @brief Constructs an empty node reference of unspecified class.
         * 
         */
        node_reference() : node_class_(UA_NODECLASS_UNSPECIFIED) {
        }

        /**
         * @brief Constructs a new node reference object.
         * 
         * @param _display_name the display name.
         * @param _node_class the node class.
         * @param _node_id the node id.
         * @param _type_definition the type definition node id.
         */
        node_reference(std::string _display_name, UA_NodeClass _node_class, std::string _node_id, std::string _type_definition = "") :
            display_name_(_display_name), node_class_(_node_class), node_id_(_node_id), type_definition_(_type_definition) {
        }

        /**
         * @brief Returns whether both references name the same subscription target.
         *
         * Only display name and node id are compared, the remaining fields may differ between browse calls.
         * @param _other the other node reference.
         * @return true if display name and node id match.
         * @return false otherwise.
         */
        bool is_same_target(const node_reference& _other) const {
            return display_name_ == _other.display_name_ && node_id_ == _other.node_id_;
        }

        /**
         * @brief Converts a browse result entry.
         * 
         * @param _reference_description the reference description.
         * @return node_reference the node reference.
         */
        static node_reference
        from_reference_description(const UA_ReferenceDescription& _reference_description);
};

/**
 * @brief Returns the canonical string form of a node id.
 * 
 * @param _node_id the node id.
 * @return std::string the string form, empty if printing failed.
 */
std::string
node_id_to_string(const UA_NodeId& _node_id);

/**
 * @brief Parses the canonical string form of a node id.
 * 
 * @param _node_id_string the string form.
 * @param _node_id the parsed node id, must be cleared by the caller.
 * @return UA_StatusCode the status code.
 */
UA_StatusCode
parse_node_id(const std::string& _node_id_string, UA_NodeId& _node_id);

/**
 * @brief Copies an open62541 string into a std::string.
 * 
 * @param _string the open62541 string.
 * @return std::string the copy.
 */
std::string
ua_string_to_string(const UA_String& _string);

/**
 * @brief Returns the corresponding string for a node class.
 * 
 * @param _node_class the node class.
 * @return std::string the corresponding string.
 */
std::string
node_class_to_string(UA_NodeClass _node_class);

#endif // NODE_REFERENCE_HPP
