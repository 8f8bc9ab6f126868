/**
 * @file value_io.hpp
 * @brief Reading and writing node values through the active session of a connection.
 */
#ifndef VALUE_IO_HPP
#define VALUE_IO_HPP

#include <open62541/types.h>
#include <string>
#include <vector>
#include "client_log.hpp"
#include "client_session.hpp"

/**
 * @brief Reads and writes values independent of subscriptions.
 *
 * Failures are logged and turned into empty results or false.
 */
class value_io {
private:
    session_provider& session_provider_; /**< the connection providing the session. */
    client_log& log_; /**< the log. */

    /**
     * @brief Narrows a value to a numeric range.
     * 
     * @param _value the value, left unchanged if the range cannot be applied.
     * @param _index_range the numeric range.
     * @return true if the value was narrowed.
     * @return false otherwise.
     */
    bool
    apply_index_range(data_value& _value, const std::string& _index_range) const;
public:
    /**
     * @brief Constructs a new value io object.
     * 
     * @param _session_provider the connection providing the session.
     * @param _log the log.
     */
    value_io(session_provider& _session_provider, client_log& _log);

    ~value_io();

    /**
     * @brief Reads the value of a node.
     * 
     * @param _node_reference the node.
     * @return std::vector<data_value> the value, empty on failure.
     */
    std::vector<data_value>
    read_node(const node_reference& _node_reference);

    /**
     * @brief Reads the values of nodes in one request.
     * 
     * @param _node_references the nodes.
     * @return std::vector<data_value> one value per node, empty on failure.
     */
    std::vector<data_value>
    read_nodes(const std::vector<node_reference>& _node_references);

    /**
     * @brief Writes a value to a node.
     * 
     * @param _node_reference the node.
     * @param _value the value.
     * @param _index_range the numeric range the value is narrowed to, empty for the full value.
     * @return true if the write succeeded.
     * @return false otherwise.
     */
    bool
    write_to_node(const node_reference& _node_reference, const UA_Variant& _value, const std::string& _index_range = "");

    /**
     * @brief Writes the same value to nodes in one request.
     * 
     * @param _node_references the nodes.
     * @param _value the value.
     * @param _index_range the numeric range the value is narrowed to, empty for the full value.
     * @return true if the service succeeded and no single write returned a bad status.
     * @return false otherwise.
     */
    bool
    write_to_nodes(const std::vector<node_reference>& _node_references, const UA_Variant& _value, const std::string& _index_range = "");
};

#endif // VALUE_IO_HPP
