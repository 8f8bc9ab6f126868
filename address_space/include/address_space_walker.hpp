/**
 * @file address_space_walker.hpp
 * @brief Single level and recursive browsing of a remote address space.
 */
#ifndef ADDRESS_SPACE_WALKER_HPP
#define ADDRESS_SPACE_WALKER_HPP

#include <boost/unordered_set.hpp>
#include <string>
#include <vector>
#include "client_log.hpp"
#include "client_session.hpp"
#include "node_ids.hpp"

#define DEFAULT_BROWSE_CLASS_MASK (UA_NODECLASS_OBJECT | UA_NODECLASS_VARIABLE | UA_NODECLASS_METHOD)

/**
 * @brief Browses the address space through the active session of a connection.
 *
 * Browsing never connects. Without an active session, or when the browse service fails,
 * the result is empty.
 */
class address_space_walker {
private:
    session_provider& session_provider_; /**< the connection providing the session. */
    client_log& log_; /**< the log. */

    void
    walk(const std::vector<node_reference>& _references, boost::unordered_set<std::string>& _visited, std::vector<node_reference>& _result);
public:
    /**
     * @brief Constructs a new address space walker object.
     * 
     * @param _session_provider the connection providing the session.
     * @param _log the log.
     */
    address_space_walker(session_provider& _session_provider, client_log& _log);

    ~address_space_walker();

    /**
     * @brief Returns the immediate hierarchical children of a node.
     *
     * Children whose display name contains "Server" are dropped, or exclusively kept
     * when the server subtree is requested.
     * @param _root_node_id the browsed node.
     * @param _node_class_mask the accepted node classes.
     * @param _include_server_subtree true to keep only the server children.
     * @return std::vector<node_reference> the children, empty on failure.
     */
    std::vector<node_reference>
    browse_node(const std::string& _root_node_id = OBJECTS_FOLDER_NODE_ID, opcua_link::node_class_mask_t _node_class_mask = DEFAULT_BROWSE_CLASS_MASK,
                bool _include_server_subtree = false);

    /**
     * @brief Returns the given references followed by the depth first expansion of each one.
     *
     * Every node id is emitted and expanded at most once, so cyclic references terminate.
     * @param _references the seed references.
     * @return std::vector<node_reference> the seed and all descendants.
     */
    std::vector<node_reference>
    recursive_browse(const std::vector<node_reference>& _references);

    /**
     * @brief Browses the complete tree below the objects folder, server nodes excluded.
     * 
     * @return std::vector<node_reference> all found references.
     */
    std::vector<node_reference>
    browse_objects_node();

    /**
     * @brief Browses the complete tree below the server nodes of the objects folder.
     * 
     * @return std::vector<node_reference> all found references.
     */
    std::vector<node_reference>
    browse_server_node();

    static std::vector<std::string>
    get_display_names(const std::vector<node_reference>& _references);

    static std::vector<std::string>
    get_node_ids(const std::vector<node_reference>& _references);
};

#endif // ADDRESS_SPACE_WALKER_HPP
