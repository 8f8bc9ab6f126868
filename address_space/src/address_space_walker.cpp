#include "../include/address_space_walker.hpp"
#include <algorithm>
#include <exception>
#include <open62541/types.h>

address_space_walker::address_space_walker(session_provider& _session_provider, client_log& _log) :
    session_provider_(_session_provider), log_(_log) {
}

address_space_walker::~address_space_walker() {
}

std::vector<node_reference>
address_space_walker::browse_node(const std::string& _root_node_id, opcua_link::node_class_mask_t _node_class_mask, bool _include_server_subtree) {
    std::vector<node_reference> references;
    client_session* session = session_provider_.get_active_session();
    if (session == nullptr) {
        log_.log(log_level::INFO, "Cannot browse nodes on client with endpoint: " + session_provider_.get_endpoint() + " due to bad connection.");
        return references;
    }

    UA_StatusCode status;
    try {
        status = session->browse(_root_node_id, _node_class_mask, references);
    } catch (const std::exception& e) {
        log_.log(log_level::WARN, "Browsing " + _root_node_id + " on " + session_provider_.get_endpoint() + " threw: " + e.what());
        return std::vector<node_reference>();
    }
    if (status != UA_STATUSCODE_GOOD) {
        log_.log(log_level::WARN, "Browsing " + _root_node_id + " on " + session_provider_.get_endpoint() + " failed: " + UA_StatusCode_name(status));
        return std::vector<node_reference>();
    }

    references.erase(std::remove_if(references.begin(), references.end(), [_include_server_subtree](const node_reference& _reference) {
        bool is_server = _reference.display_name_.find(SERVER_SUBTREE_TOKEN) != std::string::npos;
        return is_server != _include_server_subtree;
    }), references.end());
    return references;
}

void
address_space_walker::walk(const std::vector<node_reference>& _references, boost::unordered_set<std::string>& _visited, std::vector<node_reference>& _result) {
    std::vector<node_reference> unvisited;
    for (const node_reference& reference : _references) {
        if (_visited.insert(reference.node_id_).second)
            unvisited.push_back(reference);
    }
    _result.insert(_result.end(), unvisited.begin(), unvisited.end());
    for (const node_reference& reference : unvisited)
        walk(browse_node(reference.node_id_), _visited, _result);
}

std::vector<node_reference>
address_space_walker::recursive_browse(const std::vector<node_reference>& _references) {
    std::vector<node_reference> result;
    boost::unordered_set<std::string> visited;
    walk(_references, visited, result);
    return result;
}

std::vector<node_reference>
address_space_walker::browse_objects_node() {
    return recursive_browse(browse_node());
}

std::vector<node_reference>
address_space_walker::browse_server_node() {
    return recursive_browse(browse_node(OBJECTS_FOLDER_NODE_ID, DEFAULT_BROWSE_CLASS_MASK, true));
}

std::vector<std::string>
address_space_walker::get_display_names(const std::vector<node_reference>& _references) {
    std::vector<std::string> display_names;
    for (const node_reference& reference : _references)
        display_names.push_back(reference.display_name_);
    return display_names;
}

std::vector<std::string>
address_space_walker::get_node_ids(const std::vector<node_reference>& _references) {
    std::vector<std::string> node_ids;
    for (const node_reference& reference : _references)
        node_ids.push_back(reference.node_id_);
    return node_ids;
}
