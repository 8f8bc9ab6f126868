#include "../include/local_discovery_client.hpp"
#include <open62541/client_config_default.h>
#include <open62541/client_highlevel.h>
#include <open62541/plugin/log_stdout.h>
#include "../include/client_connection_establisher.hpp"
#include "node_reference.hpp"

#define MAX_NETWORK_RECORDS 1000

local_discovery_client::local_discovery_client(std::string _discovery_endpoint) : discovery_endpoint_(_discovery_endpoint) {
}

local_discovery_client::~local_discovery_client() {
}

UA_StatusCode
local_discovery_client::find_servers(std::vector<UA_ApplicationDescription>& _application_descriptions) {
    UA_ApplicationDescription* application_description_array = NULL;
    size_t application_description_array_size = 0;

    UA_StatusCode retval;
    {
        UA_Client* client = UA_Client_new();
        UA_ClientConfig_setDefault(UA_Client_getConfig(client));
        retval = UA_Client_findServers(client, discovery_endpoint_.c_str(), 0, NULL, 0, NULL,
                                       &application_description_array_size, &application_description_array);
        UA_Client_delete(client);
    }
    if (retval != UA_STATUSCODE_GOOD) {
        UA_LOG_ERROR(UA_Log_Stdout, UA_LOGCATEGORY_USERLAND, "Could not call FindServers service on %s. "
                "Is the discovery server started? StatusCode %s", discovery_endpoint_.c_str(), UA_StatusCode_name(retval));
        return retval;
    }

    for (size_t i = 0; i < application_description_array_size; i++) {
        UA_ApplicationDescription description;
        UA_ApplicationDescription_copy(&application_description_array[i], &description);
        _application_descriptions.push_back(description);
    }
    UA_Array_delete(application_description_array, application_description_array_size,
                    &UA_TYPES[UA_TYPES_APPLICATIONDESCRIPTION]);
    return UA_STATUSCODE_GOOD;
}

void
local_discovery_client::clear_descriptions(std::vector<UA_ApplicationDescription>& _application_descriptions) {
    for (UA_ApplicationDescription& description : _application_descriptions)
        UA_ApplicationDescription_clear(&description);
    _application_descriptions.clear();
}

std::vector<std::string>
local_discovery_client::find_servers_url() {
    std::vector<std::string> urls;
    std::vector<UA_ApplicationDescription> descriptions;
    if (find_servers(descriptions) != UA_STATUSCODE_GOOD)
        return urls;
    for (const UA_ApplicationDescription& description : descriptions) {
        for (size_t i = 0; i < description.discoveryUrlsSize; i++)
            urls.push_back(ua_string_to_string(description.discoveryUrls[i]));
    }
    clear_descriptions(descriptions);
    return urls;
}

std::vector<std::string>
local_discovery_client::find_servers_app_name() {
    std::vector<std::string> names;
    std::vector<UA_ApplicationDescription> descriptions;
    if (find_servers(descriptions) != UA_STATUSCODE_GOOD)
        return names;
    for (const UA_ApplicationDescription& description : descriptions)
        names.push_back(ua_string_to_string(description.applicationName.text));
    clear_descriptions(descriptions);
    return names;
}

std::map<std::string, std::vector<std::string>>
local_discovery_client::map_find_servers() {
    std::map<std::string, std::vector<std::string>> servers;
    std::vector<UA_ApplicationDescription> descriptions;
    if (find_servers(descriptions) != UA_STATUSCODE_GOOD)
        return servers;
    for (const UA_ApplicationDescription& description : descriptions) {
        std::vector<std::string> properties = {ua_string_to_string(description.applicationName.text),
                                               application_type_to_string(description.applicationType),
                                               ua_string_to_string(description.applicationUri)};
        for (size_t i = 0; i < description.discoveryUrlsSize; i++)
            servers[ua_string_to_string(description.discoveryUrls[i])] = properties;
    }
    clear_descriptions(descriptions);
    return servers;
}

std::vector<network_server>
local_discovery_client::find_servers_on_network() {
    std::vector<network_server> servers;
#ifdef UA_ENABLE_DISCOVERY
    UA_ServerOnNetwork* server_on_network = NULL;
    size_t server_on_network_size = 0;
    UA_StatusCode retval;
    {
        UA_Client* client = UA_Client_new();
        UA_ClientConfig_setDefault(UA_Client_getConfig(client));
        retval = UA_Client_findServersOnNetwork(client, discovery_endpoint_.c_str(), 0, MAX_NETWORK_RECORDS, 0, NULL,
                                                &server_on_network_size, &server_on_network);
        UA_Client_delete(client);
    }
    if (retval != UA_STATUSCODE_GOOD) {
        UA_LOG_ERROR(UA_Log_Stdout, UA_LOGCATEGORY_USERLAND, "Could not call FindServersOnNetwork service on %s. StatusCode %s",
                     discovery_endpoint_.c_str(), UA_StatusCode_name(retval));
        return servers;
    }
    for (size_t i = 0; i < server_on_network_size; i++) {
        network_server server;
        server.record_id_ = server_on_network[i].recordId;
        server.server_name_ = ua_string_to_string(server_on_network[i].serverName);
        server.discovery_url_ = ua_string_to_string(server_on_network[i].discoveryUrl);
        for (size_t j = 0; j < server_on_network[i].serverCapabilitiesSize; j++)
            server.capabilities_.push_back(ua_string_to_string(server_on_network[i].serverCapabilities[j]));
        servers.push_back(server);
    }
    UA_Array_delete(server_on_network, server_on_network_size, &UA_TYPES[UA_TYPES_SERVERONNETWORK]);
#else
    UA_LOG_WARNING(UA_Log_Stdout, UA_LOGCATEGORY_USERLAND, "FindServersOnNetwork is not supported by this open62541 build");
#endif
    return servers;
}

bool
local_discovery_client::is_reachable() const {
    return client_connection_establisher::test_connection(discovery_endpoint_);
}

std::string
local_discovery_client::application_type_to_string(UA_ApplicationType _application_type) {
    switch (_application_type) {
        case UA_APPLICATIONTYPE_SERVER:
            return "Server";
        case UA_APPLICATIONTYPE_CLIENT:
            return "Client";
        case UA_APPLICATIONTYPE_CLIENTANDSERVER:
            return "ClientAndServer";
        case UA_APPLICATIONTYPE_DISCOVERYSERVER:
            return "DiscoveryServer";
        default:
            return "Unknown";
    }
}
