#include "../include/client_connection_establisher.hpp"
#include <open62541/client_config_default.h>
#include <open62541/plugin/log_stdout.h>
#include <string.h>
#include "../include/ua_client_session.hpp"
#include "filtered_logger.hpp"

#define TEST_CONNECTION_TIMEOUT 1000

client_connection_establisher::client_connection_establisher(std::string _application_name, UA_LogLevel _stack_log_level) :
    application_name_(_application_name), stack_log_level_(_stack_log_level) {
}

client_connection_establisher::~client_connection_establisher() {
}

UA_Client*
client_connection_establisher::create_client(opcua_link::timeout_ms_t _operation_timeout_ms) {
    UA_ClientConfig client_config;
    memset(&client_config, 0, sizeof(UA_ClientConfig));
    client_config.logging = filtered_logger::create_filtered_logger(stack_log_level_);
    UA_StatusCode status = UA_ClientConfig_setDefault(&client_config);
    if (status != UA_STATUSCODE_GOOD) {
        UA_LOG_ERROR(UA_Log_Stdout, UA_LOGCATEGORY_USERLAND, "%s: Default client configuration failed (%s)", __FUNCTION__, UA_StatusCode_name(status));
        UA_ClientConfig_clear(&client_config);
        return nullptr;
    }
    client_config.securityMode = UA_MESSAGESECURITYMODE_NONE;
    client_config.timeout = _operation_timeout_ms;
    UA_LocalizedText_clear(&client_config.clientDescription.applicationName);
    client_config.clientDescription.applicationName = UA_LOCALIZEDTEXT_ALLOC("en-US", application_name_.c_str());
    return UA_Client_newWithConfig(&client_config);
}

UA_StatusCode
client_connection_establisher::select_endpoint(const std::string& _endpoint, opcua_link::timeout_ms_t _operation_timeout_ms, endpoint_description& _description) {
    UA_Client* client = create_client(_operation_timeout_ms);
    if (client == nullptr)
        return UA_STATUSCODE_BADOUTOFMEMORY;

    UA_EndpointDescription* endpoints = NULL;
    size_t endpoints_size = 0;
    UA_StatusCode status = UA_Client_getEndpoints(client, _endpoint.c_str(), &endpoints_size, &endpoints);
    UA_Client_delete(client);
    if (status != UA_STATUSCODE_GOOD) {
        UA_LOG_WARNING(UA_Log_Stdout, UA_LOGCATEGORY_USERLAND, "%s: GetEndpoints on %s failed (%s)", __FUNCTION__, _endpoint.c_str(), UA_StatusCode_name(status));
        return status;
    }

    const UA_EndpointDescription* selected = NULL;
    for (size_t i = 0; i < endpoints_size; i++) {
        const UA_EndpointDescription* candidate = &endpoints[i];
        if (candidate->securityMode != UA_MESSAGESECURITYMODE_NONE)
            continue;
        if (selected == NULL || candidate->securityLevel > selected->securityLevel)
            selected = candidate;
    }

    status = UA_STATUSCODE_BADNOTFOUND;
    if (selected != NULL) {
        _description.endpoint_url_ = _endpoint;
        _description.server_endpoint_url_ = ua_string_to_string(selected->endpointUrl);
        _description.security_policy_uri_ = ua_string_to_string(selected->securityPolicyUri);
        _description.security_mode_ = selected->securityMode;
        _description.security_level_ = selected->securityLevel;
        status = UA_STATUSCODE_GOOD;
    }
    UA_Array_delete(endpoints, endpoints_size, &UA_TYPES[UA_TYPES_ENDPOINTDESCRIPTION]);
    return status;
}

UA_StatusCode
client_connection_establisher::open(const endpoint_description& _description, opcua_link::timeout_ms_t _session_timeout_ms, opcua_link::timeout_ms_t _operation_timeout_ms,
                                    std::unique_ptr<client_session>& _session) {
    _session.reset();
    UA_Client* client = create_client(_operation_timeout_ms);
    if (client == nullptr)
        return UA_STATUSCODE_BADOUTOFMEMORY;
    UA_ClientConfig* client_config = UA_Client_getConfig(client);
    client_config->requestedSessionTimeout = _session_timeout_ms;
    client_config->securityMode = _description.security_mode_;
    UA_String_clear(&client_config->securityPolicyUri);
    client_config->securityPolicyUri = UA_STRING_ALLOC(_description.security_policy_uri_.c_str());

    UA_StatusCode status = UA_Client_connect(client, _description.endpoint_url_.c_str());
    if (status != UA_STATUSCODE_GOOD) {
        UA_LOG_ERROR(UA_Log_Stdout, UA_LOGCATEGORY_USERLAND, "%s: Connection attempt to %s failed (%s)", __FUNCTION__, _description.endpoint_url_.c_str(), UA_StatusCode_name(status));
        UA_Client_delete(client);
        return status;
    }
    _session = std::make_unique<ua_client_session>(client, _description.endpoint_url_);
    return UA_STATUSCODE_GOOD;
}

bool
client_connection_establisher::test_connection(std::string _server_endpoint) {
    UA_Client* test_client = UA_Client_new();
    UA_ClientConfig* client_config = UA_Client_getConfig(test_client);
    client_config->securityMode = UA_MESSAGESECURITYMODE_NONE;
    client_config->timeout = TEST_CONNECTION_TIMEOUT;
    UA_StatusCode status = UA_Client_connect(test_client, _server_endpoint.c_str());
    UA_LOG_INFO(UA_Log_Stdout, UA_LOGCATEGORY_USERLAND, "%s: Test connection status: %s", __FUNCTION__, UA_StatusCode_name(status));
    UA_Client_delete(test_client);
    return status == UA_STATUSCODE_GOOD;
}
