#include "../include/ua_client_session.hpp"
#include <open62541/plugin/log_stdout.h>
#include "../include/node_value_subscriber.hpp"
#include "../include/response_checker.hpp"

ua_client_session::ua_client_session(UA_Client* _client, std::string _endpoint_url) :
    client_(_client), endpoint_url_(_endpoint_url), suppress_callbacks_(false) {
    UA_ClientConfig* client_config = UA_Client_getConfig(client_);
    client_config->clientContext = this;
    client_config->stateCallback = state_changed;
    client_config->inactivityCallback = inactivity_detected;
}

ua_client_session::~ua_client_session() {
    suppress_callbacks_ = true;
    UA_Client_getConfig(client_)->clientContext = NULL;
    UA_Client_delete(client_);
}

void
ua_client_session::state_changed(UA_Client* _client, UA_SecureChannelState _channel_state, UA_SessionState _session_state, UA_StatusCode _connect_status) {
    ua_client_session* self = static_cast<ua_client_session*>(UA_Client_getContext(_client));
    if (self == NULL)
        return;
    if (_connect_status != UA_STATUSCODE_GOOD) {
        self->notify_keep_alive(_connect_status);
    } else if (_session_state == UA_SESSIONSTATE_CLOSED && _channel_state == UA_SECURECHANNELSTATE_CLOSED) {
        self->notify_keep_alive(UA_STATUSCODE_BADCONNECTIONCLOSED);
    }
}

void
ua_client_session::inactivity_detected(UA_Client* _client) {
    ua_client_session* self = static_cast<ua_client_session*>(UA_Client_getContext(_client));
    if (self != NULL)
        self->notify_keep_alive(UA_STATUSCODE_BADTIMEOUT);
}

void
ua_client_session::notify_keep_alive(UA_StatusCode _status) {
    if (suppress_callbacks_ || !keep_alive_callback_)
        return;
    keep_alive_callback_(_status);
}

bool
ua_client_session::is_connected() const {
    UA_SecureChannelState channel_state;
    UA_SessionState session_state;
    UA_StatusCode connect_status;
    UA_Client_getState(client_, &channel_state, &session_state, &connect_status);
    return session_state == UA_SESSIONSTATE_ACTIVATED && connect_status == UA_STATUSCODE_GOOD;
}

void
ua_client_session::close() {
    suppress_callbacks_ = true;
    UA_StatusCode status = UA_Client_disconnect(client_);
    if (status != UA_STATUSCODE_GOOD)
        UA_LOG_WARNING(UA_Log_Stdout, UA_LOGCATEGORY_USERLAND, "%s: Disconnecting from %s returned %s", __FUNCTION__, endpoint_url_.c_str(), UA_StatusCode_name(status));
}

UA_StatusCode
ua_client_session::reconnect() {
    UA_NodeId token_before;
    UA_NodeId_init(&token_before);
    UA_ByteString nonce;
    UA_ByteString_init(&nonce);
    UA_Client_getSessionAuthenticationToken(client_, &token_before, &nonce);
    UA_ByteString_clear(&nonce);

    suppress_callbacks_ = true;
    UA_Client_disconnectSecureChannel(client_);
    UA_StatusCode status = UA_Client_connect(client_, endpoint_url_.c_str());
    suppress_callbacks_ = false;
    if (status != UA_STATUSCODE_GOOD) {
        UA_NodeId_clear(&token_before);
        return status;
    }

    UA_NodeId token_after;
    UA_NodeId_init(&token_after);
    UA_Client_getSessionAuthenticationToken(client_, &token_after, &nonce);
    UA_ByteString_clear(&nonce);
    bool same_session = !UA_NodeId_isNull(&token_before) && UA_NodeId_equal(&token_before, &token_after);
    UA_NodeId_clear(&token_before);
    UA_NodeId_clear(&token_after);
    return same_session ? UA_STATUSCODE_GOOD : UA_STATUSCODE_BADSESSIONIDINVALID;
}

void
ua_client_session::set_keep_alive(keep_alive_callback_t _callback, opcua_link::interval_ms_t _interval_ms) {
    keep_alive_callback_ = _callback;
    UA_Client_getConfig(client_)->connectivityCheckInterval = _interval_ms;
}

UA_StatusCode
ua_client_session::browse(const std::string& _node_id, opcua_link::node_class_mask_t _node_class_mask, std::vector<node_reference>& _references) {
    UA_BrowseDescription bd;
    UA_BrowseDescription_init(&bd);
    UA_StatusCode status = parse_node_id(_node_id, bd.nodeId);
    if (status != UA_STATUSCODE_GOOD)
        return status;
    bd.referenceTypeId = UA_NODEID_NUMERIC(0, UA_NS0ID_HIERARCHICALREFERENCES);
    bd.browseDirection = UA_BROWSEDIRECTION_FORWARD;
    bd.includeSubtypes = true;
    bd.nodeClassMask = _node_class_mask;
    bd.resultMask = UA_BROWSERESULTMASK_ALL;

    UA_BrowseResult bres = UA_Client_browse(client_, NULL, 0, &bd);
    UA_BrowseDescription_clear(&bd);
    while (true) {
        status = bres.statusCode;
        if (status != UA_STATUSCODE_GOOD)
            break;
        for (size_t i = 0; i < bres.referencesSize; ++i)
            _references.push_back(node_reference::from_reference_description(bres.references[i]));
        if (bres.continuationPoint.length == 0)
            break;
        UA_ByteString continuation_point;
        UA_ByteString_copy(&bres.continuationPoint, &continuation_point);
        UA_BrowseResult_clear(&bres);
        bres = UA_Client_browseNext(client_, false, continuation_point);
        UA_ByteString_clear(&continuation_point);
    }
    UA_BrowseResult_clear(&bres);
    return status;
}

UA_StatusCode
ua_client_session::read(const std::vector<std::string>& _node_ids, std::vector<data_value>& _values) {
    std::vector<UA_ReadValueId> read_value_ids(_node_ids.size());
    UA_StatusCode status = UA_STATUSCODE_GOOD;
    for (size_t i = 0; i < _node_ids.size(); i++) {
        UA_ReadValueId_init(&read_value_ids[i]);
        read_value_ids[i].attributeId = UA_ATTRIBUTEID_VALUE;
        if (status == UA_STATUSCODE_GOOD)
            status = parse_node_id(_node_ids[i], read_value_ids[i].nodeId);
    }

    if (status == UA_STATUSCODE_GOOD) {
        UA_ReadRequest request;
        UA_ReadRequest_init(&request);
        request.nodesToRead = read_value_ids.data();
        request.nodesToReadSize = read_value_ids.size();
        request.timestampsToReturn = UA_TIMESTAMPSTORETURN_SOURCE;
        UA_ReadResponse response = UA_Client_Service_read(client_, request);
        status = response.responseHeader.serviceResult;
        if (status == UA_STATUSCODE_GOOD && response.resultsSize != _node_ids.size())
            status = UA_STATUSCODE_BADUNEXPECTEDERROR;
        if (status == UA_STATUSCODE_GOOD) {
            for (size_t i = 0; i < response.resultsSize; i++)
                _values.push_back(data_value(response.results[i]));
        }
        UA_ReadResponse_clear(&response);
    }

    for (UA_ReadValueId& read_value_id : read_value_ids)
        UA_ReadValueId_clear(&read_value_id);
    return status;
}

UA_StatusCode
ua_client_session::write(const std::vector<write_entry>& _entries, std::vector<UA_StatusCode>& _results) {
    std::vector<UA_WriteValue> write_values(_entries.size());
    UA_StatusCode status = UA_STATUSCODE_GOOD;
    for (size_t i = 0; i < _entries.size(); i++) {
        UA_WriteValue_init(&write_values[i]);
        write_values[i].attributeId = UA_ATTRIBUTEID_VALUE;
        if (status == UA_STATUSCODE_GOOD)
            status = parse_node_id(_entries[i].node_id_, write_values[i].nodeId);
        if (status == UA_STATUSCODE_GOOD)
            status = UA_DataValue_copy(&_entries[i].value_.get(), &write_values[i].value);
        if (status == UA_STATUSCODE_GOOD && !_entries[i].index_range_.empty())
            write_values[i].indexRange = UA_STRING_ALLOC(_entries[i].index_range_.c_str());
    }

    if (status == UA_STATUSCODE_GOOD) {
        UA_WriteRequest request;
        UA_WriteRequest_init(&request);
        request.nodesToWrite = write_values.data();
        request.nodesToWriteSize = write_values.size();
        UA_WriteResponse response = UA_Client_Service_write(client_, request);
        response_checker checker(&response);
        status = checker.get_service_result();
        if (status == UA_STATUSCODE_GOOD && checker.get_results_size() != _entries.size())
            status = UA_STATUSCODE_BADUNEXPECTEDERROR;
        if (status == UA_STATUSCODE_GOOD) {
            for (size_t i = 0; i < checker.get_results_size(); i++)
                _results.push_back(checker.get_result(i));
        }
        UA_WriteResponse_clear(&response);
    }

    for (UA_WriteValue& write_value : write_values)
        UA_WriteValue_clear(&write_value);
    return status;
}

std::unique_ptr<subscription_context>
ua_client_session::create_subscription(double _publishing_interval_ms) {
    return std::make_unique<node_value_subscriber>(client_, _publishing_interval_ms);
}

UA_StatusCode
ua_client_session::run_iterate(opcua_link::timeout_ms_t _timeout_ms) {
    return UA_Client_run_iterate(client_, _timeout_ms);
}
