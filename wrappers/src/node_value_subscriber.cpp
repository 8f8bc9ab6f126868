#include "../include/node_value_subscriber.hpp"
#include <open62541/plugin/log_stdout.h>
#include <algorithm>

node_value_subscriber::node_value_subscriber(UA_Client* _client, double _publishing_interval) :
    client_(_client), publishing_interval_(_publishing_interval), subscription_id_(0) {
}

node_value_subscriber::~node_value_subscriber() {
}

void
node_value_subscriber::value_changed(UA_Client* _client, UA_UInt32 _subscription_id, void* _subscription_context,
                                     UA_UInt32 _monitored_item_id, void* _monitored_item_context, UA_DataValue* _value) {
    monitored_node* node = static_cast<monitored_node*>(_monitored_item_context);
    if (node == NULL || _value == NULL || !node->callback_)
        return;
    node->callback_(node->reference_, data_value(*_value));
}

UA_StatusCode
node_value_subscriber::create() {
    if (client_ == nullptr)
        return UA_STATUSCODE_BAD;
    if (subscription_id_ != 0)
        return UA_STATUSCODE_GOOD;
    UA_CreateSubscriptionRequest request = UA_CreateSubscriptionRequest_default();
    request.requestedPublishingInterval = publishing_interval_;
    UA_CreateSubscriptionResponse response = UA_Client_Subscriptions_create(client_, request, this, NULL, NULL);
    UA_StatusCode status = response.responseHeader.serviceResult;
    if (status == UA_STATUSCODE_GOOD) {
        subscription_id_ = response.subscriptionId;
        publishing_interval_ = response.revisedPublishingInterval;
    }
    UA_CreateSubscriptionResponse_clear(&response);
    return status;
}

UA_StatusCode
node_value_subscriber::remove() {
    UA_StatusCode status = UA_STATUSCODE_GOOD;
    if (subscription_id_ != 0)
        status = UA_Client_Subscriptions_deleteSingle(client_, subscription_id_);
    subscription_id_ = 0;
    monitored_nodes_.clear();
    pending_additions_.clear();
    pending_removals_.clear();
    return status;
}

void
node_value_subscriber::add_item(const node_reference& _node_reference, notification_callback_t _callback) {
    std::unique_ptr<monitored_node> node = std::make_unique<monitored_node>();
    node->reference_ = _node_reference;
    node->callback_ = _callback;
    node->monitored_item_id_ = 0;
    pending_additions_.push_back(std::move(node));
}

bool
node_value_subscriber::remove_item(const node_reference& _node_reference) {
    auto pending = std::find_if(pending_additions_.begin(), pending_additions_.end(),
                                [&_node_reference](const std::unique_ptr<monitored_node>& _node) { return _node->reference_.is_same_target(_node_reference); });
    if (pending != pending_additions_.end()) {
        pending_additions_.erase(pending);
        return true;
    }
    for (auto& entry : monitored_nodes_) {
        if (!entry.second->reference_.is_same_target(_node_reference))
            continue;
        if (std::find(pending_removals_.begin(), pending_removals_.end(), entry.first) == pending_removals_.end())
            pending_removals_.push_back(entry.first);
        return true;
    }
    return false;
}

UA_StatusCode
node_value_subscriber::delete_pending_removals() {
    if (pending_removals_.empty())
        return UA_STATUSCODE_GOOD;
    UA_DeleteMonitoredItemsRequest request;
    UA_DeleteMonitoredItemsRequest_init(&request);
    request.subscriptionId = subscription_id_;
    request.monitoredItemIds = pending_removals_.data();
    request.monitoredItemIdsSize = pending_removals_.size();
    UA_DeleteMonitoredItemsResponse response = UA_Client_MonitoredItems_delete(client_, request);

    UA_StatusCode status = response.responseHeader.serviceResult;
    if (status == UA_STATUSCODE_GOOD) {
        for (size_t i = 0; i < response.resultsSize && i < pending_removals_.size(); i++) {
            if (response.results[i] == UA_STATUSCODE_GOOD || response.results[i] == UA_STATUSCODE_BADMONITOREDITEMIDINVALID)
                monitored_nodes_.erase(pending_removals_[i]);
            else if (status == UA_STATUSCODE_GOOD)
                status = response.results[i];
        }
    }
    UA_DeleteMonitoredItemsResponse_clear(&response);
    pending_removals_.clear();
    return status;
}

UA_StatusCode
node_value_subscriber::create_pending_additions() {
    if (pending_additions_.empty())
        return UA_STATUSCODE_GOOD;
    size_t items_size = pending_additions_.size();
    std::vector<UA_MonitoredItemCreateRequest> items(items_size);
    std::vector<void*> contexts(items_size);
    std::vector<UA_Client_DataChangeNotificationCallback> callbacks(items_size, value_changed);
    std::vector<UA_Client_DeleteMonitoredItemCallback> delete_callbacks(items_size, nullptr);

    UA_StatusCode status = UA_STATUSCODE_GOOD;
    for (size_t i = 0; i < items_size; i++) {
        UA_NodeId node_id;
        UA_NodeId_init(&node_id);
        UA_StatusCode parse_status = parse_node_id(pending_additions_[i]->reference_.node_id_, node_id);
        if (parse_status != UA_STATUSCODE_GOOD && status == UA_STATUSCODE_GOOD)
            status = parse_status;
        items[i] = UA_MonitoredItemCreateRequest_default(node_id);
        items[i].monitoringMode = UA_MONITORINGMODE_REPORTING;
        contexts[i] = pending_additions_[i].get();
    }

    if (status == UA_STATUSCODE_GOOD) {
        UA_CreateMonitoredItemsRequest request;
        UA_CreateMonitoredItemsRequest_init(&request);
        request.subscriptionId = subscription_id_;
        request.timestampsToReturn = UA_TIMESTAMPSTORETURN_BOTH;
        request.itemsToCreate = items.data();
        request.itemsToCreateSize = items_size;
        UA_CreateMonitoredItemsResponse response = UA_Client_MonitoredItems_createDataChanges(client_, request, contexts.data(),
                                                                                              callbacks.data(), delete_callbacks.data());
        status = response.responseHeader.serviceResult;
        for (size_t i = 0; status == UA_STATUSCODE_GOOD && i < response.resultsSize && i < items_size; i++) {
            if (UA_StatusCode_isBad(response.results[i].statusCode)) {
                UA_LOG_WARNING(UA_Log_Stdout, UA_LOGCATEGORY_USERLAND, "%s: Monitoring %s failed (%s)", __FUNCTION__,
                               pending_additions_[i]->reference_.display_name_.c_str(), UA_StatusCode_name(response.results[i].statusCode));
                continue;
            }
            pending_additions_[i]->monitored_item_id_ = response.results[i].monitoredItemId;
            monitored_nodes_[response.results[i].monitoredItemId] = std::move(pending_additions_[i]);
        }
        for (size_t i = 0; status == UA_STATUSCODE_GOOD && i < response.resultsSize; i++) {
            if (UA_StatusCode_isBad(response.results[i].statusCode))
                status = response.results[i].statusCode;
        }
        UA_CreateMonitoredItemsResponse_clear(&response);
    }

    for (UA_MonitoredItemCreateRequest& item : items)
        UA_MonitoredItemCreateRequest_clear(&item);
    pending_additions_.clear();
    return status;
}

UA_StatusCode
node_value_subscriber::apply_changes() {
    if (subscription_id_ == 0)
        return UA_STATUSCODE_BADSUBSCRIPTIONIDINVALID;
    UA_StatusCode removal_status = delete_pending_removals();
    UA_StatusCode addition_status = create_pending_additions();
    return removal_status != UA_STATUSCODE_GOOD ? removal_status : addition_status;
}

std::vector<node_reference>
node_value_subscriber::get_monitored_items() const {
    std::vector<node_reference> references;
    for (const auto& entry : monitored_nodes_)
        references.push_back(entry.second->reference_);
    return references;
}

size_t
node_value_subscriber::get_monitored_item_count() const {
    return monitored_nodes_.size();
}

double
node_value_subscriber::get_publishing_interval() const {
    return publishing_interval_;
}
