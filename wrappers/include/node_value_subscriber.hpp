/**
 * @file node_value_subscriber.hpp
 * @brief Subscription context monitoring value changes of nodes through an open62541 client.
 */
#ifndef NODE_VALUE_SUBSCRIBER_HPP
#define NODE_VALUE_SUBSCRIBER_HPP

#include <open62541/client_subscriptions.h>
#include <map>
#include <memory>
#include <vector>
#include "client_session.hpp"

/**
 * @brief One subscription of a client with its data change monitored items.
 *
 * The monitored node objects are the monitored item contexts handed to open62541 and
 * must outlive the items on the server, so they are only released after deletion.
 */
class node_value_subscriber : public subscription_context {
private:
    /**
     * @brief The context of one monitored item.
     */
    struct monitored_node {
        node_reference reference_; /**< the monitored node. */
        notification_callback_t callback_; /**< the callback invoked on value changes. */
        UA_UInt32 monitored_item_id_; /**< the server assigned id, 0 while pending. */
    };

    UA_Client* client_; /**< the client, owned by the session. */
    double publishing_interval_; /**< the requested publishing interval. */
    UA_UInt32 subscription_id_; /**< the server assigned subscription id, 0 if not created. */
    std::map<UA_UInt32, std::unique_ptr<monitored_node>> monitored_nodes_; /**< the live monitored items by id. */
    std::vector<std::unique_ptr<monitored_node>> pending_additions_; /**< the items to create. */
    std::vector<UA_UInt32> pending_removals_; /**< the ids of the items to delete. */

    /**
     * @brief Forwards a data change to the callback of the monitored node.
     */
    static void
    value_changed(UA_Client* _client, UA_UInt32 _subscription_id, void* _subscription_context,
                  UA_UInt32 _monitored_item_id, void* _monitored_item_context, UA_DataValue* _value);

    UA_StatusCode
    delete_pending_removals();

    UA_StatusCode
    create_pending_additions();
public:
    /**
     * @brief Constructs a new node value subscriber object.
     * 
     * @param _client the client.
     * @param _publishing_interval the publishing interval in milliseconds.
     */
    node_value_subscriber(UA_Client* _client, double _publishing_interval);

    /**
     * @brief Destroys the node value subscriber object, the subscription on the server is left untouched.
     * 
     */
    ~node_value_subscriber();

    UA_StatusCode
    create() override;

    UA_StatusCode
    remove() override;

    void
    add_item(const node_reference& _node_reference, notification_callback_t _callback) override;

    bool
    remove_item(const node_reference& _node_reference) override;

    /**
     * @brief Deletes the queued removals first, then creates the queued additions.
     * 
     * @return UA_StatusCode the first bad status code, good if every item succeeded.
     */
    UA_StatusCode
    apply_changes() override;

    std::vector<node_reference>
    get_monitored_items() const override;

    size_t
    get_monitored_item_count() const override;

    double
    get_publishing_interval() const override;
};

#endif // NODE_VALUE_SUBSCRIBER_HPP
