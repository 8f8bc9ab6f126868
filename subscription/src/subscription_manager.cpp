#include "../include/subscription_manager.hpp"
#include <exception>

subscription_manager::subscription_manager(session_provider& _session_provider, client_log& _log) :
    session_provider_(_session_provider), log_(_log) {
}

subscription_manager::~subscription_manager() {
}

bool
subscription_manager::ensure_ready(double _publishing_interval_ms) {
    if (session_provider_.acquire_session() == nullptr)
        return false;
    if (context_)
        return true;
    client_session* session = session_provider_.get_active_session();
    if (session == nullptr)
        return false;

    try {
        std::unique_ptr<subscription_context> context = session->create_subscription(_publishing_interval_ms);
        if (!context) {
            log_.log(log_level::ERROR, "Failed to create a subscription on " + session_provider_.get_endpoint());
            return false;
        }
        UA_StatusCode status = context->create();
        if (status != UA_STATUSCODE_GOOD) {
            log_.log(log_level::ERROR, "Failed to activate the subscription on " + session_provider_.get_endpoint() + ": " + UA_StatusCode_name(status));
            return false;
        }
        context_ = std::move(context);
    } catch (const std::exception& e) {
        log_.log(log_level::ERROR, "Failed to create a subscription on " + session_provider_.get_endpoint() + ": " + e.what());
        return false;
    }
    return true;
}

bool
subscription_manager::has_context() const {
    return context_ != nullptr;
}

bool
subscription_manager::add_monitored_item(const node_reference& _node_reference, notification_callback_t _callback) {
    if (!context_)
        return false;
    context_->add_item(_node_reference, _callback);
    return true;
}

bool
subscription_manager::remove_monitored_item(const node_reference& _node_reference) {
    if (!context_)
        return false;
    return context_->remove_item(_node_reference);
}

bool
subscription_manager::is_monitored(const node_reference& _node_reference) const {
    if (!context_)
        return false;
    for (const node_reference& reference : context_->get_monitored_items()) {
        if (reference.is_same_target(_node_reference))
            return true;
    }
    return false;
}

bool
subscription_manager::apply_changes() {
    if (!context_)
        return false;
    try {
        UA_StatusCode status = context_->apply_changes();
        if (status != UA_STATUSCODE_GOOD) {
            log_.log(log_level::ERROR, "Applying subscription changes on " + session_provider_.get_endpoint() + " failed: " + UA_StatusCode_name(status));
            return false;
        }
    } catch (const std::exception& e) {
        log_.log(log_level::ERROR, "Applying subscription changes on " + session_provider_.get_endpoint() + " threw: " + e.what());
        return false;
    }
    return true;
}

std::vector<node_reference>
subscription_manager::get_monitored_items() const {
    if (!context_)
        return std::vector<node_reference>();
    return context_->get_monitored_items();
}

size_t
subscription_manager::get_monitored_item_count() const {
    if (!context_)
        return 0;
    return context_->get_monitored_item_count();
}

void
subscription_manager::release(bool _remove_from_session) {
    if (!context_)
        return;
    std::unique_ptr<subscription_context> context = std::move(context_);
    if (_remove_from_session) {
        UA_StatusCode status = context->remove();
        if (status != UA_STATUSCODE_GOOD)
            log_.log(log_level::WARN, "Removing the subscription from " + session_provider_.get_endpoint() + " returned " + UA_StatusCode_name(status));
    }
}
