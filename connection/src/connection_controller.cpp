#include "../include/connection_controller.hpp"

#include <boost/unordered_set.hpp>
#include <algorithm>
#include <chrono>
#include <exception>

#include "client_connection_establisher.hpp"
#include "filtered_logger.hpp"
#include "node_ids.hpp"

std::string
connection_state_to_string(connection_state _state) {
    switch (_state) {
        case connection_state::DISCONNECTED: return "Disconnected";
        case connection_state::CONNECTED_NO_SUBSCRIPTION: return "Connected-NoSubscription";
        case connection_state::CONNECTED_SUBSCRIBED: return "Connected-Subscribed";
        default: return "Unimplemented item";
    }
}

static node_reference
server_status_reference() {
    return node_reference(SERVER_STATUS_CURRENT_TIME, UA_NODECLASS_VARIABLE, SERVER_STATUS_CURRENT_TIME_NODE_ID);
}

static std::shared_ptr<client_log>
log_or_default(const client_configuration& _configuration, std::shared_ptr<client_log> _log) {
    if (_log)
        return _log;
    return std::make_shared<filtered_logger>(_configuration.log_levels_);
}

connection_controller::connection_controller(const client_configuration& _configuration, std::shared_ptr<client_log> _log) :
    connection_controller(_configuration,
                          std::make_unique<client_connection_establisher>(_configuration.application_name_, _configuration.stack_log_level_),
                          _log) {
}

connection_controller::connection_controller(const client_configuration& _configuration, std::unique_ptr<client_session_factory> _session_factory,
                                             std::shared_ptr<client_log> _log) :
    configuration_(_configuration), endpoint_(_configuration.endpoint_), log_(log_or_default(_configuration, _log)),
    session_factory_(std::move(_session_factory)), subscription_manager_(*this, *log_), address_space_walker_(*this, *log_),
    value_io_(*this, *log_), notification_channel_(_configuration.notification_queue_capacity_), backoff_timer_(timer_context_),
    operating_(true), current_retries_(0), current_publishing_interval_(_configuration.publishing_interval_ms_),
    keep_alive_interval_(_configuration.keep_alive_interval_ms_), session_generation_(0), server_status_monitored_(false) {
    default_notification_callback_ = [this](const node_reference& _node_reference, const data_value& _value) {
        log_notification(_node_reference, _value);
    };
}

connection_controller::~connection_controller() {
    disconnect();
}

/* Connection lifecycle */

UA_StatusCode
connection_controller::open_session(opcua_link::timeout_ms_t _session_timeout_ms, opcua_link::interval_ms_t _keep_alive_interval_ms) {
    try {
        endpoint_description description;
        UA_StatusCode status = session_factory_->select_endpoint(endpoint_, configuration_.operation_timeout_ms_, description);
        if (status != UA_STATUSCODE_GOOD)
            return status;
        std::unique_ptr<client_session> session;
        status = session_factory_->open(description, _session_timeout_ms, configuration_.operation_timeout_ms_, session);
        if (status != UA_STATUSCODE_GOOD)
            return status;
        if (!session)
            return UA_STATUSCODE_BADINTERNALERROR;
        session_ = std::move(session);
    } catch (const std::exception& e) {
        log_->log(log_level::ERROR, "Opening a session to endpoint: " + endpoint_ + " threw: " + e.what());
        return UA_STATUSCODE_BADUNEXPECTEDERROR;
    }
    session_generation_++;
    keep_alive_interval_ = _keep_alive_interval_ms;
    session_->set_keep_alive(make_keep_alive_callback(session_generation_), keep_alive_interval_);
    return UA_STATUSCODE_GOOD;
}

void
connection_controller::wait_backoff(opcua_link::interval_ms_t _backoff_ms) {
    backoff_timer_.expires_after(std::chrono::milliseconds(_backoff_ms));
    boost::system::error_code ec;
    backoff_timer_.wait(ec);
}

bool
connection_controller::connect(keep_alive_callback_t _keep_alive_handler, opcua_link::timeout_ms_t _session_timeout_ms,
                               opcua_link::interval_ms_t _keep_alive_interval_ms) {
    if (_keep_alive_handler)
        keep_alive_handler_ = _keep_alive_handler;
    opcua_link::timeout_ms_t session_timeout = _session_timeout_ms > 0 ? _session_timeout_ms : configuration_.session_timeout_ms_;
    opcua_link::interval_ms_t keep_alive_interval = _keep_alive_interval_ms > 0 ? _keep_alive_interval_ms : configuration_.keep_alive_interval_ms_;

    if (session_ != nullptr) {
        log_->log(log_level::INFO, "Replacing the existing session on client with endpoint: " + endpoint_);
        disconnect();
    }

    current_retries_ = 0;
    opcua_link::interval_ms_t backoff = configuration_.retry_backoff_ms_;
    while (true) {
        UA_StatusCode status = open_session(session_timeout, keep_alive_interval);
        if (status == UA_STATUSCODE_GOOD) {
            current_retries_ = 0;
            operating_ = true;
            log_->log(log_level::INFO, "Connected client to endpoint: " + endpoint_);
            return true;
        }

        current_retries_++;
        log_->log(log_level::ERROR, "Failed to connect client to endpoint: " + endpoint_ + " (" + UA_StatusCode_name(status) +
                                    "), current retries: " + std::to_string(current_retries_));
        if (configuration_.max_retries_ >= 0 && current_retries_ >= configuration_.max_retries_) {
            disconnect();
            operating_ = false;
            log_->log(log_level::FATAL, "Client on endpoint: " + endpoint_ + " is no longer operating.");
            return false;
        }
        operating_ = false;
        if (backoff > 0) {
            wait_backoff(backoff);
            backoff = std::min(backoff * 2, configuration_.max_retry_backoff_ms_);
        }
    }
}

void
connection_controller::disconnect() {
    if (session_ == nullptr) {
        subscription_manager_.release(false);
        return;
    }
    try {
        subscription_manager_.release(session_->is_connected());
        session_->close();
    } catch (const std::exception& e) {
        log_->log(log_level::WARN, "While trying to disconnect client from endpoint: " + endpoint_ + " experienced: " + e.what());
        subscription_manager_.release(false);
    }
    session_.reset();
    session_generation_++;
    log_->log(log_level::INFO, "Disconnected client from endpoint: " + endpoint_);
}

void
connection_controller::reset_endpoint(const std::string& _endpoint) {
    operating_ = true;
    current_retries_ = 0;
    std::string previous_endpoint = endpoint_;
    endpoint_ = _endpoint;
    references_.clear();
    server_status_monitored_ = false;
    server_status_callback_ = nullptr;
    disconnect();
    log_->log(log_level::INFO, "Reset endpoint from " + previous_endpoint + " to " + endpoint_);
}

bool
connection_controller::reconnect() {
    disconnect();
    current_retries_ = 0;
    operating_ = true;
    return resubscribe_references();
}

/* Liveness */

keep_alive_callback_t
connection_controller::make_keep_alive_callback(opcua_link::session_generation_t _generation) {
    return [this, _generation](UA_StatusCode _status) {
        if (!notification_channel_.post([this, _generation, _status]() { on_keep_alive(_generation, _status); }))
            log_->log(log_level::WARN, "Dropped liveness status " + std::string(UA_StatusCode_name(_status)) + " of endpoint: " + endpoint_ + ", notification channel is full.");
    };
}

void
connection_controller::on_keep_alive(opcua_link::session_generation_t _generation, UA_StatusCode _status) {
    if (_generation != session_generation_ || session_ == nullptr) {
        log_->log(log_level::DEBUG, "Ignoring liveness status " + std::string(UA_StatusCode_name(_status)) + " of a replaced session on endpoint: " + endpoint_);
        return;
    }
    if (!keep_alive_handler_) {
        handle_keep_alive(_status);
        return;
    }
    try {
        keep_alive_handler_(_status);
    } catch (const std::exception& e) {
        log_->log(log_level::ERROR, "Liveness handler of client with endpoint: " + endpoint_ + " threw: " + e.what());
    }
}

void
connection_controller::handle_keep_alive(UA_StatusCode _status) {
    if (_status == UA_STATUSCODE_GOOD)
        return;
    log_->log(log_level::ERROR, "Connection on client with endpoint: " + endpoint_ + " is bad (" + UA_StatusCode_name(_status) + "), trying to reconnect.");

    UA_StatusCode reconnect_status = UA_STATUSCODE_BADCONNECTIONCLOSED;
    if (session_ != nullptr) {
        try {
            reconnect_status = session_->reconnect();
        } catch (const std::exception& e) {
            log_->log(log_level::WARN, "Reconnecting the session on endpoint: " + endpoint_ + " threw: " + e.what());
            reconnect_status = UA_STATUSCODE_BADUNEXPECTEDERROR;
        }
    }
    if (reconnect_status == UA_STATUSCODE_GOOD) {
        session_generation_++;
        session_->set_keep_alive(make_keep_alive_callback(session_generation_), keep_alive_interval_);
        log_->log(log_level::INFO, "Reconnected session on client with endpoint: " + endpoint_);
        return;
    }

    log_->log(log_level::WARN, "Session on endpoint: " + endpoint_ + " cannot be recovered (" + UA_StatusCode_name(reconnect_status) + "), resubscribing.");
    disconnect();
    if (!resubscribe_references()) {
        disconnect();
        operating_ = false;
        log_->log(log_level::FATAL, "Unable to re-establish a connection to endpoint: " + endpoint_ + " client no longer in operation.");
    }
}

bool
connection_controller::resubscribe_references() {
    if (!connect() || !ensure_ready())
        return false;

    std::vector<std::string> display_names = address_space_walker::get_display_names(address_space_walker_.browse_objects_node());
    boost::unordered_set<std::string> live_names(display_names.begin(), display_names.end());
    for (const reference_entry& entry : references_.get_entries()) {
        const std::string& display_name = entry.reference_.display_name_;
        if (live_names.find(display_name) != live_names.end()) {
            queue_subscription(entry.reference_, entry.callback_);
            subscription_manager_.apply_changes();
            log_->log(log_level::INFO, "Resubscribing to " + display_name + " on client with endpoint: " + endpoint_);
        } else {
            references_.remove(entry.reference_);
            log_->log(log_level::WARN, display_name + " no longer exists on endpoint: " + endpoint_ + " removing from references.");
        }
    }
    if (server_status_monitored_)
        arm_server_status();
    return true;
}

/* Subscriptions */

bool
connection_controller::ensure_ready() {
    bool ready = subscription_manager_.ensure_ready(current_publishing_interval_);
    log_->log(log_level::DEBUG, std::string("Readiness check ") + (ready ? "succeeded" : "failed") + " on client with endpoint: " + endpoint_);
    return ready;
}

notification_callback_t
connection_controller::make_channel_callback(notification_callback_t _callback) {
    return [this, _callback](const node_reference& _node_reference, const data_value& _value) {
        bool posted = notification_channel_.post([this, _callback, _node_reference, _value]() {
            try {
                _callback(_node_reference, _value);
            } catch (const std::exception& e) {
                log_->log(log_level::ERROR, "Notification callback of " + _node_reference.display_name_ + " threw: " + e.what());
            }
        });
        if (!posted)
            log_->log(log_level::WARN, "Dropped value change of " + _node_reference.display_name_ + ", notification channel is full.");
    };
}

void
connection_controller::log_notification(const node_reference& _node_reference, const data_value& _value) {
    log_->log(log_level::MESSAGE, _node_reference.display_name_ + " { Value: " + _value.value_to_string() +
                                  ", SourceTimestamp: " + _value.source_timestamp_to_string() +
                                  ", StatusCode: " + UA_StatusCode_name(_value.get_status()) + " }");
}

notification_callback_t
connection_controller::resolve_callback(notification_callback_t _callback) {
    if (!_callback)
        return default_notification_callback_;
    default_notification_callback_ = _callback;
    return _callback;
}

void
connection_controller::queue_subscription(const node_reference& _node_reference, notification_callback_t _callback) {
    const node_reference* stored = references_.get_reference(_node_reference.display_name_, _node_reference.node_id_);
    if (stored != nullptr)
        subscription_manager_.remove_monitored_item(*stored);
    references_.insert(_node_reference, _callback);
    subscription_manager_.add_monitored_item(_node_reference, make_channel_callback(_callback));
}

bool
connection_controller::subscribe(const node_reference& _node_reference, notification_callback_t _callback, UA_NodeClass _allow_class,
                                 double _publishing_interval_ms) {
    set_publishing_interval(_publishing_interval_ms);
    if (!ensure_ready())
        return false;
    if (_allow_class != UA_NODECLASS_UNSPECIFIED && _allow_class != _node_reference.node_class_)
        return false;
    queue_subscription(_node_reference, resolve_callback(_callback));
    bool applied = subscription_manager_.apply_changes();
    log_->log(log_level::INFO, "Started subscribing to " + _node_reference.display_name_ + " on client with endpoint: " + endpoint_);
    return applied;
}

bool
connection_controller::subscribe(const std::vector<node_reference>& _node_references, notification_callback_t _callback, UA_NodeClass _allow_class,
                                 double _publishing_interval_ms) {
    set_publishing_interval(_publishing_interval_ms);
    if (!ensure_ready())
        return false;
    notification_callback_t callback = resolve_callback(_callback);
    size_t queued = 0;
    for (const node_reference& reference : _node_references) {
        if (_allow_class != UA_NODECLASS_UNSPECIFIED && _allow_class != reference.node_class_)
            continue;
        queue_subscription(reference, callback);
        queued++;
        log_->log(log_level::INFO, "Started subscribing to " + reference.display_name_ + " on client with endpoint: " + endpoint_);
    }
    if (queued == 0)
        return false;
    return subscription_manager_.apply_changes();
}

bool
connection_controller::stop_subscription(const node_reference& _node_reference) {
    const node_reference* stored = references_.get_reference(_node_reference.display_name_, _node_reference.node_id_);
    if (stored == nullptr)
        return false;
    node_reference target = *stored;
    if (get_active_session() != nullptr && subscription_manager_.remove_monitored_item(target))
        subscription_manager_.apply_changes();
    references_.remove(target);
    log_->log(log_level::INFO, "Cancelled subscription to " + target.display_name_ + " on client with endpoint: " + endpoint_);
    return true;
}

bool
connection_controller::arm_server_status() {
    node_reference server_status = server_status_reference();
    subscription_manager_.remove_monitored_item(server_status);
    subscription_manager_.add_monitored_item(server_status, make_channel_callback(server_status_callback_));
    return subscription_manager_.apply_changes();
}

bool
connection_controller::monitor(bool _enable, notification_callback_t _callback, double _publishing_interval_ms) {
    set_publishing_interval(_publishing_interval_ms);
    if (!_enable) {
        if (!server_status_monitored_)
            return true;
        if (get_active_session() != nullptr && subscription_manager_.remove_monitored_item(server_status_reference()))
            subscription_manager_.apply_changes();
        server_status_monitored_ = false;
        server_status_callback_ = nullptr;
        log_->log(log_level::INFO, "Stopped monitoring server status on client with endpoint: " + endpoint_);
        return true;
    }

    if (!ensure_ready())
        return false;
    if (_callback)
        server_status_callback_ = _callback;
    else if (!server_status_monitored_)
        server_status_callback_ = [this](const node_reference& _node_reference, const data_value& _value) {
            log_notification(_node_reference, _value);
        };
    server_status_monitored_ = true;
    bool applied = arm_server_status();
    log_->log(log_level::INFO, "Started monitoring server status on client with endpoint: " + endpoint_);
    return applied;
}

void
connection_controller::set_publishing_interval(double _publishing_interval_ms) {
    current_publishing_interval_ = _publishing_interval_ms < 0 ? configuration_.publishing_interval_ms_ : _publishing_interval_ms;
}

double
connection_controller::get_publishing_interval() const {
    return current_publishing_interval_;
}

/* Event loop */

UA_StatusCode
connection_controller::run_iterate(opcua_link::timeout_ms_t _timeout_ms) {
    UA_StatusCode status = UA_STATUSCODE_BADCONNECTIONCLOSED;
    if (session_ != nullptr) {
        try {
            status = session_->run_iterate(_timeout_ms);
        } catch (const std::exception& e) {
            log_->log(log_level::ERROR, "Event loop of client with endpoint: " + endpoint_ + " threw: " + e.what());
            status = UA_STATUSCODE_BADUNEXPECTEDERROR;
        }
        if (status != UA_STATUSCODE_GOOD)
            make_keep_alive_callback(session_generation_)(status);
    }
    process_notifications();
    return status;
}

size_t
connection_controller::process_notifications() {
    return notification_channel_.drain();
}

/* Accessors */

client_session*
connection_controller::acquire_session() {
    if (session_ == nullptr && !connect())
        return nullptr;
    return session_.get();
}

client_session*
connection_controller::get_active_session() {
    if (!operating_ || session_ == nullptr || !session_->is_connected())
        return nullptr;
    return session_.get();
}

bool
connection_controller::is_operating_successfully() const {
    return operating_;
}

const std::string&
connection_controller::get_endpoint() const {
    return endpoint_;
}

opcua_link::retry_count_t
connection_controller::get_current_retries() const {
    return current_retries_;
}

connection_state
connection_controller::get_connection_state() const {
    if (session_ == nullptr)
        return connection_state::DISCONNECTED;
    if (!subscription_manager_.has_context())
        return connection_state::CONNECTED_NO_SUBSCRIPTION;
    return connection_state::CONNECTED_SUBSCRIBED;
}

client_session*
connection_controller::get_session() const {
    return session_.get();
}

std::vector<node_reference>
connection_controller::get_references() const {
    return references_.get_references();
}

const node_reference*
connection_controller::get_reference(const std::string& _display_name, const std::string& _node_id) const {
    return references_.get_reference(_display_name, _node_id);
}

void
connection_controller::clear_references() {
    references_.clear();
}

std::vector<node_reference>
connection_controller::get_monitored_items() {
    if (!ensure_ready())
        return std::vector<node_reference>();
    return subscription_manager_.get_monitored_items();
}

bool
connection_controller::is_server_status_monitored() const {
    return server_status_monitored_;
}

address_space_walker&
connection_controller::get_address_space_walker() {
    return address_space_walker_;
}

value_io&
connection_controller::get_value_io() {
    return value_io_;
}

client_log&
connection_controller::get_log() {
    return *log_;
}

const client_configuration&
connection_controller::get_configuration() const {
    return configuration_;
}
