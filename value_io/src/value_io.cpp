#include "../include/value_io.hpp"
#include <open62541/util.h>
#include <exception>

value_io::value_io(session_provider& _session_provider, client_log& _log) :
    session_provider_(_session_provider), log_(_log) {
}

value_io::~value_io() {
}

bool
value_io::apply_index_range(data_value& _value, const std::string& _index_range) const {
    if (_index_range.empty())
        return false;
    UA_NumericRange range;
    UA_String range_string;
    range_string.length = _index_range.size();
    range_string.data = (UA_Byte*) const_cast<char*>(_index_range.data());
    if (UA_NumericRange_parse(&range, range_string) != UA_STATUSCODE_GOOD)
        return false;
    bool narrowed = false;
    if (range.dimensionsSize > 0) {
        UA_Variant sub_value;
        UA_Variant_init(&sub_value);
        if (UA_Variant_copyRange(&_value.get_variant(), &sub_value, range) == UA_STATUSCODE_GOOD)
            narrowed = _value.set_variant(sub_value) == UA_STATUSCODE_GOOD;
        UA_Variant_clear(&sub_value);
    }
    UA_free(range.dimensions);
    return narrowed;
}

std::vector<data_value>
value_io::read_node(const node_reference& _node_reference) {
    return read_nodes(std::vector<node_reference>{_node_reference});
}

std::vector<data_value>
value_io::read_nodes(const std::vector<node_reference>& _node_references) {
    std::vector<data_value> values;
    client_session* session = session_provider_.get_active_session();
    if (session == nullptr) {
        log_.log(log_level::ERROR, "Cannot read nodes on client with endpoint: " + session_provider_.get_endpoint() + " due to bad connection.");
        return values;
    }

    std::vector<std::string> node_ids;
    for (const node_reference& reference : _node_references)
        node_ids.push_back(reference.node_id_);
    try {
        UA_StatusCode status = session->read(node_ids, values);
        if (status != UA_STATUSCODE_GOOD) {
            log_.log(log_level::ERROR, "Reading nodes on " + session_provider_.get_endpoint() + " failed: " + UA_StatusCode_name(status));
            values.clear();
        }
    } catch (const std::exception& e) {
        log_.log(log_level::ERROR, "Reading nodes on " + session_provider_.get_endpoint() + " threw: " + e.what());
        values.clear();
    }
    return values;
}

bool
value_io::write_to_node(const node_reference& _node_reference, const UA_Variant& _value, const std::string& _index_range) {
    return write_to_nodes(std::vector<node_reference>{_node_reference}, _value, _index_range);
}

bool
value_io::write_to_nodes(const std::vector<node_reference>& _node_references, const UA_Variant& _value, const std::string& _index_range) {
    client_session* session = session_provider_.get_active_session();
    if (session == nullptr) {
        log_.log(log_level::ERROR, "Cannot write nodes on client with endpoint: " + session_provider_.get_endpoint() + " due to bad connection.");
        return false;
    }

    data_value value(_value);
    std::string index_range = apply_index_range(value, _index_range) ? _index_range : "";
    std::vector<write_entry> entries;
    for (const node_reference& reference : _node_references)
        entries.push_back(write_entry{reference.node_id_, value, index_range});

    std::vector<UA_StatusCode> results;
    try {
        UA_StatusCode status = session->write(entries, results);
        if (status != UA_STATUSCODE_GOOD) {
            log_.log(log_level::ERROR, "Writing nodes on " + session_provider_.get_endpoint() + " failed: " + UA_StatusCode_name(status));
            return false;
        }
    } catch (const std::exception& e) {
        log_.log(log_level::ERROR, "Writing nodes on " + session_provider_.get_endpoint() + " threw: " + e.what());
        return false;
    }

    if (results.size() != entries.size())
        return false;
    for (size_t i = 0; i < results.size(); i++) {
        if (UA_StatusCode_isBad(results[i])) {
            log_.log(log_level::WARN, "Writing " + entries[i].node_id_ + " returned " + UA_StatusCode_name(results[i]));
            return false;
        }
    }
    return true;
}
