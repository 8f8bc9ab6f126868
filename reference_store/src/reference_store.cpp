#include "../include/reference_store.hpp"
#include <algorithm>

reference_store::reference_store() {
}

reference_store::~reference_store() {
}

std::vector<reference_entry>::iterator
reference_store::find(const std::string& _display_name, const std::string& _node_id) {
    return std::find_if(entries_.begin(), entries_.end(), [&](const reference_entry& _entry) {
        return _entry.reference_.display_name_ == _display_name && _entry.reference_.node_id_ == _node_id;
    });
}

std::vector<reference_entry>::const_iterator
reference_store::find(const std::string& _display_name, const std::string& _node_id) const {
    return std::find_if(entries_.begin(), entries_.end(), [&](const reference_entry& _entry) {
        return _entry.reference_.display_name_ == _display_name && _entry.reference_.node_id_ == _node_id;
    });
}

const node_reference*
reference_store::get_reference(const std::string& _display_name, const std::string& _node_id) const {
    auto entry = find(_display_name, _node_id);
    if (entry == entries_.end())
        return nullptr;
    return &entry->reference_;
}

bool
reference_store::contains(const node_reference& _node_reference) const {
    return find(_node_reference.display_name_, _node_reference.node_id_) != entries_.end();
}

bool
reference_store::insert(const node_reference& _node_reference, notification_callback_t _callback) {
    bool replaced = remove(_node_reference);
    entries_.push_back(reference_entry{_node_reference, _callback});
    return replaced;
}

bool
reference_store::remove(const node_reference& _node_reference) {
    auto entry = find(_node_reference.display_name_, _node_reference.node_id_);
    if (entry == entries_.end())
        return false;
    entries_.erase(entry);
    return true;
}

notification_callback_t
reference_store::get_callback(const node_reference& _node_reference) const {
    auto entry = find(_node_reference.display_name_, _node_reference.node_id_);
    if (entry == entries_.end())
        return notification_callback_t();
    return entry->callback_;
}

void
reference_store::clear() {
    entries_.clear();
}

size_t
reference_store::size() const {
    return entries_.size();
}

bool
reference_store::empty() const {
    return entries_.empty();
}

std::vector<reference_entry>
reference_store::get_entries() const {
    return entries_;
}

std::vector<node_reference>
reference_store::get_references() const {
    std::vector<node_reference> references;
    for (const reference_entry& entry : entries_)
        references.push_back(entry.reference_);
    return references;
}
