/**
 * @file reference_store.hpp
 * @brief Ordered store of subscribed node references and their notification callbacks.
 */
#ifndef REFERENCE_STORE_HPP
#define REFERENCE_STORE_HPP

#include <string>
#include <vector>
#include "callbacks.hpp"
#include "node_reference.hpp"

/**
 * @brief A subscribed node reference with its callback.
 */
struct reference_entry {
    node_reference reference_; /**< the subscribed node. */
    notification_callback_t callback_; /**< the callback invoked on value changes. */
};

/**
 * @brief Keeps at most one entry per display name and node id, in insertion order.
 *
 * Entries survive disconnects and are replayed on reconnect. The store performs no I/O.
 */
class reference_store {
private:
    std::vector<reference_entry> entries_; /**< the entries in insertion order. */

    std::vector<reference_entry>::iterator
    find(const std::string& _display_name, const std::string& _node_id);

    std::vector<reference_entry>::const_iterator
    find(const std::string& _display_name, const std::string& _node_id) const;
public:
    reference_store();
    ~reference_store();

    /**
     * @brief Looks up the stored reference with the given identity.
     * 
     * @param _display_name the display name.
     * @param _node_id the node id.
     * @return const node_reference* the stored reference or nullptr.
     */
    const node_reference*
    get_reference(const std::string& _display_name, const std::string& _node_id) const;

    bool
    contains(const node_reference& _node_reference) const;

    /**
     * @brief Inserts a reference, replacing an existing entry for the same target.
     *
     * A replaced entry is removed first, so the new entry is appended at the end.
     * @param _node_reference the reference.
     * @param _callback the callback.
     * @return true if an existing entry was replaced.
     * @return false if the reference was new.
     */
    bool
    insert(const node_reference& _node_reference, notification_callback_t _callback);

    /**
     * @brief Removes the entry for the same target.
     * 
     * @param _node_reference the reference.
     * @return true if an entry was removed.
     * @return false otherwise.
     */
    bool
    remove(const node_reference& _node_reference);

    /**
     * @brief Returns the callback of the entry for the same target.
     * 
     * @param _node_reference the reference.
     * @return notification_callback_t the callback, empty if there is no entry.
     */
    notification_callback_t
    get_callback(const node_reference& _node_reference) const;

    void
    clear();

    size_t
    size() const;

    bool
    empty() const;

    /**
     * @brief Returns a snapshot of all entries, safe to iterate while the store is modified.
     * 
     * @return std::vector<reference_entry> the entries.
     */
    std::vector<reference_entry>
    get_entries() const;

    /**
     * @brief Returns a snapshot of all references.
     * 
     * @return std::vector<node_reference> the references.
     */
    std::vector<node_reference>
    get_references() const;
};

#endif // REFERENCE_STORE_HPP
