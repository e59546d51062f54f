/**
 * @file event.hpp
 * @brief relaypost events - heap-free observability records and a bounded event log.
 *
 * The keeper and router never print. Everything worth surfacing (a post
 * arriving, an acknowledgement coming back, a remote error, a timeout) is
 * emitted as an `Event` into an `EventLog`, and whoever owns the log (CLI,
 * tests, a daemon wrapper) drains it and decides how to render it.
 *
 *  - `AttrList` : a small, fixed-capacity list of key→value attributes.
 *                 Keys are preserved EXACTLY as provided; only leading and
 *                 trailing whitespace is trimmed from keys and values.
 *  - `Event`    : a short type tag (e.g. "post_received") plus its attributes.
 *  - `EventLog` : a bounded FIFO. When full, the oldest event is dropped and
 *                 counted in `dropped()`, so a slow consumer can never make
 *                 ledger operations fail.
 *
 * ## Tuning capacities
 * - `EV_KEY_MAX`   : max attribute key length (default 32).
 * - `EV_VAL_MAX`   : max attribute value length (default 128). Longer values
 *                    (e.g. a long remote error message) are truncated.
 * - `EV_ATTRS_MAX` : max attributes per event (default 8).
 *
 * Not thread-safe - one log per chain, guarded externally if shared.
 */

#pragma once
#include "etl/string.h"
#include "etl/vector.h"
#include "etl/deque.h"
#include <stdint.h>
#include <stddef.h>

namespace relaypost {

static constexpr size_t EV_TYPE_MAX  = 32;   ///< Maximum length of an event type tag
static constexpr size_t EV_KEY_MAX   = 32;   ///< Maximum length for an attribute key
static constexpr size_t EV_VAL_MAX   = 128;  ///< Maximum length for an attribute value
static constexpr size_t EV_ATTRS_MAX = 8;    ///< Maximum number of attributes per event

using EventTypeStr = etl::string<EV_TYPE_MAX>;
using AttrKeyStr   = etl::string<EV_KEY_MAX>;
using AttrValStr   = etl::string<EV_VAL_MAX>;

/// @brief A single attribute entry (key→value).
struct Attr {
    AttrKeyStr k;  ///< Key string, preserved as provided (after whitespace trim)
    AttrValStr v;  ///< Value string; may be empty
};

/// @brief Minimal, heap-free attribute list with fixed capacity.
struct AttrList {
    etl::vector<Attr, EV_ATTRS_MAX> items;  ///< Storage for key/value entries

    /// @brief Trim leading and trailing spaces/tabs (in-place) for keys.
    static void trim_str(AttrKeyStr& s) {
        while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.erase(0, 1);
        while (!s.empty() && (s.back()  == ' ' || s.back()  == '\t')) s.pop_back();
    }

    /// @brief Trim leading and trailing spaces/tabs (in-place) for values.
    static void trim_str(AttrValStr& s) {
        while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.erase(0, 1);
        while (!s.empty() && (s.back()  == ' ' || s.back()  == '\t')) s.pop_back();
    }

    /**
     * @brief Set or replace a key→value pair.
     * @param key Raw key (kept exactly as provided after trimming). Must not be nullptr.
     * @param val Raw value (trimmed). May be nullptr to store an empty value.
     * @return true on success; false if capacity is full or key is null.
     */
    bool set(const char* key, const char* val) {
        if (!key) return false;
        AttrKeyStr k_str = key; trim_str(k_str);
        AttrValStr v_str; if (val) { v_str = val; trim_str(v_str); }
        for (auto& kv : items) {
            if (kv.k == k_str) { kv.v = v_str; return true; }
        }
        if (items.full()) return false;
        items.push_back({k_str, v_str});
        return true;
    }

    /// @brief Check if a key exists.
    bool has(const char* key) const {
        for (auto& kv : items) if (kv.k == key) return true;
        return false;
    }

    /**
     * @brief Get the stored value for a key (read-only).
     * @return Pointer to value string if found; nullptr otherwise.
     */
    const AttrValStr* get(const char* key) const {
        for (auto& kv : items) if (kv.k == key) return &kv.v;
        return nullptr;
    }

    size_t size() const { return items.size(); }

    const Attr& operator[](size_t i) const { return items[i]; }
};

/// @brief One observable occurrence: a type tag plus attributes.
struct Event {
    EventTypeStr type;
    AttrList     attrs;

    bool is(const char* t) const { return type == t; }
};

/**
 * @brief Bounded FIFO of events shared by a chain's keeper and router.
 *
 * `emit()` never fails: when the log is at `EVENT_CAP`, the oldest entry is
 * evicted to make room and `dropped()` is incremented.
 */
class EventLog {
public:
    static constexpr size_t EVENT_CAP = 32;   ///< Max events retained before eviction

    void emit(const Event& ev) {
        if (events_.full()) {
            events_.pop_front();
            ++dropped_;
        }
        events_.push_back(ev);
    }

    /// @brief Build and emit an event in one call.
    Event& emit(const char* type) {
        Event ev;
        ev.type = type;
        emit(ev);
        return events_.back();
    }

    /**
     * @brief Dequeue the oldest event.
     * @retval true  `out` holds the event.
     * @retval false log was empty.
     */
    bool next(Event& out) {
        if (events_.empty()) return false;
        out = events_.front();
        events_.pop_front();
        return true;
    }

    size_t   size() const    { return events_.size(); }
    bool     empty() const   { return events_.empty(); }
    uint32_t dropped() const { return dropped_; }

private:
    etl::deque<Event, EVENT_CAP> events_;
    uint32_t dropped_{0};
};

} // namespace relaypost
