/**
 * @file store.hpp
 * @brief Append-only record stores owned by one chain.
 *
 * Each store is an `AppendLog<Record>`: records get a dense, strictly
 * increasing id equal to the store's counter at append time, and are never
 * edited or removed through the ledger operations. `Stores` bundles the three
 * logs plus the index of originated packets that already reached a terminal
 * state.
 *
 * A `Stores` value is passed by reference into the keeper; there is no global
 * state. Not thread-safe: one writer per chain.
 */

#pragma once
#include <stdint.h>
#include <stddef.h>
#include <algorithm>
#include <set>
#include <utility>
#include <vector>

#include "relaypost/types.hpp"

namespace relaypost {

/**
 * @brief Append-only log keyed by a monotonically increasing id.
 *
 * @tparam Record any record type with a `uint64_t id` member.
 *
 * `count()` is the next id to hand out. After `restore()` from a genesis
 * snapshot the records may be sparse (ids < count, not necessarily dense), so
 * lookups use a binary search over the id-ordered vector.
 */
template <typename Record>
class AppendLog {
public:
  /// Assign the next id to `rec`, store it, and return that id.
  uint64_t append(Record rec) {
    rec.id = count_;
    records_.push_back(std::move(rec));
    return count_++;
  }

  /// Pointer to the record with `id`, or nullptr.
  const Record* find(uint64_t id) const {
    auto it = std::lower_bound(records_.begin(), records_.end(), id,
                               [](const Record& r, uint64_t v) { return r.id < v; });
    if (it == records_.end() || it->id != id) return nullptr;
    return &*it;
  }

  const std::vector<Record>& all() const { return records_; }

  size_t   size() const  { return records_.size(); }
  uint64_t count() const { return count_; }

  /// Replace contents from a snapshot. Caller validates ids (unique, < count).
  void restore(std::vector<Record> records, uint64_t count) {
    std::sort(records.begin(), records.end(),
              [](const Record& a, const Record& b) { return a.id < b.id; });
    records_ = std::move(records);
    count_   = count;
  }

private:
  std::vector<Record> records_;
  uint64_t count_{0};
};

using PostStore         = AppendLog<PostRecord>;
using SentPostStore     = AppendLog<SentPostRecord>;
using TimedOutPostStore = AppendLog<TimedOutPostRecord>;

/// Originated packets whose acknowledgement or timeout has been applied.
class ResolvedPacketIndex {
public:
  bool contains(const PacketKey& key) const { return keys_.count(key) != 0; }
  void insert(const PacketKey& key)         { keys_.insert(key); }
  size_t size() const                       { return keys_.size(); }

private:
  std::set<PacketKey> keys_;
};

/// Everything the post module persists for one chain.
struct Stores {
  PostStore           posts;
  SentPostStore       sent_posts;
  TimedOutPostStore   timed_out_posts;
  ResolvedPacketIndex resolved;
};

} // namespace relaypost
