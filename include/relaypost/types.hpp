/**
 * @file types.hpp
 * @brief relaypost value types - packets, post payloads, acknowledgements and records.
 *
 * These are the nouns every other module passes around:
 *
 *  - `Height` / `Packet` : one unit of cross-chain transmission. A packet is
 *    built once by `Keeper::transmit_post()` and only ever read afterwards.
 *  - `PostPayload`       : the replicated application content (creator/title/content).
 *  - `AckResult`         : what a receiving chain hands back on success.
 *  - `Acknowledgement`   : the outcome envelope relayed to the sender, tagged
 *                          Success / Failure / Unknown.
 *  - `PostRecord`, `SentPostRecord`, `TimedOutPostRecord` : the three local
 *    side-effect records, each owned by an append-only store (see store.hpp).
 *
 * ## Identifier strings
 * Port and channel identifiers are fixed-capacity ETL strings sized to the
 * identifier limits the router validates (port 2..128, channel 8..64). Content
 * fields (title, content, creator) are free-form and stay `std::string`.
 *
 * ## Cross-chain creator mangling
 * A post created from a remote payload carries the creator
 * `<sourcePort>-<sourceChannel>-<creator>`. Downstream consumers match on that
 * exact string; `remote_creator()` is the only place it is built.
 */

#pragma once
#include "relaypost/status.hpp"
#include "etl/string.h"
#include <stdint.h>
#include <stddef.h>
#include <string>
#include <vector>

namespace relaypost {

static constexpr size_t RP_PORT_MAX    = 128;  ///< longest accepted port identifier
static constexpr size_t RP_CHANNEL_MAX = 64;   ///< longest accepted channel identifier

using PortIdStr    = etl::string<RP_PORT_MAX>;
using ChannelIdStr = etl::string<RP_CHANNEL_MAX>;

/// Opaque byte sequence (packet data, acknowledgement bytes).
using Bytes = std::vector<uint8_t>;

/**
 * @brief Block height on a counterparty chain, as (revision, height).
 *
 * The zero height disables height-based timeouts. Ordering is lexicographic:
 * revision first, then height inside the revision.
 */
struct Height {
  uint64_t revision_number{0};
  uint64_t revision_height{0};

  bool is_zero() const { return revision_number == 0 && revision_height == 0; }
};

bool operator==(const Height& a, const Height& b);
bool operator!=(const Height& a, const Height& b);
bool operator<(const Height& a, const Height& b);
bool operator>=(const Height& a, const Height& b);

/**
 * @brief One cross-chain transmission unit.
 *
 * Uniquely identified by (source_port, source_channel, sequence). Consumers
 * receive it by const reference; nothing in relaypost edits a packet after
 * `Keeper::transmit_post()` constructs it.
 */
struct Packet {
  uint64_t     sequence{0};
  PortIdStr    source_port;
  ChannelIdStr source_channel;
  PortIdStr    destination_port;
  ChannelIdStr destination_channel;
  Height       timeout_height;
  uint64_t     timeout_timestamp{0};   ///< nanoseconds; 0 = no timestamp timeout
  Bytes        data;
};

/// Identity of an originated packet, used to track which ones are resolved.
struct PacketKey {
  PortIdStr    port;
  ChannelIdStr channel;
  uint64_t     sequence{0};
};

bool operator<(const PacketKey& a, const PacketKey& b);
bool operator==(const PacketKey& a, const PacketKey& b);

PacketKey key_of(const Packet& packet);

/// Application content replicated to the counterparty.
struct PostPayload {
  std::string creator;
  std::string title;
  std::string content;
};

bool operator==(const PostPayload& a, const PostPayload& b);

/// Structural check run before a payload is applied: creator and title must be non-empty.
Status validate_basic(const PostPayload& payload);

/// Success value returned by the receiving chain: the id it assigned, in decimal.
struct AckResult {
  std::string post_id;
};

bool operator==(const AckResult& a, const AckResult& b);

/// Tag of an acknowledgement envelope. `Unknown` covers anything undecodable.
enum class AckKind : uint8_t { Success = 0, Failure, Unknown };

/**
 * @brief Delivery outcome relayed back to the sender.
 *
 * Exactly one of `result` (Success) or `error` (Failure) is meaningful,
 * selected by `kind`.
 */
struct Acknowledgement {
  AckKind     kind{AckKind::Unknown};
  Bytes       result;
  std::string error;

  static Acknowledgement success(Bytes result_bytes);
  static Acknowledgement failure(std::string message);
};

struct PostRecord {
  uint64_t    id{0};
  std::string creator;
  std::string title;
  std::string content;
};

struct SentPostRecord {
  uint64_t    id{0};
  std::string creator;
  std::string post_id;
  std::string title;
  std::string chain;
};

struct TimedOutPostRecord {
  uint64_t    id{0};
  std::string creator;
  std::string title;
  std::string chain;
};

bool operator==(const PostRecord& a, const PostRecord& b);
bool operator==(const SentPostRecord& a, const SentPostRecord& b);
bool operator==(const TimedOutPostRecord& a, const TimedOutPostRecord& b);

/// `<sourcePort>-<sourceChannel>-<creator>` for a post that arrived over `packet`.
std::string remote_creator(const Packet& packet, const std::string& creator);

/// `<destPort>-<destChannel>`: the chain label stored on sender-side records.
std::string destination_chain(const Packet& packet);

} // namespace relaypost
