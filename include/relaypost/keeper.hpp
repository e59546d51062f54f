/**
 * @file keeper.hpp
 * @brief relaypost Keeper - the four ledger operations of cross-chain post replication.
 *
 * @details
 * ## Field Brief
 * A chain sends a post to its counterpart over an already-open channel. The
 * counterpart applies it and answers with an acknowledgement. Eventually the
 * sender learns one of three things: it worked, it was refused, or it never
 * arrived in time. **Keeper** is the piece that keeps each ledger's records
 * consistent through all of that. It does not move bytes, open channels, or
 * retry anything. It only knows **packets in**, **records appended**,
 * **statuses out**.
 *
 * ---
 *
 * @par What This File Provides
 * - `relaypost::Keeper`, with exactly four operations:
 *   - `transmit_post()`           - build a packet and hand it to the transport.
 *   - `on_recv_post()`            - apply an inbound post; produce an AckResult.
 *   - `on_acknowledgement_post()` - reconcile the sender after an acknowledgement.
 *   - `on_timeout_post()`         - reconcile the sender after a timeout.
 *
 * ---
 *
 * @par Operational Model
 * ```
 *  [chain A]                                  [chain B]
 *  transmit_post() ──► transport ──────────► on_recv_post()
 *                                               │  posts.append()
 *                                               ▼
 *  on_acknowledgement_post() ◄── transport ◄── AckResult / error
 *        │ sent_posts.append()
 *   or
 *  on_timeout_post()  (transport gave up)
 *        │ timed_out_posts.append()
 * ```
 *
 * Per originated packet the sender moves `Created → Sent →` exactly one of
 * `Acked-Success | Acked-Failure | TimedOut`. The transport promises to call
 * one reconciler at most once; the keeper also records each resolved packet
 * so a second reconciliation (a misbehaving harness, a replayed relay) has no
 * effect beyond a `packet_already_resolved` event.
 *
 * ---
 *
 * @par Failure Model
 * - Every operation returns a `Status`; nothing throws.
 * - Validation always runs first. A store append, when there is one, is the
 *   last step, so a failed call leaves every store exactly as it was.
 * - `on_recv_post()` errors are not turned into acknowledgements here; the
 *   router (router.hpp) owns that translation.
 * - `AckDecodeError` / `UnsupportedAckFormat` are terminal for the packet.
 *
 * ---
 *
 * @par Ownership
 * The keeper holds references to its collaborators and to the chain's
 * `Stores` and `EventLog`; it owns none of them. Construct one keeper per
 * chain and keep those objects alive for its lifetime. Not thread-safe.
 *
 * @par Minimal Usage Example
 * @code
 * relaypost::Stores stores;
 * relaypost::EventLog events;
 * relaypost::Keeper keeper(channels, capabilities, stores, events);
 *
 * relaypost::PostPayload post{"alice", "Hello", "first post"};
 * relaypost::Status st = keeper.transmit_post(post, "blog", "channel-0", {}, deadline_ns);
 * if (!st.ok()) std::cerr << "status=error reason=" << st.message() << "\n";
 * @endcode
 */
#ifndef RELAYPOST_KEEPER_HPP
#define RELAYPOST_KEEPER_HPP

#include <stdint.h>
#include "relaypost/event.hpp"
#include "relaypost/status.hpp"
#include "relaypost/store.hpp"
#include "relaypost/types.hpp"
#include "relaypost/transport/channel_keeper.hpp"

namespace relaypost {

class Keeper {
public:
  /**
   * @brief Wire a keeper to its collaborators.
   *
   * @param channels     channel transport (lookups + send primitive).
   * @param capabilities capability registry for this module.
   * @param stores       the chain's record stores; appended to by the receive
   *                     and reconcile operations.
   * @param events       sink for observability events.
   */
  Keeper(transport::IChannelKeeper& channels,
         const transport::ICapabilityKeeper& capabilities,
         Stores& stores,
         EventLog& events);

  /**
   * @brief Build a post packet and hand it to the transport.
   *
   * @details
   * Steps, each failing fast with the listed code:
   *   1. resolve the channel end for (source_port, source_channel) - `ChannelNotFound`
   *   2. read the counterparty port/channel as the destination
   *   3. resolve the next send sequence - `SequenceNotFound`
   *   4. resolve the channel capability - `CapabilityMissing`
   *   5. encode `data` as module packet data - `EncodingError`
   *   6. construct the packet
   *   7. `send_packet()` - its Status is returned unchanged
   *
   * No store is touched; advancing the sequence is the transport's job.
   *
   * @param timeout_height    zero disables the height timeout.
   * @param timeout_timestamp nanoseconds; zero disables the timestamp timeout.
   */
  Status transmit_post(const PostPayload& data,
                       const PortIdStr& source_port,
                       const ChannelIdStr& source_channel,
                       const Height& timeout_height,
                       uint64_t timeout_timestamp);

  /**
   * @brief Apply a post that arrived from the counterparty.
   *
   * @details
   * Validates `data` (`ValidationError` when creator or title is empty), then
   * appends a PostRecord whose creator is
   * `<packet.source_port>-<packet.source_channel>-<data.creator>` and whose
   * title/content are copied verbatim. `out_ack.post_id` receives the new id
   * in decimal. Emits `post_received`.
   *
   * @param out_ack written only on success.
   */
  Status on_recv_post(const Packet& packet, const PostPayload& data, AckResult& out_ack);

  /**
   * @brief Reconcile the sender once an acknowledgement for `packet` is relayed back.
   *
   * @details
   * - `AckKind::Failure` - intentional no-op on the stores. The remote error
   *   is surfaced as a `post_ack_error` event; no compensation is attempted.
   * - `AckKind::Success` - decode `ack.result` as an AckResult
   *   (`AckDecodeError` if that fails) and append a SentPostRecord for
   *   `<destPort>-<destChannel>`. Emits `post_sent`.
   * - `AckKind::Unknown` - `UnsupportedAckFormat`.
   */
  Status on_acknowledgement_post(const Packet& packet, const PostPayload& data,
                                 const Acknowledgement& ack);

  /**
   * @brief Reconcile the sender after the transport abandoned delivery of `packet`.
   *
   * Appends a TimedOutPostRecord for `<destPort>-<destChannel>` and emits
   * `post_timed_out`. Never fails.
   */
  Status on_timeout_post(const Packet& packet, const PostPayload& data);

  const Stores& stores() const { return stores_; }

private:
  /// true (and emits `packet_already_resolved`) if `packet` already reached a terminal state.
  bool already_resolved(const Packet& packet, const char* outcome);

  transport::IChannelKeeper&          channels_;
  const transport::ICapabilityKeeper& capabilities_;
  Stores&                             stores_;
  EventLog&                           events_;
};

} // namespace relaypost

#endif // RELAYPOST_KEEPER_HPP
