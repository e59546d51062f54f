/**
 * @file router.hpp
 * @brief relaypost PacketRouter - transport-facing callbacks and the send-post message.
 *
 * @details
 * The keeper works on decoded values. The router sits between the keeper and
 * whoever delivers packets (a real channel module, or `LoopbackRelayer` in
 * tests/CLI) and owns everything byte-shaped:
 *
 *  - `send_post()`                  : validate a `MsgSendPost`, pick a timeout, transmit.
 *  - `on_recv_packet()`             : decode packet data, apply it, and *always*
 *                                     return acknowledgement bytes - a keeper error
 *                                     becomes an error acknowledgement here.
 *  - `on_acknowledgement_packet()`  : classify ack bytes, decode packet data, reconcile.
 *  - `on_timeout_packet()`          : decode packet data, reconcile.
 *
 * Each callback emits a module-level event (`ibc_post_packet`,
 * `acknowledgement`, `timeout`) in addition to whatever the keeper emits.
 */

#pragma once
#include <stdint.h>
#include <string>
#include "relaypost/event.hpp"
#include "relaypost/keeper.hpp"
#include "relaypost/status.hpp"
#include "relaypost/types.hpp"

namespace relaypost {

/// Module-wide settings.
struct ModuleConfig {
  std::string port_id{"blog"};                          ///< port the module binds
  std::string version{"blog-1"};                        ///< channel version string
  uint64_t    default_timeout_ns{600ull * 1000000000ull};  ///< relative timeout when a message gives 0
};

/// Request to replicate one post to the counterparty of (port, channel_id).
struct MsgSendPost {
  std::string creator;
  std::string port;
  std::string channel_id;
  uint64_t    timeout_timestamp{0};   ///< absolute ns; 0 = now + default_timeout_ns
  std::string title;
  std::string content;
};

/// Port identifier rules: 2..128 chars from [a-zA-Z0-9._+-#[]<>].
bool is_valid_port_id(const std::string& id);

/// Channel identifier rules: 8..64 chars, same alphabet as ports.
bool is_valid_channel_id(const std::string& id);

/// Stateless checks on a MsgSendPost (creator, port, channel).
Status validate_basic(const MsgSendPost& msg);

class PacketRouter {
public:
  PacketRouter(Keeper& keeper, EventLog& events, ModuleConfig config);

  /**
   * @brief Handle a MsgSendPost.
   * @param now_ns current block time, used when `msg.timeout_timestamp` is 0.
   * @return ValidationError for a malformed message, otherwise whatever
   *         `Keeper::transmit_post()` returns.
   */
  Status send_post(const MsgSendPost& msg, uint64_t now_ns);

  /**
   * @brief Deliver an inbound packet.
   * @return encoded acknowledgement bytes - result on success, error otherwise.
   */
  Bytes on_recv_packet(const Packet& packet);

  /**
   * @brief Deliver the acknowledgement of a packet this chain sent.
   * @return PacketDecodeError if the original packet data cannot be decoded,
   *         otherwise the keeper's status.
   */
  Status on_acknowledgement_packet(const Packet& packet, const Bytes& acknowledgement);

  /// Deliver the timeout of a packet this chain sent.
  Status on_timeout_packet(const Packet& packet);

  const ModuleConfig& config() const { return config_; }

private:
  /// Decode packet data and require the post variant.
  Status decode_post_packet(const Packet& packet, PostPayload& out) const;

  Keeper&      keeper_;
  EventLog&    events_;
  ModuleConfig config_;
};

} // namespace relaypost
