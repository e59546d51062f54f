/**
 * @file relayer.hpp
 * @brief Loopback relayer that shuttles packets between two in-process chains.
 *
 * For each packet a chain queued for sending, `relay_once()` decides between
 * the two terminal outcomes:
 *
 *  - timeout : the destination clock reached the packet's timeout height or
 *              timestamp. The commitment is deleted and the sender's router
 *              gets `on_timeout_packet()`.
 *  - deliver : the receiver's router produces acknowledgement bytes, the
 *              commitment is deleted and the sender's router gets
 *              `on_acknowledgement_packet()` with those bytes.
 *
 * A packet whose commitment is already gone is skipped, so nothing is ever
 * reconciled twice through the relayer. A packet whose destination end does
 * not exist is requeued with its commitment intact until it can time out.
 */

#pragma once
#include <stddef.h>
#include "relaypost/chain.hpp"
#include "relaypost/status.hpp"

namespace relaypost {

struct RelayReport {
  size_t delivered{0};      ///< packets handed to the receiving router
  size_t acknowledged{0};   ///< acknowledgements accepted by the sender
  size_t timed_out{0};      ///< timeouts accepted by the sender
  size_t failed{0};         ///< packets the sender (or routing) refused
  size_t requeued{0};       ///< unroutable packets put back for a later pass
  Status last_error;        ///< most recent failure, success() if none
};

class LoopbackRelayer {
public:
  /// `a` and `b` must outlive the relayer.
  LoopbackRelayer(Chain& a, Chain& b);

  /// Drain both outbound queues: a → b first, then b → a.
  RelayReport relay_once();

private:
  void relay(Chain& from, Chain& to, RelayReport& report);
  static bool timed_out(const Packet& packet, const Chain& destination);

  Chain& a_;
  Chain& b_;
};

} // namespace relaypost
