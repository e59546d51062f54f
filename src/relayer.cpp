// -----------------------------------------------------------------------------
// relayer.cpp - Implementation of relaypost::LoopbackRelayer
// API: see include/relaypost/relayer.hpp
// Tests: tests/test_relayer.cpp
// -----------------------------------------------------------------------------
#include "relaypost/relayer.hpp"

#include <string>
#include <vector>

namespace relaypost {

LoopbackRelayer::LoopbackRelayer(Chain& a, Chain& b)
: a_(a), b_(b) {
}

RelayReport LoopbackRelayer::relay_once() {
  RelayReport report;
  report.last_error = Status::success();
  relay(a_, b_, report);
  relay(b_, a_, report);
  return report;
}

bool LoopbackRelayer::timed_out(const Packet& packet, const Chain& destination) {
  if (!packet.timeout_height.is_zero() && destination.height() >= packet.timeout_height) return true;
  if (packet.timeout_timestamp != 0 && destination.time_ns() >= packet.timeout_timestamp) return true;
  return false;
}

// -----------------------------------------------------------------------------
// relay() - One direction, every queued packet.
// PRE:
//   - `from` queued packets through its MemoryChannelKeeper.
// POLICY:
//   - No commitment → already settled, skip.
//   - Destination end must exist on `to`; otherwise count as failed, keep
//     the commitment and requeue the packet once the pass is over, so a
//     later pass can still time it out.
//   - Commitment is deleted before the sender's callback runs.
// -----------------------------------------------------------------------------
void LoopbackRelayer::relay(Chain& from, Chain& to, RelayReport& report) {
  std::vector<Packet> stranded;
  Packet packet;
  while (from.channels().next_outbound(packet)) {
    const PacketKey key = key_of(packet);
    if (!from.channels().has_commitment(key)) continue;

    if (timed_out(packet, to)) {
      from.channels().delete_commitment(key);
      Status st = from.router().on_timeout_packet(packet);
      if (st.ok()) {
        ++report.timed_out;
      } else {
        ++report.failed;
        report.last_error = st;
      }
      continue;
    }

    if (!to.channels().get_channel(packet.destination_port, packet.destination_channel)) {
      ++report.failed;
      report.last_error = Status::failure(
          ErrorCode::ChannelNotFound,
          std::string("port ID (") + packet.destination_port.c_str() + ") channel ID (" +
          packet.destination_channel.c_str() + ") on " + to.id());
      stranded.push_back(packet);
      continue;
    }

    const Bytes ack = to.router().on_recv_packet(packet);
    ++report.delivered;

    from.channels().delete_commitment(key);
    Status st = from.router().on_acknowledgement_packet(packet, ack);
    if (st.ok()) {
      ++report.acknowledged;
    } else {
      ++report.failed;
      report.last_error = st;
    }
  }

  for (const Packet& p : stranded) {
    if (from.channels().requeue(p)) {
      ++report.requeued;
    } else {
      report.last_error = Status::failure(ErrorCode::TransportError,
                                          "cannot requeue packet " + std::to_string(p.sequence));
    }
  }
}

} // namespace relaypost
