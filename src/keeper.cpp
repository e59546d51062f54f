// -----------------------------------------------------------------------------
// keeper.cpp - Implementation of relaypost::Keeper
//
// API & contracts:
//   see include/relaypost/keeper.hpp
//
// Behaviour tests:
//   see tests/test_keeper_transmit.cpp, tests/test_keeper_recv.cpp,
//       tests/test_keeper_reconcile.cpp
//
// NOTE: every operation validates first and mutates last. If you add a step,
// keep the store append (and the resolved-index insert) at the very end.
// -----------------------------------------------------------------------------
#include "relaypost/keeper.hpp"

#include <string>
#include "relaypost/codec.hpp"

namespace relaypost {

Keeper::Keeper(transport::IChannelKeeper& channels,
               const transport::ICapabilityKeeper& capabilities,
               Stores& stores,
               EventLog& events)
: channels_(channels),
  capabilities_(capabilities),
  stores_(stores),
  events_(events) {
}

// -----------------------------------------------------------------------------
// transmit_post() - Resolve the channel, build the packet, hand it off.
// PRE:
//   - source_port/source_channel name a channel end this module should own.
// POLICY:
//   - Lookups in order channel → sequence → capability; first miss wins.
//   - Transport errors pass through untouched (backpressure etc. is not ours
//     to interpret).
// OUT:
//   - No store mutation. The transport advances its own sequence.
// -----------------------------------------------------------------------------
Status Keeper::transmit_post(const PostPayload& data,
                             const PortIdStr& source_port,
                             const ChannelIdStr& source_channel,
                             const Height& timeout_height,
                             uint64_t timeout_timestamp) {
  const std::string where = std::string("port ID (") + source_port.c_str() +
                            ") channel ID (" + source_channel.c_str() + ")";

  auto counterparty = channels_.get_channel(source_port, source_channel);
  if (!counterparty) {
    return Status::failure(ErrorCode::ChannelNotFound, where);
  }

  auto sequence = channels_.get_next_sequence_send(source_port, source_channel);
  if (!sequence) {
    return Status::failure(ErrorCode::SequenceNotFound, where);
  }

  auto cap = capabilities_.get_capability(
      transport::channel_capability_path(source_port, source_channel));
  if (!cap) {
    return Status::failure(ErrorCode::CapabilityMissing, "module does not own channel capability");
  }

  Packet packet;
  Status enc = codec::encode_packet_data(data, packet.data);   // EncodingError on bad text
  if (!enc.ok()) return enc;

  packet.sequence            = *sequence;
  packet.source_port         = source_port;
  packet.source_channel      = source_channel;
  packet.destination_port    = counterparty->port_id;          // counterparty is our destination
  packet.destination_channel = counterparty->channel_id;
  packet.timeout_height      = timeout_height;
  packet.timeout_timestamp   = timeout_timestamp;

  return channels_.send_packet(*cap, packet);
}

// -----------------------------------------------------------------------------
// on_recv_post() - Apply an inbound post and report its new id.
// PRE:
//   - packet/data were decoded by the router from the same delivery.
// POLICY:
//   - validate_basic() before anything else; a refused post leaves no trace.
//   - Creator is namespaced by source endpoint: "<port>-<channel>-<creator>".
// OUT:
//   - One PostRecord appended; out_ack.post_id = decimal id; "post_received".
// -----------------------------------------------------------------------------
Status Keeper::on_recv_post(const Packet& packet, const PostPayload& data, AckResult& out_ack) {
  Status valid = validate_basic(data);
  if (!valid.ok()) return valid;

  PostRecord post;
  post.creator = remote_creator(packet, data.creator);
  post.title   = data.title;
  post.content = data.content;

  const uint64_t id = stores_.posts.append(post);             // last mutation
  out_ack.post_id = std::to_string(id);

  Event& ev = events_.emit("post_received");
  ev.attrs.set("port", packet.source_port.c_str());
  ev.attrs.set("channel", packet.source_channel.c_str());
  ev.attrs.set("post_id", out_ack.post_id.c_str());
  ev.attrs.set("creator", post.creator.c_str());
  return Status::success();
}

// -----------------------------------------------------------------------------
// on_acknowledgement_post() - Reconcile the sender from a relayed outcome.
// PRE:
//   - packet is one this chain originated; data is its decoded payload.
// POLICY:
//   - Already-resolved packets are ignored (event only).
//   - Switch over every AckKind with no default so a new tag is a compile
//     warning, not a silent fallthrough.
//   - Failure is a deliberate no-op on the stores: the remote refused the
//     post and nothing here compensates for that. The message goes to the
//     event log instead of being dropped.
// OUT:
//   - Success: one SentPostRecord + "post_sent".
//   - Failure: "post_ack_error".
// -----------------------------------------------------------------------------
Status Keeper::on_acknowledgement_post(const Packet& packet, const PostPayload& data,
                                       const Acknowledgement& ack) {
  if (already_resolved(packet, "acknowledgement")) return Status::success();

  switch (ack.kind) {
    case AckKind::Failure: {
      Event& ev = events_.emit("post_ack_error");
      ev.attrs.set("chain", destination_chain(packet).c_str());
      ev.attrs.set("sequence", std::to_string(packet.sequence).c_str());
      ev.attrs.set("error", ack.error.c_str());
      stores_.resolved.insert(key_of(packet));
      return Status::success();
    }

    case AckKind::Success: {
      AckResult result;
      Status dec = codec::decode_ack_result(ack.result, result);
      if (!dec.ok()) {
        // counterparty does not speak our acknowledgement format
        return Status::failure(ErrorCode::AckDecodeError, dec.detail);
      }

      SentPostRecord sent;
      sent.creator = data.creator;
      sent.post_id = result.post_id;
      sent.title   = data.title;
      sent.chain   = destination_chain(packet);

      stores_.sent_posts.append(sent);
      stores_.resolved.insert(key_of(packet));

      Event& ev = events_.emit("post_sent");
      ev.attrs.set("chain", sent.chain.c_str());
      ev.attrs.set("post_id", sent.post_id.c_str());
      ev.attrs.set("creator", sent.creator.c_str());
      return Status::success();
    }

    case AckKind::Unknown:
      break;
  }

  return Status::failure(ErrorCode::UnsupportedAckFormat,
                         "the counter-party module does not implement the correct acknowledgment format");
}

// -----------------------------------------------------------------------------
// on_timeout_post() - Record a post the counterparty never received.
// POLICY:
//   - Unconditional append (unless already resolved); never fails.
// OUT:
//   - One TimedOutPostRecord + "post_timed_out".
// -----------------------------------------------------------------------------
Status Keeper::on_timeout_post(const Packet& packet, const PostPayload& data) {
  if (already_resolved(packet, "timeout")) return Status::success();

  TimedOutPostRecord timed_out;
  timed_out.creator = data.creator;
  timed_out.title   = data.title;
  timed_out.chain   = destination_chain(packet);

  stores_.timed_out_posts.append(timed_out);
  stores_.resolved.insert(key_of(packet));

  Event& ev = events_.emit("post_timed_out");
  ev.attrs.set("chain", timed_out.chain.c_str());
  ev.attrs.set("sequence", std::to_string(packet.sequence).c_str());
  ev.attrs.set("creator", timed_out.creator.c_str());
  return Status::success();
}

// ---------- private ----------

bool Keeper::already_resolved(const Packet& packet, const char* outcome) {
  if (!stores_.resolved.contains(key_of(packet))) return false;

  Event& ev = events_.emit("packet_already_resolved");
  ev.attrs.set("port", packet.source_port.c_str());
  ev.attrs.set("channel", packet.source_channel.c_str());
  ev.attrs.set("sequence", std::to_string(packet.sequence).c_str());
  ev.attrs.set("outcome", outcome);
  return true;
}

} // namespace relaypost
