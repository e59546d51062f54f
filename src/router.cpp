// -----------------------------------------------------------------------------
// router.cpp - Implementation of relaypost::PacketRouter
// API: see include/relaypost/router.hpp
// Tests: tests/test_router.cpp
// -----------------------------------------------------------------------------
#include "relaypost/router.hpp"

#include <utility>
#include "relaypost/codec.hpp"

namespace relaypost {

namespace {

bool valid_identifier(const std::string& id, size_t min_len, size_t max_len) {
  if (id.size() < min_len || id.size() > max_len) return false;
  for (char c : id) {
    const bool alnum = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
    const bool sym   = c == '.' || c == '_' || c == '+' || c == '-' || c == '#' ||
                       c == '[' || c == ']' || c == '<' || c == '>';
    if (!alnum && !sym) return false;
  }
  return true;
}

} // namespace

bool is_valid_port_id(const std::string& id)    { return valid_identifier(id, 2, RP_PORT_MAX); }
bool is_valid_channel_id(const std::string& id) { return valid_identifier(id, 8, RP_CHANNEL_MAX); }

Status validate_basic(const MsgSendPost& msg) {
  if (msg.creator.empty()) {
    return Status::failure(ErrorCode::ValidationError, "invalid creator address");
  }
  if (!is_valid_port_id(msg.port)) {
    return Status::failure(ErrorCode::ValidationError, "invalid packet port ID (" + msg.port + ")");
  }
  if (!is_valid_channel_id(msg.channel_id)) {
    return Status::failure(ErrorCode::ValidationError, "invalid packet channel ID (" + msg.channel_id + ")");
  }
  return Status::success();
}

PacketRouter::PacketRouter(Keeper& keeper, EventLog& events, ModuleConfig config)
: keeper_(keeper), events_(events), config_(std::move(config)) {
}

// send_post() - message handler: validate, default the timeout, transmit.
Status PacketRouter::send_post(const MsgSendPost& msg, uint64_t now_ns) {
  Status valid = validate_basic(msg);
  if (!valid.ok()) return valid;

  PostPayload data;
  data.creator = msg.creator;
  data.title   = msg.title;
  data.content = msg.content;

  const uint64_t timeout = msg.timeout_timestamp != 0 ? msg.timeout_timestamp
                                                      : now_ns + config_.default_timeout_ns;

  return keeper_.transmit_post(data, PortIdStr(msg.port.c_str()),
                               ChannelIdStr(msg.channel_id.c_str()), Height{}, timeout);
}

// -----------------------------------------------------------------------------
// on_recv_packet() - Apply an inbound packet and build its acknowledgement.
// POLICY:
//   - Never fails toward the transport: every problem becomes an error ack
//     that travels back to the sender.
// OUT:
//   - Ack bytes + one "ibc_post_packet" event (success=true|false).
// -----------------------------------------------------------------------------
Bytes PacketRouter::on_recv_packet(const Packet& packet) {
  Acknowledgement ack;

  codec::PacketKind kind = codec::PacketKind::NoData;
  PostPayload data;
  Status dec = codec::decode_packet_data(packet.data, kind, data);

  if (!dec.ok()) {
    ack = Acknowledgement::failure("cannot unmarshal " + config_.port_id + " packet data: " + dec.detail);
  } else if (kind != codec::PacketKind::Post) {
    ack = Acknowledgement::failure("unrecognized " + config_.port_id + " packet type");
  } else {
    AckResult result;
    Status st = keeper_.on_recv_post(packet, data, result);
    Bytes result_bytes;
    if (st.ok()) st = codec::encode_ack_result(result, result_bytes);

    ack = st.ok() ? Acknowledgement::success(std::move(result_bytes))
                  : Acknowledgement::failure(st.message());
  }

  Event& ev = events_.emit("ibc_post_packet");
  ev.attrs.set("module", config_.port_id.c_str());
  ev.attrs.set("sequence", std::to_string(packet.sequence).c_str());
  ev.attrs.set("success", ack.kind == AckKind::Success ? "true" : "false");
  if (ack.kind == AckKind::Failure) ev.attrs.set("error", ack.error.c_str());

  return codec::encode_acknowledgement(ack);
}

// -----------------------------------------------------------------------------
// on_acknowledgement_packet() - Reconcile from relayed ack bytes.
// POLICY:
//   - Undecodable ack bytes are tagged Unknown and left to the keeper, which
//     answers UnsupportedAckFormat.
//   - Packet data must decode; it is our own encoding, so failure is an error.
//   - A packet that was already settled gets no "acknowledgement" event.
// -----------------------------------------------------------------------------
Status PacketRouter::on_acknowledgement_packet(const Packet& packet, const Bytes& acknowledgement) {
  const Acknowledgement ack = codec::decode_acknowledgement(acknowledgement);

  PostPayload data;
  Status dec = decode_post_packet(packet, data);
  if (!dec.ok()) return dec;

  const bool settled = keeper_.stores().resolved.contains(key_of(packet));
  Status st = keeper_.on_acknowledgement_post(packet, data, ack);
  if (!st.ok() || settled) return st;   // duplicate: keeper already logged packet_already_resolved

  Event& ev = events_.emit("acknowledgement");
  ev.attrs.set("module", config_.port_id.c_str());
  ev.attrs.set("sequence", std::to_string(packet.sequence).c_str());
  if (ack.kind == AckKind::Success) {
    ev.attrs.set("success", codec::to_text(ack.result).c_str());
  } else {
    ev.attrs.set("error", ack.error.c_str());
  }
  return Status::success();
}

Status PacketRouter::on_timeout_packet(const Packet& packet) {
  PostPayload data;
  Status dec = decode_post_packet(packet, data);
  if (!dec.ok()) return dec;

  const bool settled = keeper_.stores().resolved.contains(key_of(packet));
  Status st = keeper_.on_timeout_post(packet, data);
  if (!st.ok() || settled) return st;

  Event& ev = events_.emit("timeout");
  ev.attrs.set("module", config_.port_id.c_str());
  ev.attrs.set("sequence", std::to_string(packet.sequence).c_str());
  return Status::success();
}

Status PacketRouter::decode_post_packet(const Packet& packet, PostPayload& out) const {
  codec::PacketKind kind = codec::PacketKind::NoData;
  Status dec = codec::decode_packet_data(packet.data, kind, out);
  if (!dec.ok()) return dec;
  if (kind != codec::PacketKind::Post) {
    return Status::failure(ErrorCode::PacketDecodeError, "unrecognized " + config_.port_id + " packet type");
  }
  return Status::success();
}

} // namespace relaypost
