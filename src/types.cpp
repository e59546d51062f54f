// -----------------------------------------------------------------------------
// types.cpp - comparisons and small builders for relaypost value types.
// API: see include/relaypost/types.hpp
// -----------------------------------------------------------------------------
#include "relaypost/types.hpp"

#include <utility>

namespace relaypost {

// ---------- Height ----------

bool operator==(const Height& a, const Height& b) {
  return a.revision_number == b.revision_number && a.revision_height == b.revision_height;
}

bool operator!=(const Height& a, const Height& b) { return !(a == b); }

bool operator<(const Height& a, const Height& b) {
  if (a.revision_number != b.revision_number) return a.revision_number < b.revision_number;
  return a.revision_height < b.revision_height;
}

bool operator>=(const Height& a, const Height& b) { return !(a < b); }

// ---------- PacketKey ----------

bool operator<(const PacketKey& a, const PacketKey& b) {
  if (a.port != b.port)       return a.port < b.port;
  if (a.channel != b.channel) return a.channel < b.channel;
  return a.sequence < b.sequence;
}

bool operator==(const PacketKey& a, const PacketKey& b) {
  return a.port == b.port && a.channel == b.channel && a.sequence == b.sequence;
}

PacketKey key_of(const Packet& packet) {
  PacketKey key;
  key.port     = packet.source_port;
  key.channel  = packet.source_channel;
  key.sequence = packet.sequence;
  return key;
}

// ---------- payloads ----------

bool operator==(const PostPayload& a, const PostPayload& b) {
  return a.creator == b.creator && a.title == b.title && a.content == b.content;
}

Status validate_basic(const PostPayload& payload) {
  if (payload.creator.empty()) return Status::failure(ErrorCode::ValidationError, "creator cannot be empty");
  if (payload.title.empty())   return Status::failure(ErrorCode::ValidationError, "title cannot be empty");
  return Status::success();
}

bool operator==(const AckResult& a, const AckResult& b) { return a.post_id == b.post_id; }

Acknowledgement Acknowledgement::success(Bytes result_bytes) {
  Acknowledgement ack;
  ack.kind   = AckKind::Success;
  ack.result = std::move(result_bytes);
  return ack;
}

Acknowledgement Acknowledgement::failure(std::string message) {
  Acknowledgement ack;
  ack.kind  = AckKind::Failure;
  ack.error = std::move(message);
  return ack;
}

// ---------- records ----------

bool operator==(const PostRecord& a, const PostRecord& b) {
  return a.id == b.id && a.creator == b.creator && a.title == b.title && a.content == b.content;
}

bool operator==(const SentPostRecord& a, const SentPostRecord& b) {
  return a.id == b.id && a.creator == b.creator && a.post_id == b.post_id &&
         a.title == b.title && a.chain == b.chain;
}

bool operator==(const TimedOutPostRecord& a, const TimedOutPostRecord& b) {
  return a.id == b.id && a.creator == b.creator && a.title == b.title && a.chain == b.chain;
}

// ---------- builders ----------

std::string remote_creator(const Packet& packet, const std::string& creator) {
  std::string out;
  out.reserve(packet.source_port.size() + packet.source_channel.size() + creator.size() + 2);
  out.append(packet.source_port.c_str());
  out.push_back('-');
  out.append(packet.source_channel.c_str());
  out.push_back('-');
  out.append(creator);
  return out;
}

std::string destination_chain(const Packet& packet) {
  std::string out(packet.destination_port.c_str());
  out.push_back('-');
  out.append(packet.destination_channel.c_str());
  return out;
}

} // namespace relaypost
