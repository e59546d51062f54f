// -----------------------------------------------------------------------------
// memory_channel.cpp - in-process channel transport + capability registry.
// API: see include/relaypost/transport/memory_channel.hpp
// -----------------------------------------------------------------------------
#include "relaypost/transport/memory_channel.hpp"

namespace relaypost::transport {

// ---------- MemoryCapabilityKeeper ----------

std::optional<Capability> MemoryCapabilityKeeper::get_capability(const std::string& path) const {
  auto it = caps_.find(path);
  if (it == caps_.end()) return std::nullopt;
  return it->second;
}

Capability MemoryCapabilityKeeper::claim(const std::string& path) {
  auto it = caps_.find(path);
  if (it != caps_.end()) return it->second;

  Capability cap;
  cap.index = next_index_++;
  cap.name  = path;
  caps_.emplace(path, cap);
  return cap;
}

bool MemoryCapabilityKeeper::release(const std::string& path) {
  return caps_.erase(path) != 0;
}

// ---------- MemoryChannelKeeper ----------

MemoryChannelKeeper::MemoryChannelKeeper(const ICapabilityKeeper& capabilities)
: capabilities_(capabilities) {
}

std::string MemoryChannelKeeper::end_key(const PortIdStr& port, const ChannelIdStr& channel) {
  return std::string(port.c_str()) + "/" + channel.c_str();
}

void MemoryChannelKeeper::open_channel(const PortIdStr& port, const ChannelIdStr& channel,
                                       const Counterparty& counterparty) {
  ChannelEnd end;
  end.counterparty = counterparty;
  ends_[end_key(port, channel)] = end;
}

bool MemoryChannelKeeper::set_next_sequence_send(const PortIdStr& port, const ChannelIdStr& channel,
                                                 uint64_t sequence) {
  auto it = ends_.find(end_key(port, channel));
  if (it == ends_.end()) return false;
  it->second.next_sequence_send = sequence;
  return true;
}

std::optional<Counterparty> MemoryChannelKeeper::get_channel(const PortIdStr& port,
                                                             const ChannelIdStr& channel) const {
  auto it = ends_.find(end_key(port, channel));
  if (it == ends_.end()) return std::nullopt;
  return it->second.counterparty;
}

std::optional<uint64_t> MemoryChannelKeeper::get_next_sequence_send(const PortIdStr& port,
                                                                    const ChannelIdStr& channel) const {
  auto it = ends_.find(end_key(port, channel));
  if (it == ends_.end()) return std::nullopt;
  return it->second.next_sequence_send;
}

// -----------------------------------------------------------------------------
// send_packet() - authenticate, check, commit, queue.
// POLICY:
//   - The capability must be the one registered for the source end.
//   - Sequence must match exactly; the keeper read it moments ago.
//   - At least one timeout (height or timestamp) must be set.
//   - Queue full → TransportError (backpressure), nothing committed.
// -----------------------------------------------------------------------------
Status MemoryChannelKeeper::send_packet(const Capability& cap, const Packet& packet) {
  auto owned = capabilities_.get_capability(
      channel_capability_path(packet.source_port, packet.source_channel));
  if (!owned || !(*owned == cap)) {
    return Status::failure(ErrorCode::CapabilityMissing, "caller does not own capability for channel");
  }

  auto it = ends_.find(end_key(packet.source_port, packet.source_channel));
  if (it == ends_.end()) {
    return Status::failure(ErrorCode::ChannelNotFound,
                           std::string("port ID (") + packet.source_port.c_str() + ") channel ID (" +
                           packet.source_channel.c_str() + ")");
  }
  ChannelEnd& end = it->second;

  if (packet.sequence != end.next_sequence_send) {
    return Status::failure(ErrorCode::TransportError,
                           "packet sequence " + std::to_string(packet.sequence) +
                           " != next send sequence " + std::to_string(end.next_sequence_send));
  }
  if (packet.timeout_height.is_zero() && packet.timeout_timestamp == 0) {
    return Status::failure(ErrorCode::TransportError,
                           "packet timeout height and packet timeout timestamp cannot both be 0");
  }
  if (outbound_.full()) {
    return Status::failure(ErrorCode::TransportError, "send queue full");
  }

  commitments_[key_of(packet)] = packet;
  outbound_.push_back(packet);
  ++end.next_sequence_send;
  return Status::success();
}

bool MemoryChannelKeeper::has_commitment(const PacketKey& key) const {
  return commitments_.count(key) != 0;
}

bool MemoryChannelKeeper::delete_commitment(const PacketKey& key) {
  return commitments_.erase(key) != 0;
}

bool MemoryChannelKeeper::next_outbound(Packet& out) {
  if (outbound_.empty()) return false;
  out = outbound_.front();
  outbound_.pop_front();
  return true;
}

bool MemoryChannelKeeper::requeue(const Packet& packet) {
  if (!has_commitment(key_of(packet)) || outbound_.full()) return false;
  outbound_.push_back(packet);
  return true;
}

} // namespace relaypost::transport
