#pragma once
/**
 * @file memory_channel.hpp
 * @brief In-process channel transport and capability registry.
 *
 * Reference implementations of the two collaborator traits. They keep just
 * enough state to behave like the real thing from the keeper's point of view:
 * channel ends with counterparties and send sequences, capability ownership,
 * packet commitments, and a bounded outbound queue a relayer drains.
 */

#include <map>
#include <optional>
#include <string>
#include "etl/deque.h"
#include "relaypost/transport/channel_keeper.hpp"

namespace relaypost::transport {

class MemoryCapabilityKeeper : public ICapabilityKeeper {
public:
  std::optional<Capability> get_capability(const std::string& path) const override;

  /// Mint (or return the existing) capability for `path`.
  Capability claim(const std::string& path);

  /// Drop ownership of `path`. Returns false if it was not held.
  bool release(const std::string& path);

private:
  std::map<std::string, Capability> caps_;
  uint64_t next_index_{1};
};

class MemoryChannelKeeper : public IChannelKeeper {
public:
  static constexpr size_t OUTBOUND_CAP = 16;   ///< packets awaiting relay before send is refused

  explicit MemoryChannelKeeper(const ICapabilityKeeper& capabilities);

  /// Create (or reset) a channel end with next send sequence 1.
  void open_channel(const PortIdStr& port, const ChannelIdStr& channel, const Counterparty& counterparty);

  /// Override the next send sequence of an open channel (state restore). false if absent.
  bool set_next_sequence_send(const PortIdStr& port, const ChannelIdStr& channel, uint64_t sequence);

  std::optional<Counterparty> get_channel(const PortIdStr& port,
                                          const ChannelIdStr& channel) const override;
  std::optional<uint64_t> get_next_sequence_send(const PortIdStr& port,
                                                 const ChannelIdStr& channel) const override;

  /**
   * @brief Commit and queue a packet.
   *
   * Refuses with CapabilityMissing when `cap` is not the capability bound to
   * the packet's source end, ChannelNotFound for an unknown end, and
   * TransportError for a wrong sequence, a packet with no timeout at all, or
   * a full outbound queue.
   */
  Status send_packet(const Capability& cap, const Packet& packet) override;

  bool has_commitment(const PacketKey& key) const;
  bool delete_commitment(const PacketKey& key);

  /// Pop the oldest queued packet. false when nothing is waiting.
  bool next_outbound(Packet& out);

  /**
   * @brief Put a popped packet back at the tail of the outbound queue.
   *
   * Only packets that still hold a commitment are accepted. false when the
   * commitment is gone or the queue is full.
   */
  bool requeue(const Packet& packet);
  size_t pending() const { return outbound_.size(); }

private:
  struct ChannelEnd {
    Counterparty counterparty;
    uint64_t     next_sequence_send{1};
  };

  static std::string end_key(const PortIdStr& port, const ChannelIdStr& channel);

  const ICapabilityKeeper&            capabilities_;
  std::map<std::string, ChannelEnd>   ends_;
  std::map<PacketKey, Packet>         commitments_;
  etl::deque<Packet, OUTBOUND_CAP>    outbound_;
};

} // namespace relaypost::transport
