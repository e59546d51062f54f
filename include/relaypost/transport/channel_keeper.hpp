#pragma once
/**
 * @file channel_keeper.hpp
 * @brief Core-agnostic interfaces to the channel transport and capability subsystems.
 *
 * The keeper only ever talks to these two traits. Production wiring plugs in
 * the real channel/capability modules; tests and the CLI plug in the in-memory
 * versions from memory_channel.hpp.
 */

#include <optional>
#include <string>
#include "relaypost/status.hpp"
#include "relaypost/types.hpp"

namespace relaypost::transport {

/// Remote end of a channel.
struct Counterparty {
  PortIdStr    port_id;
  ChannelIdStr channel_id;
};

/// Opaque proof that the holder may send on one channel end.
struct Capability {
  uint64_t    index{0};
  std::string name;
};

inline bool operator==(const Capability& a, const Capability& b) {
  return a.index == b.index && a.name == b.name;
}

/// Deterministic lookup path of the capability bound to (port, channel).
inline std::string channel_capability_path(const PortIdStr& port, const ChannelIdStr& channel) {
  return std::string("capabilities/ports/") + port.c_str() + "/channels/" + channel.c_str();
}

/**
 * @brief Channel transport every keeper can rely on.
 *
 * Contract:
 *  - get_channel() resolves the counterparty of an open channel end.
 *  - get_next_sequence_send() returns the sequence the next packet must carry.
 *  - send_packet() authenticates the capability, commits the packet and
 *    advances the sequence; any refusal is returned as a Status and passed
 *    through the keeper unchanged.
 */
class IChannelKeeper {
public:
  virtual ~IChannelKeeper() = default;
  virtual std::optional<Counterparty> get_channel(const PortIdStr& port,
                                                  const ChannelIdStr& channel) const = 0;
  virtual std::optional<uint64_t> get_next_sequence_send(const PortIdStr& port,
                                                         const ChannelIdStr& channel) const = 0;
  virtual Status send_packet(const Capability& cap, const Packet& packet) = 0;
};

/// Capability registry scoped to this module.
class ICapabilityKeeper {
public:
  virtual ~ICapabilityKeeper() = default;
  virtual std::optional<Capability> get_capability(const std::string& path) const = 0;
};

} // namespace relaypost::transport
