/**
 * @file chain.hpp
 * @brief One in-process ledger: stores, collaborators, keeper, router and clock.
 *
 * A `Chain` is what the CLI and the tests stand up twice and join with a
 * `LoopbackRelayer`. Members are wired in declaration order, so every
 * reference handed to the keeper and router stays valid for the chain's
 * lifetime. Chains are neither copyable nor movable.
 */

#pragma once
#include <stdint.h>
#include <string>
#include "relaypost/event.hpp"
#include "relaypost/keeper.hpp"
#include "relaypost/router.hpp"
#include "relaypost/store.hpp"
#include "relaypost/transport/memory_channel.hpp"
#include "relaypost/types.hpp"

namespace relaypost {

class Chain {
public:
  explicit Chain(std::string chain_id, ModuleConfig config = ModuleConfig{});

  Chain(const Chain&) = delete;
  Chain& operator=(const Chain&) = delete;

  /**
   * @brief Open a channel end on the module port and claim its capability.
   * @return the claimed capability.
   */
  transport::Capability open_channel(const ChannelIdStr& channel,
                                     const transport::Counterparty& counterparty);

  /// Convenience: `router().send_post(msg, time_ns())`.
  Status send_post(const MsgSendPost& msg);

  /// Move the clock forward by `blocks` blocks and `ns` nanoseconds.
  void advance(uint64_t blocks, uint64_t ns);

  Height   height() const;
  uint64_t time_ns() const { return time_ns_; }

  const std::string&  id() const     { return chain_id_; }
  const ModuleConfig& config() const { return router_.config(); }
  PortIdStr           port() const   { return PortIdStr(config().port_id.c_str()); }

  Stores&                            stores()       { return stores_; }
  const Stores&                      stores() const { return stores_; }
  EventLog&                          events()       { return events_; }
  Keeper&                            keeper()       { return keeper_; }
  PacketRouter&                      router()       { return router_; }
  transport::MemoryChannelKeeper&    channels()     { return channels_; }
  transport::MemoryCapabilityKeeper& capabilities() { return capabilities_; }

private:
  std::string                       chain_id_;
  transport::MemoryCapabilityKeeper capabilities_;
  transport::MemoryChannelKeeper    channels_;
  Stores                            stores_;
  EventLog                          events_;
  Keeper                            keeper_;
  PacketRouter                      router_;

  uint64_t block_height_{1};
  uint64_t time_ns_{0};
};

} // namespace relaypost
