// -----------------------------------------------------------------------------
// chain.cpp - wiring for one in-process ledger.
// API: see include/relaypost/chain.hpp
// -----------------------------------------------------------------------------
#include "relaypost/chain.hpp"

#include <utility>

namespace relaypost {

Chain::Chain(std::string chain_id, ModuleConfig config)
: chain_id_(std::move(chain_id)),
  capabilities_(),
  channels_(capabilities_),
  stores_(),
  events_(),
  keeper_(channels_, capabilities_, stores_, events_),
  router_(keeper_, events_, std::move(config)) {
}

transport::Capability Chain::open_channel(const ChannelIdStr& channel,
                                          const transport::Counterparty& counterparty) {
  const PortIdStr p = port();
  channels_.open_channel(p, channel, counterparty);
  return capabilities_.claim(transport::channel_capability_path(p, channel));
}

Status Chain::send_post(const MsgSendPost& msg) {
  return router_.send_post(msg, time_ns_);
}

void Chain::advance(uint64_t blocks, uint64_t ns) {
  block_height_ += blocks;
  time_ns_      += ns;
}

Height Chain::height() const {
  Height h;
  h.revision_number = 0;
  h.revision_height = block_height_;
  return h;
}

} // namespace relaypost
