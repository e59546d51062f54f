/**
 * @file genesis.hpp
 * @brief Snapshot and restore of a chain's post-module state.
 *
 * `GenesisState` is the full, JSON-serializable picture of one chain's
 * `Stores`: the three record lists and their counters, plus the bound port.
 * The CLI persists it between runs; a chain can be seeded from it.
 *
 * JSON form (field names fixed):
 * @code
 * {"portId":"blog",
 *  "postList":[{"id":0,"creator":"..","title":"..","content":".."}], "postCount":1,
 *  "sentPostList":[{"id":0,"creator":"..","postID":"..","title":"..","chain":".."}], "sentPostCount":1,
 *  "timedoutPostList":[{"id":0,"creator":"..","title":"..","chain":".."}], "timedoutPostCount":1}
 * @endcode
 */

#pragma once
#include <stdint.h>
#include <string>
#include <vector>
#include "relaypost/router.hpp"
#include "relaypost/status.hpp"
#include "relaypost/store.hpp"
#include "relaypost/types.hpp"

namespace relaypost {

struct GenesisState {
  std::string                     port_id;
  std::vector<PostRecord>         posts;
  uint64_t                        post_count{0};
  std::vector<SentPostRecord>     sent_posts;
  uint64_t                        sent_post_count{0};
  std::vector<TimedOutPostRecord> timed_out_posts;
  uint64_t                        timed_out_post_count{0};
};

/// Empty state bound to the default module port.
GenesisState default_genesis();

/// GenesisInvalid on: empty/invalid port, duplicate ids, or any id >= its count.
Status validate(const GenesisState& state);

/// Snapshot `stores` (and the configured port) into a GenesisState.
GenesisState export_genesis(const Stores& stores, const ModuleConfig& config);

/// Validate `state` and, only if valid, replace the contents of `stores`.
Status init_genesis(Stores& stores, const GenesisState& state);

/// Render as JSON text (pretty-printed when indent >= 0).
std::string genesis_to_json(const GenesisState& state, int indent = -1);

/// Parse JSON text; GenesisInvalid on malformed input. Does not call validate().
Status genesis_from_json(const std::string& text, GenesisState& out);

} // namespace relaypost
