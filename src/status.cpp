// -----------------------------------------------------------------------------
// status.cpp - reason strings and message rendering for relaypost::Status.
// API: see include/relaypost/status.hpp
// -----------------------------------------------------------------------------
#include "relaypost/status.hpp"

namespace relaypost {

const char* to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::Ok:                   return "ok";
    case ErrorCode::ChannelNotFound:      return "channel not found";
    case ErrorCode::SequenceNotFound:     return "sequence send not found";
    case ErrorCode::CapabilityMissing:    return "channel capability not found";
    case ErrorCode::EncodingError:        return "failed to encode";
    case ErrorCode::ValidationError:      return "invalid packet data";
    case ErrorCode::AckDecodeError:       return "cannot unmarshal acknowledgment";
    case ErrorCode::UnsupportedAckFormat: return "unsupported acknowledgement format";
    case ErrorCode::TransportError:       return "transport error";
    case ErrorCode::PacketDecodeError:    return "cannot unmarshal packet data";
    case ErrorCode::GenesisInvalid:       return "invalid genesis state";
    case ErrorCode::StateIoError:         return "state file I/O failed";
  }
  return "unknown error";
}

std::string Status::message() const {
  if (detail.empty()) return to_string(code);
  return detail + ": " + to_string(code);
}

} // namespace relaypost
