/**
 * @file status.hpp
 * @brief relaypost Status - the single error currency of the library.
 *
 * Every operation that can fail returns a `Status`. Nothing in the public
 * surface throws: callers branch on `ok()` and, when they need to, read the
 * `ErrorCode` for programmatic handling and `detail` for humans and logs.
 *
 * `message()` renders "<detail>: <reason>", the same shape the transport layer
 * puts into an error acknowledgement, so a counterparty sees a readable
 * explanation of why its packet was refused.
 */

#pragma once
#include <stdint.h>
#include <string>
#include <utility>

namespace relaypost {

/// Error kinds surfaced by the keeper, router, codec and reference transport.
enum class ErrorCode : uint8_t {
  Ok = 0,
  ChannelNotFound,       ///< no channel end for (port, channel)
  SequenceNotFound,      ///< transport holds no send sequence for the endpoint
  CapabilityMissing,     ///< module does not own the channel capability
  EncodingError,         ///< codec could not serialize a value
  ValidationError,       ///< payload or message failed basic validation
  AckDecodeError,        ///< acknowledgement result bytes are not an AckResult
  UnsupportedAckFormat,  ///< acknowledgement is neither a result nor an error
  TransportError,        ///< error raised by the transport's send primitive
  PacketDecodeError,     ///< packet data is not a recognised module envelope
  GenesisInvalid,        ///< genesis state failed validation
  StateIoError,          ///< persisted state could not be read or written
};

/// Short, stable, lowercase reason text for a code (e.g. "channel not found").
const char* to_string(ErrorCode code);

struct Status {
  ErrorCode   code{ErrorCode::Ok};
  std::string detail;

  static Status success() { return {}; }

  static Status failure(ErrorCode c, std::string d = {}) {
    return {c, std::move(d)};
  }

  bool ok() const { return code == ErrorCode::Ok; }

  /// "<detail>: <reason>", or just "<reason>" when no detail was given.
  std::string message() const;
};

} // namespace relaypost
