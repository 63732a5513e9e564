#pragma once

#include <cstddef>
#include <memory>
#include <string_view>

#include "zipline/raw-chars.hpp"

// =============================================================================
// zipline Encoding Abstraction
// =============================================================================
// Two interfaces split the responsibilities:
//   * Encoder: configuration-only object providing one-shot compression.
//   * EncoderContext: stateful streaming object created from an Encoder via makeContext().
// Lifecycle of a context: encodeChunk(data)* -> encodeChunk({}) (finish) -> destroy.
//
// Thread Safety: Both Encoder and created EncoderContext instances are not thread-safe. Each one
// must be confined to a single response body.
//
// Error Handling: Implementations throw on initialization or fatal internal codec errors.
//
// Extension Points: Adding a new codec only requires providing a subclass of Encoder + a matching
// EncoderContext implementation, and wiring it in MakeEncoder().
// =============================================================================

namespace zipline {

class EncoderContext {
 public:
  virtual ~EncoderContext() = default;

  // Streaming chunk encoder. If 'data' is empty, it will be considered as a finish.
  // The returned view is valid until the next call.
  virtual std::string_view encodeChunk(std::size_t encoderChunkSize, std::string_view data) = 0;
};

class Encoder {
 public:
  virtual ~Encoder() = default;

  // One-shot full-buffer compression. Compressed data is appended to 'buf'.
  virtual void encodeFull(std::string_view data, RawChars &buf) = 0;

  // Create a streaming context. Each context is independent, but may share the encoder output buffer,
  // so the encoder must outlive its contexts.
  virtual std::unique_ptr<EncoderContext> makeContext() = 0;
};

}  // namespace zipline
