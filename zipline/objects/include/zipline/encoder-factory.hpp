#pragma once

#include <memory>
#include <optional>

#include "zipline/encoder.hpp"
#include "zipline/encoding.hpp"
#include "zipline/media-type.hpp"

namespace zipline {

// Creates the encoder for 'encoding' with its fixed preset, taking the content category into account when the
// algorithm exposes a mode hint.
// Returns nullptr if this build has no encoder for 'encoding' (compress, chunked, extension tokens, or a codec that
// is not built in).
std::unique_ptr<Encoder> MakeEncoder(const Encoding &encoding, const std::optional<MediaType> &contentType);

}  // namespace zipline
