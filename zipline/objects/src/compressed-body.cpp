#include "zipline/compressed-body.hpp"

#include <cstddef>
#include <exception>
#include <format>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "zipline/body-producer.hpp"
#include "zipline/compression-config.hpp"
#include "zipline/encoder.hpp"
#include "zipline/encoding.hpp"
#include "zipline/log.hpp"
#include "zipline/raw-chars.hpp"

namespace zipline {

CompressedBody::CompressedBody(std::unique_ptr<BodyProducer> source, std::unique_ptr<Encoder> encoder,
                               Encoding encoding, BodyCompressionMode mode, std::size_t encoderChunkSize)
    : _source(std::move(source)),
      _encoder(std::move(encoder)),
      _encoding(std::move(encoding)),
      _encoderChunkSize(encoderChunkSize),
      _mode(mode) {}

BodyChunk CompressedBody::next() {
  if (_state == State::done) {
    return BodyChunk::End();
  }
  return _mode == BodyCompressionMode::buffered ? nextBuffered() : nextStreaming();
}

BodyChunk CompressedBody::nextBuffered() {
  RawChars plain;
  try {
    for (bool readAll = false; !readAll;) {
      BodyChunk chunk = _source->next();
      switch (chunk.kind()) {
        case BodyChunk::Kind::data:
          plain.append(chunk.data());
          break;
        case BodyChunk::Kind::end:
          readAll = true;
          break;
        case BodyChunk::Kind::failure:
          return fail(std::format("error reading body: {}", chunk.error()));
      }
    }
  } catch (const std::exception& ex) {
    return fail(std::format("error reading body: {}", ex.what()));
  }

  _source.reset();

  try {
    _encoder->encodeFull(plain, _out);
  } catch (const std::exception& ex) {
    return fail(ex.what());
  }

  log::trace("Compressed {} bytes into {} bytes with {}", plain.size(), _out.size(), _encoding.str());
  _state = State::done;
  return BodyChunk::Data(_out);
}

BodyChunk CompressedBody::nextStreaming() {
  try {
    if (_state == State::pending) {
      _context = _encoder->makeContext();
      _state = State::producing;
    }
    for (;;) {
      BodyChunk chunk = _source->next();
      switch (chunk.kind()) {
        case BodyChunk::Kind::data: {
          if (chunk.data().empty()) {
            // an empty input would finish the encoder stream
            break;
          }
          const std::string_view out = _context->encodeChunk(_encoderChunkSize, chunk.data());
          if (!out.empty()) {
            return BodyChunk::Data(out);
          }
          break;
        }
        case BodyChunk::Kind::end: {
          const std::string_view out = _context->encodeChunk(_encoderChunkSize, {});
          _state = State::done;
          _source.reset();
          return BodyChunk::Data(out);
        }
        case BodyChunk::Kind::failure:
          return fail(std::format("error reading body: {}", chunk.error()));
      }
    }
  } catch (const std::exception& ex) {
    return fail(ex.what());
  }
}

BodyChunk CompressedBody::fail(std::string_view reason) {
  log::error("Error compressing response with {}: {}", _encoding.str(), reason);
  _state = State::done;
  _source.reset();
  _context.reset();
  return BodyChunk::Failure(std::string(reason));
}

}  // namespace zipline
