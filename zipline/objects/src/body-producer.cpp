#include "zipline/body-producer.hpp"

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>

namespace zipline {

BodyChunk InMemoryBody::next() {
  if (_pos == _data.size()) {
    return BodyChunk::End();
  }
  const std::size_t remaining = _data.size() - _pos;
  const std::size_t len = _chunkSize == 0 ? remaining : std::min(remaining, _chunkSize);
  const std::string_view slice(_data.data() + _pos, len);
  _pos += len;
  return BodyChunk::Data(slice);
}

BodyChunk CallbackBody::next() {
  if (_done) {
    return BodyChunk::End();
  }
  BodyChunk chunk = _generator();
  if (!chunk.isData()) {
    _done = true;
  }
  return chunk;
}

BodyReadResult ReadAll(BodyProducer &producer) {
  BodyReadResult result;
  for (;;) {
    BodyChunk chunk = producer.next();
    switch (chunk.kind()) {
      case BodyChunk::Kind::data:
        result.data.append(chunk.data());
        break;
      case BodyChunk::Kind::end:
        return result;
      case BodyChunk::Kind::failure:
        result.error.emplace(chunk.error());
        return result;
    }
  }
}

}  // namespace zipline
