#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace omni_supervisor::relay {

// Reassembles a chunked body into lines. A UTF-8 sequence cut at a chunk boundary
// is carried into the next chunk. A chunk containing malformed UTF-8 is dropped
// along with the line it interrupted, up to the next newline.
class NdjsonDecoder {
 public:
  // Appends every completed line to `lines`. Returns false when the chunk was dropped.
  bool feed(std::string_view chunk, std::vector<std::string>& lines);
  // Emits a trailing line that never received its newline.
  void finish(std::vector<std::string>& lines);

  [[nodiscard]] std::size_t chunks_skipped() const noexcept;

 private:
  std::string pending_utf8_{};
  std::string line_buffer_{};
  std::size_t chunks_skipped_{0};
  bool discard_to_newline_{false};
};

}  // namespace omni_supervisor::relay
