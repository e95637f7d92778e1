#include "relay/ndjson_decoder.hpp"

#include <optional>
#include <utility>

namespace omni_supervisor::relay {
namespace {

bool is_continuation(const unsigned char byte) { return (byte & 0xC0U) == 0x80U; }

// Length of the longest prefix made of whole, well-formed UTF-8 sequences, or
// nullopt when a malformed sequence appears. A truncated final sequence is not an
// error; it is excluded from the prefix.
std::optional<std::size_t> complete_utf8_prefix(const std::string_view data) {
  std::size_t i = 0;
  while (i < data.size()) {
    const auto lead = static_cast<unsigned char>(data[i]);
    std::size_t length = 0;
    unsigned char min_second = 0x80U;
    unsigned char max_second = 0xBFU;

    if (lead < 0x80U) {
      ++i;
      continue;
    }
    if (lead >= 0xC2U && lead <= 0xDFU) {
      length = 2;
    } else if (lead >= 0xE0U && lead <= 0xEFU) {
      length = 3;
      if (lead == 0xE0U) {
        min_second = 0xA0U;
      } else if (lead == 0xEDU) {
        max_second = 0x9FU;
      }
    } else if (lead >= 0xF0U && lead <= 0xF4U) {
      length = 4;
      if (lead == 0xF0U) {
        min_second = 0x90U;
      } else if (lead == 0xF4U) {
        max_second = 0x8FU;
      }
    } else {
      return std::nullopt;
    }

    for (std::size_t k = 1; k < length; ++k) {
      if (i + k >= data.size()) {
        return i;
      }
      const auto byte = static_cast<unsigned char>(data[i + k]);
      if (k == 1 && (byte < min_second || byte > max_second)) {
        return std::nullopt;
      }
      if (k > 1 && !is_continuation(byte)) {
        return std::nullopt;
      }
    }
    i += length;
  }
  return i;
}

}  // namespace

bool NdjsonDecoder::feed(const std::string_view chunk, std::vector<std::string>& lines) {
  std::string data = pending_utf8_;
  data.append(chunk.data(), chunk.size());
  pending_utf8_.clear();

  const auto valid = complete_utf8_prefix(data);
  if (!valid.has_value()) {
    ++chunks_skipped_;
    // The partial line before the bad bytes cannot be completed. Unless the
    // dropped data ended on a line boundary, the head of the next chunk belongs
    // to that broken line too.
    line_buffer_.clear();
    discard_to_newline_ = data.back() != '\n';
    return false;
  }

  pending_utf8_ = data.substr(*valid);
  std::size_t start = 0;
  if (discard_to_newline_) {
    const std::size_t boundary = data.find('\n');
    if (boundary == std::string::npos || boundary >= *valid) {
      return true;
    }
    start = boundary + 1;
    discard_to_newline_ = false;
  }
  line_buffer_.append(data, start, *valid - start);

  std::size_t newline_pos = line_buffer_.find('\n');
  while (newline_pos != std::string::npos) {
    std::string line = line_buffer_.substr(0, newline_pos);
    line_buffer_.erase(0, newline_pos + 1);
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    lines.push_back(std::move(line));
    newline_pos = line_buffer_.find('\n');
  }
  return true;
}

void NdjsonDecoder::finish(std::vector<std::string>& lines) {
  if (!line_buffer_.empty()) {
    lines.push_back(std::move(line_buffer_));
    line_buffer_.clear();
  }
  pending_utf8_.clear();
  discard_to_newline_ = false;
}

std::size_t NdjsonDecoder::chunks_skipped() const noexcept { return chunks_skipped_; }

}  // namespace omni_supervisor::relay
