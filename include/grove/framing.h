#ifndef INCLUDE_GROVE_FRAMING_H_
#define INCLUDE_GROVE_FRAMING_H_

#include <string>
#include <vector>
#include <string_view>

// Longest header block accepted before the blank line
constexpr size_t kMaxHeaderSize = 8192;

// "Content-Length: <N>\r\n\r\n" followed by the payload bytes
std::string EncodeFrame(std::string_view payload);

// Incremental parser for Content-Length framed streams.
// Reads need not align with frames: a chunk may hold part of a header, several
// frames, or a frame plus the start of the next one.
class FrameDecoder {
  enum class State { HEADER, PAYLOAD, ERROR };

  State state_;
  size_t max_payload_;
  size_t expected_;
  std::string buffer_;
  std::string error_;

  bool ParseHeader_(std::string_view header);
  bool Fail_(std::string message);
 public:
  explicit FrameDecoder(size_t max_payload) :
      state_(State::HEADER), max_payload_(max_payload), expected_(0) {}

  // Appends every completed payload to out. Returns false once the stream is
  // malformed; the decoder stays failed afterwards.
  bool Feed(std::string_view data, std::vector<std::string>& out);

  bool Failed() const { return state_ == State::ERROR; }
  const std::string& Error() const { return error_; }
  // bytes held for an incomplete frame
  size_t Buffered() const { return buffer_.size(); }
};

#endif  // INCLUDE_GROVE_FRAMING_H_
