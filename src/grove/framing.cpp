#include <grove/framing.h>

#include <cctype>

#include <fmt/format.h>

namespace {

const std::string_view kHeaderEnd = "\r\n\r\n";
const std::string_view kLengthField = "content-length";

std::string_view Trim(std::string_view str) {
  while (!str.empty() && (str.front() == ' ' || str.front() == '\t')) str.remove_prefix(1);
  while (!str.empty() && (str.back() == ' ' || str.back() == '\t')) str.remove_suffix(1);
  return str;
}

bool EqualsIgnoreCase(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); i++) {
    if (std::tolower((unsigned char)a[i]) != b[i]) return false;
  }
  return true;
}

} // namespace

std::string EncodeFrame(std::string_view payload) {
  std::string ret = fmt::format("Content-Length: {}\r\n\r\n", payload.size());
  ret.append(payload);
  return ret;
}

bool FrameDecoder::Fail_(std::string message) {
  state_ = State::ERROR;
  error_ = std::move(message);
  buffer_.clear();
  return false;
}

bool FrameDecoder::ParseHeader_(std::string_view header) {
  bool has_length = false;
  while (!header.empty()) {
    size_t eol = header.find("\r\n");
    std::string_view line = header.substr(0, eol);
    header = eol == std::string_view::npos ? std::string_view() : header.substr(eol + 2);
    size_t colon = line.find(':');
    if (colon == std::string_view::npos) {
      return Fail_(fmt::format("Malformed header line '{}'", line.substr(0, 64)));
    }
    if (!EqualsIgnoreCase(Trim(line.substr(0, colon)), kLengthField)) continue;
    if (has_length) return Fail_("Duplicate Content-Length");
    std::string_view value = Trim(line.substr(colon + 1));
    if (value.empty() || value.size() > 19) {
      return Fail_(fmt::format("Invalid Content-Length '{}'", value.substr(0, 32)));
    }
    size_t length = 0;
    for (char c : value) {
      if (c < '0' || c > '9') return Fail_(fmt::format("Invalid Content-Length '{}'", value.substr(0, 32)));
      length = length * 10 + (c - '0');
    }
    if (length > max_payload_) {
      return Fail_(fmt::format("Frame of {} bytes exceeds the {} byte limit", length, max_payload_));
    }
    has_length = true;
    expected_ = length;
  }
  if (!has_length) return Fail_("Missing Content-Length");
  return true;
}

bool FrameDecoder::Feed(std::string_view data, std::vector<std::string>& out) {
  if (state_ == State::ERROR) return false;
  buffer_.append(data);
  size_t pos = 0;
  while (true) {
    if (state_ == State::HEADER) {
      size_t end = buffer_.find(kHeaderEnd, pos);
      if (end == std::string::npos) {
        if (buffer_.size() - pos > kMaxHeaderSize) return Fail_("Header block too long");
        break;
      }
      if (end - pos > kMaxHeaderSize) return Fail_("Header block too long");
      if (!ParseHeader_(std::string_view(buffer_).substr(pos, end - pos))) return false;
      pos = end + kHeaderEnd.size();
      state_ = State::PAYLOAD;
    }
    if (buffer_.size() - pos < expected_) break;
    out.emplace_back(buffer_, pos, expected_);
    pos += expected_;
    expected_ = 0;
    state_ = State::HEADER;
  }
  buffer_.erase(0, pos);
  return true;
}
