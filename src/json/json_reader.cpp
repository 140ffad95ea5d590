#include "json/json_reader.hpp"

namespace jcodec::json {

// ============================================================================
// StreamReader
// ============================================================================

auto StreamReader::read() -> int {
    ++offset_;
    if (retracted_) {
        retracted_ = false;
        return last_;
    }
    auto c = is_.get();
    last_ = c == std::istream::traits_type::eof() ? -1 : static_cast<unsigned char>(c);
    return last_;
}

void StreamReader::retract() {
    --offset_;
    retracted_ = true;
}

// ============================================================================
// RecordingReader
// ============================================================================

auto RecordingReader::read() -> int {
    if (pos_ < buffer_.size()) {
        return buffer_[pos_++];
    }
    int c = in_.read();
    buffer_.push_back(c);
    ++pos_;
    return c;
}

void RecordingReader::retract() {
    --pos_;
}

} // namespace jcodec::json
