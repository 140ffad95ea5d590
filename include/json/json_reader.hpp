//! # JSON Input Sources
//!
//! Decoders pull characters from a `JsonReader` one at a time. A reader can
//! give back the last character it produced (`retract`), which is all the
//! lookahead the lexer needs.
//!
//! | Reader | Source |
//! |--------|--------|
//! | `StringReader` | A borrowed string view |
//! | `StreamReader` | A borrowed `std::istream` |
//! | `RecordingReader` | Another reader, recording everything so it can be replayed |
//!
//! `read()` returns the next byte as `0..255`, or `-1` at end of input.
//! Reading past the end still advances the position, so a retract after
//! `-1` is always balanced.

#pragma once

#include <cstddef>
#include <istream>
#include <string_view>
#include <vector>

namespace jcodec::json {

/// Character source with single-character retract.
class JsonReader {
public:
    virtual ~JsonReader() = default;

    /// Reads the next byte, or `-1` at end of input.
    virtual auto read() -> int = 0;

    /// Pushes back the most recently read byte. Only one retract is
    /// allowed between two reads.
    virtual void retract() = 0;

    /// Number of bytes consumed so far.
    [[nodiscard]] virtual auto offset() const -> size_t = 0;

    /// Reads the next byte that is not JSON whitespace, or `-1`.
    auto next_non_whitespace() -> int {
        int c = read();
        while (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
            c = read();
        }
        return c;
    }
};

/// Reads from a string view. The viewed text must outlive the reader.
class StringReader : public JsonReader {
public:
    explicit StringReader(std::string_view input) : input_(input) {}

    auto read() -> int override {
        size_t at = pos_++;
        if (at >= input_.size()) {
            return -1;
        }
        return static_cast<unsigned char>(input_[at]);
    }

    void retract() override {
        --pos_;
    }

    [[nodiscard]] auto offset() const -> size_t override {
        return pos_;
    }

private:
    std::string_view input_;
    size_t pos_ = 0;
};

/// Reads from an input stream owned by the caller.
class StreamReader : public JsonReader {
public:
    explicit StreamReader(std::istream& is) : is_(is) {}

    auto read() -> int override;
    void retract() override;

    [[nodiscard]] auto offset() const -> size_t override {
        return offset_;
    }

private:
    std::istream& is_;
    int last_ = -1;
    bool retracted_ = false;
    size_t offset_ = 0;
};

/// Records every byte read from an underlying reader so decoding can
/// restart from the point where recording began.
///
/// After `rewind()` the recorded bytes are replayed; once they run out the
/// reader continues with the underlying source. The underlying reader must
/// outlive this one.
///
/// # Example
///
/// ```cpp
/// RecordingReader recording(in);
/// // ... scan ahead for the discriminator ...
/// recording.rewind();
/// // ... decode the whole object again from the start ...
/// ```
class RecordingReader : public JsonReader {
public:
    explicit RecordingReader(JsonReader& in) : in_(in), start_(in.offset()) {}

    auto read() -> int override;
    void retract() override;

    [[nodiscard]] auto offset() const -> size_t override {
        return start_ + pos_;
    }

    /// Restarts reading at the first recorded byte.
    void rewind() {
        pos_ = 0;
    }

private:
    JsonReader& in_;
    size_t start_;
    std::vector<int> buffer_;
    size_t pos_ = 0;
};

} // namespace jcodec::json
