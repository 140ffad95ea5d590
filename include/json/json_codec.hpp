//! # Codec Registry
//!
//! Shared declarations for the encoder and decoder halves of the library.
//!
//! A user type takes part in encoding and decoding by specializing
//! `JsonDerive<T>` with a static `codec()` that returns a `Codec<T>`. The
//! codec is normally produced by the derivation builders in
//! `json_derive.hpp`:
//!
//! ```cpp
//! struct User {
//!     int64_t id;
//!     std::string name;
//! };
//!
//! template <> struct jcodec::json::JsonDerive<User> {
//!     static auto codec() -> const Codec<User>& {
//!         static const auto c = derive::product<User>()
//!                                   .field("id", &User::id)
//!                                   .field("name", &User::name)
//!                                   .build();
//!         return c;
//!     }
//! };
//! ```
//!
//! After that, `encoder<User>()`, `decoder<User>()`, `to_json(user)` and
//! `from_json<User>(text)` work, as do containers of `User`.

#pragma once

#include "common.hpp"

namespace jcodec::json {

template <typename T> class Encoder;
template <typename T> class Decoder;

/// Shared handle to an encoder. Encoders are immutable and thread-safe.
template <typename T> using EncoderRef = Rc<const Encoder<T>>;

/// Shared handle to a decoder. Decoders are immutable and thread-safe.
template <typename T> using DecoderRef = Rc<const Decoder<T>>;

/// An encoder and a decoder for the same type.
template <typename T> struct Codec {
    EncoderRef<T> encoder;
    DecoderRef<T> decoder;
};

/// Opt-in point for user types. Specialize with
/// `static auto codec() -> const Codec<T>&`.
template <typename T> struct JsonDerive;

} // namespace jcodec::json
