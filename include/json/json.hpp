//! # jcodec JSON Library
//!
//! Umbrella header for the JSON value model, cursors, the streaming
//! encoder and decoder protocols, and codec derivation.
//!
//! | Header | Contents |
//! |--------|----------|
//! | `json_value.hpp` | `JsonValue`, `JsonNumber`, equality and hashing |
//! | `json_cursor.hpp` | `JsonCursor`, `parse_cursor` |
//! | `json_builder.hpp` | `JsonBuilder` fluent construction |
//! | `json_encoder.hpp` | `Encoder<T>`, built-in instances, `to_json` |
//! | `json_decoder.hpp` | `Decoder<T>`, built-in instances, `from_json`, `parse_json` |
//! | `json_derive.hpp` | `derive::product`, `derive::sum` |
//!
//! ## Example
//!
//! ```cpp
//! #include "json/json.hpp"
//!
//! using namespace jcodec::json;
//!
//! auto doc = unwrap(parse_json(R"({"user": {"name": "Ada"}})"));
//! auto name = doc.get(cursor::field("user").field("name"));
//! std::cout << doc.to_string_pretty() << "\n";
//! ```

#pragma once

#include "json/json_builder.hpp"
#include "json/json_codec.hpp"
#include "json/json_cursor.hpp"
#include "json/json_decoder.hpp"
#include "json/json_derive.hpp"
#include "json/json_encoder.hpp"
#include "json/json_error.hpp"
#include "json/json_lexer.hpp"
#include "json/json_reader.hpp"
#include "json/json_value.hpp"
#include "json/json_writer.hpp"
