//! # prism JSON
//!
//! Umbrella header for the shape-driven JSON codec.
//!
//! ## Components
//!
//! | Header | Contents |
//! |--------|----------|
//! | `json_error.hpp` | `DeserError`, `SerError`, spans, paths, rendering |
//! | `json_scalar.hpp` | Number and string codec, UTF-8 helpers |
//! | `json_tokenizer.hpp` | `Tokenizer`, `Token`, `Cursor` |
//! | `json_deserializer.hpp` | `deserialize`, `from_str`, `from_str_next` |
//! | `json_serializer.hpp` | `serialize`, `to_string`, `to_string_pretty` |
//!
//! Shapes for standard types come from `shape_std.hpp`; user types are
//! described with the builders in `shape_builder.hpp`.

#pragma once

#include "prism/json/json_deserializer.hpp"
#include "prism/json/json_error.hpp"
#include "prism/json/json_scalar.hpp"
#include "prism/json/json_serializer.hpp"
#include "prism/json/json_tokenizer.hpp"
#include "prism/shape/shape.hpp"
#include "prism/shape/shape_builder.hpp"
#include "prism/shape/shape_std.hpp"
