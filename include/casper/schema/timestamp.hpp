#pragma once
#include <casper/schema/primitives.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace casper::schema {

// "YYYY-MM-DDTHH:MM:SS.mmmZ", always UTC with millisecond precision.
std::string to_iso8601(timestamp_milliseconds_t timestamp);

// Accepts the form above, with or without the fractional part.
std::optional<timestamp_milliseconds_t> try_from_iso8601(std::string_view text);

timestamp_milliseconds_t now_milliseconds();

}  // namespace casper::schema
