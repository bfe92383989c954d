#include <casper/schema/timestamp.hpp>

#include <spdlog/fmt/fmt.h>

#include <charconv>
#include <chrono>

namespace casper::schema {

namespace {

std::optional<unsigned> parse_digits(const std::string_view text,
                                     const std::size_t offset,
                                     const std::size_t count) {
  if (offset + count > text.size()) {
    return std::nullopt;
  }
  auto value = unsigned{};
  const auto* first = text.data() + offset;
  const auto* last = first + count;
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc{} || ptr != last) {
    return std::nullopt;
  }
  return value;
}

bool separator_at(const std::string_view text,
                  const std::size_t offset,
                  const char expected) {
  return offset < text.size() && text[offset] == expected;
}

}  // namespace

std::string to_iso8601(const timestamp_milliseconds_t timestamp) {
  using namespace std::chrono;
  auto point = sys_time<milliseconds>{milliseconds{timestamp}};
  auto day = floor<days>(point);
  auto date = year_month_day{day};
  auto time = hh_mm_ss<milliseconds>{point - day};
  return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
                     static_cast<int>(date.year()),
                     static_cast<unsigned>(date.month()),
                     static_cast<unsigned>(date.day()), time.hours().count(),
                     time.minutes().count(), time.seconds().count(),
                     time.subseconds().count());
}

std::optional<timestamp_milliseconds_t> try_from_iso8601(
    const std::string_view text) {
  using namespace std::chrono;
  auto year = parse_digits(text, 0, 4);
  auto month = parse_digits(text, 5, 2);
  auto day = parse_digits(text, 8, 2);
  auto hour = parse_digits(text, 11, 2);
  auto minute = parse_digits(text, 14, 2);
  auto second = parse_digits(text, 17, 2);
  if (!year || !month || !day || !hour || !minute || !second ||
      !separator_at(text, 4, '-') || !separator_at(text, 7, '-') ||
      !separator_at(text, 10, 'T') || !separator_at(text, 13, ':') ||
      !separator_at(text, 16, ':')) {
    return std::nullopt;
  }

  auto millis = unsigned{};
  auto offset = std::size_t{19};
  if (separator_at(text, offset, '.')) {
    auto fraction = parse_digits(text, offset + 1, 3);
    if (!fraction) {
      return std::nullopt;
    }
    millis = *fraction;
    offset += 4;
  }
  if (!separator_at(text, offset, 'Z') || offset + 1 != text.size()) {
    return std::nullopt;
  }
  if (*hour > 23 || *minute > 59 || *second > 59) {
    return std::nullopt;
  }

  auto date = year_month_day{std::chrono::year{static_cast<int>(*year)},
                             std::chrono::month{*month},
                             std::chrono::day{*day}};
  if (!date.ok() || *year < 1970) {
    return std::nullopt;
  }
  auto point = sys_days{date} + hours{*hour} + minutes{*minute} +
               seconds{*second} + milliseconds{millis};
  return static_cast<timestamp_milliseconds_t>(
      duration_cast<milliseconds>(point.time_since_epoch()).count());
}

timestamp_milliseconds_t now_milliseconds() {
  using namespace std::chrono;
  return static_cast<timestamp_milliseconds_t>(
      duration_cast<milliseconds>(system_clock::now().time_since_epoch())
          .count());
}

}  // namespace casper::schema
