#include <casper/common/error.hpp>
#include <casper/schema/cl_value.hpp>
#include <casper/schema/motes.hpp>

#include <spdlog/fmt/fmt.h>

namespace casper::schema {

namespace {

constexpr std::size_t kFractionDigits = 9;

}  // namespace

u512_t cspr_to_motes(const std::string_view cspr) {
  auto point = cspr.find('.');
  auto whole = cspr.substr(0, point);
  auto fraction = point == std::string_view::npos ? std::string_view{}
                                                  : cspr.substr(point + 1);
  if (fraction.size() > kFractionDigits) {
    throw common::encoding_error{fmt::format(
        "'{}' has more than {} fractional digits", cspr, kFractionDigits)};
  }
  if (whole.empty() && fraction.empty()) {
    throw common::encoding_error{fmt::format("'{}' is not an amount", cspr)};
  }

  auto digits = std::string{whole.empty() ? std::string_view{"0"} : whole};
  digits.append(fraction);
  digits.append(kFractionDigits - fraction.size(), '0');
  return parse_big_uint(digits, 512);
}

std::string motes_to_cspr(const u512_t& motes) {
  auto whole = u512_t{motes / kMotesPerCspr};
  auto fraction = u512_t{motes % kMotesPerCspr}.convert_to<uint64_t>();
  if (fraction == 0) {
    return whole.str();
  }
  auto digits = fmt::format("{:09}", fraction);
  digits.erase(digits.find_last_not_of('0') + 1);
  return fmt::format("{}.{}", whole.str(), digits);
}

}  // namespace casper::schema
