#include <casper/schema/cl_type.hpp>
#include <casper/schema/primitives.hpp>

#include <utility>

namespace casper::schema {

cl_type_t make_cl_type(const cl_simple_type type) {
  return cl_type_t{.value = type};
}

cl_type_t make_option_type(cl_type_t inner) {
  return cl_type_t{.value = cl_option_type{
                       .inner = std::make_shared<const cl_type_t>(
                           std::move(inner))}};
}

cl_type_t make_list_type(cl_type_t inner) {
  return cl_type_t{.value = cl_list_type{
                       .inner = std::make_shared<const cl_type_t>(
                           std::move(inner))}};
}

cl_type_t make_byte_array_type(const uint32_t length) {
  return cl_type_t{.value = cl_byte_array_type{.length = length}};
}

cl_type_t make_map_type(cl_type_t key, cl_type_t value) {
  return cl_type_t{
      .value = cl_map_type{
          .key = std::make_shared<const cl_type_t>(std::move(key)),
          .value = std::make_shared<const cl_type_t>(std::move(value))}};
}

uint8_t tag(const cl_type_t& type) {
  return std::visit(
      overloaded{
          [](const cl_simple_type value) { return static_cast<uint8_t>(value); },
          [](const cl_option_type&) { return kClOptionTag; },
          [](const cl_list_type&) { return kClListTag; },
          [](const cl_byte_array_type&) { return kClByteArrayTag; },
          [](const cl_map_type&) { return kClMapTag; }},
      type.value);
}

bool operator==(const cl_type_t& lhs, const cl_type_t& rhs) {
  if (lhs.value.index() != rhs.value.index()) {
    return false;
  }
  return std::visit(
      overloaded{
          [&](const cl_simple_type value) {
            return value == std::get<cl_simple_type>(rhs.value);
          },
          [&](const cl_option_type& value) {
            return *value.inner == *std::get<cl_option_type>(rhs.value).inner;
          },
          [&](const cl_list_type& value) {
            return *value.inner == *std::get<cl_list_type>(rhs.value).inner;
          },
          [&](const cl_byte_array_type& value) {
            return value.length ==
                   std::get<cl_byte_array_type>(rhs.value).length;
          },
          [&](const cl_map_type& value) {
            const auto& other = std::get<cl_map_type>(rhs.value);
            return *value.key == *other.key && *value.value == *other.value;
          }},
      lhs.value);
}

std::string to_string(const cl_type_t& type) {
  return std::visit(
      overloaded{[](const cl_simple_type value) {
                   return std::string{to_string(value)};
                 },
                 [](const cl_option_type& value) {
                   return "Option(" + to_string(*value.inner) + ")";
                 },
                 [](const cl_list_type& value) {
                   return "List(" + to_string(*value.inner) + ")";
                 },
                 [](const cl_byte_array_type& value) {
                   return "ByteArray(" + std::to_string(value.length) + ")";
                 },
                 [](const cl_map_type& value) {
                   return "Map(" + to_string(*value.key) + ", " +
                          to_string(*value.value) + ")";
                 }},
      type.value);
}

}  // namespace casper::schema
