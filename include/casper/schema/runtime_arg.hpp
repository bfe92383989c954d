#pragma once
#include <casper/schema/cl_value.hpp>
#include <string>
#include <vector>

// Schema type: runtime arg.
// Named argument passed to a payment or session item. Serialization order is
// insertion order.
namespace casper::schema {

struct runtime_arg_t final {
  std::string name;
  cl_value_t value;
};

using runtime_args_t = std::vector<runtime_arg_t>;

// First argument called `name`, if any.
const runtime_arg_t* find_arg(const runtime_args_t& args,
                              std::string_view name);

}  // namespace casper::schema
