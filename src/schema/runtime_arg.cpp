#include <casper/schema/runtime_arg.hpp>

#include <algorithm>

namespace casper::schema {

const runtime_arg_t* find_arg(const runtime_args_t& args,
                              const std::string_view name) {
  auto it = std::ranges::find(args, name, &runtime_arg_t::name);
  if (it == std::end(args)) {
    return nullptr;
  }
  return &*it;
}

}  // namespace casper::schema
