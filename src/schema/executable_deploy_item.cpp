#include <casper/schema/executable_deploy_item.hpp>

namespace casper::schema {

executable_deploy_item_kind kind_of(const executable_deploy_item_t& item) {
  return static_cast<executable_deploy_item_kind>(item.index());
}

const runtime_args_t& args_of(const executable_deploy_item_t& item) {
  return std::visit(
      [](const auto& alternative) -> const runtime_args_t& {
        return alternative.args;
      },
      item);
}

}  // namespace casper::schema
