#include <strongbox/schema/transaction_result.hpp>

#include <utility>

namespace strongbox::schema {

transaction_result_t make_failed_result(failure_t failure,
                                        std::string codespace) {
  auto result = transaction_result_t{};
  result.code = static_cast<uint32_t>(code_of(failure));
  result.log = describe(failure);
  result.codespace = std::move(codespace);
  result.failure = std::move(failure);
  return result;
}

}  // namespace strongbox::schema
