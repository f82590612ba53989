#include <strongbox/execution/valuation.hpp>

namespace strongbox::execution {

strongbox::schema::outcome_t<strongbox::schema::integer_t>
balance_in_quote_currency(const ledger& ledger,
                          const strongbox::oracle::price_oracle_client& oracle,
                          const strongbox::schema::address_t& account) {
  return oracle.get_value_in_quote_currency(
      strongbox::schema::integer_t{ledger.get_balance(account)});
}

strongbox::schema::outcome_t<strongbox::schema::integer_t>
total_in_quote_currency(const ledger& ledger,
                        const strongbox::oracle::price_oracle_client& oracle) {
  return oracle.get_value_in_quote_currency(
      strongbox::schema::integer_t{ledger.total_balance()});
}

}  // namespace strongbox::execution
