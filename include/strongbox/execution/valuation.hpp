#pragma once

#include <strongbox/execution/ledger.hpp>
#include <strongbox/oracle/price_oracle_client.hpp>
#include <strongbox/schema/failure.hpp>
#include <strongbox/schema/primitives.hpp>

namespace strongbox::execution {

/// Balance of account valued through the oracle, see
/// price_oracle_client::get_value_in_quote_currency.
strongbox::schema::outcome_t<strongbox::schema::integer_t>
balance_in_quote_currency(const ledger& ledger,
                          const strongbox::oracle::price_oracle_client& oracle,
                          const strongbox::schema::address_t& account);

/// Whole custody pool valued through the oracle.
strongbox::schema::outcome_t<strongbox::schema::integer_t>
total_in_quote_currency(const ledger& ledger,
                        const strongbox::oracle::price_oracle_client& oracle);

}  // namespace strongbox::execution
