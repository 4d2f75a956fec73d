#pragma once
#include "perp/Types.hpp"
#include "perp/IMarketDataClient.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace perp {

/*
Projects the exchange's account record into engine types. Nothing is cached:
every call is one fresh fetch, and get_balance()/get_positions() called back to
back may observe different account states.
*/
class AccountReader {
public:
    AccountReader(IMarketDataClient& client, std::int64_t account_index, std::string quote_suffix = "USDT");

    // Throws ExecError(AccountUnavailable) if the fetch fails or the account
    // has no record.
    AccountSnapshot get_balance();

    // Open positions only; zero-quantity entries are dropped. An account with
    // no record has no positions.
    // Throws ExecError(AccountUnavailable) if the fetch fails.
    std::vector<Position> get_positions();

    // Normalization of a single entry; the entry must have a non-zero quantity.
    Position to_position(const RawPosition& raw) const;

    std::int64_t account_index() const { return account_index_; }

private:
    std::optional<RawAccount> fetch();

    IMarketDataClient& client_;
    std::int64_t account_index_;
    std::string quote_suffix_;
};

} // namespace perp
