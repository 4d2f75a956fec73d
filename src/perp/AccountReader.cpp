#include "perp/AccountReader.hpp"
#include "perp/ExecError.hpp"
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>

namespace perp {

AccountReader::AccountReader(IMarketDataClient& client, std::int64_t account_index, std::string quote_suffix)
    : client_(client), account_index_(account_index), quote_suffix_(std::move(quote_suffix)) {}

std::optional<RawAccount> AccountReader::fetch() {
    try {
        return client_.get_account(account_index_);
    } catch (const std::exception& e) {
        std::cerr << "[AccountReader] account " << account_index_ << " fetch failed: " << e.what() << "\n";
        throw ExecError(ErrorKind::AccountUnavailable, "", e.what());
    }
}

AccountSnapshot AccountReader::get_balance() {
    const std::optional<RawAccount> found = fetch();
    if (!found) {
        std::cerr << "[AccountReader] account " << account_index_ << " not found\n";
        throw ExecError(ErrorKind::AccountUnavailable, "",
                        "account " + std::to_string(account_index_) + " not found");
    }
    const RawAccount& account = *found;

    double unrealized = 0.0;
    for (const auto& pos : account.positions) {
        unrealized += pos.unrealized_pnl;
    }

    // collateral already carries unrealized pnl; report the wallet without it
    AccountSnapshot snap;
    snap.wallet_balance = account.collateral - unrealized;
    snap.available_balance = account.available_balance;
    snap.unrealized_pnl = unrealized;

    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2);
    ss << "[AccountReader] equity=" << account.collateral
       << " (wallet " << snap.wallet_balance << " + unrealized " << unrealized
       << "), available=" << snap.available_balance;
    std::cout << ss.str() << '\n';
    return snap;
}

Position AccountReader::to_position(const RawPosition& raw) const {
    Position p;
    p.symbol = raw.coin + quote_suffix_;
    p.side = raw.quantity > 0.0 ? PositionSide::Long : PositionSide::Short;
    p.amount = std::fabs(raw.quantity);
    p.entry_price = raw.avg_entry_price;
    p.unrealized_pnl = raw.unrealized_pnl;
    p.liquidation_price = raw.liquidation_price;

    // amount is non-zero here: flat entries are filtered before conversion
    p.mark_price = raw.mark_price ? *raw.mark_price : raw.position_value / p.amount;

    if (raw.initial_margin_fraction > 0.0) {
        p.leverage = 100.0 / raw.initial_margin_fraction;
    }
    return p;
}

std::vector<Position> AccountReader::get_positions() {
    const std::optional<RawAccount> account = fetch();

    std::vector<Position> result;
    if (!account) return result;
    result.reserve(account->positions.size());
    for (const auto& raw : account->positions) {
        if (raw.quantity == 0.0) continue;
        result.push_back(to_position(raw));
    }
    return result;
}

} // namespace perp
