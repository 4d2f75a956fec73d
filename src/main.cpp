#include "clients/FixtureDataClient.hpp"
#include "clients/PaperSigner.hpp"
#include "perp/Engine.hpp"
#include "perp/EngineConfig.hpp"
#include "perp/ExecError.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace {

void usage() {
  std::cerr <<
    "usage: perp_engine --fixture <data.json> [--config <cfg.json>] [--journal <out.jsonl>] <op> [args]\n"
    "  balance | positions | markets\n"
    "  price <SYMBOL>\n"
    "  open-long|open-short <SYMBOL> <QTY> <LEVERAGE>\n"
    "  close-long|close-short <SYMBOL> [QTY]      (QTY 0 or omitted closes all)\n"
    "  stop-loss|take-profit <SYMBOL> <long|short> <QTY> <PRICE>\n"
    "  leverage <SYMBOL> <LEVERAGE>\n"
    "  margin-mode <SYMBOL> <cross|isolated>\n"
    "  cancel <SYMBOL>\n"
    "  format <SYMBOL> <QTY>\n";
}

json position_to_json(const perp::Position& p) {
  json j;
  j["symbol"] = p.symbol;
  j["side"] = perp::position_side_to_string(p.side);
  j["positionAmt"] = p.amount;
  j["entryPrice"] = p.entry_price;
  j["markPrice"] = p.mark_price;
  j["unRealizedProfit"] = p.unrealized_pnl;
  j["liquidationPrice"] = p.liquidation_price;
  j["leverage"] = p.leverage ? json(*p.leverage) : json(nullptr);
  return j;
}

json result_to_json(const perp::WorkflowResult& r) {
  json j;
  j["orderId"] = r.order.client_order_index;
  j["symbol"] = r.order.symbol;
  j["status"] = perp::order_status_to_string(r.order.status);
  j["hash"] = r.order.submission_handle;
  j["order"] = client::PaperSigner::intent_to_json(r.order.intent);
  j["warnings"] = r.warnings;
  return j;
}

// Raised when an operation is given fewer arguments than it needs.
struct MissingArgument : std::runtime_error {
  explicit MissingArgument(const std::string& op)
    : std::runtime_error("missing arguments for '" + op + "'") {}
};

const std::string& arg(const std::vector<std::string>& a, size_t i) {
  if (i >= a.size()) throw MissingArgument(a.front());
  return a[i];
}

double number_arg(const std::vector<std::string>& a, size_t i) {
  const std::string& s = arg(a, i);
  try {
    size_t used = 0;
    double v = std::stod(s, &used);
    if (used == s.size()) return v;
  } catch (const std::logic_error&) {
    // stod reports both garbage and overflow; handled below
  }
  throw std::invalid_argument("'" + s + "' is not a valid number");
}

int int_arg(const std::vector<std::string>& a, size_t i) {
  const std::string& s = arg(a, i);
  try {
    size_t used = 0;
    int v = std::stoi(s, &used);
    if (used == s.size()) return v;
  } catch (const std::logic_error&) {
    // as above
  }
  throw std::invalid_argument("'" + s + "' is not a valid integer");
}

perp::PositionSide parse_side(const std::string& s) {
  if (s == "long" || s == "LONG") return perp::PositionSide::Long;
  if (s == "short" || s == "SHORT") return perp::PositionSide::Short;
  throw std::invalid_argument("position side must be long or short, got '" + s + "'");
}

json run(perp::Engine& engine, const std::vector<std::string>& a) {
  const std::string& op = a.front();

  if (op == "balance") {
    auto b = engine.get_balance();
    return json{{"totalWalletBalance", b.wallet_balance},
                {"availableBalance", b.available_balance},
                {"totalUnrealizedProfit", b.unrealized_pnl}};
  }
  if (op == "positions") {
    json out = json::array();
    for (const auto& p : engine.get_positions()) out.push_back(position_to_json(p));
    return out;
  }
  if (op == "markets") {
    json out = json::array();
    auto snap = engine.markets().snapshot();
    for (const auto& [coin, m] : *snap) {
      out.push_back({{"coin", coin}, {"market_index", m.market_index},
                     {"size_decimals", m.size_decimals}, {"price_decimals", m.price_decimals}});
    }
    return out;
  }
  if (op == "price") {
    return json{{"symbol", arg(a, 1)}, {"price", engine.get_market_price(arg(a, 1))}};
  }
  if (op == "open-long") {
    return result_to_json(engine.open_long(arg(a, 1), number_arg(a, 2), int_arg(a, 3)));
  }
  if (op == "open-short") {
    return result_to_json(engine.open_short(arg(a, 1), number_arg(a, 2), int_arg(a, 3)));
  }
  if (op == "close-long") {
    return result_to_json(engine.close_long(arg(a, 1), a.size() > 2 ? number_arg(a, 2) : 0.0));
  }
  if (op == "close-short") {
    return result_to_json(engine.close_short(arg(a, 1), a.size() > 2 ? number_arg(a, 2) : 0.0));
  }
  if (op == "stop-loss") {
    return result_to_json(engine.set_stop_loss(arg(a, 1), parse_side(arg(a, 2)), number_arg(a, 3), number_arg(a, 4)));
  }
  if (op == "take-profit") {
    return result_to_json(engine.set_take_profit(arg(a, 1), parse_side(arg(a, 2)), number_arg(a, 3), number_arg(a, 4)));
  }
  if (op == "leverage") {
    return json{{"symbol", arg(a, 1)}, {"hash", engine.set_leverage(arg(a, 1), int_arg(a, 2))}};
  }
  if (op == "margin-mode") {
    engine.set_margin_mode(arg(a, 1), perp::parse_margin_mode(arg(a, 2)));
    return json{{"symbol", arg(a, 1)}, {"margin_mode", arg(a, 2)}};
  }
  if (op == "cancel") {
    return json{{"symbol", arg(a, 1)}, {"hash", engine.cancel_all_orders(arg(a, 1))}};
  }
  if (op == "format") {
    return json{{"symbol", arg(a, 1)}, {"quantity", engine.format_quantity(arg(a, 1), number_arg(a, 2))}};
  }
  throw std::invalid_argument("unknown operation '" + op + "'");
}

} // namespace

int main(int argc, char* argv[]) {

#ifdef PERP_DEBUG
  std::cout << "[Main] debug build\n";
#endif

  // Parse command-line arguments
  std::string config_file;
  std::string fixture_file;
  std::string journal_file;
  std::vector<std::string> op_args;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_file = argv[++i];
    } else if (arg == "--fixture" && i + 1 < argc) {
      fixture_file = argv[++i];
    } else if (arg == "--journal" && i + 1 < argc) {
      journal_file = argv[++i];
    } else if (arg == "--help" || arg == "-h") {
      usage();
      return 0;
    } else {
      op_args.push_back(arg);
    }
  }

  if (fixture_file.empty() || op_args.empty()) {
    usage();
    return 2;
  }

  try {
    perp::EngineConfig cfg;
    if (!config_file.empty()) {
      cfg = perp::load_engine_config(config_file);
      std::cout << "[Main] config: " << cfg.to_json().dump() << "\n";
    }

    // 1. collaborators: fixture-backed data and a paper signer
    auto data = std::make_unique<client::FixtureDataClient>(
        client::FixtureDataClient::load_document(fixture_file));
    auto signer = journal_file.empty()
        ? std::make_unique<client::PaperSigner>()
        : std::make_unique<client::PaperSigner>(journal_file);

    // 2. engine: wire it all together
    perp::Engine engine(cfg, std::move(signer), std::move(data));

    // 3. run the requested operation
    json out = run(engine, op_args);
    std::cout << out.dump(2) << "\n";
  } catch (const perp::ExecError& e) {
    std::cerr << "[Main] " << e.what() << "\n";
    return 1;
  } catch (const MissingArgument& e) {
    std::cerr << "[Main] " << e.what() << "\n";
    usage();
    return 2;
  } catch (const std::exception& e) {
    std::cerr << "[Main] " << e.what() << "\n";
    return 2;
  }

  return 0;
}
