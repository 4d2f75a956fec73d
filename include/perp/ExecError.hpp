#pragma once
#include <stdexcept>
#include <string>

namespace perp {

enum class ErrorKind {
    MarketNotFound,
    PriceUnavailable,
    NoPositionToClose,
    LeverageSetFailed,
    OrderSubmissionFailed,
    MetadataReloadFailed,
    AccountUnavailable,
    CancelFailed,
    InvalidRequest
};

inline const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MarketNotFound: return "MarketNotFound";
        case ErrorKind::PriceUnavailable: return "PriceUnavailable";
        case ErrorKind::NoPositionToClose: return "NoPositionToClose";
        case ErrorKind::LeverageSetFailed: return "LeverageSetFailed";
        case ErrorKind::OrderSubmissionFailed: return "OrderSubmissionFailed";
        case ErrorKind::MetadataReloadFailed: return "MetadataReloadFailed";
        case ErrorKind::AccountUnavailable: return "AccountUnavailable";
        case ErrorKind::CancelFailed: return "CancelFailed";
        case ErrorKind::InvalidRequest: return "InvalidRequest";
    }
    return "Unknown";
}

/*
Error raised by the engine and its components. `cause()` holds the message of
the underlying transport/signing failure, empty when the engine itself
detected the problem.
*/
class ExecError : public std::runtime_error {
public:
    ExecError(ErrorKind kind, std::string symbol, std::string cause = {})
        : std::runtime_error(compose(kind, symbol, cause)),
          kind_(kind), symbol_(std::move(symbol)), cause_(std::move(cause)) {}

    ErrorKind kind() const { return kind_; }
    const std::string& symbol() const { return symbol_; }
    const std::string& cause() const { return cause_; }

private:
    static std::string compose(ErrorKind kind, const std::string& symbol, const std::string& cause) {
        std::string msg = error_kind_to_string(kind);
        if (!symbol.empty()) msg += " [" + symbol + "]";
        if (!cause.empty()) msg += ": " + cause;
        return msg;
    }

    ErrorKind   kind_;
    std::string symbol_;
    std::string cause_;
};

} // namespace perp
