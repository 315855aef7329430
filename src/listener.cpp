// =============================================================================
// listener.cpp - Stream ledger listener
// =============================================================================

#include "sslp/listener.hpp"
#include <sstream>

namespace sslp {

void StreamLedgerListener::write(LogLevel level, const PoolKey& key, const std::string& line) {
    if (!enabled(level)) return;
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << "[" << log_level_name(level) << "] pool=" << key.id() << " " << line << "\n";
}

void StreamLedgerListener::on_fund(const PoolKey& key, const Address& depositor,
                                   Asset asset, I128 amount) {
    std::ostringstream os;
    os << "fund depositor=" << to_hex(depositor) << " asset=" << asset_name(asset)
       << " amount=" << to_string(amount);
    write(LogLevel::Info, key, os.str());
}

void StreamLedgerListener::on_defund(const PoolKey& key, const Address& depositor,
                                     Asset asset, I128 amount) {
    std::ostringstream os;
    os << "defund depositor=" << to_hex(depositor) << " asset=" << asset_name(asset)
       << " amount=" << to_string(amount);
    write(LogLevel::Info, key, os.str());
}

void StreamLedgerListener::on_match(const PoolKey& key, const PositionId& position,
                                    const MatchResult& result) {
    std::ostringstream os;
    os << (result.partial ? "partial match" : "match")
       << " controller=" << to_hex(position.controller)
       << " asset=" << asset_name(result.asset)
       << " need=" << to_string(result.need)
       << " fronted=" << to_string(result.fronted);
    if (result.partial) {
        os << " shortfall=" << to_string(result.shortfall);
    }
    write(result.partial ? LogLevel::Warn : LogLevel::Info, key, os.str());
}

void StreamLedgerListener::on_unwind(const PoolKey& key, const PositionId& position,
                                     const UnwindResult& result) {
    std::ostringstream os;
    os << "unwind controller=" << to_hex(position.controller)
       << " asset=" << asset_name(result.asset)
       << " amount=" << to_string(result.amount)
       << " reclaimed=" << to_string(result.reclaimed)
       << " remaining_debt=" << to_string(result.remaining_debt);
    write(LogLevel::Info, key, os.str());
}

void StreamLedgerListener::on_rejected(const PoolKey& key, const char* operation, int32_t code) {
    std::ostringstream os;
    os << operation << " rejected: " << errors::message(code) << " (" << code << ")";
    write(LogLevel::Error, key, os.str());
}

} // namespace sslp
