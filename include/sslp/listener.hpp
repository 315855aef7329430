#ifndef SSLP_LISTENER_HPP
#define SSLP_LISTENER_HPP

#include <cstdint>
#include <mutex>
#include <ostream>

#include "types.hpp"
#include "ledger.hpp"
#include "config.hpp"

namespace sslp {

// Callback interface for ledger notifications. Success events fire only
// after the operation has fully committed.
class LedgerListener {
public:
    virtual ~LedgerListener() = default;
    virtual void on_fund(const PoolKey& key, const Address& depositor, Asset asset, I128 amount) = 0;
    virtual void on_defund(const PoolKey& key, const Address& depositor, Asset asset, I128 amount) = 0;
    virtual void on_match(const PoolKey& key, const PositionId& position, const MatchResult& result) = 0;
    virtual void on_unwind(const PoolKey& key, const PositionId& position, const UnwindResult& result) = 0;
    virtual void on_rejected(const PoolKey& key, const char* operation, int32_t code) = 0;
};

// No-op listener for when notifications aren't needed
class NullLedgerListener : public LedgerListener {
public:
    void on_fund(const PoolKey&, const Address&, Asset, I128) override {}
    void on_defund(const PoolKey&, const Address&, Asset, I128) override {}
    void on_match(const PoolKey&, const PositionId&, const MatchResult&) override {}
    void on_unwind(const PoolKey&, const PositionId&, const UnwindResult&) override {}
    void on_rejected(const PoolKey&, const char*, int32_t) override {}
};

// One line per event, filtered by level. Commits are info, partial matches
// warn, rejections error.
class StreamLedgerListener : public LedgerListener {
public:
    StreamLedgerListener(std::ostream& out, LogLevel level) : out_(out), level_(level) {}

    void on_fund(const PoolKey& key, const Address& depositor, Asset asset, I128 amount) override;
    void on_defund(const PoolKey& key, const Address& depositor, Asset asset, I128 amount) override;
    void on_match(const PoolKey& key, const PositionId& position, const MatchResult& result) override;
    void on_unwind(const PoolKey& key, const PositionId& position, const UnwindResult& result) override;
    void on_rejected(const PoolKey& key, const char* operation, int32_t code) override;

private:
    std::ostream& out_;
    LogLevel level_;
    std::mutex mutex_;

    bool enabled(LogLevel level) const { return level_ != LogLevel::Off && level >= level_; }
    void write(LogLevel level, const PoolKey& key, const std::string& line);
};

} // namespace sslp

#endif // SSLP_LISTENER_HPP
