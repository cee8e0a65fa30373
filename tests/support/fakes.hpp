#pragma once

// =============================================================================
// fakes.hpp
// =============================================================================
// In-memory collaborators for the order pipeline tests, plus an Arbitrum-like
// fixture (tokens, markets, prices, config).
//
// Every fake counts its reads so tests can assert which collaborators a
// rejected request touched. All fakes are thread-safe: the resolver and the
// allowance step call them from WorkerPool threads.
// =============================================================================

#include "gmx/config/engine_config.hpp"
#include "gmx/core/errors.hpp"
#include "gmx/domain/address.hpp"
#include "gmx/domain/market_info.hpp"
#include "gmx/domain/price_quote.hpp"
#include "gmx/gas/i_gas_limit_table.hpp"
#include "gmx/gateway/i_ledger_gateway.hpp"
#include "gmx/numeric/fixed_point.hpp"
#include "gmx/oracle/i_price_oracle.hpp"
#include "gmx/registry/i_registries.hpp"
#include "gmx/signing/i_signer.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace gmx_test {

using gmx::BigInt;

// --- Addresses ---------------------------------------------------------------
inline const std::string kWallet = "0x1111111111111111111111111111111111111111";
inline const std::string kExchangeRouter =
    "0x7C68C7866A64FA2160F78EEaE12217FFbf871fa8";
inline const std::string kSyntheticsRouter =
    "0x7452c558d45f8afC8c83dAe62C3f8A5BE19c71f6";
inline const std::string kOrderVault =
    "0x31eF83a530Fde1B38EE9A18093A333D8Bbbc40D5";
inline const std::string kDataStore =
    "0xFD70de6b91282D8017aA4E741e9Ae325CAb992d8";

inline const std::string kWeth = "0x82aF49447D8a07e3bd95BD0d56f35241523fBab1";
inline const std::string kUsdc = "0xaf88d065e77c8cC2239327C5EDb3A432268e5831";
inline const std::string kWbtcB = "0x47904963fc8b2340414262125aF798B9655E58Cd";
inline const std::string kWbtc = "0x2f2a2543B76A4166549F7aaB2e75Bef0aefC5B0f";

inline const std::string kEthMarket =
    "0x70d95587d40A2caf56bd97485aB3Eec10Bee6336";
inline const std::string kBtcMarket =
    "0x47c031236e19d024b42f8AE6780E44A573170703";

// USD × 10^(30 − decimals), the exchange's raw price scale.
inline BigInt rawPrice(const std::string& usd, int decimals) {
  return gmx::floorToInteger(gmx::parseDecimal(usd) *
                             gmx::pow10(gmx::kUsdDecimals - decimals));
}

inline gmx::domain::PriceQuote quote(const std::string& token,
                                     const BigInt& min, const BigInt& max) {
  gmx::domain::PriceQuote q;
  q.token_address = token;
  q.min_price = min;
  q.max_price = max;
  return q;
}

// =============================================================================
// FakeLedgerGateway
// =============================================================================
class FakeLedgerGateway : public gmx::ILedgerGateway {
 public:
  struct EncodedCall {
    std::string contract;
    std::string method;
    nlohmann::json args;
  };

  // --- Setup -----------------------------------------------------------------
  void setBaseFee(const BigInt& fee) {
    std::lock_guard lock(mutex_);
    base_fee_ = fee;
  }
  void setNonce(const std::string& address, std::uint64_t nonce) {
    std::lock_guard lock(mutex_);
    nonces_[gmx::domain::normalizeAddress(address)] = nonce;
  }
  void setNativeBalance(const std::string& owner, const BigInt& value) {
    std::lock_guard lock(mutex_);
    native_balances_[gmx::domain::normalizeAddress(owner)] = value;
  }
  void setTokenBalance(const std::string& token, const std::string& owner,
                       const BigInt& value) {
    std::lock_guard lock(mutex_);
    token_balances_[key(token, owner)] = value;
  }
  void setAllowance(const std::string& token, const std::string& owner,
                    const std::string& spender, const BigInt& value) {
    std::lock_guard lock(mutex_);
    allowances_[key(token, owner, spender)] = value;
  }
  void setGasLimit(const std::string& key_name, const nlohmann::json& value) {
    std::lock_guard lock(mutex_);
    gas_limits_[key_name] = value;
  }
  void rejectSubmissions(const std::string& reason) {
    std::lock_guard lock(mutex_);
    reject_reason_ = reason;
  }

  // --- ILedgerGateway --------------------------------------------------------
  std::uint64_t chainId() override { return 42161; }

  BigInt baseFee() override {
    std::lock_guard lock(mutex_);
    ++base_fee_reads_;
    return base_fee_;
  }

  std::uint64_t nonce(const std::string& address) override {
    std::lock_guard lock(mutex_);
    ++nonce_reads_;
    return nonces_[gmx::domain::normalizeAddress(address)];
  }

  BigInt nativeBalance(const std::string& owner) override {
    std::lock_guard lock(mutex_);
    ++native_balance_reads_;
    return native_balances_[gmx::domain::normalizeAddress(owner)];
  }

  BigInt tokenBalance(const std::string& token,
                      const std::string& owner) override {
    std::lock_guard lock(mutex_);
    ++token_balance_reads_;
    token_balance_tokens_.push_back(token);
    return token_balances_[key(token, owner)];
  }

  BigInt allowance(const std::string& token, const std::string& owner,
                   const std::string& spender) override {
    std::lock_guard lock(mutex_);
    ++allowance_reads_;
    return allowances_[key(token, owner, spender)];
  }

  nlohmann::json call(const std::string& contract, const std::string& method,
                      const nlohmann::json& args) override {
    std::lock_guard lock(mutex_);
    ++contract_calls_;
    if (gmx::domain::sameAddress(contract, kDataStore) && method == "getUint") {
      auto it = gas_limits_.find(args.at(0).get<std::string>());
      if (it == gas_limits_.end()) {
        return "0";
      }
      return it->second;
    }
    throw gmx::GatewayError("unexpected call " + method);
  }

  // Calldata is readable text: "<method>(<args json>)".
  std::string encodeCall(const std::string& contract,
                         const std::string& method,
                         const nlohmann::json& args) override {
    std::lock_guard lock(mutex_);
    encoded_.push_back({contract, method, args});
    return method + "(" + args.dump() + ")";
  }

  std::string submit(const gmx::domain::SignedTransaction& tx) override {
    std::lock_guard lock(mutex_);
    ++submit_calls_;
    if (!reject_reason_.empty()) {
      throw gmx::SubmissionFailedError(reject_reason_);
    }
    submitted_.push_back(tx);

    // The submitted transaction takes effect immediately.
    const gmx::domain::TransactionEnvelope& e = tx.envelope;
    ++nonces_[gmx::domain::normalizeAddress(e.from)];
    const std::string approve_prefix = "approve(";
    if (e.data.compare(0, approve_prefix.size(), approve_prefix) == 0) {
      const nlohmann::json args = nlohmann::json::parse(
          e.data.substr(approve_prefix.size(),
                        e.data.size() - approve_prefix.size() - 1));
      allowances_[key(e.to, e.from, args.at(0).get<std::string>())] =
          gmx::parseBigInt(args.at(1).get<std::string>());
    }
    return "0xtx" + std::to_string(submitted_.size());
  }

  // --- Inspection ------------------------------------------------------------
  int baseFeeReads() const { return locked(base_fee_reads_); }
  int nonceReads() const { return locked(nonce_reads_); }
  int nativeBalanceReads() const { return locked(native_balance_reads_); }
  int tokenBalanceReads() const { return locked(token_balance_reads_); }
  int allowanceReads() const { return locked(allowance_reads_); }
  int contractCalls() const { return locked(contract_calls_); }
  int submitCalls() const { return locked(submit_calls_); }

  std::vector<gmx::domain::SignedTransaction> submitted() const {
    std::lock_guard lock(mutex_);
    return submitted_;
  }
  std::vector<EncodedCall> encoded() const {
    std::lock_guard lock(mutex_);
    return encoded_;
  }
  std::vector<std::string> tokenBalanceTokens() const {
    std::lock_guard lock(mutex_);
    return token_balance_tokens_;
  }
  BigInt allowanceOf(const std::string& token, const std::string& owner,
                     const std::string& spender) const {
    std::lock_guard lock(mutex_);
    auto it = allowances_.find(key(token, owner, spender));
    return it == allowances_.end() ? BigInt(0) : it->second;
  }

 private:
  static std::string key(const std::string& a, const std::string& b,
                         const std::string& c = "") {
    return gmx::domain::normalizeAddress(a) + "|" +
           gmx::domain::normalizeAddress(b) + "|" +
           gmx::domain::normalizeAddress(c);
  }
  int locked(const int& counter) const {
    std::lock_guard lock(mutex_);
    return counter;
  }

  mutable std::mutex mutex_;
  BigInt base_fee_{100000000};  // 0.1 gwei
  std::map<std::string, std::uint64_t> nonces_;
  std::map<std::string, BigInt> native_balances_;
  std::map<std::string, BigInt> token_balances_;
  std::map<std::string, BigInt> allowances_;
  std::map<std::string, nlohmann::json> gas_limits_;
  std::string reject_reason_;

  std::vector<EncodedCall> encoded_;
  std::vector<gmx::domain::SignedTransaction> submitted_;
  std::vector<std::string> token_balance_tokens_;
  int base_fee_reads_{0};
  int nonce_reads_{0};
  int native_balance_reads_{0};
  int token_balance_reads_{0};
  int allowance_reads_{0};
  int contract_calls_{0};
  int submit_calls_{0};
};

// =============================================================================
// FakeSigner
// =============================================================================
class FakeSigner : public gmx::ISigner {
 public:
  explicit FakeSigner(std::string address = kWallet)
      : address_(std::move(address)) {}

  const std::string& address() const override { return address_; }

  gmx::domain::SignedTransaction sign(
      const gmx::domain::TransactionEnvelope& envelope) override {
    std::lock_guard lock(mutex_);
    ++signs_;
    gmx::domain::SignedTransaction tx;
    tx.envelope = envelope;
    tx.raw = "0xraw" + std::to_string(envelope.nonce);
    tx.hash = "0xhash" + std::to_string(signs_);
    return tx;
  }

  int signs() const {
    std::lock_guard lock(mutex_);
    return signs_;
  }

 private:
  std::string address_;
  mutable std::mutex mutex_;
  int signs_{0};
};

// =============================================================================
// FakePriceOracle
// =============================================================================
class FakePriceOracle : public gmx::IPriceOracle {
 public:
  void set(const std::string& token, const BigInt& min, const BigInt& max) {
    std::lock_guard lock(mutex_);
    prices_[gmx::domain::normalizeAddress(token)] = quote(token, min, max);
  }
  void failWith(const std::string& reason) {
    std::lock_guard lock(mutex_);
    failure_ = reason;
  }

  gmx::domain::OracleSnapshot snapshot(const std::string& /*chain*/) override {
    std::lock_guard lock(mutex_);
    ++reads_;
    if (!failure_.empty()) {
      throw gmx::GatewayError(failure_);
    }
    return prices_;
  }

  int reads() const {
    std::lock_guard lock(mutex_);
    return reads_;
  }

 private:
  mutable std::mutex mutex_;
  gmx::domain::OracleSnapshot prices_;
  std::string failure_;
  int reads_{0};
};

// =============================================================================
// FakeTokenRegistry / FakeMarketRegistry
// =============================================================================
class FakeTokenRegistry : public gmx::ITokenRegistry {
 public:
  std::vector<gmx::domain::TokenInfo> list;

  std::vector<gmx::domain::TokenInfo> tokens(const std::string& chain) override {
    std::lock_guard lock(mutex_);
    ++reads_;
    if (chain != "arbitrum") {
      return {};
    }
    return list;
  }
  int reads() const {
    std::lock_guard lock(mutex_);
    return reads_;
  }

 private:
  mutable std::mutex mutex_;
  int reads_{0};
};

class FakeMarketRegistry : public gmx::IMarketRegistry {
 public:
  std::vector<gmx::domain::MarketInfo> list;

  std::vector<gmx::domain::MarketInfo> markets(
      const std::string& chain) override {
    std::lock_guard lock(mutex_);
    ++reads_;
    if (chain != "arbitrum") {
      return {};
    }
    return list;
  }
  int reads() const {
    std::lock_guard lock(mutex_);
    return reads_;
  }

 private:
  mutable std::mutex mutex_;
  int reads_{0};
};

// =============================================================================
// FakeGasLimitTable
// =============================================================================
class FakeGasLimitTable : public gmx::IGasLimitTable {
 public:
  std::map<gmx::domain::OrderKind, BigInt> limits{
      {gmx::domain::OrderKind::Increase, BigInt(3'000'000)},
      {gmx::domain::OrderKind::Decrease, BigInt(2'500'000)},
      {gmx::domain::OrderKind::Swap, BigInt(2'000'000)},
  };

  BigInt baseEstimate(gmx::domain::OrderKind kind) override {
    std::lock_guard lock(mutex_);
    ++reads_;
    return limits.at(kind);
  }
  int reads() const {
    std::lock_guard lock(mutex_);
    return reads_;
  }

 private:
  mutable std::mutex mutex_;
  int reads_{0};
};

// =============================================================================
// Arbitrum-like fixture data
// =============================================================================
inline std::vector<gmx::domain::TokenInfo> arbitrumTokens() {
  return {
      {kWeth, "WETH", 18, false},
      {kUsdc, "USDC", 6, false},
      {kWbtcB, "WBTC.b", 8, true},
      {kWbtc, "WBTC", 8, false},
  };
}

inline std::vector<gmx::domain::MarketInfo> arbitrumMarkets() {
  return {
      {kEthMarket, kWeth, kWeth, kUsdc, "ETH/USD [WETH-USDC]"},
      {kBtcMarket, kWbtcB, kWbtc, kUsdc, "BTC/USD [WBTC-USDC]"},
  };
}

// BTC 60005, ETH 3000, USDC 1; bid == ask.
inline void setArbitrumPrices(FakePriceOracle& oracle) {
  oracle.set(kWbtcB, rawPrice("60005", 8), rawPrice("60005", 8));
  oracle.set(kWbtc, rawPrice("60005", 8), rawPrice("60005", 8));
  oracle.set(kWeth, rawPrice("3000", 18), rawPrice("3000", 18));
  oracle.set(kUsdc, rawPrice("1", 6), rawPrice("1", 6));
}

inline gmx::EngineConfig testConfig() {
  gmx::EngineConfig cfg;
  cfg.chain = "arbitrum";
  cfg.chain_id = 42161;
  cfg.wallet_address = kWallet;
  cfg.wrapped_native_address = kWeth;
  cfg.contracts.exchange_router = kExchangeRouter;
  cfg.contracts.synthetics_router = kSyntheticsRouter;
  cfg.contracts.order_vault = kOrderVault;
  cfg.contracts.datastore = kDataStore;
  cfg.gateway_endpoint = "tcp://127.0.0.1:1";
  cfg.signer_endpoint = "tcp://127.0.0.1:2";
  cfg.registry_file = "unused.json";
  cfg.worker_threads = 2;
  return cfg;
}

}  // namespace gmx_test
