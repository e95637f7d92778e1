#pragma once

#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "core/config.hpp"
#include "transport/http_client.hpp"

namespace omni_supervisor::quotes {

constexpr double kDefaultQuotePrice = 100.0;
constexpr double kDefaultQuoteChange = 0.0;

struct Quote {
  std::string symbol;
  double price{kDefaultQuotePrice};
  // 24h change in percent.
  double change{kDefaultQuoteChange};
  // True when any field was substituted.
  bool fallback{true};
};

class QuoteError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Provider id for a ticker symbol ("BTC" -> "bitcoin"). Unknown symbols are lowercased.
std::string provider_id_for(const std::string& symbol);

nlohmann::json to_json(const Quote& quote);

class QuoteClient {
 public:
  QuoteClient(transport::HttpClient& client, core::QuoteSettings settings);

  // Never fails: missing fields and failed requests resolve to the defaults.
  Quote fetch_quote(const std::string& symbol) const;

  // Provider response as decoded JSON. Throws QuoteError on transport, status or
  // decode failure.
  nlohmann::json fetch_raw_quote(const std::string& symbol) const;

 private:
  transport::HttpRequest make_request(const std::string& provider_id) const;

  transport::HttpClient& client_;
  core::QuoteSettings settings_;
};

}  // namespace omni_supervisor::quotes
