#include "quotes/quote_client.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <iostream>
#include <unordered_map>
#include <utility>

namespace omni_supervisor::quotes {
namespace {

const std::unordered_map<std::string, std::string>& provider_ids() {
  static const std::unordered_map<std::string, std::string> kProviderIds = {
      {"BTC", "bitcoin"},   {"ETH", "ethereum"},      {"SOL", "solana"},   {"BNB", "binancecoin"},
      {"XRP", "ripple"},    {"ADA", "cardano"},       {"DOGE", "dogecoin"}, {"DOT", "polkadot"},
      {"MATIC", "matic-network"}, {"LTC", "litecoin"}, {"AVAX", "avalanche-2"}, {"LINK", "chainlink"},
  };
  return kProviderIds;
}

std::string to_upper(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return value;
}

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

// Symbols and provider ids end up in a query string; anything outside this set is
// rejected rather than escaped.
bool is_query_safe(const std::string& value) {
  return !value.empty() && std::all_of(value.begin(), value.end(), [](unsigned char c) {
    return std::isalnum(c) != 0 || c == '-' || c == '_' || c == '.';
  });
}

}  // namespace

std::string provider_id_for(const std::string& symbol) {
  const auto it = provider_ids().find(to_upper(symbol));
  if (it != provider_ids().end()) {
    return it->second;
  }
  return to_lower(symbol);
}

nlohmann::json to_json(const Quote& quote) {
  return nlohmann::json{
      {"symbol", quote.symbol}, {"price", quote.price}, {"change", quote.change}, {"fallback", quote.fallback}};
}

QuoteClient::QuoteClient(transport::HttpClient& client, core::QuoteSettings settings)
    : client_(client), settings_(std::move(settings)) {}

Quote QuoteClient::fetch_quote(const std::string& symbol) const {
  Quote quote{};
  quote.symbol = to_upper(symbol);
  quote.price = settings_.default_price;

  const std::string id = provider_id_for(symbol);
  if (!is_query_safe(id)) {
    return quote;
  }

  const auto response = client_.fetch(make_request(id));
  if (!response.success()) {
    std::cerr << "[quotes] " << quote.symbol << ": request failed ("
              << (response.error.empty() ? "HTTP " + std::to_string(response.status) : response.error)
              << "); using defaults\n";
    return quote;
  }

  const auto body = nlohmann::json::parse(response.body, nullptr, false);
  if (body.is_discarded() || !body.is_object()) {
    return quote;
  }

  const auto entry = body.find(id);
  if (entry == body.end() || !entry->is_object()) {
    return quote;
  }

  bool complete = true;
  const auto price_it = entry->find(settings_.vs_currency);
  if (price_it != entry->end() && price_it->is_number()) {
    quote.price = price_it->get<double>();
  } else {
    complete = false;
  }

  const auto change_it = entry->find(settings_.vs_currency + "_24h_change");
  if (change_it != entry->end() && change_it->is_number()) {
    quote.change = change_it->get<double>();
  } else {
    complete = false;
  }

  quote.fallback = !complete;
  return quote;
}

nlohmann::json QuoteClient::fetch_raw_quote(const std::string& symbol) const {
  const std::string id = provider_id_for(symbol);
  if (!is_query_safe(id)) {
    throw QuoteError("invalid symbol: " + symbol);
  }

  const auto response = client_.fetch(make_request(id));
  if (response.transport != transport::transport_status::OK) {
    throw QuoteError("quote request failed: " + (response.error.empty() ? std::string("transport error") : response.error));
  }
  if (!response.success()) {
    throw QuoteError("quote request failed: HTTP " + std::to_string(response.status));
  }

  auto body = nlohmann::json::parse(response.body, nullptr, false);
  if (body.is_discarded()) {
    throw QuoteError("quote response is not valid JSON");
  }
  return body;
}

transport::HttpRequest QuoteClient::make_request(const std::string& provider_id) const {
  transport::HttpRequest request{};
  request.url = settings_.origin + "/api/v3/simple/price?ids=" + provider_id + "&vs_currencies=" +
                settings_.vs_currency + "&include_24hr_change=true";
  request.headers = {"Accept: application/json"};
  request.timeout = settings_.timeout;
  return request;
}

}  // namespace omni_supervisor::quotes
