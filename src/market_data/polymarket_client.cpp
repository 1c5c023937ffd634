#include "market_data/polymarket_client.hpp"
#include "market_data/feed_messages.hpp"
#include "common/errors.hpp"
#include "utils/crypto.hpp"
#include "utils/time_utils.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <curl/curl.h>
#include <stdexcept>

namespace tarb {

namespace {
    size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* output) {
        size_t total_size = size * nmemb;
        output->append(static_cast<char*>(contents), total_size);
        return total_size;
    }

    std::string trim_slash(std::string s) {
        while (!s.empty() && s.back() == '/') s.pop_back();
        return s;
    }

    std::string escape(const std::string& s) {
        CURL* curl = curl_easy_init();
        if (!curl) return s;
        char* out = curl_easy_escape(curl, s.c_str(), static_cast<int>(s.size()));
        std::string result = out ? out : s;
        curl_free(out);
        curl_easy_cleanup(curl);
        return result;
    }
}

PolymarketClient::PolymarketClient(const ConnectionConfig& connection, const CredentialsConfig& credentials)
    : connection_(connection)
    , credentials_(credentials)
{
    curl_global_init(CURL_GLOBAL_ALL);
    spdlog::info("PolymarketClient initialized (gamma={}, clob={}, credentials={})",
                 connection_.gamma_api_url, connection_.clob_api_url, has_credentials() ? "yes" : "no");
}

PolymarketClient::~PolymarketClient() {
    curl_global_cleanup();
}

bool PolymarketClient::has_credentials() const {
    return credentials_.has_api_credentials() && !credentials_.api_passphrase.empty();
}

PolymarketClient::HttpResponse PolymarketClient::http_get(const std::string& url) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw std::runtime_error("Failed to initialize CURL");
    }

    HttpResponse response;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(connection_.http_timeout_secs));
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Accept: application/json");
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

    CURLcode res = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        throw std::runtime_error(std::string("GET ") + url + " failed: " + curl_easy_strerror(res));
    }
    return response;
}

PolymarketClient::HttpResponse PolymarketClient::http_post(const std::string& url, const std::string& body,
                                                           const std::vector<std::string>& extra_headers) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw std::runtime_error("Failed to initialize CURL");
    }

    HttpResponse response;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(connection_.http_timeout_secs));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    headers = curl_slist_append(headers, "Accept: application/json");
    for (const auto& h : extra_headers) {
        headers = curl_slist_append(headers, h.c_str());
    }
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

    CURLcode res = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        throw std::runtime_error(std::string("POST ") + url + " failed: " + curl_easy_strerror(res));
    }
    return response;
}

std::vector<std::string> PolymarketClient::l2_headers(const std::string& method, const std::string& path,
                                                      const std::string& body) const {
    std::string timestamp = std::to_string(time_utils::epoch_seconds());
    std::string signature = crypto::l2_signature(credentials_.api_secret, timestamp, method, path, body);

    return {
        "POLY_ADDRESS: " + credentials_.wallet_address,
        "POLY_API_KEY: " + credentials_.api_key,
        "POLY_TIMESTAMP: " + timestamp,
        "POLY_SIGNATURE: " + signature,
        "POLY_PASSPHRASE: " + credentials_.api_passphrase
    };
}

std::optional<Market> PolymarketClient::get_market_by_slug(const std::string& slug) {
    std::string url = trim_slash(connection_.gamma_api_url) + "/events/slug/" + escape(slug);
    HttpResponse response = http_get(url);

    if (response.status == 404) {
        return std::nullopt;
    }
    if (response.status >= 400) {
        throw std::runtime_error(fmt::format("Gamma lookup for {} returned HTTP {}", slug, response.status));
    }

    auto j = nlohmann::json::parse(response.body);
    auto market = parse_gamma_event(j);
    if (market && market->slug.empty()) {
        market->slug = slug;
    }
    return market;
}

Market PolymarketClient::get_market(const std::string& condition_id) {
    std::string url = trim_slash(connection_.clob_api_url) + "/markets/" + escape(condition_id);
    HttpResponse response = http_get(url);

    if (response.status >= 400) {
        throw std::runtime_error(fmt::format("CLOB market {} returned HTTP {}", condition_id, response.status));
    }

    try {
        return parse_clob_market(nlohmann::json::parse(response.body));
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(fmt::format("Unexpected CLOB market response for {}: {}", condition_id, e.what()));
    }
}

std::optional<Quote> PolymarketClient::get_best_prices(const std::string& token_id) {
    std::string url = trim_slash(connection_.clob_api_url) + "/book?token_id=" + escape(token_id);
    HttpResponse response = http_get(url);

    if (response.status >= 400) {
        throw std::runtime_error(fmt::format("CLOB book for {} returned HTTP {}", token_id, response.status));
    }

    auto j = nlohmann::json::parse(response.body);
    static const nlohmann::json empty = nlohmann::json::array();
    const auto& bids = j.contains("bids") && j.at("bids").is_array() ? j.at("bids") : empty;
    const auto& asks = j.contains("asks") && j.at("asks").is_array() ? j.at("asks") : empty;

    QuoteUpdate best = best_from_levels(bids, asks);
    if (!best.ask) {
        return std::nullopt;
    }
    return Quote{best.bid, best.ask};
}

OrderResponse PolymarketClient::place_order(const OrderRequest& request) {
    if (!has_credentials()) {
        throw ConfigurationError("Live order placement needs api_key, api_secret and api_passphrase");
    }

    OrderResponse response;
    try {
        nlohmann::json body = {
            {"order", {
                {"tokenID", request.token_id},
                {"side", side_to_string(request.side)},
                {"price", fmt::format("{:.4f}", request.price)},
                {"size", fmt::format("{:.2f}", request.size)}
            }},
            {"owner", credentials_.api_key},
            {"orderType", order_type_to_string(request.type)}
        };

        const std::string path = "/order";
        std::string payload = body.dump();
        HttpResponse http = http_post(trim_slash(connection_.clob_api_url) + path, payload,
                                      l2_headers("POST", path, payload));

        auto j = nlohmann::json::parse(http.body, nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            response.error_message = fmt::format("HTTP {}: unparseable response", http.status);
            return response;
        }

        std::string order_id = j.value("orderID", j.value("orderId", ""));
        bool accepted = j.value("success", !order_id.empty());
        if (http.status < 400 && accepted && !order_id.empty()) {
            response.success = true;
            response.order_id = order_id;
        } else {
            std::string message = j.value("errorMsg", j.value("error", j.value("message", "")));
            response.error_message = fmt::format("HTTP {}: {}", http.status, message.empty() ? "order rejected" : message);
        }
    } catch (const std::exception& e) {
        response.error_message = e.what();
    }

    if (!response.success) {
        spdlog::error("Order for {} @ {:.4f} x {} failed: {}", request.token_id, request.price, request.size,
                      response.error_message);
    }
    return response;
}

} // namespace tarb
