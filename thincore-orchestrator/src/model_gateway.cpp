/**
 * @file model_gateway.cpp
 * @brief HTTP model gateway
 */

#include "model_gateway.hpp"
#include "logger.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>

using json = nlohmann::json;

namespace thincore {

namespace {

const char* COMPLETE_PATH = "/v1/complete";
const char* COST_HEADER = "x-cost-units";

std::string lower(const std::string& value) {
    std::string result = value;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // namespace

HttpModelGateway::HttpModelGateway(const std::string& base_url, int timeout_ms)
    : client_(std::make_unique<artifacts::HttpClient>(base_url, timeout_ms))
{
    if (base_url.empty()) {
        throw ConfigurationError("Model gateway URL cannot be empty");
    }
}

GatewayResponse HttpModelGateway::complete(const GatewayRequest& request) {
    json body;
    body["run_id"] = request.run_id;
    body["task_key"] = request.task_key;
    body["task_type"] = request.task_type;
    body["input_hashes"] = request.input_hashes;
    body["params_hex"] = artifacts::to_hex(request.params);

    artifacts::HttpResponse response;
    try {
        response = client_->post(COMPLETE_PATH, body.dump(), {{"Content-Type", "application/json"}});
    } catch (const artifacts::HttpClientError& e) {
        throw TaskExecutionError("Model gateway rejected task " + request.task_key + ": " + e.what());
    }

    GatewayResponse result;
    result.body = std::move(response.body);
    for (const auto& [name, value] : response.headers) {
        std::string key = lower(name);
        if (key == COST_HEADER) {
            try {
                result.cost_units = std::stoll(value);
            } catch (const std::logic_error&) {
                throw TaskExecutionError("Model gateway sent a malformed cost header: '" + value + "'");
            }
            if (result.cost_units < 0) {
                throw TaskExecutionError("Model gateway reported a negative cost: " + value);
            }
        } else if (key == "content-type") {
            result.content_type = value;
        }
    }
    return result;
}

std::string HttpModelGateway::describe() const {
    return Logger::mask_url(client_->base_url());
}

} // namespace thincore
