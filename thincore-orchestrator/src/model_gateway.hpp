/**
 * @file model_gateway.hpp
 * @brief Boundary to the language-model service
 *
 * Prompt construction and response parsing happen behind the gateway; the
 * core only forwards input hashes and params and stores the bytes it gets
 * back together with the reported cost.
 */

#ifndef THINCORE_MODEL_GATEWAY_HPP
#define THINCORE_MODEL_GATEWAY_HPP

#include "hash/content_hash.hpp"
#include "api/http_client.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace thincore {

/**
 * @brief One completion request
 */
struct GatewayRequest {
    std::string run_id;
    std::string task_key;
    std::string task_type;
    std::vector<std::string> input_hashes;
    artifacts::Bytes params;
};

/**
 * @brief Completion response
 */
struct GatewayResponse {
    artifacts::Bytes body;
    std::string content_type;
    int64_t cost_units;          ///< Reported cost, negative when the gateway did not report one

    GatewayResponse() : cost_units(-1) {}
};

/**
 * @brief Model gateway interface
 */
class ModelGateway {
public:
    virtual ~ModelGateway() = default;

    /**
     * @throws TransientIOError if the gateway is unreachable
     * @throws TaskExecutionError if the gateway rejects the request
     */
    virtual GatewayResponse complete(const GatewayRequest& request) = 0;

    virtual std::string describe() const = 0;
};

/**
 * @brief Gateway reached over HTTP
 *
 * POST <base_url>/v1/complete with a JSON body
 *   {"run_id", "task_key", "task_type", "input_hashes": [...], "params_hex"}
 * The raw response body is the completion; the X-Cost-Units header carries
 * the charged cost in units.
 */
class HttpModelGateway : public ModelGateway {
public:
    explicit HttpModelGateway(const std::string& base_url, int timeout_ms = 120000);

    GatewayResponse complete(const GatewayRequest& request) override;
    std::string describe() const override;

    void set_retry_policy(const artifacts::RetryPolicy& policy) { client_->set_retry_policy(policy); }

private:
    std::unique_ptr<artifacts::HttpClient> client_;
};

} // namespace thincore

#endif // THINCORE_MODEL_GATEWAY_HPP
