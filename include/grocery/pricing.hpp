#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <grpcpp/grpcpp.h>
#include "grocery/pricing.grpc.pb.h"
#include "grocery/pricing.pb.h"
#include "catalog.hpp"
#include "types.hpp"

namespace grocery {

/**
 * Σ unit_price(item) × qty, rounded to cents. Unknown items cost nothing.
 */
double calculate_total(const Catalog& catalog, const std::vector<LineItem>& items);

/**
 * Answer a PriceRequest the way the pricing service does.
 */
PriceResponse price_request(const Catalog& catalog, const PriceRequest& request);

/**
 * Downstream pricing collaborator as seen by the coordinator.
 */
class PricingClient {
public:
    virtual ~PricingClient() = default;

    /**
     * @throws GroceryError on any failure; callers degrade to a zero price
     */
    virtual double total_price(const std::vector<LineItem>& items) = 0;
};

/**
 * PricingClient over gRPC.
 *
 * Example:
 *   auto pricing = GrpcPricingClient::connect("localhost:50052");
 *   double total = pricing->total_price({{"milk", 2}});
 */
class GrpcPricingClient : public PricingClient {
public:
    static constexpr std::chrono::milliseconds DEFAULT_DEADLINE{2000};

    static std::unique_ptr<GrpcPricingClient> connect(
        const std::string& endpoint, std::chrono::milliseconds deadline = DEFAULT_DEADLINE);

    explicit GrpcPricingClient(std::shared_ptr<grpc::Channel> channel,
                               std::chrono::milliseconds deadline = DEFAULT_DEADLINE);

    /**
     * @throws GrpcError if the call fails
     * @throws CollaboratorError if the service answers with a non-OK code
     */
    double total_price(const std::vector<LineItem>& items) override;

private:
    std::unique_ptr<PricingService::Stub> stub_;
    std::chrono::milliseconds deadline_;
};

} // namespace grocery
