#include "grocery/catalog.hpp"
#include "grocery/logging.hpp"
#include "grocery/pricing.grpc.pb.h"
#include "grocery/pricing.hpp"
#include <grpcpp/grpcpp.h>

namespace pricing {

class PricingServiceImpl final : public grocery::PricingService::Service {
public:
    explicit PricingServiceImpl(const grocery::Catalog& catalog)
        : catalog_(catalog) {}

    grpc::Status GetTotalPrice(grpc::ServerContext* context,
                               const grocery::PriceRequest* request,
                               grocery::PriceResponse* response) override {
        *response = grocery::price_request(catalog_, *request);
        grocery::log_info("pricing", "total_calculated",
            {{"line_items", request->items_size()}, {"total_price", response->total_price()}});
        return grpc::Status::OK;
    }

private:
    const grocery::Catalog& catalog_;
};

std::unique_ptr<grocery::PricingService::Service> create_pricing_service() {
    return std::make_unique<PricingServiceImpl>(grocery::Catalog::standard());
}

}  // namespace pricing
