#include "grocery/pricing.hpp"

#include <cstdio>
#include "grocery/errors.hpp"
#include "grocery/helpers.hpp"

namespace grocery {

double calculate_total(const Catalog& catalog, const std::vector<LineItem>& items) {
    double total = 0.0;
    for (const auto& line : items) {
        total += catalog.unit_price(line.item) * line.qty;
    }
    return helpers::round_cents(total);
}

PriceResponse price_request(const Catalog& catalog, const PriceRequest& request) {
    double total = calculate_total(catalog, helpers::to_line_items(request.items()));

    char message[64];
    std::snprintf(message, sizeof(message), "Total: $%.2f", total);

    PriceResponse response;
    response.set_code(OK);
    response.set_message(message);
    response.set_total_price(total);
    return response;
}

std::unique_ptr<GrpcPricingClient> GrpcPricingClient::connect(
    const std::string& endpoint, std::chrono::milliseconds deadline) {
    auto channel = grpc::CreateChannel(helpers::format_endpoint(endpoint),
                                       grpc::InsecureChannelCredentials());
    return std::make_unique<GrpcPricingClient>(channel, deadline);
}

GrpcPricingClient::GrpcPricingClient(std::shared_ptr<grpc::Channel> channel,
                                     std::chrono::milliseconds deadline)
    : stub_(PricingService::NewStub(channel)), deadline_(deadline) {}

double GrpcPricingClient::total_price(const std::vector<LineItem>& items) {
    PriceRequest request;
    helpers::append_items(items, request.mutable_items());

    PriceResponse response;
    grpc::ClientContext context;
    context.set_deadline(std::chrono::system_clock::now() + deadline_);
    auto status = stub_->GetTotalPrice(&context, request, &response);
    if (!status.ok()) {
        throw GrpcError(status.error_message(), status.error_code());
    }
    if (response.code() != OK) {
        throw CollaboratorError("Pricing rejected request: " + response.message());
    }
    return response.total_price();
}

} // namespace grocery
