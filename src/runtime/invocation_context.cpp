#include <spdlog/spdlog.h>
#include <crowdfund/runtime/invocation_context.hpp>

namespace crowdfund::runtime {

void invocation_context::log(std::string message) {
  spdlog::info("Program log: {}", message);
  logs.push_back(std::move(message));
}

void invocation_context::emit(
    std::string type,
    std::vector<crowdfund::schema::transaction_event_attribute_t> attributes) {
  events.push_back(crowdfund::schema::transaction_event_t{
      .type = std::move(type), .attributes = std::move(attributes)});
}

}  // namespace crowdfund::runtime
