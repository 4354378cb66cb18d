#include "worktree/core/ContractViolation.hpp"
#include "worktree/log/TaggedLogger.hpp"

#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <iostream>

namespace WT {

namespace {
std::atomic<ContractViolationHandler> gHandler{&abortingContractViolationHandler};

auto formatViolation(ContractViolation const& violation) -> std::string {
    auto const file = std::filesystem::path{violation.location.file_name()}.filename().string();
    return "WorkTree contract violation: " + violation.message + " (" + file + ":" + std::to_string(violation.location.line()) + ")";
}
} // namespace

auto abortingContractViolationHandler(ContractViolation const& violation) -> void {
    std::cerr << formatViolation(violation) << std::endl;
    std::abort();
}

auto throwingContractViolationHandler(ContractViolation const& violation) -> void {
    throw ContractViolationError(violation.message, violation.location);
}

auto setContractViolationHandler(ContractViolationHandler handler) -> ContractViolationHandler {
    if (handler == nullptr) {
        handler = &abortingContractViolationHandler;
    }
    return gHandler.exchange(handler, std::memory_order_acq_rel);
}

auto contractViolationHandler() -> ContractViolationHandler {
    return gHandler.load(std::memory_order_acquire);
}

auto contractViolation(std::string message, std::source_location location) -> void {
    wt_log("Contract violation: " + message, "Error");
    ContractViolation const violation{std::move(message), location};
    contractViolationHandler()(violation);
    // The handler declined to unwind or terminate.
    std::cerr << formatViolation(violation) << std::endl;
    std::abort();
}

} // namespace WT
