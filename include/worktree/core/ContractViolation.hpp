#pragma once
#include <source_location>
#include <stdexcept>
#include <string>

namespace WT {

/**
 * Programmer errors that leave the workflow tree in an unverifiable state:
 * duplicate child or side-effect keys within one render pass, reentrant action
 * application, use of a RenderContext after its pass ended, host calls made off
 * the loop thread.
 *
 * contractViolation() never returns. It logs, then hands the violation to the
 * installed handler. The default handler prints to stderr and aborts; a handler
 * that returns is followed by std::abort(). Tests install
 * throwingContractViolationHandler to observe violations as exceptions.
 */
struct ContractViolation {
    std::string          message;
    std::source_location location;
};

class ContractViolationError : public std::logic_error {
public:
    ContractViolationError(std::string const& message, std::source_location location)
        : std::logic_error(message), location_(location) {}

    [[nodiscard]] auto location() const noexcept -> std::source_location const& { return location_; }

private:
    std::source_location location_;
};

using ContractViolationHandler = void (*)(ContractViolation const&);

auto abortingContractViolationHandler(ContractViolation const& violation) -> void;
auto throwingContractViolationHandler(ContractViolation const& violation) -> void;

// Returns the previously installed handler. Passing nullptr restores the aborting handler.
auto setContractViolationHandler(ContractViolationHandler handler) -> ContractViolationHandler;
[[nodiscard]] auto contractViolationHandler() -> ContractViolationHandler;

[[noreturn]] auto contractViolation(std::string message,
                                    std::source_location location = std::source_location::current()) -> void;

class ScopedContractViolationHandler {
public:
    explicit ScopedContractViolationHandler(ContractViolationHandler handler)
        : previous(setContractViolationHandler(handler)) {}
    ~ScopedContractViolationHandler() { setContractViolationHandler(previous); }

    ScopedContractViolationHandler(ScopedContractViolationHandler const&)            = delete;
    ScopedContractViolationHandler& operator=(ScopedContractViolationHandler const&) = delete;

private:
    ContractViolationHandler previous;
};

} // namespace WT

#define WT_REQUIRE(condition, message)                  \
    do {                                                \
        if (!(condition)) {                             \
            ::WT::contractViolation((message));         \
        }                                               \
    } while (false)
