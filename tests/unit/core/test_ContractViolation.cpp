#include "WorkTreeTestHelper.hpp"

#include <doctest/doctest.h>
#include "worktree/core/ContractViolation.hpp"

#include <string>

using namespace WT;

namespace {
ContractViolation lastSeen;
int               seenCount = 0;

void recordAndThrow(ContractViolation const& violation) {
    lastSeen = violation;
    ++seenCount;
    throw ContractViolationError(violation.message, violation.location);
}
} // namespace

TEST_SUITE("core.contract_violation") {

TEST_CASE("the throwing handler raises ContractViolationError") {
    test::ThrowingContractViolations throwing;
    CHECK_THROWS_AS(contractViolation("boom"), ContractViolationError);
    CHECK_THROWS_WITH(contractViolation("described"), "described");
}

TEST_CASE("WT_REQUIRE only fires when the condition fails") {
    test::ThrowingContractViolations throwing;
    CHECK_NOTHROW(WT_REQUIRE(1 + 1 == 2, "arithmetic"));
    CHECK_THROWS_AS(WT_REQUIRE(1 + 1 == 3, "arithmetic"), ContractViolationError);
}

TEST_CASE("custom handlers receive the message and call site") {
    seenCount = 0;
    ScopedContractViolationHandler scoped(&recordAndThrow);
    CHECK(contractViolationHandler() == &recordAndThrow);

    CHECK_THROWS_AS(contractViolation("located"), ContractViolationError);
    CHECK(seenCount == 1);
    CHECK(lastSeen.message == "located");
    CHECK(std::string(lastSeen.location.file_name()).find("test_ContractViolation.cpp") != std::string::npos);
}

TEST_CASE("scoped handlers restore the previous handler") {
    auto const before = contractViolationHandler();
    {
        test::ThrowingContractViolations throwing;
        CHECK(contractViolationHandler() == &throwingContractViolationHandler);
    }
    CHECK(contractViolationHandler() == before);
}

TEST_CASE("setting a null handler restores the aborting one") {
    auto previous = setContractViolationHandler(&throwingContractViolationHandler);
    setContractViolationHandler(nullptr);
    CHECK(contractViolationHandler() == &abortingContractViolationHandler);
    setContractViolationHandler(previous);
}

}
