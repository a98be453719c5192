#include "TestSupport.hpp"

#include "common/utils/ExceptionHandler.hpp"

TEST_SUITE("AppExceptionHandler") {

TEST_CASE("concurrency conflicts map to 409 with version details") {
    auto json = AppExceptionHandler::toJson(ConcurrencyError("o-1", 3, 5));
    CHECK(json["status"].asInt() == 409);
    CHECK(json["code"].asInt() == ErrorCodes::CONCURRENCY_CONFLICT);
    CHECK(json["details"]["aggregateId"].asString() == "o-1");
    CHECK(json["details"]["expectedVersion"].asInt64() == 3);
    CHECK(json["details"]["actualVersion"].asInt64() == 5);
}

TEST_CASE("replay errors carry the failing version") {
    auto json = AppExceptionHandler::toJson(ReplayError("o-1", 7, "gap"));
    CHECK(json["status"].asInt() == 500);
    CHECK(json["code"].asInt() == ErrorCodes::REPLAY_FAILED);
    CHECK(json["details"]["version"].asInt64() == 7);
}

TEST_CASE("application errors keep their code and status") {
    auto notFound = AppExceptionHandler::toJson(NotFoundException("订单不存在"));
    CHECK(notFound["status"].asInt() == 404);
    CHECK(notFound["message"].asString() == "订单不存在");
    CHECK_FALSE(notFound.isMember("details"));

    auto invalid = AppExceptionHandler::toJson(ValidationException("bad"));
    CHECK(invalid["code"].asInt() == ErrorCodes::BAD_REQUEST);
    CHECK(invalid["status"].asInt() == 400);
}

TEST_CASE("unknown exceptions are hidden behind a generic 500") {
    auto json = AppExceptionHandler::toJson(std::runtime_error("secret detail"));
    CHECK(json["status"].asInt() == 500);
    CHECK(json["code"].asInt() == ErrorCodes::INTERNAL_ERROR);
    CHECK(json["message"].asString().find("secret") == std::string::npos);
}

}
