#include <doctest/doctest.h>
#include <aistrack/util/event.hpp>
#include <aistrack/validate/validator.hpp>

using namespace aistrack;

TEST_CASE("Event carries batch outcomes") {
    Event<const validate::ValidationReport &> on_validated;

    validate::ValidationReport report;
    report.input_rows = 10;
    report.invalid_geodata = 3;

    SUBCASE("subscribers see the report emitted") {
        usize kept = 0;
        usize dropped = 0;
        on_validated.subscribe([&](const validate::ValidationReport &r) { kept += r.retained(); });
        on_validated.subscribe([&](const validate::ValidationReport &r) { dropped += r.dropped(); });
        on_validated.emit(report);
        CHECK(kept == 7);
        CHECK(dropped == 3);
        CHECK(on_validated.count() == 2);
    }

    SUBCASE("no subscribers is fine") {
        on_validated.emit(report);
        CHECK(on_validated.count() == 0);
    }

    SUBCASE("unsubscribed handler stays silent") {
        usize batches = 0;
        auto id = on_validated.subscribe([&](const validate::ValidationReport &) { ++batches; });
        CHECK(id != util::NO_SUBSCRIPTION);
        on_validated.emit(report);
        CHECK(on_validated.unsubscribe(id));
        CHECK_FALSE(on_validated.unsubscribe(id));
        on_validated.emit(report);
        CHECK(batches == 1);
    }
}

TEST_CASE("Event with error payload") {
    Event<const Error &> on_failed;
    ErrorCode seen = ErrorCode::Ok;
    dp::String message;
    on_failed.subscribe([&](const Error &e) {
        seen = e.code;
        message = e.message;
    });
    on_failed.emit(Error(ErrorCode::SinkError, "disk full"));
    CHECK(seen == ErrorCode::SinkError);
    CHECK(message == "disk full");
}
