#include <catch2/catch_test_macros.hpp>

#include "CancellableOperations.hpp"
#include "EnhancementErrors.hpp"
#include "TaskDispatch.hpp"

#include <atomic>
#include <stdexcept>

TEST_CASE("CancellationToken throws once cancelled") {
    CancellationToken token;
    CHECK_FALSE(token.is_cancelled());
    CHECK_NOTHROW(token.throw_if_cancelled());

    token.cancel();
    CHECK(token.is_cancelled());
    CHECK_THROWS_AS(token.throw_if_cancelled(), OperationCancelled);
}

TEST_CASE("Starting an operation cancels the previous one under the same key") {
    OperationSlots slots;
    auto first = slots.begin("load");
    auto other = slots.begin("test");
    auto second = slots.begin("load");

    CHECK(first->is_cancelled());
    CHECK_FALSE(second->is_cancelled());
    CHECK_FALSE(other->is_cancelled());
    CHECK_FALSE(slots.is_current("load", first));
    CHECK(slots.is_current("load", second));

    CHECK_FALSE(slots.finish("load", first));
    CHECK(slots.active("load"));
    CHECK(slots.finish("load", second));
    CHECK_FALSE(slots.active("load"));
    CHECK_FALSE(slots.finish("load", second));
}

TEST_CASE("Cancelled slots are cleared") {
    OperationSlots slots;
    auto load = slots.begin("load");
    auto test = slots.begin("test");

    slots.cancel("load");
    CHECK(load->is_cancelled());
    CHECK_FALSE(slots.active("load"));
    CHECK_FALSE(slots.finish("load", load));
    CHECK_FALSE(slots.empty());

    slots.cancel("missing");
    slots.cancel_all();
    CHECK(test->is_cancelled());
    CHECK(slots.empty());
}

TEST_CASE("InlineExecutor runs tasks immediately") {
    InlineExecutor executor;
    int runs = 0;
    executor.post([&]() { ++runs; });
    executor.post({});
    CHECK(runs == 1);
}

TEST_CASE("ThreadExecutor runs every task and reports idle") {
    ThreadExecutor executor;
    std::atomic<int> runs{0};
    for (int i = 0; i < 8; ++i) {
        executor.post([&runs]() { ++runs; });
    }
    executor.post([]() { throw std::runtime_error("task failure is logged"); });

    executor.wait_idle();
    CHECK(executor.idle());
    CHECK(runs.load() == 8);

    executor.post([&runs]() { ++runs; });
    executor.wait_idle();
    CHECK(runs.load() == 9);
}
