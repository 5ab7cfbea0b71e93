#include <gtest/gtest.h>
#include <sandpool/call_in_destructor.hh>
#include <stdexcept>

// NOLINTNEXTLINE
TEST(CallInDtor, calls_upon_scope_exit) {
    int calls = 0;
    {
        CallInDtor guard{[&]() noexcept { ++calls; }};
        EXPECT_TRUE(guard.active());
        EXPECT_EQ(calls, 0);
    }
    EXPECT_EQ(calls, 1);
}

// NOLINTNEXTLINE
TEST(CallInDtor, calls_when_an_exception_leaves_the_scope) {
    int calls = 0;
    EXPECT_THROW(
        {
            CallInDtor guard{[&]() noexcept { ++calls; }};
            throw std::runtime_error("startup failed");
        },
        std::runtime_error
    );
    EXPECT_EQ(calls, 1);
}

// NOLINTNEXTLINE
TEST(CallInDtor, cancel) {
    int calls = 0;
    {
        CallInDtor guard{[&]() noexcept { ++calls; }};
        guard.cancel();
        EXPECT_FALSE(guard.active());
    }
    EXPECT_EQ(calls, 0);
}
