#include "dockpulse/running_set_cache.hpp"

#include <memory>

#include "dockpulse/telemetry.hpp"
#include "gtest/gtest.h"

namespace dockpulse {
namespace {

class RunningSetCacheTest : public ::testing::Test {
protected:
    void SetUp() override { Telemetry::instance().reset(); }

    qint64 recomputes() const { return Telemetry::instance().counter("running_cache.recomputes"); }

    qint64 nowMs_ = 10000;
    RunningSetCache cache_{3000, [this]() { return nowMs_; }};
};

TEST_F(RunningSetCacheTest, InPlaceEditIsInvisibleUntilClear) {
    auto items = std::make_shared<ContainerList>(ContainerList{{"1", "web", "Up 1m", "--"}});

    EXPECT_TRUE(cache_.ensure(items).contains("1"));

    (*items)[0].status = "Exited";
    nowMs_ += 1000;
    EXPECT_TRUE(cache_.ensure(items).contains("1"));
    EXPECT_EQ(recomputes(), 1);

    cache_.clear();
    EXPECT_TRUE(cache_.runningIds().isEmpty());
    EXPECT_FALSE(cache_.ensure(items).contains("1"));
    EXPECT_EQ(recomputes(), 2);
}

TEST_F(RunningSetCacheTest, ExpiresAfterTtl) {
    auto items = std::make_shared<ContainerList>(ContainerList{{"1", "web", "Up 1m", "--"}});
    cache_.ensure(items);

    (*items)[0].status = "Exited";
    nowMs_ += 2999;
    EXPECT_TRUE(cache_.ensure(items).contains("1"));

    nowMs_ += 1;
    EXPECT_FALSE(cache_.ensure(items).contains("1"));
}

TEST_F(RunningSetCacheTest, NewListInstanceRecomputes) {
    auto first = std::make_shared<const ContainerList>(ContainerList{{"1", "web", "Up 1m", "--"}});
    auto second = std::make_shared<const ContainerList>(ContainerList{{"1", "web", "Exited (0)", "--"}});

    EXPECT_TRUE(cache_.ensure(first).contains("1"));
    EXPECT_FALSE(cache_.ensure(second).contains("1"));
    EXPECT_EQ(recomputes(), 2);
}

TEST_F(RunningSetCacheTest, RepeatedCallsHitTheCache) {
    auto items = std::make_shared<const ContainerList>(ContainerList{
        {"1", "web", "Up 1m", "--"},
        {"2", "db", "Exited (1)", "--"},
        {"3", "job", "running", "--"},
    });
    for (int i = 0; i < 5; ++i) {
        cache_.ensure(items);
    }
    EXPECT_EQ(recomputes(), 1);
    EXPECT_EQ(Telemetry::instance().counter("running_cache.hits"), 4);
    EXPECT_EQ(cache_.runningIds(), (QSet<QString>{"1", "3"}));
}

TEST_F(RunningSetCacheTest, NullListIsEmpty) {
    EXPECT_TRUE(cache_.ensure(nullptr).isEmpty());
}

TEST(RunningSetCacheStandaloneTest, ZeroTtlAlwaysRecomputes) {
    qint64 now = 0;
    RunningSetCache cache(0, [&now]() { return now; });
    auto items = std::make_shared<ContainerList>(ContainerList{{"1", "web", "Up", "--"}});
    EXPECT_TRUE(cache.ensure(items).contains("1"));
    (*items)[0].status = "Exited";
    EXPECT_FALSE(cache.ensure(items).contains("1"));
}

}  // namespace
}  // namespace dockpulse
