#include "dockpulse/selection_resolver.hpp"

#include <memory>

#include "dockpulse/telemetry.hpp"
#include "gtest/gtest.h"

namespace dockpulse {
namespace {

DockerSnapshot sampleSnapshot() {
    DockerSnapshot snapshot;
    snapshot.containers = std::make_shared<const ContainerList>(ContainerList{
        {"c1", "redis", "Up 2 hours", "6379/tcp"},
        {"c2", "builder", "Exited (0) 1 day ago", "--"},
        {"c3", "web", "Up 5 minutes", "0.0.0.0:80->80/tcp"},
    });
    snapshot.images = std::make_shared<const ImageList>(ImageList{
        {"redis", "7", "sha256:ab$c;12 3", "41MB"},
        {"nginx", "latest", "9f8e7d", "180MB"},
    });
    StatRecord stat;
    stat.name = "redis";
    stat.cpuText = "1.5%";
    stat.memUsageText = "10MiB / 1GiB";
    snapshot.stats = std::make_shared<const StatList>(StatList{stat});
    snapshot.compose = std::make_shared<const ComposeList>(ComposeList{
        {"shop", "running(2)", "/srv/shop/compose.yml"},
    });
    return snapshot;
}

class SelectionResolverTest : public ::testing::Test {
protected:
    void SetUp() override { Telemetry::instance().reset(); }

    DockerSnapshot snapshot_ = sampleSnapshot();
    FilterState filters_;
    SelectionResolver resolver_;
};

TEST_F(SelectionResolverTest, ContainerEntriesUseIdAsKeyAndNameAsTarget) {
    const QVector<SelectionEntry> entries =
        resolver_.getEntries(DockerView::Containers, snapshot_, filters_);
    ASSERT_EQ(entries.size(), 3);
    EXPECT_EQ(entries[0].kind, SelectionKind::Container);
    EXPECT_EQ(entries[0].key, "c1");
    EXPECT_EQ(entries[0].title, "redis");
    EXPECT_EQ(entries[0].subtitle, "Up 2 hours");
    EXPECT_EQ(entries[0].target, QString("redis"));
}

TEST_F(SelectionResolverTest, StatusFilterUsesRunningClassifier) {
    filters_.status = StatusFilter::Running;
    QVector<SelectionEntry> entries = resolver_.getEntries(DockerView::Containers, snapshot_, filters_);
    ASSERT_EQ(entries.size(), 2);
    EXPECT_EQ(entries[0].key, "c1");
    EXPECT_EQ(entries[1].key, "c3");

    filters_.status = StatusFilter::Exited;
    entries = resolver_.getEntries(DockerView::Containers, snapshot_, filters_);
    ASSERT_EQ(entries.size(), 1);
    EXPECT_EQ(entries[0].key, "c2");
}

TEST_F(SelectionResolverTest, SearchIsCaseInsensitiveOverViewFields) {
    filters_.search = "  REDIS ";
    EXPECT_EQ(resolver_.getEntries(DockerView::Containers, snapshot_, filters_).size(), 1);
    EXPECT_EQ(resolver_.getEntries(DockerView::Images, snapshot_, filters_).size(), 1);
    EXPECT_EQ(resolver_.getEntries(DockerView::Stats, snapshot_, filters_).size(), 1);
    EXPECT_TRUE(resolver_.getEntries(DockerView::Compose, snapshot_, filters_).isEmpty());

    filters_.search = "80->80";
    EXPECT_EQ(resolver_.getEntries(DockerView::Containers, snapshot_, filters_).size(), 1);
    filters_.search = "compose.yml";
    EXPECT_EQ(resolver_.getEntries(DockerView::Compose, snapshot_, filters_).size(), 1);
    filters_.search = "latest";
    EXPECT_EQ(resolver_.getEntries(DockerView::Images, snapshot_, filters_).size(), 1);
}

TEST_F(SelectionResolverTest, StatAndComposeEntriesHaveNoTarget) {
    const QVector<SelectionEntry> stats = resolver_.getEntries(DockerView::Stats, snapshot_, filters_);
    ASSERT_EQ(stats.size(), 1);
    EXPECT_EQ(stats[0].key, "redis");
    EXPECT_FALSE(stats[0].target.has_value());

    const QVector<SelectionEntry> compose = resolver_.getEntries(DockerView::Compose, snapshot_, filters_);
    ASSERT_EQ(compose.size(), 1);
    EXPECT_EQ(compose[0].subtitle, "running(2)");
    EXPECT_FALSE(compose[0].target.has_value());
}

TEST_F(SelectionResolverTest, ImageEntryTitleAndNormalizedTarget) {
    const QVector<SelectionEntry> entries = resolver_.getEntries(DockerView::Images, snapshot_, filters_);
    ASSERT_EQ(entries.size(), 2);
    EXPECT_EQ(entries[0].title, "redis:7");
    EXPECT_EQ(entries[0].key, "sha256:ab$c;12 3");
    EXPECT_EQ(entries[0].target, QString("abc123"));
}

TEST_F(SelectionResolverTest, NormalizeImageTarget) {
    EXPECT_EQ(SelectionResolver::normalizeImageTarget("sha256:0a1b2c"), QString("0a1b2c"));
    EXPECT_EQ(SelectionResolver::normalizeImageTarget("  9f8e7d  "), QString("9f8e7d"));
    EXPECT_EQ(SelectionResolver::normalizeImageTarget("abc`rm -rf`"), QString("abcrm-rf"));
    EXPECT_EQ(SelectionResolver::normalizeImageTarget("SHA512:ff00"), QString("ff00"));
    EXPECT_EQ(SelectionResolver::normalizeImageTarget("ab12:34cd"), QString("ab1234cd"));
    EXPECT_EQ(SelectionResolver::normalizeImageTarget("md5:ab12"), QString("md5ab12"));
    EXPECT_FALSE(SelectionResolver::normalizeImageTarget("--").has_value());
    EXPECT_FALSE(SelectionResolver::normalizeImageTarget("   ").has_value());
    EXPECT_FALSE(SelectionResolver::normalizeImageTarget("sha256:$$").has_value());
}

TEST_F(SelectionResolverTest, NormalizeSelectionKeepsPreviousWhenStillListed) {
    const WorkbenchSelection previous{SelectionKind::Container, "c3"};
    const auto selection =
        resolver_.normalizeSelection(DockerView::Containers, snapshot_, filters_, previous);
    ASSERT_TRUE(selection.has_value());
    EXPECT_EQ(*selection, previous);
}

TEST_F(SelectionResolverTest, NormalizeSelectionFallsBackToFirstEntry) {
    const WorkbenchSelection gone{SelectionKind::Container, "c9"};
    auto selection = resolver_.normalizeSelection(DockerView::Containers, snapshot_, filters_, gone);
    ASSERT_TRUE(selection.has_value());
    EXPECT_EQ(selection->key, "c1");

    const WorkbenchSelection wrongKind{SelectionKind::Container, "c1"};
    selection = resolver_.normalizeSelection(DockerView::Images, snapshot_, filters_, wrongKind);
    ASSERT_TRUE(selection.has_value());
    EXPECT_EQ(selection->kind, SelectionKind::Image);
    EXPECT_EQ(selection->key, "sha256:ab$c;12 3");

    selection = resolver_.normalizeSelection(DockerView::Stats, snapshot_, filters_, std::nullopt);
    ASSERT_TRUE(selection.has_value());
    EXPECT_EQ(selection->key, "redis");
}

TEST_F(SelectionResolverTest, NormalizeSelectionIsEmptyWithoutEntries) {
    filters_.search = "no-such-thing";
    const WorkbenchSelection previous{SelectionKind::Container, "c1"};
    EXPECT_FALSE(resolver_.normalizeSelection(DockerView::Containers, snapshot_, filters_, previous)
                     .has_value());
}

TEST_F(SelectionResolverTest, FindEntryRequiresMatchingKind) {
    EXPECT_TRUE(resolver_.findEntry(
        DockerView::Stats, snapshot_, filters_, WorkbenchSelection{SelectionKind::Stat, "redis"})
                    .has_value());
    EXPECT_FALSE(resolver_.findEntry(
        DockerView::Stats, snapshot_, filters_, WorkbenchSelection{SelectionKind::Container, "redis"})
                     .has_value());
    EXPECT_FALSE(resolver_.findEntry(DockerView::Stats, snapshot_, filters_, std::nullopt).has_value());
}

TEST_F(SelectionResolverTest, ImageSelectionOnlyResolvesImageActions) {
    const WorkbenchSelection image{SelectionKind::Image, "sha256:ab$c;12 3"};
    EXPECT_FALSE(resolver_.resolveActionTarget(
        DockerAction::Rm, DockerView::Images, snapshot_, filters_, image).has_value());
    EXPECT_EQ(
        resolver_.resolveActionTarget(DockerAction::Rmi, DockerView::Images, snapshot_, filters_, image),
        QString("abc123"));
    EXPECT_EQ(
        resolver_.resolveActionTarget("run", DockerView::Images, snapshot_, filters_, image),
        QString("abc123"));
    EXPECT_EQ(Telemetry::instance().counter("selection.target_rejected"), 1);
}

TEST_F(SelectionResolverTest, ContainerSelectionOnlyResolvesContainerActions) {
    const WorkbenchSelection container{SelectionKind::Container, "c3"};
    for (DockerAction action :
         {DockerAction::Start, DockerAction::Stop, DockerAction::Restart, DockerAction::Logs, DockerAction::Rm}) {
        EXPECT_EQ(
            resolver_.resolveActionTarget(action, DockerView::Containers, snapshot_, filters_, container),
            QString("web"));
    }
    EXPECT_FALSE(resolver_.resolveActionTarget(
        DockerAction::Rmi, DockerView::Containers, snapshot_, filters_, container).has_value());
    EXPECT_FALSE(resolver_.resolveActionTarget(
        DockerAction::Run, DockerView::Containers, snapshot_, filters_, container).has_value());
}

TEST_F(SelectionResolverTest, HiddenOrUnknownSelectionHasNoTarget) {
    filters_.status = StatusFilter::Exited;
    const WorkbenchSelection running{SelectionKind::Container, "c1"};
    EXPECT_FALSE(resolver_.resolveActionTarget(
        DockerAction::Stop, DockerView::Containers, snapshot_, filters_, running).has_value());

    EXPECT_FALSE(resolver_.resolveActionTarget(
        "explode", DockerView::Containers, snapshot_, FilterState{}, running).has_value());
    EXPECT_FALSE(resolver_.resolveActionTarget(
        DockerAction::Logs, DockerView::Stats, snapshot_, FilterState{},
        WorkbenchSelection{SelectionKind::Stat, "redis"}).has_value());
}

}  // namespace
}  // namespace dockpulse
