#include "dockpulse/dashboard_engine.hpp"

#include <QCoreApplication>
#include <QElapsedTimer>
#include <QJsonArray>

#include "dockpulse/telemetry.hpp"
#include "gtest/gtest.h"

namespace dockpulse {
namespace {

RawOutputs sampleOutputs() {
    RawOutputs outputs;
    outputs.containers =
        "CONTAINER ID\tNAMES\tSTATUS\tPORTS\n"
        "c1\tapi\tUp 1 hour\t8080/tcp\n"
        "c2\tworker\tUp 2 hours\t--\n"
        "c3\tmigrate\tExited (0) 3 days ago\t--";
    outputs.images =
        "REPOSITORY\tTAG\tIMAGE ID\tSIZE\n"
        "api\tv2\tsha256:feed01\t95MB\n"
        "postgres\t16\tsha256:beef02\t410MB";
    outputs.stats =
        "NAME\tCPU %\tMEM USAGE / LIMIT\tNET I/O\n"
        "api\t40%\t512MiB / 1GiB\t1MB / 1MB\n"
        "worker\t75%\t128MiB / 1GiB\t0B / 0B\n"
        "migrate\t5%\t--\t--";
    return outputs;
}

QJsonObject actionRow(const QJsonObject& response, const QString& action) {
    for (const QJsonValue& value : response.value("actions").toArray()) {
        if (value.toObject().value("action").toString() == action) {
            return value.toObject();
        }
    }
    return {};
}

void pumpEventsFor(int ms) {
    QElapsedTimer timer;
    timer.start();
    while (timer.elapsed() < ms) {
        QCoreApplication::processEvents(QEventLoop::AllEvents, 5);
    }
}

class DashboardEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        Telemetry::instance().reset();
        engine_.refresh(sampleOutputs());
    }

    qint64 nowMs_ = 0;
    DashboardEngine engine_{EngineConfig{}, [this]() { return nowMs_; }};
};

TEST_F(DashboardEngineTest, RefreshSelectsFirstEntry) {
    ASSERT_TRUE(engine_.selection().has_value());
    EXPECT_EQ(engine_.selection()->kind, SelectionKind::Container);
    EXPECT_EQ(engine_.selection()->key, "c1");
    EXPECT_EQ(engine_.actionTarget(DockerAction::Stop), QString("api"));
}

TEST_F(DashboardEngineTest, SelectionSurvivesRefreshWhileListed) {
    engine_.select({SelectionKind::Container, "c2"});
    engine_.refresh(sampleOutputs());
    ASSERT_TRUE(engine_.selection().has_value());
    EXPECT_EQ(engine_.selection()->key, "c2");
}

TEST_F(DashboardEngineTest, FilterHidingSelectionMovesToFirstVisible) {
    engine_.select({SelectionKind::Container, "c1"});
    engine_.setFilters({QString(), StatusFilter::Exited});
    ASSERT_TRUE(engine_.selection().has_value());
    EXPECT_EQ(engine_.selection()->key, "c3");

    engine_.setFilters({"nothing-matches", StatusFilter::All});
    EXPECT_FALSE(engine_.selection().has_value());
    EXPECT_FALSE(engine_.actionTarget(DockerAction::Logs).has_value());
}

TEST_F(DashboardEngineTest, SwitchingToImagesRetargetsActions) {
    engine_.setView(DockerView::Images);
    ASSERT_TRUE(engine_.selection().has_value());
    EXPECT_EQ(engine_.selection()->kind, SelectionKind::Image);
    EXPECT_EQ(engine_.selection()->key, "sha256:feed01");

    EXPECT_EQ(engine_.actionTarget(DockerAction::Rmi), QString("feed01"));
    EXPECT_FALSE(engine_.actionTarget(DockerAction::Rm).has_value());

    const ActionState rm = engine_.actionState(DockerAction::Rm, std::nullopt);
    EXPECT_TRUE(rm.disabled);
    EXPECT_EQ(rm.reason, QString("Selection does not support this action"));
    EXPECT_FALSE(rm.target.has_value());

    const ActionState run = engine_.actionState(DockerAction::Run, std::nullopt);
    EXPECT_FALSE(run.disabled);
    EXPECT_EQ(run.target, QString("feed01"));
}

TEST_F(DashboardEngineTest, PendingCommandDisablesEveryAction) {
    const ActionState start = engine_.actionState(DockerAction::Start, QString("stop"));
    EXPECT_TRUE(start.disabled);
    EXPECT_EQ(start.reason, QString("Another command is running"));
}

TEST_F(DashboardEngineTest, RunningFilterFollowsReplacedContainers) {
    engine_.setFilters({QString(), StatusFilter::Running});
    EXPECT_EQ(engine_.entries().size(), 2);

    nowMs_ += 1000;
    engine_.replaceSource(
        SourceKind::Containers,
        "CONTAINER ID\tNAMES\tSTATUS\tPORTS\nc1\tapi\tExited (137) 1 second ago\t--");
    EXPECT_TRUE(engine_.entries().isEmpty());
    EXPECT_FALSE(engine_.selection().has_value());

    engine_.setFilters({QString(), StatusFilter::Exited});
    EXPECT_EQ(engine_.entries().size(), 1);
}

TEST_F(DashboardEngineTest, RankingFollowsDimensionAndTopN) {
    engine_.setTopN(3);
    EXPECT_EQ(engine_.rankedView().names(), QStringList({"worker", "api", "migrate"}));

    engine_.setRankDimension(RankDimension::Mem);
    EXPECT_EQ(engine_.rankedView().names(), QStringList({"api", "worker", "migrate"}));

    engine_.setTopN(7);
    EXPECT_EQ(engine_.topN(), 3);
}

TEST_F(DashboardEngineTest, UpdateRankingDiffsAgainstPreviousRows) {
    engine_.setTopN(3);
    QVector<RowInstruction> rows = engine_.updateRanking();
    ASSERT_EQ(rows.size(), 3);
    for (const RowInstruction& row : rows) {
        EXPECT_EQ(row.op, RowOp::Enter);
    }

    engine_.replaceSource(
        SourceKind::Stats,
        "NAME\tCPU %\tMEM USAGE / LIMIT\tNET I/O\n"
        "api\t90%\t512MiB / 1GiB\t1MB / 1MB\n"
        "cache\t20%\t64MiB / 1GiB\t--");
    rows = engine_.updateRanking();

    ASSERT_EQ(rows.size(), 4);
    EXPECT_EQ(rows[0].op, RowOp::Exit);
    EXPECT_EQ(rows[0].name, "worker");
    EXPECT_EQ(rows[1].op, RowOp::Exit);
    EXPECT_EQ(rows[1].name, "migrate");
    EXPECT_EQ(rows[2].op, RowOp::Update);
    EXPECT_EQ(rows[2].name, "api");
    EXPECT_EQ(rows[3].op, RowOp::Enter);
    EXPECT_EQ(rows[3].name, "cache");
}

TEST_F(DashboardEngineTest, BuildResponseDescribesDashboard) {
    engine_.setView(DockerView::Images);
    const QJsonObject response = engine_.buildResponse();

    EXPECT_EQ(response.value("view").toString(), "images");
    EXPECT_EQ(response.value("entries").toArray().size(), 2);
    EXPECT_EQ(response.value("selection").toObject().value("kind").toString(), "image");
    EXPECT_EQ(response.value("summary").toObject().value("running_containers").toInt(), 2);

    const QJsonObject rmi = actionRow(response, "rmi");
    EXPECT_FALSE(rmi.value("disabled").toBool());
    EXPECT_TRUE(rmi.value("danger").toBool());
    EXPECT_EQ(rmi.value("target").toString(), "feed01");

    const QJsonObject stop = actionRow(response, "stop");
    EXPECT_TRUE(stop.value("disabled").toBool());
    EXPECT_TRUE(stop.value("target").isNull());
    EXPECT_EQ(Telemetry::instance().counter("selection.target_rejected"), 0);

    const QJsonObject counters = response.value("telemetry").toObject().value("counters").toObject();
    EXPECT_EQ(counters.value("snapshot.generations").toInt(), 1);
    EXPECT_EQ(counters.value("dashboard.responses").toInt(), 1);
}

TEST_F(DashboardEngineTest, DebounceWindowComesFromConfig) {
    EXPECT_EQ(engine_.searchDebouncer().delayMs(), 100);

    EngineConfig config;
    config.searchDebounceMs = 15;
    DashboardEngine engine(config);
    EXPECT_EQ(engine.searchDebouncer().delayMs(), 15);
}

TEST(DashboardEngineSearchTest, ScheduledSearchAppliesAfterWindow) {
    EngineConfig config;
    config.searchDebounceMs = 10;
    DashboardEngine engine(config);
    engine.refresh(sampleOutputs());
    engine.setFilters({QString(), StatusFilter::Running});

    engine.scheduleSearch("wor");
    engine.scheduleSearch("worker");
    EXPECT_TRUE(engine.filters().search.isEmpty());

    pumpEventsFor(150);
    EXPECT_EQ(engine.filters().search, "worker");
    EXPECT_EQ(engine.filters().status, StatusFilter::Running);
    ASSERT_TRUE(engine.selection().has_value());
    EXPECT_EQ(engine.selection()->key, "c2");
}

TEST(DashboardEngineSearchTest, CancelledSearchLeavesFiltersAlone) {
    EngineConfig config;
    config.searchDebounceMs = 10;
    DashboardEngine engine(config);
    engine.refresh(sampleOutputs());

    engine.scheduleSearch("api");
    engine.cancelSearch();
    pumpEventsFor(100);
    EXPECT_TRUE(engine.filters().search.isEmpty());
    EXPECT_EQ(engine.entries().size(), 3);
}

}  // namespace
}  // namespace dockpulse
