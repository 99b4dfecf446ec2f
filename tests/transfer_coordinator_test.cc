#include "test_support.h"
#include <core/transfer/transfer_service.h>
#include <gtest/gtest.h>

using namespace shuttle::core;
using namespace shuttle::test;

using Kind = SurfaceCall::Kind;
using Steps = std::vector<ScriptedTransfer::Step>;

class TransferCoordinatorTest : public ::testing::Test {
protected:
    TransferId start(TransferDirection direction, std::string name, Steps steps) {
        return service_.StartTransfer(
            std::make_unique<ScriptedTransfer>(direction, std::move(name), std::move(steps)));
    }

    std::vector<int> progressValues(TransferId id) const {
        std::vector<int> values;
        for (const auto& call : surface_.CallsFor(id)) {
            if (call.kind == Kind::kUpdate && call.state->progress) {
                values.push_back(*call.state->progress);
            }
        }
        return values;
    }

    IoContextRunner runner_;
    RecordingSurface surface_;
    std::atomic<bool> sound_enabled_{false};
    TransferService service_{runner_.ioc(),
                             surface_,
                             [this] { return sound_enabled_.load(); },
                             std::chrono::milliseconds(200)};
};

TEST_F(TransferCoordinatorTest, ReceiveScenarioUpdatesLiveThenAnnouncesResult) {
    auto id = start(TransferDirection::kReceive,
                    "Phone",
                    {{event::Connect{}},
                     {event::TransferHeader{3}},
                     {event::Progress{50}},
                     {event::Success{}},
                     {event::Finish{}}});
    ASSERT_NE(id, kInvalidTransferId);
    ASSERT_TRUE(surface_.WaitForStop(id));

    auto live = surface_.CallsFor(id);
    ASSERT_EQ(live.size(), 5u);

    EXPECT_EQ(live[0].kind, Kind::kStart);
    EXPECT_EQ(live[0].state->body, "Receiving from Phone...");
    EXPECT_TRUE(live[0].state->indeterminate());
    EXPECT_EQ(live[0].state->icon, NotificationIcon::kDownload);
    EXPECT_FALSE(live[0].state->play_sound);
    ASSERT_EQ(live[0].state->actions.size(), 1u);
    EXPECT_EQ(live[0].state->actions[0].operation, "StopTransfer");
    EXPECT_EQ(live[0].state->actions[0].transfer_id, id);

    EXPECT_EQ(live[1].kind, Kind::kUpdate);
    EXPECT_EQ(live[1].state->body, "Receiving from Phone...");
    EXPECT_EQ(live[2].kind, Kind::kUpdate);
    EXPECT_EQ(live[2].state->body, "Receiving from Phone...");

    EXPECT_EQ(live[3].kind, Kind::kUpdate);
    EXPECT_EQ(live[3].state->progress.value_or(-1), 50);
    EXPECT_EQ(live[3].state->body, "Receiving from Phone...");

    EXPECT_EQ(live[4].kind, Kind::kStop);

    auto results = surface_.UpdatesExcept({id});
    ASSERT_EQ(results.size(), 1u);
    EXPECT_NE(results[0].id, id);
    EXPECT_GT(results[0].id, id);
    EXPECT_EQ(results[0].state->body, "Transfer succeeded with Phone");
    EXPECT_EQ(results[0].state->icon, NotificationIcon::kDownloadDone);
    EXPECT_TRUE(results[0].state->actions.empty());
    // the result is published before the live notification is retired
    EXPECT_LE(results[0].at, live[4].at);

    EXPECT_FALSE(service_.IsActive(id));
}

TEST_F(TransferCoordinatorTest, SendScenarioSwitchesFromConnectingToSending) {
    auto id = start(TransferDirection::kSend,
                    "Laptop",
                    {{event::Connect{}},
                     {event::TransferHeader{2}},
                     {event::Success{}},
                     {event::Finish{}}});
    ASSERT_TRUE(surface_.WaitForStop(id));

    auto live = surface_.CallsFor(id);
    // the header of an outgoing transfer is only logged
    ASSERT_EQ(live.size(), 3u);
    EXPECT_EQ(live[0].state->body, "Connecting to Laptop...");
    EXPECT_EQ(live[0].state->icon, NotificationIcon::kUpload);
    EXPECT_EQ(live[1].state->body, "Sending to Laptop...");
    EXPECT_FALSE(live[1].state->play_sound);
    EXPECT_EQ(live[2].kind, Kind::kStop);

    auto results = surface_.UpdatesExcept({id});
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].state->icon, NotificationIcon::kUploadDone);
}

TEST_F(TransferCoordinatorTest, ErrorMessageIsShownVerbatim) {
    sound_enabled_ = true;
    auto id = start(TransferDirection::kReceive,
                    "Phone",
                    {{event::Connect{}},
                     {event::Progress{10}},
                     {event::Error{"connection reset"}},
                     {event::Finish{}}});
    ASSERT_TRUE(surface_.WaitForStop(id));

    auto results = surface_.UpdatesExcept({id});
    ASSERT_EQ(results.size(), 1u);
    EXPECT_NE(results[0].id, id);
    EXPECT_NE(results[0].state->body.find("connection reset"), std::string::npos);
    EXPECT_NE(results[0].state->body.find("Phone"), std::string::npos);
    EXPECT_TRUE(results[0].state->play_sound);
    EXPECT_FALSE(service_.IsActive(id));
}

TEST_F(TransferCoordinatorTest, EachOutcomeGetsItsOwnNotificationId) {
    auto succeeded = start(TransferDirection::kSend,
                           "A",
                           {{event::Connect{}}, {event::Success{}}, {event::Finish{}}});
    auto failed = start(TransferDirection::kSend,
                        "B",
                        {{event::Connect{}}, {event::Error{"refused"}}, {event::Finish{}}});
    ASSERT_TRUE(surface_.WaitForStop(succeeded));
    ASSERT_TRUE(surface_.WaitForStop(failed));

    auto results = surface_.UpdatesExcept({succeeded, failed});
    ASSERT_EQ(results.size(), 2u);
    EXPECT_NE(results[0].id, results[1].id);
    for (const auto& result : results) {
        EXPECT_NE(result.id, succeeded);
        EXPECT_NE(result.id, failed);
    }
}

TEST_F(TransferCoordinatorTest, SoundPreferenceIsReadForEveryResult) {
    auto quiet = start(TransferDirection::kSend, "A", {{event::Success{}}, {event::Finish{}}});
    ASSERT_TRUE(surface_.WaitForStop(quiet));

    sound_enabled_ = true;
    auto loud = start(TransferDirection::kSend, "B", {{event::Success{}}, {event::Finish{}}});
    ASSERT_TRUE(surface_.WaitForStop(loud));

    auto results = surface_.UpdatesExcept({quiet, loud});
    ASSERT_EQ(results.size(), 2u);
    EXPECT_FALSE(results[0].state->play_sound);
    EXPECT_TRUE(results[1].state->play_sound);
}

TEST_F(TransferCoordinatorTest, ProgressBurstIsThrottledAndTrailingValuePublished) {
    auto id = start(TransferDirection::kSend,
                    "Laptop",
                    {{event::Connect{}},
                     {event::Progress{10}},
                     {event::Progress{20}},
                     {event::Progress{30}},
                     {event::Progress{40}},
                     {event::Success{}, std::chrono::milliseconds(600)},
                     {event::Finish{}}});
    ASSERT_TRUE(surface_.WaitForStop(id));

    EXPECT_EQ(progressValues(id), (std::vector<int>{10, 40}));

    std::vector<std::chrono::steady_clock::time_point> published;
    for (const auto& call : surface_.CallsFor(id)) {
        if (call.kind == Kind::kUpdate && call.state->progress) {
            published.push_back(call.at);
        }
    }
    ASSERT_EQ(published.size(), 2u);
    EXPECT_GE(published[1] - published[0], std::chrono::milliseconds(180));
}

TEST_F(TransferCoordinatorTest, SteadyProgressStaysWithinOneUpdatePerWindow) {
    Steps steps{{event::Connect{}}};
    for (int progress = 5; progress <= 100; progress += 5) {
        steps.push_back({event::Progress{progress}, std::chrono::milliseconds(50)});
    }
    steps.push_back({event::Success{}, std::chrono::milliseconds(500)});
    steps.push_back({event::Finish{}});

    auto id = start(TransferDirection::kReceive, "Phone", std::move(steps));
    ASSERT_TRUE(surface_.WaitForStop(id, std::chrono::seconds(10)));

    std::vector<SurfaceCall> progress_updates;
    for (const auto& call : surface_.CallsFor(id)) {
        if (call.kind == Kind::kUpdate && call.state->progress) {
            progress_updates.push_back(call);
        }
    }
    ASSERT_GE(progress_updates.size(), 2u);
    // 20 events over about a second cannot produce more than one update per 200 ms window
    EXPECT_LT(progress_updates.size(), 10u);
    for (std::size_t i = 1; i < progress_updates.size(); ++i) {
        EXPECT_GE(progress_updates[i].at - progress_updates[i - 1].at,
                  std::chrono::milliseconds(180));
        EXPECT_GE(*progress_updates[i].state->progress, *progress_updates[i - 1].state->progress);
    }
    EXPECT_EQ(*progress_updates.back().state->progress, 100);
}

TEST_F(TransferCoordinatorTest, ProgressIsClampedToPercentRange) {
    auto id = start(TransferDirection::kReceive,
                    "Phone",
                    {{event::Progress{150}}, {event::Success{}}, {event::Finish{}}});
    ASSERT_TRUE(surface_.WaitForStop(id));
    EXPECT_EQ(progressValues(id), (std::vector<int>{100}));
}

TEST_F(TransferCoordinatorTest, ThrottledProgressIsDroppedOnOutcome) {
    auto id = start(TransferDirection::kSend,
                    "Laptop",
                    {{event::Connect{}},
                     {event::Progress{10}},
                     {event::Progress{90}},
                     {event::Success{}},
                     {event::Finish{}}});
    ASSERT_TRUE(surface_.WaitForStop(id));
    std::this_thread::sleep_for(std::chrono::milliseconds(300));

    EXPECT_EQ(progressValues(id), (std::vector<int>{10}));
    EXPECT_EQ(surface_.CallsFor(id).back().kind, Kind::kStop);
}

TEST_F(TransferCoordinatorTest, StopAfterFinishIsIgnored) {
    auto transfer = std::make_unique<ScriptedTransfer>(
        TransferDirection::kSend,
        "Laptop",
        Steps{{event::Connect{}}, {event::Success{}}, {event::Finish{}}});
    auto stop_count = transfer->stop_count();
    auto id = service_.StartTransfer(std::move(transfer));
    ASSERT_TRUE(surface_.WaitForStop(id));

    EXPECT_FALSE(service_.IsActive(id));
    EXPECT_NO_THROW(service_.StopTransfer(id));
    EXPECT_EQ(stop_count->load(), 0);
}

TEST_F(TransferCoordinatorTest, EventsAfterFinishAreIgnored) {
    auto id = start(TransferDirection::kSend,
                    "Laptop",
                    {{event::Success{}},
                     {event::Finish{}},
                     {event::Progress{10}},
                     {event::Error{"late"}}});
    ASSERT_TRUE(surface_.WaitForStop(id));
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    EXPECT_EQ(surface_.CallsFor(id).back().kind, Kind::kStop);
    EXPECT_EQ(surface_.UpdatesExcept({id}).size(), 1u);
}

TEST_F(TransferCoordinatorTest, SecondOutcomeIsIgnored) {
    auto id = start(TransferDirection::kSend,
                    "Laptop",
                    {{event::Success{}}, {event::Error{"twice"}}, {event::Finish{}}});
    ASSERT_TRUE(surface_.WaitForStop(id));

    auto results = surface_.UpdatesExcept({id});
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].state->body, "Transfer succeeded with Laptop");
}

TEST_F(TransferCoordinatorTest, SurfaceFailuresDoNotBreakTheTransfer) {
    surface_.set_fail_updates(true);
    auto id = start(TransferDirection::kReceive,
                    "Phone",
                    {{event::Connect{}}, {event::Progress{50}}, {event::Success{}}, {event::Finish{}}});
    ASSERT_TRUE(surface_.WaitForStop(id));
    EXPECT_FALSE(service_.IsActive(id));
    EXPECT_EQ(service_.ActiveTransferCount(), 0u);
}

TEST_F(TransferCoordinatorTest, CrashingEngineIsReportedAsError) {
    auto transfer = std::make_unique<ScriptedTransfer>(TransferDirection::kSend,
                                                       "Laptop",
                                                       Steps{{event::Connect{}}});
    transfer->set_run_error("engine crashed");
    auto id = service_.StartTransfer(std::move(transfer));
    ASSERT_TRUE(surface_.WaitForStop(id));

    auto results = surface_.UpdatesExcept({id});
    ASSERT_EQ(results.size(), 1u);
    EXPECT_NE(results[0].state->body.find("engine crashed"), std::string::npos);
    EXPECT_FALSE(service_.IsActive(id));
}

TEST_F(TransferCoordinatorTest, CrashAfterFinishKeepsTheReportedOutcome) {
    auto transfer = std::make_unique<ScriptedTransfer>(
        TransferDirection::kSend,
        "Laptop",
        Steps{{event::Success{}}, {event::Finish{}}});
    transfer->set_run_error("cleanup failed");
    auto id = service_.StartTransfer(std::move(transfer));
    ASSERT_TRUE(surface_.WaitForStop(id));
    service_.Join();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    auto results = surface_.UpdatesExcept({id});
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].state->body, "Transfer succeeded with Laptop");
}

TEST_F(TransferCoordinatorTest, EngineReturningWithoutFinishIsRetired) {
    auto id = start(TransferDirection::kReceive, "Phone", {{event::Progress{20}}, {event::Success{}}});
    ASSERT_TRUE(surface_.WaitForStop(id));
    EXPECT_FALSE(service_.IsActive(id));

    auto results = surface_.UpdatesExcept({id});
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].state->body, "Transfer succeeded with Phone");
}
