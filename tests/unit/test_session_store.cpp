#include <gtest/gtest.h>

#include "footfall/session/session_store.hpp"

using namespace footfall;
using namespace std::chrono_literals;

class SessionStoreTest : public ::testing::Test {
protected:
    Timestamp at(std::chrono::milliseconds offset) const {
        return t0_ + offset;
    }

    SessionStore store_;
    Timestamp t0_ = Timestamp{} + 1000s;
};

TEST_F(SessionStoreTest, EntryCreatesSession) {
    store_.on_entry(4, at(0ms));

    const Session* session = store_.find(4);
    ASSERT_NE(session, nullptr);
    EXPECT_EQ(session->session_id, "CUST_001");
    EXPECT_EQ(session->person_id, 4);
    EXPECT_EQ(session->entry_time, at(0ms));
    EXPECT_FALSE(session->exit_time.has_value());
    EXPECT_EQ(session->events, (std::vector<std::string>{"ENTRY"}));
    EXPECT_EQ(session->state(), SessionState::ACTIVE);
    EXPECT_EQ(store_.session_id(4), std::optional<std::string>("CUST_001"));
}

TEST_F(SessionStoreTest, SessionIdsAreSequential) {
    store_.on_entry(10, at(0ms));
    store_.on_entry(3, at(1ms));
    store_.on_entry(10, at(2ms));

    EXPECT_EQ(store_.session_id(10), std::optional<std::string>("CUST_001"));
    EXPECT_EQ(store_.session_id(3), std::optional<std::string>("CUST_002"));
    EXPECT_EQ(store_.size(), 2u);
}

TEST_F(SessionStoreTest, ObserveAloneCreatesNothing) {
    store_.observe(1, at(0ms));
    EXPECT_EQ(store_.size(), 0u);
    EXPECT_FALSE(store_.session_id(1).has_value());
}

TEST_F(SessionStoreTest, ExitWithoutSessionIsNoOp) {
    store_.on_exit(1, at(0ms));
    store_.on_zone_entry(1, "counter", at(0ms));
    store_.on_zone_exit(1, "counter", at(0ms));

    EXPECT_EQ(store_.size(), 0u);
    EXPECT_EQ(store_.find(1), nullptr);
}

TEST_F(SessionStoreTest, ExitClosesSession) {
    store_.on_entry(1, at(0ms));
    store_.on_exit(1, at(3000ms));

    const Session* session = store_.find(1);
    ASSERT_NE(session, nullptr);
    EXPECT_EQ(session->exit_time, at(3000ms));
    EXPECT_EQ(session->events, (std::vector<std::string>{"ENTRY", "EXIT"}));
    EXPECT_EQ(session->state(), SessionState::CLOSED);
}

TEST_F(SessionStoreTest, ClosedSessionIsNeverReopened) {
    store_.on_entry(1, at(0ms));
    store_.on_exit(1, at(1000ms));
    store_.on_entry(1, at(2000ms));
    store_.on_exit(1, at(3000ms));

    const Session* session = store_.find(1);
    ASSERT_NE(session, nullptr);
    EXPECT_EQ(session->entry_time, at(0ms));
    EXPECT_EQ(session->exit_time, at(1000ms));
    EXPECT_EQ(session->events, (std::vector<std::string>{"ENTRY", "EXIT", "ENTRY", "EXIT"}));
    EXPECT_EQ(session->state(), SessionState::CLOSED);
    EXPECT_EQ(store_.size(), 1u);
}

TEST_F(SessionStoreTest, InactiveSessionAutoExits) {
    store_.on_entry(1, at(0ms));
    store_.observe(1, at(1000ms));

    EXPECT_EQ(store_.mark_inactive_if_not_seen(at(7000ms)), 1u);

    const Session* session = store_.find(1);
    ASSERT_NE(session, nullptr);
    EXPECT_EQ(session->exit_time, at(1000ms));
    EXPECT_EQ(session->events.back(), "AUTO_EXIT");

    // Terminal: a second sweep changes nothing
    EXPECT_EQ(store_.mark_inactive_if_not_seen(at(20000ms)), 0u);
    EXPECT_EQ(session->events.size(), 2u);
}

TEST_F(SessionStoreTest, TimeoutIsStrict) {
    store_.on_entry(1, at(0ms));

    EXPECT_EQ(store_.mark_inactive_if_not_seen(at(5000ms)), 0u);
    EXPECT_EQ(store_.mark_inactive_if_not_seen(at(5001ms)), 1u);
}

TEST_F(SessionStoreTest, ObservationKeepsSessionAlive) {
    store_.on_entry(1, at(0ms));
    for (int s = 1; s <= 20; ++s) {
        store_.observe(1, at(std::chrono::milliseconds(s * 1000)));
        store_.mark_inactive_if_not_seen(at(std::chrono::milliseconds(s * 1000)));
    }

    EXPECT_EQ(store_.find(1)->state(), SessionState::ACTIVE);
}

TEST_F(SessionStoreTest, ActiveSessions) {
    store_.on_entry(1, at(0ms));
    store_.on_entry(2, at(0ms));
    store_.on_entry(3, at(0ms));
    store_.on_exit(2, at(1000ms));
    store_.observe(3, at(4000ms));

    auto active = store_.active_sessions(at(6000ms));

    // 1 timed out, 2 exited, 3 seen 2 s ago
    ASSERT_EQ(active.size(), 1u);
    EXPECT_EQ(active[0].person_id, 3);
    EXPECT_EQ(store_.find(1)->events.back(), "AUTO_EXIT");
}

TEST_F(SessionStoreTest, AllSessionsInCreationOrder) {
    store_.on_entry(9, at(0ms));
    store_.on_entry(2, at(1ms));
    store_.on_entry(5, at(2ms));

    const auto& all = store_.all_sessions();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].person_id, 9);
    EXPECT_EQ(all[1].person_id, 2);
    EXPECT_EQ(all[2].person_id, 5);
}

TEST_F(SessionStoreTest, ZoneEntryIsIdempotentWhileOpen) {
    store_.on_entry(1, at(0ms));
    store_.on_zone_entry(1, "counter", at(100ms));
    store_.on_zone_entry(1, "counter", at(200ms));

    const Session* session = store_.find(1);
    ASSERT_EQ(session->zone_visits.size(), 1u);
    EXPECT_EQ(session->zone_visits[0].entry_time, at(100ms));
    EXPECT_TRUE(session->zone_visits[0].is_open());
}

TEST_F(SessionStoreTest, ZoneVisitsOpenAndClose) {
    store_.on_entry(1, at(0ms));
    store_.on_zone_entry(1, "counter", at(100ms));
    store_.on_zone_exit(1, "counter", at(500ms));
    store_.on_zone_entry(1, "counter", at(800ms));
    store_.on_zone_entry(1, "shelf", at(900ms));
    store_.on_zone_exit(1, "shelf", at(950ms));

    const Session* session = store_.find(1);
    ASSERT_EQ(session->zone_visits.size(), 3u);
    EXPECT_EQ(session->zone_visits[0].exit_time, at(500ms));
    EXPECT_TRUE(session->zone_visits[1].is_open());
    EXPECT_EQ(session->zone_visits[2].zone_name, "shelf");
    EXPECT_EQ(session->zone_visits[2].exit_time, at(950ms));
}

TEST_F(SessionStoreTest, ExitClosesOpenZoneVisits) {
    store_.on_entry(1, at(0ms));
    store_.on_zone_entry(1, "counter", at(100ms));
    store_.on_zone_entry(1, "shelf", at(200ms));
    store_.on_zone_exit(1, "shelf", at(300ms));
    store_.on_exit(1, at(1000ms));

    const Session* session = store_.find(1);
    ASSERT_EQ(session->zone_visits.size(), 2u);
    EXPECT_EQ(session->zone_visits[0].exit_time, at(1000ms));
    EXPECT_EQ(session->zone_visits[1].exit_time, at(300ms));
}

TEST_F(SessionStoreTest, AutoExitClosesOpenZoneVisits) {
    store_.on_entry(1, at(0ms));
    store_.on_zone_entry(1, "counter", at(100ms));
    store_.observe(1, at(1000ms));

    EXPECT_EQ(store_.mark_inactive_if_not_seen(at(7000ms)), 1u);

    const Session* session = store_.find(1);
    ASSERT_EQ(session->zone_visits.size(), 1u);
    EXPECT_FALSE(session->zone_visits[0].is_open());
    EXPECT_EQ(session->zone_visits[0].exit_time, at(1000ms));

    // A later visit to the same zone is recorded separately
    store_.on_zone_entry(1, "counter", at(8000ms));
    ASSERT_EQ(session->zone_visits.size(), 2u);
    EXPECT_TRUE(session->zone_visits[1].is_open());
}

TEST_F(SessionStoreTest, ZoneExitWithoutOpenVisitIsNoOp) {
    store_.on_entry(1, at(0ms));
    store_.on_zone_exit(1, "counter", at(100ms));
    EXPECT_TRUE(store_.find(1)->zone_visits.empty());
}

TEST_F(SessionStoreTest, CustomTimeout) {
    store_.set_inactivity_timeout(1000ms);
    store_.on_entry(1, at(0ms));

    EXPECT_EQ(store_.mark_inactive_if_not_seen(at(1500ms)), 1u);
}
