/**
 * @file EventLogTest.cpp
 * @brief Unit tests for EventLog ordering and publishing
 */

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "application/EventLog.hpp"
#include "../mocks/RecordingEventPublisher.hpp"

using namespace arena;
using namespace arena::application;
using namespace arena::tests;
using domain::EventKind;

class EventLogTest : public ::testing::Test {
protected:
    void SetUp() override {
        publisher_ = std::make_shared<RecordingEventPublisher>();
        log_ = std::make_shared<EventLog>(publisher_);
    }

    domain::EventLogEntry add(const std::string& account, EventKind kind, const std::string& ref) {
        return log_->append(account, kind, ref, R"({"ref":")" + ref + R"("})", now_);
    }

    std::shared_ptr<RecordingEventPublisher> publisher_;
    std::shared_ptr<EventLog> log_;
    domain::Timestamp now_ = domain::Timestamp::fromUnixMillis(1'765'929'600'000);
};

// ============================================
// Ordering
// ============================================

TEST_F(EventLogTest, Offsets_AreGlobalAndContiguous) {
    EXPECT_EQ(add("acc-1", EventKind::PURCHASE, "wop-1").offset, 0u);
    EXPECT_EQ(add("acc-2", EventKind::PURCHASE, "wop-2").offset, 1u);
    EXPECT_EQ(add("acc-1", EventKind::ROUND, "match-1").offset, 2u);
    EXPECT_EQ(log_->size(), 3u);
}

TEST_F(EventLogTest, SequenceNumbers_PerAccountFromOne) {
    auto a1 = add("acc-1", EventKind::PURCHASE, "wop-1");
    auto b1 = add("acc-2", EventKind::PURCHASE, "wop-2");
    auto a2 = add("acc-1", EventKind::ROUND, "match-1");
    auto a3 = add("acc-1", EventKind::CASHOUT, "wop-3");

    EXPECT_EQ(a1.sequenceNumber, 1u);
    EXPECT_EQ(b1.sequenceNumber, 1u);
    EXPECT_EQ(a2.sequenceNumber, 2u);
    EXPECT_EQ(a3.sequenceNumber, 3u);
}

TEST_F(EventLogTest, EntriesFor_ReturnsOnlyAccountInOrder) {
    add("acc-1", EventKind::PURCHASE, "wop-1");
    add("acc-2", EventKind::PURCHASE, "wop-2");
    add("acc-1", EventKind::ROUND, "match-1");

    auto entries = log_->entriesFor("acc-1");
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].referenceId, "wop-1");
    EXPECT_EQ(entries[1].referenceId, "match-1");
    EXPECT_TRUE(log_->entriesFor("acc-3").empty());
}

TEST_F(EventLogTest, EntriesSince_ResumesFromOffset) {
    add("acc-1", EventKind::PURCHASE, "wop-1");
    add("acc-1", EventKind::ROUND, "match-1");
    add("acc-1", EventKind::ROUND, "match-2");

    auto tail = log_->entriesSince(1);
    ASSERT_EQ(tail.size(), 2u);
    EXPECT_EQ(tail[0].offset, 1u);
    EXPECT_EQ(tail[1].referenceId, "match-2");
    EXPECT_TRUE(log_->entriesSince(3).empty());
}

// ============================================
// Publishing
// ============================================

TEST_F(EventLogTest, Append_PublishesWithRoutingKey) {
    add("acc-1", EventKind::PURCHASE, "wop-1");
    add("acc-1", EventKind::ROUND, "match-1");
    add("acc-1", EventKind::CASHOUT, "wop-2");

    auto messages = publisher_->getPublishedMessages();
    ASSERT_EQ(messages.size(), 3u);
    EXPECT_EQ(messages[0].routingKey, "arena.purchase");
    EXPECT_EQ(messages[1].routingKey, "arena.round");
    EXPECT_EQ(messages[2].routingKey, "arena.cashout");

    auto json = nlohmann::json::parse(messages[1].message);
    EXPECT_EQ(json["offset"], 1);
    EXPECT_EQ(json["sequenceNumber"], 2);
    EXPECT_EQ(json["referenceId"], "match-1");
    EXPECT_EQ(json["payload"]["ref"], "match-1");
}

TEST_F(EventLogTest, PublisherFailure_EntryStillRecorded) {
    publisher_->setFailing(true);

    EXPECT_NO_THROW(add("acc-1", EventKind::ROUND, "match-1"));
    EXPECT_EQ(log_->size(), 1u);
    EXPECT_EQ(publisher_->publishCallCount(), 0);

    publisher_->setFailing(false);
    EXPECT_EQ(add("acc-1", EventKind::ROUND, "match-2").sequenceNumber, 2u);
}

TEST_F(EventLogTest, NullPublisher_Allowed) {
    EventLog silent(nullptr);
    auto entry = silent.append("acc-1", EventKind::ROUND, "match-1", "{}", now_);
    EXPECT_EQ(entry.offset, 0u);
}
