#include "conductor/notify/notification_outbox.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <string>
#include <vector>

using namespace conductor;

class NotificationOutboxTest : public ::testing::Test {
protected:
  auto subscribe(NotificationType type,
                 std::optional<IntegrationId> integration = std::nullopt)
      -> NotificationId {
    auto id = outbox_.subscribe(
        NotificationSubscription{.id = {},
                                 .tenant = tenant_,
                                 .integration = std::move(integration),
                                 .type = type,
                                 .target_config = R"({"channel":"#ops"})",
                                 .active = true,
                                 .trigger_count = 0,
                                 .last_triggered_at = std::nullopt});
    EXPECT_TRUE(id.has_value());
    return id.value_or(NotificationId{});
  }

  auto event(NotificationType type,
             std::optional<IntegrationId> integration = std::nullopt)
      -> NotificationEvent {
    return NotificationEvent{.tenant = tenant_,
                             .integration = std::move(integration),
                             .type = type,
                             .message = "something happened",
                             .details = R"({"k":"v"})"};
  }

  ManualClock clock_{test::epoch()};
  NotificationOutbox outbox_{clock_, 3};
  TenantId tenant_{"acme"};
};

TEST_F(NotificationOutboxTest, UnmatchedEventProducesUntargetedRecord) {
  EXPECT_EQ(outbox_.emit(event(NotificationType::PipelineFailed)), 1u);
  auto records = outbox_.drain();
  ASSERT_EQ(records.size(), 1u);
  EXPECT_FALSE(records[0].subscription.has_value());
  EXPECT_TRUE(records[0].target_config.empty());
  EXPECT_EQ(records[0].triggered_at, test::epoch());
  EXPECT_EQ(outbox_.pending(), 0u);
}

TEST_F(NotificationOutboxTest, FansOutToMatchingSubscriptions) {
  auto all = subscribe(NotificationType::WebhookFailed);
  auto github = subscribe(NotificationType::WebhookFailed, IntegrationId("gh"));
  subscribe(NotificationType::WebhookFailed, IntegrationId("gitlab"));
  subscribe(NotificationType::RateLimit);

  EXPECT_EQ(outbox_.emit(event(NotificationType::WebhookFailed,
                               IntegrationId("gh"))),
            2u);
  auto records = outbox_.drain();
  ASSERT_EQ(records.size(), 2u);
  EXPECT_EQ(records[0].subscription, all);
  EXPECT_EQ(records[1].subscription, github);
  EXPECT_EQ(records[0].target_config, R"({"channel":"#ops"})");

  auto subs = outbox_.subscriptions(tenant_);
  ASSERT_EQ(subs.size(), 4u);
  EXPECT_EQ(subs[0].trigger_count, 1);
  EXPECT_EQ(subs[2].trigger_count, 0);
  ASSERT_TRUE(subs[0].last_triggered_at.has_value());
}

TEST_F(NotificationOutboxTest, InactiveSubscriptionIsSkipped) {
  auto id = subscribe(NotificationType::SyncError);
  ASSERT_TRUE(outbox_.set_active(tenant_, id, false).has_value());
  outbox_.emit(event(NotificationType::SyncError));
  auto records = outbox_.drain();
  ASSERT_EQ(records.size(), 1u);
  EXPECT_FALSE(records[0].subscription.has_value());

  ASSERT_TRUE(outbox_.unsubscribe(tenant_, id).has_value());
  EXPECT_TRUE(test::is_error(outbox_.unsubscribe(tenant_, id), Error::NotFound));
}

TEST_F(NotificationOutboxTest, InvalidTargetConfigRejected) {
  EXPECT_TRUE(test::is_error(
      outbox_.subscribe(NotificationSubscription{.id = {},
                                                 .tenant = tenant_,
                                                 .integration = std::nullopt,
                                                 .type = NotificationType::RateLimit,
                                                 .target_config = "{broken",
                                                 .active = true,
                                                 .trigger_count = 0,
                                                 .last_triggered_at = std::nullopt}),
      Error::ParseError));
}

TEST_F(NotificationOutboxTest, FullQueueDropsOldest) {
  for (int i = 0; i < 5; ++i) {
    auto e = event(NotificationType::AgentTaskFailed);
    e.message = "n" + std::to_string(i);
    outbox_.emit(std::move(e));
  }
  EXPECT_EQ(outbox_.pending(), 3u);
  EXPECT_EQ(outbox_.dropped(), 2u);

  auto first = outbox_.drain(1);
  ASSERT_EQ(first.size(), 1u);
  EXPECT_EQ(first[0].message, "n2");
  EXPECT_EQ(outbox_.drain().size(), 2u);
}

TEST_F(NotificationOutboxTest, SinkSeesEveryRecord) {
  std::vector<NotificationType> seen;
  outbox_.set_sink(
      [&](const NotificationRecord &record) { seen.push_back(record.type); });
  outbox_.emit(event(NotificationType::HierarchyCorruption));
  ASSERT_EQ(seen.size(), 1u);
  EXPECT_EQ(seen[0], NotificationType::HierarchyCorruption);
}

TEST_F(NotificationOutboxTest, RecordSerializesToJson) {
  outbox_.emit(event(NotificationType::PipelineFailed, IntegrationId("gh")));
  auto records = outbox_.drain();
  ASSERT_EQ(records.size(), 1u);

  auto parsed = parse_json(records[0].to_json());
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(json_string(*parsed, "type"), "pipeline_failed");
  EXPECT_EQ(json_string(*parsed, "integration_id"), "gh");
  EXPECT_EQ(json_string(*parsed, "tenant_id"), "acme");
}
