#pragma once

#include <chrono>
#include <cstddef>

namespace conductor {

namespace limits {
// Ceiling for parent chain walks; exceeding it means corrupted parent links.
constexpr int kMaxHierarchyDepth = 50;
constexpr int kMaxDependencyDepth = 50;
constexpr std::size_t kMaxStepsPerPipeline = 4096;
constexpr int kMaxProgress = 100;
} // namespace limits

namespace defaults {
constexpr int kPipelineConcurrency = 3;
constexpr auto kPipelineTimeout = std::chrono::minutes(60);
constexpr int kStepMaxRetries = 0;

constexpr int kAgentMaxConcurrentTasks = 5;
constexpr auto kAgentTimeout = std::chrono::minutes(30);
constexpr int kAgentTaskMaxRetries = 3;
constexpr int kAgentTaskPriority = 3;

constexpr int kEventMaxAttempts = 3;
constexpr auto kEventRetryBackoff = std::chrono::minutes(5);
constexpr auto kEventRetention = std::chrono::days(90);

constexpr int kRateLimitRequests = 1000;
constexpr auto kRateLimitWindow = std::chrono::minutes(60);

constexpr auto kStatsWindow = std::chrono::days(30);
constexpr std::size_t kOutboxCapacity = 4096;
constexpr unsigned kShardCount = 16;
} // namespace defaults

namespace timing {
constexpr auto kRetrySweepInterval = std::chrono::seconds(30);
constexpr auto kTimeoutCheckInterval = std::chrono::seconds(60);
constexpr auto kPurgeInterval = std::chrono::seconds(3600);
constexpr auto kShutdownPollInterval = std::chrono::milliseconds(50);
} // namespace timing

} // namespace conductor
