/**
 * @file test_kafka.cpp
 * @brief Tests for librdkafka consumer error handling.
 */
#include <gtest/gtest.h>
#include <future>
#include <string>
#include <thread>

#include <librdkafka/rdkafkacpp.h>

#include "strangler/events/kafka_broker.hpp"

using strangler::events::ConsumeDisposition;
using strangler::events::classify_consume_error;
using strangler::events::fulfil_and_release;

TEST(ConsumeError, PollTimeoutAndEof_AreIdle) {
  EXPECT_EQ(classify_consume_error(RdKafka::ERR__TIMED_OUT, false), ConsumeDisposition::Idle);
  EXPECT_EQ(classify_consume_error(RdKafka::ERR__PARTITION_EOF, false), ConsumeDisposition::Idle);
}

/**
 * @test RecoverableErrors_KeepLoopAlive
 * @brief A topic that does not exist yet, a broker outage or a transport
 *        error must not end the loop: librdkafka reconnects by itself.
 */
TEST(ConsumeError, RecoverableErrors_KeepLoopAlive) {
  for (auto err : {RdKafka::ERR_UNKNOWN_TOPIC_OR_PART, RdKafka::ERR__UNKNOWN_PARTITION,
                   RdKafka::ERR__TRANSPORT, RdKafka::ERR__ALL_BROKERS_DOWN,
                   RdKafka::ERR__RESOLVE, RdKafka::ERR_LEADER_NOT_AVAILABLE,
                   RdKafka::ERR_NOT_COORDINATOR, RdKafka::ERR_REBALANCE_IN_PROGRESS}) {
    EXPECT_EQ(classify_consume_error(err, false), ConsumeDisposition::Transient) << RdKafka::err2str(err);
  }
}

TEST(ConsumeError, FatalErrors_EndLoop) {
  EXPECT_EQ(classify_consume_error(RdKafka::ERR__FATAL, false), ConsumeDisposition::Fatal);
  EXPECT_EQ(classify_consume_error(RdKafka::ERR_TOPIC_AUTHORIZATION_FAILED, false), ConsumeDisposition::Fatal);
  EXPECT_EQ(classify_consume_error(RdKafka::ERR_GROUP_AUTHORIZATION_FAILED, false), ConsumeDisposition::Fatal);
}

TEST(ConsumeError, FatalFlag_Wins) {
  EXPECT_EQ(classify_consume_error(RdKafka::ERR__TRANSPORT, true), ConsumeDisposition::Fatal);
  EXPECT_EQ(classify_consume_error(RdKafka::ERR__TIMED_OUT, true), ConsumeDisposition::Fatal);
}

/**
 * @test DeliveryHandoff_WaiterMayDestroyPromise
 * @brief The waiter returns and destroys its stack promise as soon as get()
 *        completes; the reporting thread must not touch it afterwards.
 */
TEST(DeliveryHandoff, WaiterMayDestroyPromise) {
  for (int i = 0; i < 2000; ++i) {
    std::thread reporter;
    {
      std::promise<std::string> done;
      auto fut = done.get_future();
      reporter = std::thread([&done, i] { fulfil_and_release(done, std::to_string(i)); });
      EXPECT_EQ(fut.get(), std::to_string(i));
    }  // promise destroyed here, possibly while the reporter is still returning
    reporter.join();
  }
}
