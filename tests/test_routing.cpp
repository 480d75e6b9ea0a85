/**
 * @file test_routing.cpp
 * @brief Tests for MigrationRouter path classification and canary rolls.
 *
 * Validates:
 *  - Priority order: movies prefix, events prefix, fallback
 *  - Migration disabled never draws and never leaves the monolith
 *  - 0% / 100% extremes and the strict less-than boundary
 *  - Aggregate ratio converges to the configured percentage
 *  - Observer counters per origin
 */

#include <gtest/gtest.h>
#include <cstddef>
#include <string>
#include <vector>

#include "strangler/obs/observability.hpp"
#include "strangler/routing/migration_router.hpp"
#include "strangler/routing/random_source.hpp"

using strangler::routing::MigrationConfig;
using strangler::routing::MigrationRouter;
using strangler::routing::MtRandomSource;
using strangler::routing::Origin;
using strangler::routing::RandomSource;
using strangler::routing::RouteReason;

///
/// Deterministic source: replays a fixed sequence, wrapping around.
///
class SequenceSource final : public RandomSource {
public:
  explicit SequenceSource(std::vector<int> seq) : seq_(std::move(seq)) {}
  int roll(int upper) override {
    ++calls;
    const int v = seq_[pos_++ % seq_.size()];
    return v % upper;
  }
  std::size_t calls{0};
private:
  std::vector<int> seq_;
  std::size_t pos_{0};
};

static std::vector<int> zero_to_99() {
  std::vector<int> v;
  for (int i = 0; i < 100; ++i) v.push_back(i);
  return v;
}

// --------------------------- Movies prefix ---------------------------------

/**
 * @test Movies_MigrationDisabled_AlwaysMonolith
 * @brief Percentage is irrelevant while migration is off; no roll is drawn.
 */
TEST(MigrationRouter, Movies_MigrationDisabled_AlwaysMonolith) {
  for (int pct : {0, 1, 50, 99, 100}) {
    SequenceSource rng(zero_to_99());
    MigrationRouter router(MigrationConfig{.enabled = false, .percent = pct}, rng);
    for (int i = 0; i < 200; ++i) {
      const auto d = router.decide("/api/movies/" + std::to_string(i));
      EXPECT_EQ(d.origin, Origin::Monolith);
      EXPECT_EQ(d.reason, RouteReason::MoviesLegacy);
      EXPECT_FALSE(d.roll.has_value());
    }
    EXPECT_EQ(rng.calls, 0u);
  }
}

/**
 * @test Movies_Percent100_AlwaysMoviesService
 */
TEST(MigrationRouter, Movies_Percent100_AlwaysMoviesService) {
  SequenceSource rng(zero_to_99());
  MigrationRouter router(MigrationConfig{.enabled = true, .percent = 100}, rng);
  for (int i = 0; i < 1000; ++i) {
    const auto d = router.decide("/api/movies");
    EXPECT_EQ(d.origin, Origin::MoviesService);
    EXPECT_EQ(d.reason, RouteReason::Migrated);
  }
  EXPECT_EQ(rng.calls, 1000u);
}

/**
 * @test Movies_Percent0_AlwaysMonolith
 */
TEST(MigrationRouter, Movies_Percent0_AlwaysMonolith) {
  SequenceSource rng(zero_to_99());
  MigrationRouter router(MigrationConfig{.enabled = true, .percent = 0}, rng);
  for (int i = 0; i < 1000; ++i) {
    EXPECT_EQ(router.decide("/api/movies").origin, Origin::Monolith);
  }
}

/**
 * @test Movies_StrictLessThan_Boundary
 * @brief roll == percent stays on the monolith; roll == percent-1 migrates.
 */
TEST(MigrationRouter, Movies_StrictLessThan_Boundary) {
  SequenceSource rng({29, 30});
  MigrationRouter router(MigrationConfig{.enabled = true, .percent = 30}, rng);

  const auto first = router.decide("/api/movies/1");
  ASSERT_TRUE(first.roll.has_value());
  EXPECT_EQ(*first.roll, 29);
  EXPECT_EQ(first.origin, Origin::MoviesService);

  const auto second = router.decide("/api/movies/1");
  EXPECT_EQ(*second.roll, 30);
  EXPECT_EQ(second.origin, Origin::Monolith);
}

/**
 * @test Movies_Ratio_Deterministic
 * @brief A uniform 0..99 sequence yields exactly p% over whole cycles.
 */
TEST(MigrationRouter, Movies_Ratio_Deterministic) {
  for (int pct : {1, 25, 50, 73, 99}) {
    SequenceSource rng(zero_to_99());
    MigrationRouter router(MigrationConfig{.enabled = true, .percent = pct}, rng);
    int migrated = 0;
    constexpr int N = 2000;
    for (int i = 0; i < N; ++i) {
      if (router.decide("/api/movies").origin == Origin::MoviesService) ++migrated;
    }
    EXPECT_EQ(migrated, N * pct / 100) << "pct=" << pct;
  }
}

/**
 * @test Movies_Ratio_SeededMersenne
 * @brief With a seeded production source the share converges to p/100.
 */
TEST(MigrationRouter, Movies_Ratio_SeededMersenne) {
  MtRandomSource rng(42);
  MigrationRouter router(MigrationConfig{.enabled = true, .percent = 37}, rng);
  constexpr int N = 20000;
  int migrated = 0;
  for (int i = 0; i < N; ++i) {
    if (router.decide("/api/movies/list").origin == Origin::MoviesService) ++migrated;
  }
  const double share = static_cast<double>(migrated) / N;
  // ~4.5 standard deviations at N=20000.
  EXPECT_NEAR(share, 0.37, 0.015);
}

/**
 * @test Movies_PercentClamped
 * @brief Out-of-range percentages behave like the nearest bound.
 */
TEST(MigrationRouter, Movies_PercentClamped) {
  SequenceSource rng(zero_to_99());
  MigrationRouter high(MigrationConfig{.enabled = true, .percent = 150}, rng);
  EXPECT_EQ(high.config().percent, 100);
  MigrationRouter low(MigrationConfig{.enabled = true, .percent = -5}, rng);
  EXPECT_EQ(low.config().percent, 0);
  for (int i = 0; i < 100; ++i) {
    EXPECT_EQ(high.decide("/api/movies").origin, Origin::MoviesService);
    EXPECT_EQ(low.decide("/api/movies").origin, Origin::Monolith);
  }
}

// --------------------------- Events / fallback -----------------------------

/**
 * @test Events_AlwaysEventsService
 * @brief Migration settings never affect the events prefix.
 */
TEST(MigrationRouter, Events_AlwaysEventsService) {
  for (bool enabled : {false, true}) {
    for (int pct : {0, 100}) {
      SequenceSource rng(zero_to_99());
      MigrationRouter router(MigrationConfig{.enabled = enabled, .percent = pct}, rng);
      for (const char* p : {"/api/events", "/api/events/movie", "/api/events/health", "/api/eventsfoo"}) {
        const auto d = router.decide(p);
        EXPECT_EQ(d.origin, Origin::EventsService) << p;
        EXPECT_EQ(d.reason, RouteReason::Events);
      }
      EXPECT_EQ(rng.calls, 0u);
    }
  }
}

/**
 * @test Other_Paths_Fallback
 */
TEST(MigrationRouter, Other_Paths_Fallback) {
  SequenceSource rng({0});
  MigrationRouter router(MigrationConfig{.enabled = true, .percent = 100}, rng);
  for (const char* p : {"/", "", "/api/users", "/api/movie", "/api", "/health/deep", "/API/movies"}) {
    const auto d = router.decide(p);
    EXPECT_EQ(d.origin, Origin::Monolith) << p;
    EXPECT_EQ(d.reason, RouteReason::Fallback) << p;
  }
  EXPECT_EQ(rng.calls, 0u);
}

/**
 * @test Movies_PrefixIsLiteral
 * @brief Prefix match is textual, so "/api/moviesX" counts as a movies path.
 */
TEST(MigrationRouter, Movies_PrefixIsLiteral) {
  SequenceSource rng({0});
  MigrationRouter router(MigrationConfig{.enabled = true, .percent = 100}, rng);
  EXPECT_EQ(router.decide("/api/moviesX").origin, Origin::MoviesService);
  EXPECT_EQ(router.decide("/api/movies?x=1").origin, Origin::MoviesService);
}

// --------------------------- RandomSource -----------------------------------

TEST(MtRandomSource, Roll_InRange) {
  MtRandomSource rng(7);
  for (int i = 0; i < 10000; ++i) {
    const int v = rng.roll(100);
    ASSERT_GE(v, 0);
    ASSERT_LT(v, 100);
  }
  EXPECT_EQ(rng.roll(1), 0);
}

TEST(MtRandomSource, SameSeed_SameSequence) {
  MtRandomSource a(1234), b(1234);
  for (int i = 0; i < 100; ++i) EXPECT_EQ(a.roll(100), b.roll(100));
}

// --------------------------- Observer ---------------------------------------

TEST(LoggingObserver, Counts_By_Origin) {
  SequenceSource rng({10, 90});
  MigrationRouter router(MigrationConfig{.enabled = true, .percent = 50}, rng);
  strangler::obs::LoggingObserver obs;

  obs.record(router.decide("/api/movies"));   // 10 -> migrated
  obs.record(router.decide("/api/movies"));   // 90 -> monolith
  obs.record(router.decide("/api/events/x"));
  obs.record(router.decide("/index.html"));
  obs.record_forward_failure(Origin::EventsService);

  const auto c = obs.snapshot();
  EXPECT_EQ(c.decisions, 4u);
  EXPECT_EQ(c.migrated, 1u);
  EXPECT_EQ(c.movies_on_monolith, 1u);
  EXPECT_EQ(c.for_origin(Origin::MoviesService), 1u);
  EXPECT_EQ(c.for_origin(Origin::Monolith), 2u);
  EXPECT_EQ(c.for_origin(Origin::EventsService), 1u);
  EXPECT_EQ(c.failures_for(Origin::EventsService), 1u);
  EXPECT_EQ(c.failures_for(Origin::Monolith), 0u);
}
