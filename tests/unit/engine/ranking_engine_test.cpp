#include <gtest/gtest.h>

#include <yaml-cpp/yaml.h>

#include "nre/engine/ranking_engine.hpp"
#include "nre/engine/result_writer.hpp"
#include "support/match_fixtures.hpp"

using namespace nre::engine;
using namespace nre::test;
using nre::foundation::ErrorCode;
using nre::teams::TeamType;

// ---------------------------------------------------------------------------
// Fixture: Monaco and USA duel an unlisted opponent; a party plays Small Team
// ---------------------------------------------------------------------------

class RankingEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_.duels(1, 9, 4, 2);
        log_.duels(2, 9, 200, 100);
        for (int i = 0; i < 6; ++i) {
            log_.partyGame({3, 4}, 30, 9, Outcome::Win);
        }
    }

    RankingEngine engine(EngineConfig config = EngineConfig()) const {
        return RankingEngine(
            log_.snapshot({profile(1, "Mona", "MC"), profile(2, "Sam", "US"),
                           profile(3, "Ruth", "GB"), profile(4, "Ravi", "IN")}),
            std::move(config));
    }

    MatchLog log_;
};

TEST_F(RankingEngineTest, ConfidenceFactorIsDerivedPerSlice) {
    auto e = engine();
    auto board = e.buildNationLeaderboard(GameMode::Duel, TimeWindow::all());
    ASSERT_TRUE(board.hasValue());

    EXPECT_DOUBLE_EQ(board.value().factor.averageGamesPerNation, 153.0);
    EXPECT_DOUBLE_EQ(board.value().factor.k, 76.5);
    EXPECT_DOUBLE_EQ(board.value().factor.cf, 153.0);
    ASSERT_EQ(board.value().nations.size(), 1u);
    EXPECT_EQ(board.value().nations[0].countryCode, "US");
    EXPECT_NEAR(board.value().nations[0].adjustedScore, 100.0 / 453.0 * 10000.0, 1e-6);

    auto monaco = e.explainNationScore("MC", GameMode::Duel);
    ASSERT_TRUE(monaco.hasValue());
    EXPECT_NEAR(monaco.value().adjustedScore, 2.0 / 159.0 * 10000.0, 1e-6);
    EXPECT_FALSE(monaco.value().qualifies);
}

TEST_F(RankingEngineTest, WindowNarrowsTheSlice) {
    auto e = engine();
    // Only Monaco's six duels fall in this window.
    auto window = TimeWindow::between(at(1'000'000), at(1'000'000 + 6 * 60));
    auto board = e.buildNationLeaderboard(GameMode::Duel, window);
    ASSERT_TRUE(board.hasValue());
    EXPECT_DOUBLE_EQ(board.value().factor.cf, 6.0);
    ASSERT_EQ(board.value().nations.size(), 1u);
    EXPECT_EQ(board.value().nations[0].countryCode, "MC");
    EXPECT_EQ(board.value().window, window);
}

TEST_F(RankingEngineTest, BoardWindowIsClampedToSnapshot) {
    auto week = TimeWindow::between(at(1'000'000), at(1'000'000 + 7 * 86'400));
    RankingEngine e(log_.snapshot({profile(1, "Mona", "MC"), profile(2, "Sam", "US")}, week));

    auto board = e.buildNationLeaderboard(GameMode::Duel, TimeWindow::all());
    ASSERT_TRUE(board.hasValue());
    EXPECT_EQ(board.value().window, week);
    EXPECT_EQ(e.runNationRankings(TimeWindow::all()).window, week);
    EXPECT_EQ(e.buildTeams(TeamType::Party, TimeWindow::all()).window, week);
}

TEST_F(RankingEngineTest, RunIsolatesFailedSlices) {
    auto e = engine();
    auto run = e.runNationRankings(TimeWindow::all());

    EXPECT_EQ(run.slices.size(), nre::ranking::kRankedGameModes.size());
    ASSERT_TRUE(run.slices.at(GameMode::Duel).hasValue());
    ASSERT_TRUE(run.slices.at(GameMode::SmallTeam).hasValue());
    EXPECT_EQ(run.slices.at(GameMode::SmallTeam).value().nations.size(), 2u);

    ASSERT_TRUE(run.slices.at(GameMode::FFA).hasError());
    EXPECT_EQ(run.slices.at(GameMode::FFA).error().code(), ErrorCode::ConfidenceUndefined);
    EXPECT_EQ(run.succeeded(), 2u);
    EXPECT_EQ(run.failed(), nre::ranking::kRankedGameModes.size() - 2);
}

TEST_F(RankingEngineTest, FailedSliceKeepsPreviousBoard) {
    nre::ranking::NationLeaderboard stale;
    stale.mode = GameMode::FFA;
    stale.nations.push_back(nre::ranking::NationScore{"FR", GameMode::FFA, 1});

    PublishedLeaderboards previous;
    previous.emplace(GameMode::FFA, stale);

    auto run = engine().runNationRankings(TimeWindow::all());
    auto published = mergePublished(previous, run);

    ASSERT_EQ(published.count(GameMode::FFA), 1u);
    EXPECT_EQ(published.at(GameMode::FFA), stale);
    EXPECT_EQ(published.at(GameMode::Duel), run.slices.at(GameMode::Duel).value());
    EXPECT_EQ(published.count(GameMode::Team), 0u);
}

TEST_F(RankingEngineTest, RepeatedRunsRenderIdentically) {
    EngineConfig oneWorker;
    oneWorker.workerThreads = 1;

    auto first = toYaml(engine().runNationRankings(TimeWindow::all()));
    auto second = toYaml(engine(oneWorker).runNationRankings(TimeWindow::all()));
    EXPECT_EQ(first, second);

    auto doc = YAML::Load(first);
    EXPECT_EQ(doc["slices"]["Duel"]["nations"][0]["country_code"].as<std::string>(), "US");
    EXPECT_EQ(doc["slices"]["Duel"]["nations"][0]["rank"].as<int>(), 1);
    EXPECT_TRUE(doc["slices"]["FFA"]["error"].IsDefined());
    EXPECT_EQ(doc["slices"]["FFA"]["subsystem"].as<std::string>(), "Ranking");
}

TEST_F(RankingEngineTest, PlayerLeaderboardUsesConfig) {
    EngineConfig config;
    config.leaderboard.playerMinGames = 1;
    auto e = engine(config);

    // No match carries a rating, so no one qualifies.
    auto board = e.buildPlayerLeaderboard(GameMode::Duel);
    ASSERT_TRUE(board.hasValue());
    EXPECT_TRUE(board.value().players.empty());

    EXPECT_EQ(e.buildPlayerLeaderboard(GameMode::Team).error().code(),
              ErrorCode::GameModeNotFound);
}

TEST(RankingEnginePlayerTest, CountryBoardsSplitByNation) {
    MatchLog log;
    for (int i = 0; i < 5; ++i) {
        log.add(GameMode::Duel, {rated(result(1, Outcome::Win, 0), 30.0, 1.0),
                                 rated(result(2, Outcome::Loss, 1), 20.0, 1.0)});
        log.add(GameMode::Duel, {rated(result(3, Outcome::Win, 0), 28.0, 2.0),
                                 rated(result(4, Outcome::Loss, 1), 24.0, 2.0)});
    }
    EngineConfig config;
    config.factionCodes = {"EU"};
    RankingEngine e(log.snapshot({profile(1, "Ada", "SE"), profile(2, "Bo", "SE"),
                                  profile(3, "Cy", "EU"), profile(4, "Di", "eu")}),
                    std::move(config));

    auto se = e.buildPlayerLeaderboard(GameMode::Duel, std::string("SE"));
    ASSERT_TRUE(se.hasValue());
    ASSERT_EQ(se.value().players.size(), 2u);
    EXPECT_EQ(se.value().players[0].name, "Ada");
    EXPECT_EQ(se.value().players[0].rank, 1u);
    EXPECT_EQ(se.value().players[1].name, "Bo");
    EXPECT_EQ(se.value().players[1].rank, 2u);

    auto eu = e.buildPlayerLeaderboard(GameMode::Duel, std::string("EU"));
    ASSERT_TRUE(eu.hasValue());
    ASSERT_EQ(eu.value().players.size(), 2u);
    EXPECT_EQ(eu.value().players[0].name, "Cy");
    EXPECT_EQ(eu.value().players[1].name, "Di");
    EXPECT_EQ(eu.value().players[1].rank, 2u);

    EXPECT_EQ(e.buildPlayerLeaderboard(GameMode::Duel, std::string("EUR")).error().code(),
              ErrorCode::InvalidArgument);

    auto doc = YAML::Load(toYaml(se.value()));
    EXPECT_EQ(doc["country_code"].as<std::string>(), "SE");
    EXPECT_EQ(doc["players"].size(), 2u);
    EXPECT_EQ(doc["players"][1]["rank"].as<int>(), 2);

    auto global = YAML::Load(toYaml(e.buildPlayerLeaderboard(GameMode::Duel).value()));
    EXPECT_TRUE(global["country_code"].IsNull());
    EXPECT_EQ(global["total_players"].as<int>(), 4);
}

TEST_F(RankingEngineTest, TeamsAndPairs) {
    auto e = engine();

    auto parties = e.buildTeams(TeamType::Party, TimeWindow::all());
    ASSERT_EQ(parties.parties.size(), 1u);
    EXPECT_EQ(parties.parties[0].exactRosterMatches, 6u);
    EXPECT_DOUBLE_EQ(parties.parties[0].stabilityScore, 1.0);

    auto communities = e.buildTeams(TeamType::Community, TimeWindow::all());
    ASSERT_EQ(communities.communities.size(), 1u);
    EXPECT_EQ(communities.communities[0].teamName, "Ruth's Squad");

    auto pairs = e.frequentPairs(TimeWindow::all());
    ASSERT_EQ(pairs.size(), 1u);
    EXPECT_EQ(pairs[0].nameA, "Ruth");
    EXPECT_EQ(pairs[0].nameB, "Ravi");

    auto found = e.searchTeams("rav", TeamType::Party);
    EXPECT_EQ(found.size(), 1u);
    EXPECT_EQ(e.searchTeams("mona", TeamType::Community).size(), 0u);
}

TEST_F(RankingEngineTest, MoveKeepsState) {
    auto a = engine();
    auto size = a.snapshot().size();
    RankingEngine b(std::move(a));
    EXPECT_EQ(b.snapshot().size(), size);
    EXPECT_EQ(b.config().workerThreads, 4u);
}
