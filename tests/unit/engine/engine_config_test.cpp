#include <gtest/gtest.h>

#include "nre/engine/engine_config.hpp"

using namespace nre::engine;
using nre::foundation::ConfigManager;
using nre::foundation::ErrorCode;

TEST(EngineConfigTest, DefaultsWhenKeysAreMissing) {
    ConfigManager config;
    auto cfg = buildEngineConfig(config);
    ASSERT_TRUE(cfg.hasValue());

    EXPECT_TRUE(cfg.value().factionCodes.empty());
    EXPECT_EQ(cfg.value().leaderboard.topContributors, 3u);
    EXPECT_EQ(cfg.value().leaderboard.playerMinGames, 5u);
    EXPECT_EQ(cfg.value().leaderboard.playerBoardSize, 50u);
    EXPECT_EQ(cfg.value().teams.communityMinEdgeWeight, 5u);
    EXPECT_EQ(cfg.value().teams.maxRosterSize, 10u);
    EXPECT_EQ(cfg.value().workerThreads, 4u);
}

TEST(EngineConfigTest, ReadsEverySection) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(
        "ranking:\n"
        "  faction_codes: [XK1, EU]\n"
        "  top_contributors: 5\n"
        "  player_min_games: 10\n"
        "  player_board_size: 25\n"
        "teams:\n"
        "  party_min_matches: 3\n"
        "  community_min_edge_weight: 8\n"
        "  min_roster_size: 3\n"
        "  max_roster_size: 6\n"
        "  pair_min_weight: 4\n"
        "  max_teams: 20\n"
        "engine:\n"
        "  worker_threads: 2\n").hasValue());

    auto cfg = buildEngineConfig(config);
    ASSERT_TRUE(cfg.hasValue());
    const auto& c = cfg.value();
    EXPECT_EQ(c.factionCodes, (std::vector<std::string>{"XK1", "EU"}));
    EXPECT_EQ(c.leaderboard.topContributors, 5u);
    EXPECT_EQ(c.leaderboard.playerMinGames, 10u);
    EXPECT_EQ(c.leaderboard.playerBoardSize, 25u);
    EXPECT_EQ(c.teams.partyMinMatches, 3u);
    EXPECT_EQ(c.teams.communityMinEdgeWeight, 8u);
    EXPECT_EQ(c.teams.minRosterSize, 3u);
    EXPECT_EQ(c.teams.maxRosterSize, 6u);
    EXPECT_EQ(c.teams.pairMinWeight, 4u);
    EXPECT_EQ(c.teams.maxTeams, 20u);
    EXPECT_EQ(c.workerThreads, 2u);
}

TEST(EngineConfigTest, RosterBoundsMustBeOrdered) {
    ConfigManager config;
    config.set("teams.min_roster_size", 6);
    config.set("teams.max_roster_size", 4);

    auto cfg = buildEngineConfig(config);
    ASSERT_TRUE(cfg.hasError());
    EXPECT_EQ(cfg.error().code(), ErrorCode::InvalidArgument);
}

TEST(EngineConfigTest, ZeroWorkersRejected) {
    ConfigManager config;
    config.set("engine.worker_threads", 0);
    auto cfg = buildEngineConfig(config);
    ASSERT_TRUE(cfg.hasError());
    EXPECT_EQ(cfg.error().code(), ErrorCode::InvalidArgument);
}

TEST(EngineConfigTest, ZeroBoardSizeRejected) {
    ConfigManager config;
    config.set("ranking.player_board_size", 0);
    EXPECT_TRUE(buildEngineConfig(config).hasError());
}

TEST(EngineConfigTest, MistypedValueRejected) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("teams:\n  max_teams: lots\n").hasValue());

    auto cfg = buildEngineConfig(config);
    ASSERT_TRUE(cfg.hasError());
    EXPECT_EQ(cfg.error().code(), ErrorCode::ConfigTypeMismatch);
}
