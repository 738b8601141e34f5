#include <gtest/gtest.h>

#include "nre/ranking/nation_codes.hpp"
#include "nre/ranking/score_aggregator.hpp"
#include "support/match_fixtures.hpp"

using namespace nre::ranking;
using namespace nre::test;

// ---------------------------------------------------------------------------
// NationCodeResolver
// ---------------------------------------------------------------------------

TEST(NationCodeResolverTest, AcceptsTwoLetterCodesUpperCased) {
    NationCodeResolver resolver;
    EXPECT_EQ(resolver.resolve(std::string("us")), std::optional<std::string>("US"));
    EXPECT_EQ(resolver.resolve(std::string(" fr ")), std::optional<std::string>("FR"));
}

TEST(NationCodeResolverTest, RejectsUnknownShapes) {
    NationCodeResolver resolver;
    EXPECT_FALSE(resolver.resolve(std::nullopt).has_value());
    EXPECT_FALSE(resolver.resolve(std::string("??")).has_value());
    EXPECT_FALSE(resolver.resolve(std::string("")).has_value());
    EXPECT_FALSE(resolver.resolve(std::string("XYZ")).has_value());
    EXPECT_FALSE(resolver.resolve(std::string("1A")).has_value());
}

TEST(NationCodeResolverTest, FactionAllowList) {
    NationCodeResolver resolver({"xk1", "  ", "EU"});
    EXPECT_EQ(resolver.factionCodes().size(), 2u);
    EXPECT_EQ(resolver.resolve(std::string("XK1")), std::optional<std::string>("XK1"));
    EXPECT_TRUE(resolver.isRecognized("eu"));
    EXPECT_FALSE(resolver.isRecognized("XK2"));
}

// ---------------------------------------------------------------------------
// ScoreAggregator
// ---------------------------------------------------------------------------

class ScoreAggregatorTest : public ::testing::Test {
protected:
    std::vector<PlayerProfile> profiles() const {
        return {profile(1, "Ana", "us"), profile(2, "Ben", "US"),
                profile(3, "Chloe", "FR"), profile(4, "Dee", "??"),
                profile(5, "Eve", "XK1")};
    }
};

TEST_F(ScoreAggregatorTest, TalliesDecidedGamesPerNation) {
    MatchLog log;
    log.duels(1, 3, 3, 1);  // US 3-1 against FR
    log.duels(2, 3, 1, 2);  // US 1-2 against FR
    auto snapshot = log.snapshot(profiles());

    ScoreAggregator aggregator;
    auto agg = aggregator.aggregate(snapshot, GameMode::Duel);

    ASSERT_EQ(agg.nations.size(), 2u);
    const auto& us = agg.nations.at("US");
    EXPECT_EQ(us.wins, 4u);
    EXPECT_EQ(us.losses, 3u);
    EXPECT_EQ(us.totalGames(), 7u);
    EXPECT_EQ(us.rawScore(), 1);
    EXPECT_EQ(us.playerCount, 2u);

    const auto& fr = agg.nations.at("FR");
    EXPECT_EQ(fr.wins, 3u);
    EXPECT_EQ(fr.losses, 4u);
    EXPECT_EQ(fr.playerCount, 1u);

    EXPECT_EQ(agg.players.at(PlayerId(1)).netWins(), 2);
    EXPECT_EQ(agg.players.at(PlayerId(1)).countryCode, std::optional<std::string>("US"));
}

TEST_F(ScoreAggregatorTest, DrawsCountForPlayersOnly) {
    MatchLog log;
    log.add(GameMode::Duel, {result(1, Outcome::Draw, 0), result(3, Outcome::Draw, 1)});
    log.duels(1, 3, 1, 0);
    auto snapshot = log.snapshot(profiles());

    auto agg = ScoreAggregator().aggregate(snapshot, GameMode::Duel);
    EXPECT_EQ(agg.nations.at("US").totalGames(), 1u);
    EXPECT_EQ(agg.players.at(PlayerId(1)).draws, 1u);
    EXPECT_EQ(agg.players.at(PlayerId(1)).gamesPlayed(), 2u);
    EXPECT_EQ(agg.players.at(PlayerId(1)).decidedGames(), 1u);
}

TEST_F(ScoreAggregatorTest, UnresolvedPlayersAreCountedButNotRanked) {
    MatchLog log;
    log.duels(4, 1, 2, 0);  // "??" player beats US twice
    log.duels(6, 1, 1, 0);  // player 6 has no profile
    auto snapshot = log.snapshot(profiles());

    auto agg = ScoreAggregator().aggregate(snapshot, GameMode::Duel);
    EXPECT_EQ(agg.nations.size(), 1u);
    EXPECT_EQ(agg.nations.at("US").losses, 3u);
    EXPECT_EQ(agg.unresolvedResults, 3u);
    EXPECT_FALSE(agg.players.at(PlayerId(4)).countryCode.has_value());
    EXPECT_EQ(agg.players.at(PlayerId(4)).wins, 2u);
}

TEST_F(ScoreAggregatorTest, FactionCodesNeedAllowList) {
    MatchLog log;
    log.duels(5, 3, 1, 0);
    auto snapshot = log.snapshot(profiles());

    auto plain = ScoreAggregator().aggregate(snapshot, GameMode::Duel);
    EXPECT_EQ(plain.nations.count("XK1"), 0u);

    auto withFactions = ScoreAggregator(NationCodeResolver({"XK1"})).aggregate(snapshot, GameMode::Duel);
    EXPECT_EQ(withFactions.nations.at("XK1").wins, 1u);
}

TEST_F(ScoreAggregatorTest, ModesAreIndependentAndRecomputed) {
    MatchLog log;
    log.duels(1, 3, 2, 0, GameMode::Duel);
    log.duels(1, 3, 0, 5, GameMode::FFA);
    auto snapshot = log.snapshot(profiles());

    ScoreAggregator aggregator;
    auto duel = aggregator.aggregate(snapshot, GameMode::Duel);
    auto ffa = aggregator.aggregate(snapshot, GameMode::FFA);
    EXPECT_EQ(duel.nations.at("US").wins, 2u);
    EXPECT_EQ(duel.nations.at("US").losses, 0u);
    EXPECT_EQ(ffa.nations.at("US").wins, 0u);
    EXPECT_EQ(ffa.nations.at("US").losses, 5u);

    EXPECT_EQ(aggregator.aggregate(snapshot, GameMode::Duel), duel);
    EXPECT_TRUE(aggregator.aggregate(snapshot, GameMode::Team).nations.empty());
}
