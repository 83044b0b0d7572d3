#include "TestSupport.h"

#include "gambit/core/tournament/ResultRecorder.h"
#include "gambit/core/tournament/SwissPairingEngine.h"
#include "gambit/core/tournament/SwissRules.h"

#include <algorithm>
#include <set>

using gambit::core::EngineError;
using gambit::core::ErrorKind;
using gambit::core::tournament::ColorPolicy;
using gambit::core::tournament::PairingResult;
using gambit::core::tournament::ResultRecorder;
using gambit::core::tournament::SwissPairingEngine;
using gambit::core::tournament::TournamentConfig;
using namespace gambit::test;

namespace {

// A(2.0) B(1.5) C(1.5) D(1.0) after four rounds against outside opponents,
// with optional A-D game in round 2. Colours alternate so no preference is
// absolute.
gambit::core::registry::PlayerRegistry LateRoundField(bool a_met_d) {
    const std::string a_r2 = a_met_d ? "D" : "x2";
    const std::string d_r2 = a_met_d ? "A" : "y2";
    return MakeRegistry({
        WithHistory(MakePlayer("A", 2000), {Played(1, "x1", Color::kWhite, 1.0), Played(2, a_r2, Color::kBlack, 1.0),
                                            Played(3, "x3", Color::kWhite, 0.0), Played(4, "x4", Color::kBlack, 0.0)}),
        WithHistory(MakePlayer("B", 1900), {Played(1, "z1", Color::kBlack, 0.5), Played(2, "z2", Color::kWhite, 1.0),
                                            Played(3, "z3", Color::kBlack, 0.0), Played(4, "z4", Color::kWhite, 0.0)}),
        WithHistory(MakePlayer("C", 1800), {Played(1, "w1", Color::kWhite, 0.5), Played(2, "w2", Color::kBlack, 1.0),
                                            Played(3, "w3", Color::kWhite, 0.0), Played(4, "w4", Color::kBlack, 0.0)}),
        WithHistory(MakePlayer("D", 1700), {Played(1, "y1", Color::kBlack, 1.0), Played(2, d_r2, Color::kWhite, 0.0),
                                            Played(3, "y3", Color::kBlack, 0.0), Played(4, "y4", Color::kWhite, 0.0)}),
    });
}

}  // namespace

TEST_CASE("Swiss round one splits the field top half against bottom half", "[swiss]") {
    const auto registry = MakeField(8);
    const TournamentConfig config;
    const SwissPairingEngine engine;

    PairingResult round;
    EngineError error;
    REQUIRE(engine.PairRound(registry, config, 1, round, &error));

    REQUIRE(round.round_number == 1);
    REQUIRE(round.pairings.size() == 4);
    REQUIRE_FALSE(round.bye_player_id.has_value());
    REQUIRE(CoversEachPlayerOnce(round, registry));
    REQUIRE(round.pairings[0].white_id == "p1");
    REQUIRE(round.pairings[0].black_id == "p5");
    REQUIRE(HasBoard(round, "p4", "p8"));
    REQUIRE(round.pairing_ids.size() == 4);
    REQUIRE(round.pairing_ids[0] == "r1_pair_p1_p5");
}

TEST_CASE("Swiss pairing keeps score groups together and floats the lower rated player", "[swiss][floats]") {
    const TournamentConfig config;
    const SwissPairingEngine engine;
    PairingResult round;
    EngineError error;

    SECTION("equal scores meet when nothing blocks them") {
        const auto registry = LateRoundField(false);
        REQUIRE(engine.PairRound(registry, config, 5, round, &error));
        REQUIRE(HasBoard(round, "B", "C"));
        REQUIRE(HasBoard(round, "A", "D"));
    }

    SECTION("an earlier A-D game forces C down to D") {
        const auto registry = LateRoundField(true);
        REQUIRE(engine.PairRound(registry, config, 5, round, &error));
        REQUIRE_FALSE(HasBoard(round, "A", "D"));
        REQUIRE(HasBoard(round, "A", "B"));
        REQUIRE(HasBoard(round, "C", "D"));
        REQUIRE(CoversEachPlayerOnce(round, registry));
    }
}

TEST_CASE("Swiss bye goes to the lowest ranked player without one", "[swiss][bye]") {
    const TournamentConfig config;
    const SwissPairingEngine engine;
    PairingResult round;
    EngineError error;

    SECTION("first round") {
        const auto registry = MakeField(5);
        REQUIRE(engine.PairRound(registry, config, 1, round, &error));
        REQUIRE(round.bye_player_id == std::string("p5"));
        REQUIRE(round.pairings.size() == 2);
        REQUIRE(round.player_count() == 5);
    }

    SECTION("a player never receives a second bye") {
        auto registry = MakeRegistry({
            WithHistory(MakePlayer("p1", 2000), {Played(1, "p2", Color::kWhite, 1.0)}),
            WithHistory(MakePlayer("p2", 1900), {Played(1, "p1", Color::kBlack, 0.0)}),
            WithHistory(MakePlayer("p3", 1800), {Played(1, "p4", Color::kWhite, 0.0)}),
            WithHistory(MakePlayer("p4", 1700), {Played(1, "p3", Color::kBlack, 1.0)}),
            WithHistory(MakePlayer("p5", 1600), {Bye(1, 0.0)}),
        });
        REQUIRE(engine.PairRound(registry, config, 2, round, &error));
        REQUIRE(round.bye_player_id.has_value());
        REQUIRE(*round.bye_player_id != "p5");
        REQUIRE(CoversEachPlayerOnce(round, registry));
    }

    SECTION("odd field where everyone already had a bye is infeasible") {
        const auto registry = MakeRegistry({WithHistory(MakePlayer("a"), {Bye(1)}),
                                            WithHistory(MakePlayer("b"), {Bye(1)}),
                                            WithHistory(MakePlayer("c"), {Bye(1)})});
        REQUIRE_FALSE(engine.PairRound(registry, config, 2, round, &error));
        REQUIRE(error.kind == ErrorKind::kPairingInfeasible);
    }
}

TEST_CASE("Swiss pairing reports infeasible rematch constraints", "[swiss][errors]") {
    const auto registry = MakeRegistry({WithHistory(MakePlayer("a", 2000), {Played(1, "b", Color::kWhite, 1.0)}),
                                        WithHistory(MakePlayer("b", 1900), {Played(1, "a", Color::kBlack, 0.0)})});
    const TournamentConfig config;
    const SwissPairingEngine engine;
    PairingResult round;
    EngineError error;
    REQUIRE_FALSE(engine.PairRound(registry, config, 2, round, &error));
    REQUIRE(error.kind == ErrorKind::kPairingInfeasible);

    REQUIRE_FALSE(engine.PairRound(registry, config, 0, round, &error));
    REQUIRE(error.kind == ErrorKind::kInvalidArgument);
}

TEST_CASE("Swiss pairing is deterministic and skips withdrawn players", "[swiss]") {
    auto registry = MakeField(7);
    EngineError error;
    REQUIRE(registry.SetActive("p3", false, &error));

    const TournamentConfig config;
    std::vector<std::string> log;
    const SwissPairingEngine engine([&log](const std::string& line) { log.push_back(line); });

    PairingResult first;
    PairingResult second;
    REQUIRE(engine.PairRound(registry, config, 1, first, &error));
    REQUIRE(engine.PairRound(registry, config, 1, second, &error));
    REQUIRE(first.pairings == second.pairings);
    REQUIRE(first.pairing_ids == second.pairing_ids);
    REQUIRE_FALSE(first.bye_player_id.has_value());
    for (const auto& board : first.pairings) {
        REQUIRE_FALSE(board.Involves("p3"));
    }
    REQUIRE(log.size() == 2);
    REQUIRE(log.front().rfind("[gambit] Round 1", 0) == 0);
}

TEST_CASE("Swiss pairing avoids rematches across a full event", "[swiss][rematch]") {
    auto registry = MakeField(10);
    TournamentConfig config;
    config.total_rounds = 5;
    const SwissPairingEngine engine;
    const ResultRecorder recorder;

    std::set<std::pair<std::string, std::string>> met;
    for (int round_number = 1; round_number <= config.total_rounds; ++round_number) {
        PairingResult round;
        EngineError error;
        REQUIRE(engine.PairRound(registry, config, round_number, round, &error));
        REQUIRE(CoversEachPlayerOnce(round, registry));
        for (const auto& board : round.pairings) {
            const auto key = std::minmax(board.white_id, board.black_id);
            REQUIRE(met.insert({key.first, key.second}).second);
        }
        REQUIRE(recorder.ApplyResults(registry, round, ResultsFor(round, round_number % 2 ? 1.0 : 0.5), config,
                                      &error));
    }
    REQUIRE(registry.CompletedRounds() == 5);
}

TEST_CASE("Colour choice honours preferences before policy", "[swiss][colors]") {
    TournamentConfig config;
    const auto due_black = WithHistory(MakePlayer("a"), {Played(1, "x", Color::kWhite, 1.0),
                                                         Played(2, "y", Color::kWhite, 1.0)});
    const auto fresh = MakePlayer("b");

    const auto pairing = gambit::core::tournament::ChooseColors(due_black, fresh, config, 3);
    REQUIRE(pairing.white_id == "b");
    REQUIRE(pairing.black_id == "a");

    const auto a = MakePlayer("a");
    config.color_policy = ColorPolicy::kWhiteToHigherRanked;
    REQUIRE(gambit::core::tournament::ChooseColors(a, fresh, config, 2).white_id == "a");
    config.color_policy = ColorPolicy::kAlternateByRound;
    REQUIRE(gambit::core::tournament::ChooseColors(a, fresh, config, 2).white_id == "b");

    REQUIRE_FALSE(gambit::core::tournament::ColorsCompatible(due_black, due_black));
    REQUIRE(gambit::core::tournament::ColorsCompatible(due_black, fresh));
}
