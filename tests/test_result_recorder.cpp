#include "TestSupport.h"

#include "gambit/core/tournament/ResultRecorder.h"

using gambit::core::EngineError;
using gambit::core::ErrorKind;
using gambit::core::tournament::IsValidScore;
using gambit::core::tournament::MatchResult;
using gambit::core::tournament::Pairing;
using gambit::core::tournament::PairingResult;
using gambit::core::tournament::ResultRecorder;
using gambit::core::tournament::TournamentConfig;
using namespace gambit::test;

namespace {

PairingResult RoundOne() {
    PairingResult round;
    round.round_number = 1;
    round.pairings = {Pairing{"p1", "p3"}, Pairing{"p2", "p4"}};
    round.bye_player_id = "p5";
    return round;
}

}  // namespace

TEST_CASE("Results update history and score together", "[results]") {
    auto registry = MakeField(5);
    TournamentConfig config;
    const ResultRecorder recorder;
    EngineError error;

    REQUIRE(recorder.ApplyResults(registry, RoundOne(), {{"p1", "p3", 1.0}, {"p2", "p4", 0.5}}, config, &error));

    const auto* p1 = registry.Find("p1");
    REQUIRE(p1->score == 1.0);
    REQUIRE(p1->history.size() == 1);
    REQUIRE(p1->history[0].opponent_id == std::string("p3"));
    REQUIRE(p1->history[0].color == Color::kWhite);

    const auto* p3 = registry.Find("p3");
    REQUIRE(p3->score == 0.0);
    REQUIRE(p3->history[0].color == Color::kBlack);

    REQUIRE(registry.Find("p4")->score == 0.5);

    const auto* p5 = registry.Find("p5");
    REQUIRE(p5->score == 1.0);
    REQUIRE(p5->bye_count == 1);
    REQUIRE(p5->history[0].is_bye());
    REQUIRE(registry.CompletedRounds() == 1);
}

TEST_CASE("Bye points follow the configuration", "[results][bye]") {
    auto registry = MakeField(5);
    TournamentConfig config;
    config.bye_points = 0.5;
    const ResultRecorder recorder;
    EngineError error;
    REQUIRE(recorder.ApplyResults(registry, RoundOne(), {{"p1", "p3", 0.0}, {"p2", "p4", 1.0}}, config, &error));
    REQUIRE(registry.Find("p5")->score == 0.5);
}

TEST_CASE("Inconsistent results leave the registry untouched", "[results][errors]") {
    auto registry = MakeField(5);
    const auto before = registry.Snapshot();
    TournamentConfig config;
    const ResultRecorder recorder;
    EngineError error;

    auto unchanged = [&]() {
        for (const auto& player : registry.players()) {
            const auto* original = before.Find(player.id);
            if (player.score != original->score || player.history.size() != original->history.size()) {
                return false;
            }
        }
        return true;
    };

    SECTION("missing board result") {
        REQUIRE_FALSE(recorder.ApplyResults(registry, RoundOne(), {{"p1", "p3", 1.0}}, config, &error));
        REQUIRE(error.kind == ErrorKind::kResultMismatch);
    }

    SECTION("result for a pair that was not paired") {
        REQUIRE_FALSE(recorder.ApplyResults(registry, RoundOne(), {{"p1", "p3", 1.0}, {"p2", "p5", 1.0}}, config,
                                            &error));
        REQUIRE(error.kind == ErrorKind::kResultMismatch);
    }

    SECTION("two results for one board") {
        REQUIRE_FALSE(recorder.ApplyResults(registry, RoundOne(),
                                            {{"p1", "p3", 1.0}, {"p1", "p3", 0.0}, {"p2", "p4", 1.0}}, config,
                                            &error));
        REQUIRE(error.kind == ErrorKind::kResultMismatch);
    }

    SECTION("colours reversed") {
        REQUIRE_FALSE(recorder.ApplyResults(registry, RoundOne(), {{"p3", "p1", 1.0}, {"p2", "p4", 1.0}}, config,
                                            &error));
        REQUIRE(error.kind == ErrorKind::kResultMismatch);
    }

    SECTION("score outside win, draw or loss") {
        REQUIRE_FALSE(recorder.ApplyResults(registry, RoundOne(), {{"p1", "p3", 1.0}, {"p2", "p4", 0.75}}, config,
                                            &error));
        REQUIRE(error.kind == ErrorKind::kInvalidResult);
    }

    SECTION("player paired twice in the round") {
        auto round = RoundOne();
        round.pairings.push_back(Pairing{"p1", "p5"});
        round.bye_player_id.reset();
        REQUIRE_FALSE(recorder.ApplyResults(registry, round, {}, config, &error));
        REQUIRE(error.kind == ErrorKind::kResultMismatch);
    }

    SECTION("unknown player") {
        PairingResult round;
        round.round_number = 1;
        round.pairings = {Pairing{"p1", "ghost"}};
        REQUIRE_FALSE(recorder.ApplyResults(registry, round, {{"p1", "ghost", 1.0}}, config, &error));
        REQUIRE(error.kind == ErrorKind::kUnknownPlayer);
    }

    REQUIRE(unchanged());
}

TEST_CASE("A round cannot be recorded twice", "[results][errors]") {
    auto registry = MakeField(5);
    TournamentConfig config;
    const ResultRecorder recorder;
    EngineError error;
    const std::vector<MatchResult> results = {{"p1", "p3", 1.0}, {"p2", "p4", 1.0}};
    REQUIRE(recorder.ApplyResults(registry, RoundOne(), results, config, &error));
    REQUIRE_FALSE(recorder.ApplyResults(registry, RoundOne(), results, config, &error));
    REQUIRE(error.kind == ErrorKind::kInvalidArgument);
    REQUIRE(registry.Find("p1")->score == 1.0);
    REQUIRE(registry.Find("p5")->bye_count == 1);
}

TEST_CASE("Undo removes the last recorded round", "[results][undo]") {
    auto registry = MakeField(5);
    TournamentConfig config;
    const ResultRecorder recorder;
    EngineError error;
    REQUIRE(recorder.ApplyResults(registry, RoundOne(), {{"p1", "p3", 1.0}, {"p2", "p4", 0.5}}, config, &error));

    REQUIRE_FALSE(recorder.UndoLastRound(registry, 2, &error));
    REQUIRE(error.kind == ErrorKind::kInvalidArgument);

    REQUIRE(recorder.UndoLastRound(registry, 1, &error));
    REQUIRE(registry.CompletedRounds() == 0);
    REQUIRE(registry.Find("p1")->score == 0.0);
    REQUIRE(registry.Find("p5")->bye_count == 0);
}

TEST_CASE("Valid scores are win, draw and loss", "[results]") {
    REQUIRE(IsValidScore(0.0));
    REQUIRE(IsValidScore(0.5));
    REQUIRE(IsValidScore(1.0));
    REQUIRE_FALSE(IsValidScore(-1.0));
    REQUIRE_FALSE(IsValidScore(2.0));
    const MatchResult draw{"a", "b", 0.5};
    REQUIRE(draw.black_score() == 0.5);
}
