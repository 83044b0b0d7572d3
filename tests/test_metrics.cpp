#include "TestSupport.h"

#include "gambit/core/comparison/Metrics.h"

using gambit::core::comparison::EvaluateCompliance;
using gambit::core::comparison::FideScore;
using gambit::core::comparison::MeasureQuality;
using gambit::core::comparison::OverallScore;
using gambit::core::comparison::QualityScore;
using gambit::core::comparison::ScoreWeights;
using gambit::core::tournament::Pairing;
using gambit::core::tournament::PairingResult;
using gambit::core::tournament::TournamentConfig;
using namespace gambit::test;

namespace {

PairingResult Boards(std::vector<Pairing> pairings, std::optional<std::string> bye = std::nullopt) {
    PairingResult result;
    result.round_number = 1;
    result.pairings = std::move(pairings);
    result.bye_player_id = std::move(bye);
    return result;
}

}  // namespace

TEST_CASE("Quality metrics of a clean first round", "[metrics][quality]") {
    const auto registry = MakeRegistry({MakePlayer("a", 2000), MakePlayer("b", 1990), MakePlayer("c", 1600),
                                        MakePlayer("d", 1200)});
    const auto pairing = Boards({Pairing{"a", "b"}, Pairing{"c", "d"}});

    const auto metrics = MeasureQuality(pairing, registry);
    REQUIRE(metrics.psd == 0.0);
    REQUIRE(metrics.psd_score == 1.0);
    REQUIRE(metrics.color_balance == Approx(0.8));
    REQUIRE(metrics.bracket_compliance == 1.0);
    REQUIRE(metrics.rating_gap == Approx(0.4875));
    REQUIRE(metrics.rematch_avoidance == 1.0);
    REQUIRE(QualityScore(metrics) == Approx(0.89875));
    REQUIRE(QualityScore(pairing, registry) == Approx(0.89875));
}

TEST_CASE("Missing data yields neutral quality values", "[metrics][quality]") {
    const auto registry = MakeRegistry({MakePlayer("a"), MakePlayer("b")});
    REQUIRE(MeasureQuality(Boards({Pairing{"a", "b"}}), registry).rating_gap == 1.0);

    const auto empty = MeasureQuality(Boards({}), registry);
    REQUIRE(QualityScore(empty) == 1.0);
}

TEST_CASE("Rematches are penalised in quality and compliance", "[metrics]") {
    const auto registry = MakeRegistry({
        WithHistory(MakePlayer("a", 1800), {Played(1, "b", Color::kWhite, 1.0)}),
        WithHistory(MakePlayer("b", 1800), {Played(1, "a", Color::kBlack, 0.0)}),
    });
    const TournamentConfig config;
    const auto pairing = Boards({Pairing{"b", "a"}});
    REQUIRE(MeasureQuality(pairing, registry).rematch_avoidance == 0.0);

    const auto report = EvaluateCompliance(pairing, registry, config);
    REQUIRE(report.hard_violation());
    REQUIRE(report.CountsByCode().at("rematch") == 1);
    REQUIRE(FideScore(report) == 0.0);
}

TEST_CASE("Compliance flags hard rule violations", "[metrics][fide]") {
    const auto registry = MakeRegistry({MakePlayer("a", 2000), MakePlayer("b", 1900), MakePlayer("c", 1800),
                                        MakePlayer("d", 1700)});
    const TournamentConfig config;

    SECTION("clean pairing scores full compliance") {
        const auto pairing = Boards({Pairing{"a", "c"}, Pairing{"b", "d"}});
        const auto report = EvaluateCompliance(pairing, registry, config);
        REQUIRE_FALSE(report.hard_violation());
        REQUIRE(report.soft_checks == 2);
        REQUIRE(FideScore(pairing, registry, config) == 1.0);
    }

    SECTION("unpaired player") {
        const auto counts = EvaluateCompliance(Boards({Pairing{"a", "b"}}), registry, config).CountsByCode();
        REQUIRE(counts.at("unpaired_player") == 2);
    }

    SECTION("bye in an even field") {
        const auto counts =
            EvaluateCompliance(Boards({Pairing{"a", "b"}}, std::string("c")), registry, config).CountsByCode();
        REQUIRE(counts.at("extra_bye") == 1);
        REQUIRE(counts.at("unpaired_player") == 1);
    }

    SECTION("self pairing, duplicates and unknown ids") {
        const auto counts =
            EvaluateCompliance(Boards({Pairing{"a", "a"}, Pairing{"b", "c"}, Pairing{"c", "ghost"}}), registry, config)
                .CountsByCode();
        REQUIRE(counts.at("self_pairing") == 1);
        REQUIRE(counts.at("duplicate_player") == 1);
        REQUIRE(counts.at("unknown_player") == 1);
    }

    SECTION("bye handed to a withdrawn player") {
        auto withdrawn = MakeRegistry({MakePlayer("a", 2000), MakePlayer("b", 1900), MakePlayer("c", 1800)});
        gambit::core::EngineError error;
        REQUIRE(withdrawn.SetActive("c", false, &error));
        const auto report = EvaluateCompliance(Boards({Pairing{"a", "b"}}, std::string("c")), withdrawn, config);
        REQUIRE(report.hard_violation());
        REQUIRE(report.CountsByCode().at("inactive_player") == 1);
        REQUIRE(FideScore(report) == 0.0);
    }
}

TEST_CASE("Soft violations reduce the compliance fraction", "[metrics][fide]") {
    const auto registry = MakeRegistry({
        WithHistory(MakePlayer("a", 2000), {Played(1, "x", Color::kWhite, 1.0), Played(2, "y", Color::kWhite, 1.0)}),
        WithHistory(MakePlayer("b", 1900), {Played(1, "z", Color::kBlack, 1.0), Played(2, "w", Color::kBlack, 1.0)}),
    });
    const TournamentConfig config;

    const auto wrong = EvaluateCompliance(Boards({Pairing{"a", "b"}}), registry, config);
    REQUIRE_FALSE(wrong.hard_violation());
    REQUIRE(wrong.CountsByCode().at("color_preference") == 2);
    REQUIRE(wrong.CountsByCode().at("color_streak") == 2);
    REQUIRE(FideScore(wrong) == Approx(1.0 / 5.0));

    const auto right = EvaluateCompliance(Boards({Pairing{"b", "a"}}), registry, config);
    REQUIRE(FideScore(right) == 1.0);
}

TEST_CASE("Overall score blends normalised weights", "[metrics]") {
    REQUIRE(OverallScore(1.0, 0.0) == Approx(0.7));
    REQUIRE(OverallScore(1.0, 0.0, ScoreWeights{2.0, 2.0}) == Approx(0.5));
    REQUIRE(OverallScore(1.0, 0.0, ScoreWeights{0.0, 0.0}) == Approx(0.5));
    REQUIRE(OverallScore(1.0, 1.0) == Approx(1.0));
}
