// ==============================================================================
// Quiz Tests - Scoring and Feedback
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "scoring.h"

using namespace Earshot::Quiz;
using Catch::Approx;

namespace {

Trial lowpassTrial() {
    Trial trial;
    trial.kind = FilterKind::Lowpass;
    trial.frequencyHz = 5000;
    trial.label = "Lowpass";
    trial.details = "Cutoff: 5000 Hz (Butterworth Order 5)";
    trial.spec = Earshot::DSP::LowpassSpec{5000.0, 5};
    return trial;
}

Trial notchTrial() {
    Trial trial;
    trial.kind = FilterKind::Notch;
    trial.frequencyHz = 1500;
    trial.label = "Mid";
    trial.details = "Center: 1500 Hz (Mid), BW: 1.6 Oct, Gain: -9.0 dB";
    trial.spec = Earshot::DSP::NotchSpec{1500.0, -9.0, 1.6};
    return trial;
}

} // namespace

TEST_CASE("scoreAnswer for passband filters", "[scoring]") {
    const Trial trial = lowpassTrial();

    const auto right = scoreAnswer(trial, {FilterKind::Lowpass, std::nullopt});
    REQUIRE(right.points == 1.0);
    REQUIRE(right.typeCorrect);
    REQUIRE(verdictText(trial, right) == "Correct!");

    const auto wrong = scoreAnswer(trial, {FilterKind::Highpass, std::nullopt});
    REQUIRE(wrong.points == 0.0);
    REQUIRE_FALSE(wrong.typeCorrect);
    REQUIRE(verdictText(trial, wrong) == "Incorrect.");
}

TEST_CASE("scoreAnswer for peak filters", "[scoring]") {
    const Trial trial = notchTrial();

    SECTION("type and frequency") {
        const auto score = scoreAnswer(trial, {FilterKind::Notch, 1500});
        REQUIRE(score.points == 1.0);
        REQUIRE(score.frequencyCorrect);
        REQUIRE(verdictText(trial, score) == "Correct! (Type and Frequency)");
    }

    SECTION("type only earns half a point") {
        const auto score = scoreAnswer(trial, {FilterKind::Notch, 500});
        REQUIRE(score.points == 0.5);
        REQUIRE(score.typeCorrect);
        REQUIRE_FALSE(score.frequencyCorrect);
        REQUIRE(verdictText(trial, score) ==
                "Partially Correct. (Correct type 'Notch', but wrong frequency)");
    }

    SECTION("missing frequency counts as wrong frequency") {
        REQUIRE(scoreAnswer(trial, {FilterKind::Notch, std::nullopt}).points == 0.5);
    }

    SECTION("wrong type scores nothing even with the right frequency") {
        const auto score = scoreAnswer(trial, {FilterKind::Bandpass, 1500});
        REQUIRE(score.points == 0.0);
        REQUIRE_FALSE(score.frequencyCorrect);
    }
}

TEST_CASE("revealText honours the feedback options", "[scoring][feedback]") {
    const Trial trial = notchTrial();

    SECTION("nothing revealed by default") {
        const Answer answer{FilterKind::Lowpass, std::nullopt};
        REQUIRE(revealText(trial, answer, scoreAnswer(trial, answer), {}).empty());
    }

    SECTION("wrong type names the correct type") {
        const Answer answer{FilterKind::Lowpass, std::nullopt};
        REQUIRE(revealText(trial, answer, scoreAnswer(trial, answer), {true, false}) ==
                "The correct filter type was: Notch");
    }

    SECTION("wrong frequency names the correct band") {
        const Answer answer{FilterKind::Notch, 8000};
        REQUIRE(revealText(trial, answer, scoreAnswer(trial, answer), {true, false}) ==
                "The correct frequency was: 1500 Hz (Mid)");
    }

    SECTION("details are appended") {
        const Answer answer{FilterKind::Notch, 8000};
        REQUIRE(revealText(trial, answer, scoreAnswer(trial, answer), {true, true}) ==
                "The correct frequency was: 1500 Hz (Mid) | "
                "Filter Details: Center: 1500 Hz (Mid), BW: 1.6 Oct, Gain: -9.0 dB");
    }

    SECTION("a fully correct answer only shows details") {
        const Answer answer{FilterKind::Notch, 1500};
        REQUIRE(revealText(trial, answer, scoreAnswer(trial, answer), {true, true}) ==
                "Filter Details: Center: 1500 Hz (Mid), BW: 1.6 Oct, Gain: -9.0 dB");
    }
}

TEST_CASE("QuizSession accumulates points", "[scoring][session]") {
    QuizSession session;
    REQUIRE(session.scoreText() == "Current Score: 0.0/0");

    session.record({1.0, true, false});
    session.record({0.5, true, false});
    session.record({0.0, false, false});

    REQUIRE(session.totalPoints() == Approx(1.5));
    REQUIRE(session.questionsAnswered() == 3);
    REQUIRE(session.scoreText() == "Current Score: 1.5/3");
    REQUIRE(session.finalScoreText(10) == "Final Score: 1.5/10");
}
