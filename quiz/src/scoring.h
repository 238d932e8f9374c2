#pragma once

// ==============================================================================
// Scoring and Feedback
// ==============================================================================
// Points per question:
//   Lowpass/Highpass  1.0 for the correct type
//   Notch/Bandpass    1.0 for type and frequency, 0.5 for type only
// Anything else scores 0.
// ==============================================================================

#include "filter_catalog.h"
#include "trial.h"

#include <optional>
#include <string>

namespace Earshot::Quiz {

struct Answer {
    FilterKind kind = FilterKind::Lowpass;
    std::optional<int> frequencyHz;  // only asked for Notch/Bandpass guesses
};

struct QuestionScore {
    double points = 0.0;
    bool typeCorrect = false;
    bool frequencyCorrect = false;
};

struct FeedbackOptions {
    bool revealFilterType = false;   // name the correct type/frequency when missed
    bool revealDetails = false;      // print the trial's details line
};

QuestionScore scoreAnswer(const Trial& trial, const Answer& answer);

/// "Correct!", "Correct! (Type and Frequency)", "Partially Correct. (...)"
/// or "Incorrect."
std::string verdictText(const Trial& trial, const QuestionScore& score);

/// Optional reveal line joined with " | "; empty when nothing is revealed.
std::string revealText(const Trial& trial, const Answer& answer,
                       const QuestionScore& score, const FeedbackOptions& options);

/// Running total over the questions answered so far.
class QuizSession {
public:
    void record(const QuestionScore& score);

    [[nodiscard]] double totalPoints() const { return total_; }
    [[nodiscard]] int questionsAnswered() const { return answered_; }

    /// "Current Score: 3.5/5"
    [[nodiscard]] std::string scoreText() const;

    /// "Final Score: 7.5/10"
    [[nodiscard]] std::string finalScoreText(int numQuestions) const;

private:
    double total_ = 0.0;
    int answered_ = 0;
};

} // namespace Earshot::Quiz
