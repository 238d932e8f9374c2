#include "scoring.h"

#include <iomanip>
#include <sstream>
#include <vector>

namespace Earshot::Quiz {

namespace {

std::string formatScore(double points, int outOf) {
    std::ostringstream text;
    text << std::fixed << std::setprecision(1) << points << "/" << outOf;
    return text.str();
}

} // namespace

QuestionScore scoreAnswer(const Trial& trial, const Answer& answer) {
    QuestionScore score;
    score.typeCorrect = (answer.kind == trial.kind);
    if (!score.typeCorrect) {
        return score;
    }

    if (!hasCenterFrequency(trial.kind)) {
        score.points = 1.0;
        return score;
    }

    score.frequencyCorrect = answer.frequencyHz.has_value() &&
                             *answer.frequencyHz == trial.frequencyHz;
    score.points = score.frequencyCorrect ? 1.0 : 0.5;
    return score;
}

std::string verdictText(const Trial& trial, const QuestionScore& score) {
    if (!score.typeCorrect) {
        return "Incorrect.";
    }
    if (!hasCenterFrequency(trial.kind)) {
        return "Correct!";
    }
    if (score.frequencyCorrect) {
        return "Correct! (Type and Frequency)";
    }
    return "Partially Correct. (Correct type '" + std::string(filterKindName(trial.kind)) +
           "', but wrong frequency)";
}

std::string revealText(const Trial& trial, const Answer& answer,
                       const QuestionScore& score, const FeedbackOptions& options) {
    std::vector<std::string> parts;

    if (options.revealFilterType) {
        if (!score.typeCorrect) {
            parts.push_back("The correct filter type was: " + std::string(filterKindName(trial.kind)));
        }
        if (hasCenterFrequency(trial.kind) && !score.frequencyCorrect && answer.kind == trial.kind) {
            parts.push_back("The correct frequency was: " + formatBand(trial.frequencyHz));
        }
    }

    if (options.revealDetails) {
        parts.push_back("Filter Details: " + trial.details);
    }

    std::string joined;
    for (const auto& part : parts) {
        if (!joined.empty()) joined += " | ";
        joined += part;
    }
    return joined;
}

void QuizSession::record(const QuestionScore& score) {
    total_ += score.points;
    ++answered_;
}

std::string QuizSession::scoreText() const {
    return "Current Score: " + formatScore(total_, answered_);
}

std::string QuizSession::finalScoreText(int numQuestions) const {
    return "Final Score: " + formatScore(total_, numQuestions);
}

} // namespace Earshot::Quiz
