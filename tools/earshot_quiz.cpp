// ==============================================================================
// Earshot Hearing Quiz
// ==============================================================================
// Interactive filter-recognition quiz. Each question renders a pink-noise
// reference and a filtered copy as WAV files for playback in any audio
// player, then asks for the filter type (and center frequency for Notch and
// Bandpass) and keeps score.
//
// Usage:
//   earshot_quiz [outputDir] [--questions N] [--seed S] [--duration SECONDS]
// ==============================================================================

#include "answer_parsing.h"
#include "filter_catalog.h"
#include "quiz_config.h"
#include "scoring.h"
#include "trial.h"
#include "wav_writer.h"

#include <earshot/dsp/core/random.h>

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>

using namespace Earshot;

namespace {

struct Options {
    std::filesystem::path outputDir = "earshot_trials";
    Quiz::QuizConfig config;
};

void printUsage() {
    std::cerr << "Usage: earshot_quiz [outputDir] [--questions N] [--seed S] [--duration SECONDS]"
              << std::endl;
}

std::optional<Options> parseArguments(int argc, char* argv[]) {
    Options options;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool hasValue = (i + 1 < argc);
        try {
            if (arg == "--questions" && hasValue) {
                options.config.numQuestions = std::stoi(argv[++i]);
            } else if (arg == "--seed" && hasValue) {
                const auto seed = Quiz::parseSeed(argv[++i]);
                if (!seed) {
                    std::cerr << "Invalid value for " << arg << std::endl;
                    return std::nullopt;
                }
                options.config.seed = *seed;
            } else if (arg == "--duration" && hasValue) {
                options.config.durationSeconds = std::stod(argv[++i]);
            } else if (!arg.empty() && arg[0] != '-') {
                options.outputDir = arg;
            } else {
                std::cerr << "Unknown or incomplete option: " << arg << std::endl;
                return std::nullopt;
            }
        } catch (const std::exception&) {
            std::cerr << "Invalid value for " << arg << std::endl;
            return std::nullopt;
        }
    }

    if (options.config.numQuestions <= 0 || !(options.config.durationSeconds > 0.0)) {
        std::cerr << "Question count and duration must be positive." << std::endl;
        return std::nullopt;
    }
    return options;
}

// Prompt until the parser accepts the line. nullopt means stdin closed.
template <typename Parser>
auto prompt(const std::string& question, const std::string& retryMessage, Parser parse)
    -> decltype(parse(std::string{})) {
    std::string line;
    while (true) {
        std::cout << question << std::flush;
        if (!std::getline(std::cin, line)) {
            return std::nullopt;
        }
        if (auto value = parse(line)) {
            return value;
        }
        std::cout << retryMessage << std::endl;
    }
}

std::string trialFileName(int question, const char* role) {
    const std::string number = (question < 10 ? "0" : "") + std::to_string(question);
    return "q" + number + "_" + role + ".wav";
}

void printIntroduction() {
    std::cout << std::string(30, '-') << "\n"
              << " Hearing Test Quiz\n"
              << std::string(30, '-') << "\n"
              << "Each question renders original pink noise, then filtered pink noise.\n"
              << "1. Guess the filter type: " << Quiz::filterKindList() << "\n"
              << "2. If Notch or Bandpass, guess the center frequency.\n"
              << std::string(30, '-') << "\n"
              << "Scoring:\n"
              << " - Lowpass/Highpass: 1 point for correct type.\n"
              << " - Notch/Bandpass: 0.5 points for correct type, wrong frequency.\n"
              << " - Notch/Bandpass: 1 point for correct type AND correct frequency.\n"
              << std::string(30, '-') << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    const auto options = parseArguments(argc, argv);
    if (!options) {
        printUsage();
        return 2;
    }
    const Quiz::QuizConfig& config = options->config;

    std::error_code ec;
    std::filesystem::create_directories(options->outputDir, ec);
    if (ec) {
        std::cerr << "Failed to create output directory " << options->outputDir << ": "
                  << ec.message() << std::endl;
        return 1;
    }

    printIntroduction();

    const std::string yesNoRetry = "Invalid input. Please enter 'y' or 'n'.";
    const auto showType = prompt("Show correct FILTER TYPE after each guess? (y/n): ",
                                 yesNoRetry, Quiz::parseYesNo);
    if (!showType) {
        std::cout << "\nQuiz interrupted." << std::endl;
        return 1;
    }
    const auto showDetails = prompt("Show filter DETAILS (Freq, BW, Gain) after each guess? (y/n): ",
                                    yesNoRetry, Quiz::parseYesNo);
    if (!showDetails) {
        std::cout << "\nQuiz interrupted." << std::endl;
        return 1;
    }
    const Quiz::FeedbackOptions feedback{*showType, *showDetails};

    std::cout << "\nStarting the quiz..." << std::endl;

    DSP::Xorshift32 rng(config.seed);
    Quiz::QuizSession session;
    const auto sampleRate = static_cast<uint32_t>(config.sampleRate);

    for (int q = 1; q <= config.numQuestions; ++q) {
        std::cout << "\n--- Question " << q << "/" << config.numQuestions << " ---" << std::endl;

        const Quiz::Trial trial = Quiz::drawTrial(config, rng);
        const Quiz::RenderedTrial rendered = Quiz::renderTrial(trial, config, rng);
        if (rendered.usedReferenceFallback) {
            std::cerr << "Filtered clip was silent; using the original clip instead." << std::endl;
        }

        const auto referencePath = options->outputDir / trialFileName(q, "reference");
        const auto filteredPath = options->outputDir / trialFileName(q, "filtered");
        if (!Quiz::writeWavFile(referencePath, rendered.reference, sampleRate) ||
            !Quiz::writeWavFile(filteredPath, rendered.filtered, sampleRate)) {
            return 1;
        }
        std::cout << "Play ORIGINAL noise: " << referencePath.string() << "\n"
                  << "Play FILTERED noise: " << filteredPath.string() << std::endl;

        const auto kind = prompt("Guess the filter type (" + Quiz::filterKindList() + "): ",
                                 "Invalid guess. Please enter one of: " + Quiz::filterKindList() +
                                     " (or abbreviations like lp, hp, n, bp)",
                                 Quiz::parseFilterKind);
        if (!kind) {
            std::cout << "\nQuiz interrupted." << std::endl;
            return 1;
        }

        Quiz::Answer answer{*kind, std::nullopt};
        if (Quiz::hasCenterFrequency(*kind)) {
            std::cout << "Available frequencies: " << Quiz::bandList() << std::endl;
            answer.frequencyHz = prompt("Guess the center frequency (enter just the number): ",
                                        "Invalid frequency. Please enter one of the listed numbers.",
                                        Quiz::parseFrequencyGuess);
            if (!answer.frequencyHz) {
                std::cout << "\nQuiz interrupted." << std::endl;
                return 1;
            }
        }

        const Quiz::QuestionScore score = Quiz::scoreAnswer(trial, answer);
        session.record(score);

        std::cout << Quiz::verdictText(trial, score) << std::endl;
        const std::string reveal = Quiz::revealText(trial, answer, score, feedback);
        if (!reveal.empty()) {
            std::cout << reveal << std::endl;
        }
        std::cout << session.scoreText() << std::endl;

        std::this_thread::sleep_for(std::chrono::duration<double>(config.pauseBetweenQuestionsSeconds));
    }

    std::cout << "\n" << std::string(30, '=') << "\n"
              << "      Quiz Complete!\n"
              << "      " << session.finalScoreText(config.numQuestions) << "\n"
              << std::string(30, '=') << std::endl;
    return 0;
}
