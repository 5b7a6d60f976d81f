/**
 * VOXRELAY - Realtime Voice Gateway
 * Sentiment - Implementation
 */

#include "audio/sentiment.hpp"

#include "util/logger.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <optional>

namespace voxrelay::audio {

namespace {

constexpr double positive_threshold = 0.1;
constexpr double negative_threshold = -0.1;
constexpr double negation_factor = -0.5;

double round3(double value) {
    return std::round(value * 1000.0) / 1000.0;
}

std::unordered_map<std::string, LexiconEntry> default_lexicon() {
    return {
        // Positive
        {"good", {0.7, 0.6}},
        {"great", {0.8, 0.75}},
        {"excellent", {1.0, 1.0}},
        {"amazing", {0.6, 0.9}},
        {"awesome", {1.0, 1.0}},
        {"wonderful", {1.0, 1.0}},
        {"fantastic", {0.4, 0.9}},
        {"perfect", {1.0, 1.0}},
        {"best", {1.0, 0.3}},
        {"better", {0.5, 0.5}},
        {"nice", {0.6, 1.0}},
        {"happy", {0.8, 1.0}},
        {"glad", {0.5, 1.0}},
        {"love", {0.5, 0.6}},
        {"like", {0.2, 0.3}},
        {"enjoy", {0.4, 0.5}},
        {"pleased", {0.5, 0.8}},
        {"beautiful", {0.85, 1.0}},
        {"helpful", {0.5, 0.5}},
        {"fast", {0.2, 0.6}},
        {"easy", {0.43, 0.83}},
        {"thanks", {0.2, 0.2}},
        {"thank", {0.2, 0.2}},
        {"fine", {0.42, 0.5}},
        {"cool", {0.35, 0.65}},
        {"fun", {0.3, 0.2}},
        {"exciting", {0.3, 0.8}},
        // Negative
        {"bad", {-0.7, 0.67}},
        {"worse", {-0.4, 0.6}},
        {"worst", {-1.0, 1.0}},
        {"terrible", {-1.0, 1.0}},
        {"awful", {-1.0, 1.0}},
        {"horrible", {-1.0, 1.0}},
        {"poor", {-0.4, 0.6}},
        {"sad", {-0.5, 1.0}},
        {"angry", {-0.5, 1.0}},
        {"hate", {-0.8, 0.9}},
        {"annoying", {-0.8, 0.9}},
        {"disappointed", {-0.75, 0.75}},
        {"disappointing", {-0.6, 0.7}},
        {"slow", {-0.3, 0.4}},
        {"broken", {-0.4, 0.4}},
        {"wrong", {-0.5, 0.9}},
        {"difficult", {-0.5, 1.0}},
        {"hard", {-0.3, 0.54}},
        {"ugly", {-0.7, 1.0}},
        {"boring", {-1.0, 1.0}},
        {"problem", {-0.2, 0.3}},
        {"fail", {-0.5, 0.3}},
        {"failed", {-0.5, 0.3}},
        {"useless", {-0.5, 0.2}},
        {"sorry", {-0.5, 1.0}},
    };
}

std::optional<double> intensifier(std::string_view word) {
    if (word == "very" || word == "really" || word == "so") {
        return 1.3;
    }
    if (word == "extremely" || word == "incredibly") {
        return 1.5;
    }
    if (word == "quite" || word == "pretty") {
        return 1.1;
    }
    if (word == "slightly" || word == "somewhat") {
        return 0.6;
    }
    return std::nullopt;
}

bool is_negator(std::string_view word) {
    static const std::vector<std::string_view> negators = {
        "not", "no", "never", "none", "nothing", "neither", "nor", "without",
        "don't", "doesn't", "didn't", "isn't", "aren't", "wasn't", "weren't",
        "can't", "cannot", "won't", "wouldn't", "shouldn't", "couldn't"
    };
    return std::find(negators.begin(), negators.end(), word) != negators.end();
}

} // namespace

LexiconSentimentScorer::LexiconSentimentScorer()
    : LexiconSentimentScorer(default_lexicon())
{
}

LexiconSentimentScorer::LexiconSentimentScorer(std::unordered_map<std::string, LexiconEntry> lexicon)
    : lexicon_(std::move(lexicon))
{
    VOXRELAY_LOG_DEBUG(util::log_component::Audio, "Sentiment scorer initialized: {} words",
                       lexicon_.size());
}

std::vector<std::string> LexiconSentimentScorer::tokenize(std::string_view text) {
    std::vector<std::string> tokens;
    std::string current;

    for (char ch : text) {
        auto c = static_cast<unsigned char>(ch);
        if (std::isalnum(c) || c == '\'') {
            current += static_cast<char>(std::tolower(c));
        } else if (!current.empty()) {
            tokens.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) {
        tokens.push_back(std::move(current));
    }

    return tokens;
}

std::string LexiconSentimentScorer::label_for(double polarity) {
    if (polarity > positive_threshold) {
        return "positive";
    }
    if (polarity < negative_threshold) {
        return "negative";
    }
    return "neutral";
}

backend::Sentiment LexiconSentimentScorer::score(std::string_view text) const {
    auto tokens = tokenize(text);

    double polarity_sum = 0.0;
    double subjectivity_sum = 0.0;
    std::size_t scored = 0;

    // Modifiers apply to the next scored word only
    double modifier = 1.0;
    bool negated = false;

    for (const auto& token : tokens) {
        if (is_negator(token)) {
            negated = !negated;
            continue;
        }
        if (auto factor = intensifier(token)) {
            modifier *= *factor;
            continue;
        }

        auto it = lexicon_.find(token);
        if (it == lexicon_.end()) {
            continue;
        }

        double polarity = it->second.polarity * modifier;
        double subjectivity = it->second.subjectivity * modifier;
        if (negated) {
            polarity *= negation_factor;
        }

        polarity_sum += std::clamp(polarity, -1.0, 1.0);
        subjectivity_sum += std::clamp(subjectivity, 0.0, 1.0);
        ++scored;

        modifier = 1.0;
        negated = false;
    }

    backend::Sentiment sentiment;
    if (scored > 0) {
        sentiment.polarity = round3(polarity_sum / static_cast<double>(scored));
        sentiment.subjectivity = round3(subjectivity_sum / static_cast<double>(scored));
    }
    sentiment.label = label_for(sentiment.polarity);
    return sentiment;
}

} // namespace voxrelay::audio
