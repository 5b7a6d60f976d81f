/**
 * VOXRELAY - Realtime Voice Gateway
 * Sentiment - Lexicon-based polarity/subjectivity scorer
 *
 * Each known word carries a polarity in [-1, 1] and a subjectivity in [0, 1].
 * A preceding intensifier ("very", "really") scales the next word; a
 * preceding negator ("not", "never", "don't") flips it at half strength.
 * The text score is the mean over all scored words, rounded to 3 decimals.
 *
 * Labels: polarity > 0.1 positive, < -0.1 negative, otherwise neutral.
 */

#ifndef VOXRELAY_AUDIO_SENTIMENT_HPP
#define VOXRELAY_AUDIO_SENTIMENT_HPP

#include "backend/interfaces.hpp"

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace voxrelay::audio {

struct LexiconEntry {
    double polarity{0.0};
    double subjectivity{0.0};
};

class LexiconSentimentScorer final : public backend::SentimentScorer {
public:
    /**
     * Scorer with the built-in English lexicon
     */
    LexiconSentimentScorer();

    /**
     * Scorer with a caller-supplied lexicon (words must be lowercase)
     */
    explicit LexiconSentimentScorer(std::unordered_map<std::string, LexiconEntry> lexicon);

    backend::Sentiment score(std::string_view text) const override;

    static std::string label_for(double polarity);

    std::size_t lexicon_size() const noexcept { return lexicon_.size(); }

private:
    static std::vector<std::string> tokenize(std::string_view text);

    std::unordered_map<std::string, LexiconEntry> lexicon_;
};

} // namespace voxrelay::audio

#endif // VOXRELAY_AUDIO_SENTIMENT_HPP
