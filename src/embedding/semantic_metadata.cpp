#include "embedding/semantic_metadata.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>
#include <set>
#include <vector>

#include "extraction/text_extractor.hpp"

namespace foldermind {

namespace {

constexpr std::size_t kMaxKeyPhrases = 5;
constexpr std::size_t kMaxTopics = 5;

const std::set<std::string> &stopwords()
{
    static const std::set<std::string> words = {
        "a", "about", "after", "all", "also", "an", "and", "any", "are", "as", "at",
        "be", "been", "but", "by", "can", "could", "do", "does", "each", "for",
        "from", "had", "has", "have", "he", "her", "his", "how", "if", "in", "into",
        "is", "it", "its", "may", "more", "most", "no", "not", "of", "on", "one",
        "or", "other", "our", "out", "over", "she", "should", "so", "some", "such",
        "than", "that", "the", "their", "them", "then", "there", "these", "they",
        "this", "those", "to", "up", "use", "used", "was", "we", "were", "what",
        "when", "where", "which", "while", "who", "will", "with", "would", "you",
        "your",
    };
    return words;
}

struct TopicRule {
    const char *topic;
    std::vector<std::string> keywords;
};

const std::vector<TopicRule> &topicRules()
{
    static const std::vector<TopicRule> rules = {
        {"machine learning", {"machine", "neural", "ai", "learning", "training"}},
        {"semantic search", {"semantic", "embedding", "embeddings", "vector", "similarity"}},
        {"document processing", {"document", "documents", "text", "content", "file", "files"}},
        {"data storage", {"database", "storage", "index", "query", "sqlite", "sql"}},
        {"transformer models", {"transformer", "model", "models", "bert", "gpt"}},
        {"programming", {"python", "javascript", "typescript", "code", "function", "class"}},
        {"web services", {"api", "endpoint", "service", "server", "http"}},
    };
    return rules;
}

std::vector<std::string> lowerWords(const std::string &text)
{
    std::vector<std::string> out;
    std::string current;
    for (unsigned char c : text) {
        if (std::isalnum(c)) {
            current.push_back(static_cast<char>(std::tolower(c)));
        } else if (!current.empty()) {
            out.push_back(current);
            current.clear();
        }
    }
    if (!current.empty()) {
        out.push_back(current);
    }
    return out;
}

bool isContentWord(const std::string &word)
{
    if (word.size() < 3 || stopwords().count(word) > 0) {
        return false;
    }
    return std::any_of(word.begin(), word.end(),
                       [](unsigned char c) { return std::isalpha(c); });
}

// Frequency-ranked, ties broken by first occurrence.
std::vector<std::string> rankByFrequency(const std::vector<std::string> &items,
                                         std::size_t minCount)
{
    std::map<std::string, std::pair<std::size_t, std::size_t>> stats;
    for (std::size_t i = 0; i < items.size(); ++i) {
        auto it = stats.find(items[i]);
        if (it == stats.end()) {
            stats.emplace(items[i], std::make_pair(std::size_t{1}, i));
        } else {
            ++it->second.first;
        }
    }

    std::vector<std::pair<std::string, std::pair<std::size_t, std::size_t>>> ranked(
        stats.begin(), stats.end());
    std::sort(ranked.begin(), ranked.end(), [](const auto &a, const auto &b) {
        if (a.second.first != b.second.first) {
            return a.second.first > b.second.first;
        }
        return a.second.second < b.second.second;
    });

    std::vector<std::string> out;
    for (const auto &entry : ranked) {
        if (entry.second.first >= minCount) {
            out.push_back(entry.first);
        }
    }
    return out;
}

int countSentences(const std::string &text)
{
    int sentences = 0;
    bool inSentence = false;
    for (unsigned char c : text) {
        if (c == '.' || c == '!' || c == '?') {
            if (inSentence) {
                ++sentences;
            }
            inSentence = false;
        } else if (!std::isspace(c)) {
            inSentence = true;
        }
    }
    if (inSentence) {
        ++sentences;
    }
    return std::max(1, sentences);
}

int estimateSyllables(const std::string &word)
{
    if (word.size() <= 3) {
        return 1;
    }
    auto isVowel = [](char c) {
        return c == 'a' || c == 'e' || c == 'i' || c == 'o' || c == 'u';
    };
    int groups = 0;
    bool previousVowel = false;
    for (char c : word) {
        const bool vowel = isVowel(c);
        if (vowel && !previousVowel) {
            ++groups;
        }
        previousVowel = vowel;
    }
    if (word.back() == 'e' && groups > 1) {
        --groups;
    }
    return std::max(1, groups);
}

} // namespace

double readabilityScore(const std::string &text)
{
    const std::vector<std::string> words = lowerWords(text);
    if (words.empty()) {
        return 50.0;
    }

    int syllables = 0;
    for (const std::string &word : words) {
        syllables += estimateSyllables(word);
    }

    const double wordsPerSentence =
        static_cast<double>(words.size()) / countSentences(text);
    const double syllablesPerWord = static_cast<double>(syllables) / words.size();
    double score = 206.835 - 1.015 * wordsPerSentence - 84.6 * syllablesPerWord;
    score = score * 0.7 + 15.0;
    return std::max(30.0, std::min(70.0, std::round(score)));
}

SemanticMetadata computeSemanticMetadata(const std::string &text)
{
    SemanticMetadata metadata;
    metadata.tokenCount = TextExtractor::estimateTokens(text);
    metadata.readabilityScore = readabilityScore(text);

    const std::vector<std::string> words = lowerWords(text);
    std::vector<std::string> bigrams;
    std::vector<std::string> contentWords;
    for (std::size_t i = 0; i < words.size(); ++i) {
        if (!isContentWord(words[i])) {
            continue;
        }
        contentWords.push_back(words[i]);
        if (i + 1 < words.size() && isContentWord(words[i + 1])) {
            bigrams.push_back(words[i] + ' ' + words[i + 1]);
        }
    }

    for (const std::string &phrase : rankByFrequency(bigrams, 2)) {
        if (metadata.keyPhrases.size() >= kMaxKeyPhrases) {
            break;
        }
        metadata.keyPhrases.push_back(phrase);
    }
    for (const std::string &word : rankByFrequency(contentWords, 1)) {
        if (metadata.keyPhrases.size() >= kMaxKeyPhrases) {
            break;
        }
        metadata.keyPhrases.push_back(word);
    }

    const std::set<std::string> vocabulary(words.begin(), words.end());
    for (const TopicRule &rule : topicRules()) {
        if (metadata.topics.size() >= kMaxTopics) {
            break;
        }
        const bool matched = std::any_of(rule.keywords.begin(), rule.keywords.end(),
                                         [&](const std::string &keyword) {
                                             return vocabulary.count(keyword) > 0;
                                         });
        if (matched) {
            metadata.topics.push_back(rule.topic);
        }
    }
    if (metadata.topics.empty() && !words.empty()) {
        metadata.topics.push_back("general");
    }
    return metadata;
}

} // namespace foldermind
