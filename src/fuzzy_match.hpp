#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

// Ratcliff/Obershelp similarity. The second sequence is indexed once, so
// scoring many candidates against one query reuses it.
class SequenceMatcher {
public:
    SequenceMatcher() = default;
    SequenceMatcher(std::string a, std::string b);

    void set_first(std::string a);
    void set_second(std::string b);

    // 2*M / (|a| + |b|); 1.0 when both are empty.
    double ratio() const;

    struct Match {
        std::size_t a = 0;
        std::size_t b = 0;
        std::size_t size = 0;
    };

    Match find_longest_match(std::size_t alo, std::size_t ahi,
                             std::size_t blo, std::size_t bhi) const;
    std::size_t matched_characters() const;

private:
    void index_second();

    std::string a_;
    std::string b_;
    std::unordered_map<char, std::vector<std::size_t>> b2j_;
    std::unordered_set<char> popular_;
};

double similarity_ratio(const std::string& a, const std::string& b);

// Candidates whose ratio against `word` is >= cutoff, best first, at most n.
// Throws std::invalid_argument for n == 0 or a cutoff outside [0, 1].
std::vector<std::string> close_matches(const std::string& word,
                                       const std::vector<std::string>& candidates,
                                       std::size_t n,
                                       double cutoff);
