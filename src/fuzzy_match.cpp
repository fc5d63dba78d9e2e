#include "fuzzy_match.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace {
// Elements of a long second sequence that occur in more than 1% of it are
// not used to seed matches.
constexpr std::size_t kAutojunkMinLength = 200;
}

SequenceMatcher::SequenceMatcher(std::string a, std::string b)
    : a_(std::move(a)), b_(std::move(b)) {
    index_second();
}

void SequenceMatcher::set_first(std::string a) {
    a_ = std::move(a);
}

void SequenceMatcher::set_second(std::string b) {
    b_ = std::move(b);
    index_second();
}

void SequenceMatcher::index_second() {
    b2j_.clear();
    popular_.clear();
    for(std::size_t j = 0; j < b_.size(); ++j) {
        b2j_[b_[j]].push_back(j);
    }
    const std::size_t n = b_.size();
    if(n >= kAutojunkMinLength) {
        const std::size_t ntest = n / 100 + 1;
        for(auto it = b2j_.begin(); it != b2j_.end();) {
            if(it->second.size() > ntest) {
                popular_.insert(it->first);
                it = b2j_.erase(it);
            } else {
                ++it;
            }
        }
    }
}

SequenceMatcher::Match SequenceMatcher::find_longest_match(std::size_t alo, std::size_t ahi,
                                                           std::size_t blo, std::size_t bhi) const {
    std::size_t besti = alo;
    std::size_t bestj = blo;
    std::size_t bestsize = 0;

    // j2len[j] = length of the longest match ending with a[i-1] and b[j]
    std::unordered_map<std::size_t, std::size_t> j2len;
    for(std::size_t i = alo; i < ahi; ++i) {
        std::unordered_map<std::size_t, std::size_t> newj2len;
        auto found = b2j_.find(a_[i]);
        if(found != b2j_.end()) {
            for(std::size_t j : found->second) {
                if(j < blo) continue;
                if(j >= bhi) break;
                std::size_t k = 1;
                if(j > 0) {
                    auto prev = j2len.find(j - 1);
                    if(prev != j2len.end()) k = prev->second + 1;
                }
                newj2len[j] = k;
                if(k > bestsize) {
                    besti = i + 1 - k;
                    bestj = j + 1 - k;
                    bestsize = k;
                }
            }
        }
        j2len = std::move(newj2len);
    }

    // Popular elements never seed a match but may extend one.
    while(besti > alo && bestj > blo && a_[besti - 1] == b_[bestj - 1]) {
        --besti;
        --bestj;
        ++bestsize;
    }
    while(besti + bestsize < ahi && bestj + bestsize < bhi &&
          a_[besti + bestsize] == b_[bestj + bestsize]) {
        ++bestsize;
    }
    return Match{besti, bestj, bestsize};
}

std::size_t SequenceMatcher::matched_characters() const {
    struct Range {
        std::size_t alo, ahi, blo, bhi;
    };
    std::size_t total = 0;
    std::vector<Range> queue{{0, a_.size(), 0, b_.size()}};
    while(!queue.empty()) {
        Range r = queue.back();
        queue.pop_back();
        Match m = find_longest_match(r.alo, r.ahi, r.blo, r.bhi);
        if(m.size == 0) continue;
        total += m.size;
        if(r.alo < m.a && r.blo < m.b) {
            queue.push_back({r.alo, m.a, r.blo, m.b});
        }
        if(m.a + m.size < r.ahi && m.b + m.size < r.bhi) {
            queue.push_back({m.a + m.size, r.ahi, m.b + m.size, r.bhi});
        }
    }
    return total;
}

double SequenceMatcher::ratio() const {
    const std::size_t length = a_.size() + b_.size();
    if(length == 0) return 1.0;
    return 2.0 * static_cast<double>(matched_characters()) / static_cast<double>(length);
}

double similarity_ratio(const std::string& a, const std::string& b) {
    return SequenceMatcher(a, b).ratio();
}

std::vector<std::string> close_matches(const std::string& word,
                                       const std::vector<std::string>& candidates,
                                       std::size_t n,
                                       double cutoff) {
    if(n == 0) {
        throw std::invalid_argument("close_matches: n must be > 0");
    }
    if(cutoff < 0.0 || cutoff > 1.0) {
        throw std::invalid_argument("close_matches: cutoff must be in [0.0, 1.0]");
    }

    SequenceMatcher matcher;
    matcher.set_second(word);
    std::vector<std::pair<double, std::string>> scored;
    for(const auto& candidate : candidates) {
        matcher.set_first(candidate);
        double score = matcher.ratio();
        if(score >= cutoff) scored.emplace_back(score, candidate);
    }

    std::sort(scored.begin(), scored.end(),
              [](const auto& lhs, const auto& rhs){ return lhs > rhs; });
    if(scored.size() > n) scored.resize(n);

    std::vector<std::string> out;
    out.reserve(scored.size());
    for(auto& item : scored) out.push_back(std::move(item.second));
    return out;
}
