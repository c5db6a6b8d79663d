#include "whisper/vocabulary.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <unordered_set>
#include <utility>

namespace vocabulary {

namespace {

std::string trim(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); });
    if (begin >= end.base()) return {};
    return std::string(begin, end.base());
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

std::vector<std::string> clean_terms(const std::vector<std::string>& terms) {
    std::vector<std::string> out;
    std::unordered_set<std::string> seen;
    for (const auto& raw : terms) {
        auto term = trim(raw);
        if (term.size() < kMinTermLength || term.size() > kMaxTermLength) continue;
        if (!seen.insert(lower(term)).second) continue;
        out.push_back(std::move(term));
    }
    return out;
}

std::string build_prompt(const std::string& prompt, const std::vector<std::string>& terms) {
    std::string out = trim(prompt);
    if (out.size() > kMaxPromptLength) {
        size_t cut = kMaxPromptLength;
        // Back up to a UTF-8 lead byte.
        while (cut > 0 && (static_cast<unsigned char>(out[cut]) & 0xC0) == 0x80) --cut;
        out.resize(cut);
    }

    bool first = true;
    for (const auto& term : clean_terms(terms)) {
        std::string sep = first ? (out.empty() ? "" : " ") : ", ";
        if (out.size() + sep.size() + term.size() > kMaxPromptLength) break;
        out += sep;
        out += term;
        first = false;
    }
    return out;
}

std::expected<std::vector<std::string>, std::string> load_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return std::unexpected("cannot open " + path);
    }

    std::vector<std::string> terms;
    std::string line;
    while (std::getline(in, line)) {
        auto term = trim(line);
        if (term.empty() || term.starts_with('#')) continue;
        terms.push_back(std::move(term));
    }
    if (in.bad()) {
        return std::unexpected("read error on " + path);
    }
    return terms;
}

} // namespace vocabulary
