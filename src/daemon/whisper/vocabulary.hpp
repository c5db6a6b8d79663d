#pragma once

#include <expected>
#include <string>
#include <vector>

// whisper conditions decoding on an initial prompt; listing domain terms
// and proper nouns there biases it toward their spelling.
namespace vocabulary {

inline constexpr size_t kMinTermLength = 2;
inline constexpr size_t kMaxTermLength = 50;
// whisper keeps roughly the last 224 prompt tokens.
inline constexpr size_t kMaxPromptLength = 800;

// Trims each term and drops blanks, terms outside [kMinTermLength, kMaxTermLength]
// and case-insensitive duplicates. Order is preserved.
std::vector<std::string> clean_terms(const std::vector<std::string>& terms);

// "<prompt> <term>, <term>, ..." with terms appended until kMaxPromptLength.
// Empty when both inputs are empty.
std::string build_prompt(const std::string& prompt, const std::vector<std::string>& terms);

// One term per line. Blank lines and lines starting with '#' are skipped.
std::expected<std::vector<std::string>, std::string> load_file(const std::string& path);

} // namespace vocabulary
