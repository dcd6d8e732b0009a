#include "identity.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <initializer_list>
#include <sstream>
#include <vector>

namespace seawatch::similarity {

namespace {

constexpr double kSynonymGroupScore = 0.8;

// Hand-tuned to match analyst judgment; extend rather than re-derive.
const std::vector<std::vector<std::string_view>> kSynonymGroups = {
    {"ROBBERY", "ROBBERY/THEFT", "THEFT", "ARMED ROBBERY"},
    {"BOARDING", "ATTEMPTED BOARDING", "BOARDED"},
    {"PIRACY", "HIJACK", "HIJACKING", "KIDNAPPING"},
    {"ATTACK", "ARMED ATTACK", "MISSILE ATTACK", "DRONE ATTACK", "UAV ATTACK", "USV ATTACK", "EXPLOSION"},
    {"DETENTION", "SEIZURE", "ARREST"},
    {"SUSPICIOUS APPROACH", "APPROACH", "SUSPICIOUS ACTIVITY", "SUSPICIOUS VESSEL"},
    {"THREAT", "MISSILE THREAT", "PIRACY THREAT", "WARNING"},
};

std::string ToUpper(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return out;
}

std::string_view Trim(std::string_view text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) text.remove_prefix(1);
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) text.remove_suffix(1);
  return text;
}

std::vector<std::string> SplitWords(const std::string& text) {
  std::istringstream       in(text);
  std::vector<std::string> words;
  std::string              word;
  while (in >> word) {
    words.push_back(word);
  }
  return words;
}

bool IsClassWord(const std::string& token) {
  static const std::array<std::string_view, 6> kClassWords = {"M/V", "MV", "M/T", "MT", "VESSEL", "TANKER"};
  return std::find(kClassWords.begin(), kClassWords.end(), token) != kClassWords.end();
}

bool InSameGroup(const std::string& t1, const std::string& t2) {
  for (const auto& group : kSynonymGroups) {
    const bool has1 = std::find(group.begin(), group.end(), t1) != group.end();
    const bool has2 = std::find(group.begin(), group.end(), t2) != group.end();
    if (has1 && has2) return true;
  }
  return false;
}

} // namespace

std::string NormalizeVesselName(std::string_view name) {
  // Tokens keep '/' so "M/V" is recognised; "M.V." collapses to "MV".
  std::vector<std::string> tokens;
  for (const auto& word : SplitWords(ToUpper(name))) {
    std::string token;
    for (char c : word) {
      if (std::isalnum(static_cast<unsigned char>(c)) || c == '/') token.push_back(c);
    }
    if (!token.empty()) tokens.push_back(std::move(token));
  }

  std::string out;
  for (std::size_t i = 0; i < tokens.size(); ++i) {
    if (tokens[i] == "MOTOR" && i + 1 < tokens.size() && (tokens[i + 1] == "VESSEL" || tokens[i + 1] == "TANKER")) {
      ++i;
      continue;
    }
    if (IsClassWord(tokens[i])) continue;
    for (char c : tokens[i]) {
      if (std::isalnum(static_cast<unsigned char>(c))) out.push_back(c);
    }
  }
  return out;
}

std::size_t Levenshtein(std::string_view a, std::string_view b) {
  const std::size_t rows = a.size() + 1;
  const std::size_t cols = b.size() + 1;

  std::vector<std::size_t> d(rows * cols);
  for (std::size_t i = 0; i < rows; ++i) d[i * cols] = i;
  for (std::size_t j = 0; j < cols; ++j) d[j] = j;

  for (std::size_t i = 1; i < rows; ++i) {
    for (std::size_t j = 1; j < cols; ++j) {
      const std::size_t cost = a[i - 1] == b[j - 1] ? 0 : 1;
      d[i * cols + j]        = std::min({d[(i - 1) * cols + j] + 1, d[i * cols + j - 1] + 1, d[(i - 1) * cols + j - 1] + cost});
    }
  }
  return d[rows * cols - 1];
}

double VesselNameSimilarity(std::string_view name1, std::string_view name2) {
  name1 = Trim(name1);
  name2 = Trim(name2);
  if (name1.empty() || name2.empty()) return 0.0;

  const auto n1 = NormalizeVesselName(name1);
  const auto n2 = NormalizeVesselName(name2);
  if (n1 == n2) return 1.0;

  const double longest = static_cast<double>(std::max(n1.size(), n2.size()));
  return std::max(0.0, 1.0 - static_cast<double>(Levenshtein(n1, n2)) / longest);
}

ImoNumber::ImoNumber(std::string_view text) : text_(Trim(text)) {
}

double ImoSimilarity(const ImoNumber& imo1, const ImoNumber& imo2) {
  if (imo1.Empty() || imo2.Empty()) return 0.0;
  return imo1.Text() == imo2.Text() ? 1.0 : 0.0;
}

std::string NormalizeIncidentType(std::string_view type) {
  return ToUpper(Trim(type));
}

double IncidentTypeSimilarity(std::string_view type1, std::string_view type2) {
  const auto t1 = NormalizeIncidentType(type1);
  const auto t2 = NormalizeIncidentType(type2);
  if (t1.empty() || t2.empty()) return 0.0;
  if (t1 == t2) return 1.0;
  if (InSameGroup(t1, t2)) return kSynonymGroupScore;

  const auto words1 = SplitWords(t1);
  const auto words2 = SplitWords(t2);

  std::size_t shared = 0;
  for (const auto& word : words1) {
    if (std::find(words2.begin(), words2.end(), word) != words2.end()) ++shared;
  }
  return static_cast<double>(shared) / static_cast<double>(std::max(words1.size(), words2.size()));
}

} // namespace seawatch::similarity
