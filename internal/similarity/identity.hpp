#pragma once

#include <concepts>
#include <cstddef>
#include <string>
#include <string_view>

namespace seawatch::similarity {

/*
  Identity comparators for vessel names, IMO numbers and incident types.
  All scores are in [0,1]; a missing value on either side scores 0.
*/

// Uppercase, drop vessel-class words (M/V, MV, MOTOR VESSEL, VESSEL, M/T,
// MT, MOTOR TANKER, TANKER), keep only A-Z and 0-9.
std::string NormalizeVesselName(std::string_view name);

std::size_t Levenshtein(std::string_view a, std::string_view b);

double VesselNameSimilarity(std::string_view name1, std::string_view name2);

/*
  IMO number as reported: feeds send it either as text or as a number.
  Compared by its trimmed decimal text.
*/
class ImoNumber {
 public:
  ImoNumber() = default;
  ImoNumber(std::string_view text);
  ImoNumber(const std::string& text) : ImoNumber(std::string_view(text)) {
  }
  ImoNumber(const char* text) : ImoNumber(std::string_view(text ? text : "")) {
  }

  template <std::integral T>
  ImoNumber(T number) : text_(std::to_string(number)) {
  }

  const std::string& Text() const {
    return text_;
  }
  bool Empty() const {
    return text_.empty();
  }

 private:
  std::string text_;
};

// 1 iff both present and textually equal.
double ImoSimilarity(const ImoNumber& imo1, const ImoNumber& imo2);

// 1 on exact match, 0.8 within a synonym group, else shared-token fraction.
double IncidentTypeSimilarity(std::string_view type1, std::string_view type2);

// Uppercased and trimmed, as compared by IncidentTypeSimilarity.
std::string NormalizeIncidentType(std::string_view type);

} // namespace seawatch::similarity
