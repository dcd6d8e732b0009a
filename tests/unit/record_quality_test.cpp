#include "internal/ranking/record_quality.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <string>

namespace {

using seawatch::db::model::RawRecord;
using seawatch::ranking::Completeness;
using seawatch::ranking::DeterminePrimary;
using seawatch::ranking::QualityScore;
using seawatch::ranking::SourcePriority;

RawRecord Sparse(const std::string& id, const std::string& source) {
  RawRecord r;
  r.id     = id;
  r.source = source;
  return r;
}

void TestSourcePriority() {
  assert(SourcePriority("RECAAP") == 5);
  assert(SourcePriority("recaap") == 5);
  assert(SourcePriority("UKMTO") == 4);
  assert(SourcePriority("MDAT") == 3);
  assert(SourcePriority("ICC") == 3);
  assert(SourcePriority("CWD") == 2);
  assert(SourcePriority("Harbour Watch") == 1);
  assert(SourcePriority("") == 0);
}

void TestCompletenessGrowsWithInformation() {
  RawRecord r = Sparse("r1", "UKMTO");
  assert(Completeness(r) == 0);

  r.title = "Boarding off Bab el Mandeb";
  assert(Completeness(r) == 1);

  r.description = "Short note.";
  assert(Completeness(r) == 2);

  r.description = std::string(150, 'x');
  assert(Completeness(r) == 4);

  r.latitude  = 12.5;
  r.longitude = 43.3;
  assert(Completeness(r) == 6);

  // (0,0) is not a position
  RawRecord unknown_position = r;
  unknown_position.latitude  = 0.0;
  unknown_position.longitude = 0.0;
  assert(Completeness(unknown_position) == 4);

  r.vessel_imo = "9123456";
  assert(Completeness(r) == 8);

  r.update_text = "Crew safe.";
  assert(Completeness(r) == 10);

  // whitespace is not content
  r.region = "   ";
  assert(Completeness(r) == 10);
}

void TestQualityScore() {
  const RawRecord r = Sparse("r1", "UKMTO");
  assert(std::abs(QualityScore(r) - 1.2) < 1e-9);
}

void TestDeterminePrimary() {
  RawRecord sparse = Sparse("r1", "RECAAP");
  RawRecord rich   = Sparse("r2", "CWD");
  rich.title       = "Robbery";
  rich.description = std::string(200, 'd');
  rich.vessel_imo  = "9123456";

  auto selection = DeterminePrimary(sparse, rich);
  assert(selection.primary == &rich);
  assert(selection.secondary == &sparse);

  selection = DeterminePrimary(rich, sparse);
  assert(selection.primary == &rich);

  // ties keep the first record
  RawRecord twin_a = Sparse("a", "UKMTO");
  RawRecord twin_b = Sparse("b", "ukmto");
  selection        = DeterminePrimary(twin_a, twin_b);
  assert(selection.primary == &twin_a);
  assert(selection.secondary == &twin_b);

  // source priority breaks otherwise equal completeness
  RawRecord low  = Sparse("low", "CWD");
  RawRecord high = Sparse("high", "RECAAP");
  selection      = DeterminePrimary(low, high);
  assert(selection.primary == &high);
}

} // namespace

int main() {
  TestSourcePriority();
  TestCompletenessGrowsWithInformation();
  TestQualityScore();
  TestDeterminePrimary();

  std::cout << "seawatch_unit_record_quality: pass\n";
  return 0;
}
