#include "internal/reference/reference_cache.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_store.hpp"

namespace {

using seawatch::db::memory::MemoryStore;
using seawatch::db::model::RawRecord;
using seawatch::db::model::VesselReferenceRecord;
using seawatch::reference::ByImo;
using seawatch::reference::ByName;
using seawatch::reference::ReferenceCache;
using seawatch::reference::VesselResolver;

VesselReferenceRecord Vessel(const std::string& id, const std::string& imo, const std::string& name) {
  VesselReferenceRecord v;
  v.id              = id;
  v.imo             = imo;
  v.normalized_name = name;
  v.display_name    = name;
  return v;
}

RawRecord WithVessel(const std::string& imo, const std::string& name) {
  RawRecord r;
  r.id          = "r-" + imo + name;
  r.vessel_imo  = imo;
  r.vessel_name = name;
  return r;
}

void TestCacheBasics() {
  ReferenceCache cache;
  assert(cache.Size() == 0);
  assert(!cache.Get(ByImo{"9123456"}));

  cache.Put(ByImo{"9123456"}, "v1");
  cache.Put(ByName{"9123456"}, "v2");
  assert(cache.Size() == 2);
  assert(cache.Get(ByImo{"9123456"}) == std::string("v1"));
  assert(cache.Get(ByName{"9123456"}) == std::string("v2"));

  cache.Clear();
  assert(cache.Size() == 0);
  assert(!cache.Get(ByName{"9123456"}));
}

void TestResolverPrefersImoThenName() {
  auto store = std::make_shared<MemoryStore>();
  {
    auto tx = store->Begin();
    assert(store->InsertVesselReference(*tx, Vessel("v1", "9123456", "OCEANSTAR")));
    assert(store->InsertVesselReference(*tx, Vessel("v2", "", "NORDICACE")));
    tx->Commit();
  }

  ReferenceCache cache;
  VesselResolver resolver(*store, cache);
  auto           tx = store->Begin();

  assert(resolver.Resolve(*tx, WithVessel("9123456", "Some Other Name")) == std::string("v1"));
  assert(cache.Size() == 1);

  assert(resolver.Resolve(*tx, WithVessel("", "M/V Nordic Ace")) == std::string("v2"));
  assert(cache.Size() == 2);

  // unknown IMO falls back to the name
  assert(resolver.Resolve(*tx, WithVessel("9999999", "ocean star")) == std::string("v1"));
  assert(cache.Size() == 3);

  assert(!resolver.Resolve(*tx, WithVessel("", "")));
  tx->Commit();
}

void TestMissesAreNotCached() {
  auto           store = std::make_shared<MemoryStore>();
  ReferenceCache cache;
  VesselResolver resolver(*store, cache);

  {
    auto tx = store->Begin();
    assert(!resolver.Resolve(*tx, WithVessel("", "Kota Bersatu")));
    tx->Commit();
  }
  assert(cache.Size() == 0);

  {
    auto tx = store->Begin();
    assert(store->InsertVesselReference(*tx, Vessel("v3", "", "KOTABERSATU")));
    tx->Commit();
  }

  auto tx = store->Begin();
  assert(resolver.Resolve(*tx, WithVessel("", "Kota Bersatu")) == std::string("v3"));
  tx->Commit();
}

void TestCachedEntriesAnswerFirst() {
  auto           store = std::make_shared<MemoryStore>();
  ReferenceCache cache;
  cache.Put(ByImo{"1111111"}, "cached");

  VesselResolver resolver(*store, cache);
  auto           tx = store->Begin();
  assert(resolver.Resolve(*tx, WithVessel("1111111", "")) == std::string("cached"));
  tx->Commit();
}

} // namespace

int main() {
  TestCacheBasics();
  TestResolverPrefersImoThenName();
  TestMissesAreNotCached();
  TestCachedEntriesAnswerFirst();

  std::cout << "seawatch_unit_reference_cache: pass\n";
  return 0;
}
