#include "rates-snapshot.hpp"

#include "read-json.hpp"
#include "reader.hpp"

namespace fxr {

schema::RatesSnapshot ReadRatesSnapshot(const Reader &reader) { return ReadJsonOrThrow<schema::RatesSnapshot>(reader); }

}  // namespace fxr
