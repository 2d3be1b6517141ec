#pragma once

#include <iocoro/expected.hpp>

namespace syncoro {

using iocoro::expected;
using iocoro::unexpect;
using iocoro::unexpect_t;
using iocoro::unexpected;

// Keep `syncoro::operator==/!=` usable when referenced through the syncoro namespace.
using iocoro::operator==;
using iocoro::operator!=;

}  // namespace syncoro
