#pragma once

// Non-inline definitions. Include from exactly one translation unit.
#include <syncoro/impl/assert.ipp>
#include <syncoro/impl/error.ipp>

#include <iocoro/impl.hpp>
