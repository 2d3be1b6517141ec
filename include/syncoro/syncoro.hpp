#pragma once

#include <syncoro/assert.hpp>
#include <syncoro/client.hpp>
#include <syncoro/config.hpp>
#include <syncoro/error.hpp>
#include <syncoro/error_info.hpp>
#include <syncoro/expected.hpp>
#include <syncoro/logger.hpp>
#include <syncoro/tracing.hpp>
