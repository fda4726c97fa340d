#pragma once

#include <quill/LogMacros.h>

#include <wrapbin/log/formatter.hpp>
#include <wrapbin/log/frontend.hpp>

namespace wrapbin::log {

/// Starts the logging backend thread. Messages logged before are kept in the queues.
void initialize() noexcept;
logger* instance() noexcept;

} // namespace wrapbin::log
