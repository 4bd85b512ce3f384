#pragma once

#include <string_view>

#include <quill/LogMacros.h>

#include <tabula/log/formatter.hpp>
#include <tabula/log/frontend.hpp>

namespace tabula::log {

/**
 * Start the logging backend. Safe to call more than once.
 */
void initialize() noexcept;

logger* instance() noexcept;

/**
 * Apply a level by name: trace, debug, info, warning, error or critical.
 * Returns false and leaves the level untouched for an unknown name.
 */
bool set_level( std::string_view level ) noexcept;

} // namespace tabula::log
