/***
 * Name: labelkit::support::detail (log state)
 * Purpose: Internal accessors for the process-wide log threshold and stream.
 */
#pragma once

#include <iosfwd>

#include "labelkit/support/log.h"

namespace labelkit::support::detail {

LogLevel& LevelSlot();
std::ostream*& StreamSlot();

}  // namespace labelkit::support::detail
