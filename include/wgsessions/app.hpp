#pragma once

#include <iosfwd>

#include "wgsessions/config.hpp"

namespace wgsessions {

// Runs the whole report: dates, peer map, event stream, sessions, output.
// Progress and notices go to `out`, warnings and errors to `err`.
// Returns the process exit status (0 on success, 1 on a fatal condition).
int run_report(RunConfig cfg, const Date& today, std::ostream& out, std::ostream& err);

} // namespace wgsessions
