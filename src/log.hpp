#pragma once

#include <string>

namespace mdtable {

// Prints `msg` in debug builds. Always returns false, so it can be chained
// into an assertion: assert(ok || log("why")).
bool log(std::string msg);

}  // namespace mdtable
