#pragma once
#include <iosfwd>

namespace hookcache {

// hookcache command line. Exit codes: 0 success or hit, 1 lookup miss,
// 2 usage error (unknown option, command or cache).
int run_cli(int argc, char* argv[], std::istream& in, std::ostream& out, std::ostream& err);

} // namespace hookcache
