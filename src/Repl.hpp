#pragma once

#include <istream>
#include <ostream>

namespace Lla
{

// Reads statements until the input ends. Globals are kept between lines.
int runRepl(std::istream& in, std::ostream& out, std::ostream& errorOut);

}
