#pragma once

#include <Context.hpp>
#include <Vm/Globals.hpp>

namespace Lla
{

// Converts any value to its printed form.
Value str(Context& c);
// Seconds since an unspecified point in time.
Value clock(Context& c);

void defineBuiltins(Globals& globals);

}
