#pragma once

// These can also be set from the build, see the LLA_DEBUG_* options in CMakeLists.txt.

//#define LLA_DEBUG_PRINT_COMPILED_FUNCTIONS
//#define LLA_DEBUG_PRINT_VM_EXECUTION_TRACE
//#define LLA_DEBUG_STRESS_TEST_GC
//#define LLA_EXECUTE_ASSERTS_IN_RELEASE
