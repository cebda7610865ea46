/**
 * @file crc32.cpp
 * @brief Crc32 compilation unit.
 *
 * Crc32 is implemented inline in crc32.hpp. This unit checks that the
 * header compiles on its own and gives the library an object for it.
 *
 * @see include/yenc/crc32.hpp
 */

#include <yenc/crc32.hpp>
