/**
 * @file line_decoder.cpp
 * @brief LineDecoder compilation unit.
 *
 * The decode loop lives in line_decoder.hpp so it can be inlined into
 * the body reader.
 *
 * @see include/yenc/line_decoder.hpp
 */

#include <yenc/line_decoder.hpp>
