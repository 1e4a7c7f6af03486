/** \file Emu.hpp
 *  English Metric Unit conversions used by DrawingML extents.
 */
#pragma once
#include <cmath>
#include <cstdint>

namespace DocxFill { namespace util {

constexpr std::int64_t EmuPerInch = 914400;

inline std::int64_t inchesToEmu(double inches) {
    return static_cast<std::int64_t>(std::llround(inches * static_cast<double>(EmuPerInch)));
}

}} // namespace DocxFill::util
