/** \file FillOptions.hpp
 *  Per-fill configuration: token delimiters and image widths.
 */
#pragma once
#include "DocxFill/VariablePattern.hpp"
#include "DocxFill/ImageSizes.hpp"

namespace DocxFill {

struct FillOptions {
    VariablePattern pattern;
    ImageSizeTable imageSizes{ImageSizeTable::defaults()};
};

} // namespace DocxFill
