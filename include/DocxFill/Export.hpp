/** \file Export.hpp
 *  Symbol visibility for the DocxFill library.
 */
#pragma once
#include <QtGlobal>

#if defined(DOCXFILL_SHARED)
#  if defined(DOCXFILL_BUILD_LIBRARY)
#    define DOCXFILL_EXPORT Q_DECL_EXPORT
#  else
#    define DOCXFILL_EXPORT Q_DECL_IMPORT
#  endif
#else
#  define DOCXFILL_EXPORT
#endif
