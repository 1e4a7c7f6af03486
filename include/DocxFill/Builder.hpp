/** \file Builder.hpp
 *  Free helper functions to concisely create variable shared_ptr objects.
 *  Keys may be passed bare (LOAN_AMOUNT) or wrapped ({{LOAN_AMOUNT}}); both address the same token.
 */
#pragma once
#include "DocxFill/Export.hpp"
#include "DocxFill/VariablePattern.hpp"
#include "DocxFill/TextVariable.hpp"
#include "DocxFill/ImageVariable.hpp"
#include "DocxFill/Docx.hpp"
#include <QImage>
#include <memory>

namespace DocxFill {

/** Returns true if key already appears wrapped with pattern prefix+suffix. */
inline bool keyLooksWrapped(const QString &key, const VariablePattern &pat){
    return key.size() > pat.prefix.size() + pat.suffix.size()
        && key.startsWith(pat.prefix) && key.endsWith(pat.suffix);
}

/** Ensure a key is wrapped with pattern delimiters. */
inline QString ensureWrapped(const QString &rawOrWrapped, const VariablePattern &pat){
    if(keyLooksWrapped(rawOrWrapped, pat)) return rawOrWrapped;
    return pat.wrap(rawOrWrapped);
}

/** Strip pattern delimiters if present; the token name is what the scanner reports. */
inline QString unwrapKey(const QString &rawOrWrapped, const VariablePattern &pat){
    if(!keyLooksWrapped(rawOrWrapped, pat)) return rawOrWrapped;
    return rawOrWrapped.mid(pat.prefix.size(), rawOrWrapped.size() - pat.prefix.size() - pat.suffix.size());
}

/** Create a TextVariable (wrapping key if necessary). */
DOCXFILL_EXPORT std::shared_ptr<TextVariable> makeTextVar(const QString &keyOrName, const QString &value, const VariablePattern &pat = {});
/** Overload: derive pattern from a Docx instance. */
inline std::shared_ptr<TextVariable> makeTextVar(const Docx &d, const QString &keyOrName, const QString &value){ return makeTextVar(keyOrName, value, d.variablePattern()); }

/** Create an ImageVariable from a base64 payload (wrapping key if necessary). */
DOCXFILL_EXPORT std::shared_ptr<ImageVariable> makeImageVar(const QString &keyOrName, const QByteArray &base64Payload, const VariablePattern &pat = {});
inline std::shared_ptr<ImageVariable> makeImageVar(const Docx &d, const QString &keyOrName, const QByteArray &base64Payload){ return makeImageVar(keyOrName, base64Payload, d.variablePattern()); }

/** Create an ImageVariable from an in-memory image, encoded as PNG. Returns nullptr if the image cannot be encoded. */
DOCXFILL_EXPORT std::shared_ptr<ImageVariable> makeImageVar(const QString &keyOrName, const QImage &img, const VariablePattern &pat = {});

} // namespace DocxFill
