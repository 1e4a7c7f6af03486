/** \file ImagePayload.hpp
 *  Decoding of caller supplied base64 image payloads into media assets.
 */
#pragma once
#include <QByteArray>
#include <QSize>
#include <QString>
#include <optional>

namespace DocxFill { namespace engine {

/** Raw image bytes ready to become a media part. */
struct DecodedImage {
    QByteArray bytes;     ///< stored verbatim, never re-encoded
    QString extension;    ///< png, jpeg, gif, bmp, tiff
    QString mimeType;
    QSize nativeSize;     ///< pixels
};

/** Decode base64 (whitespace ignored, optional data: URI prefix) and check that the bytes are a readable image.
 *  Returns std::nullopt and sets *error otherwise.
 */
std::optional<DecodedImage> decodeImagePayload(const QByteArray &base64, QString *error = nullptr);

}} // namespace DocxFill::engine
