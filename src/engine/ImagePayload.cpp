#include "engine/ImagePayload.hpp"
#include <QBuffer>
#include <QImage>
#include <QImageReader>

namespace DocxFill { namespace engine {

namespace {

struct FormatInfo { const char *format; const char *extension; const char *mime; };

// Formats Word renders as inline pictures.
const FormatInfo kFormats[] = {
    {"png",  "png",  "image/png"},
    {"jpeg", "jpeg", "image/jpeg"},
    {"jpg",  "jpeg", "image/jpeg"},
    {"gif",  "gif",  "image/gif"},
    {"bmp",  "bmp",  "image/bmp"},
    {"tiff", "tiff", "image/tiff"},
    {"tif",  "tiff", "image/tiff"},
};

void setError(QString *error, const QString &msg) {
    if(error) *error = msg;
}

} // namespace

std::optional<DecodedImage> decodeImagePayload(const QByteArray &base64, QString *error) {
    QByteArray cleaned;
    cleaned.reserve(base64.size());
    for(char c : base64) {
        if(c == ' ' || c == '\n' || c == '\r' || c == '\t') continue;
        cleaned.append(c);
    }
    if(cleaned.startsWith("data:")) {
        int comma = cleaned.indexOf(',');
        if(comma < 0 || !cleaned.left(comma).endsWith(";base64")) { setError(error, QStringLiteral("unsupported data URI")); return std::nullopt; }
        cleaned = cleaned.mid(comma + 1);
    }
    if(cleaned.isEmpty()) { setError(error, QStringLiteral("empty payload")); return std::nullopt; }

    auto decoded = QByteArray::fromBase64Encoding(cleaned, QByteArray::Base64Encoding | QByteArray::AbortOnBase64DecodingErrors);
    if(!decoded) { setError(error, QStringLiteral("payload is not valid base64")); return std::nullopt; }

    DecodedImage img;
    img.bytes = decoded.decoded;
    QBuffer buf(&img.bytes);
    buf.open(QIODevice::ReadOnly);
    const QByteArray format = QImageReader::imageFormat(&buf).toLower();
    buf.close();
    for(const auto &f : kFormats) {
        if(format == f.format) { img.extension = QString::fromLatin1(f.extension); img.mimeType = QString::fromLatin1(f.mime); break; }
    }
    if(img.extension.isEmpty()) {
        setError(error, format.isEmpty() ? QStringLiteral("payload is not a recognised image")
                                     : QStringLiteral("unsupported image format %1").arg(QString::fromLatin1(format)));
        return std::nullopt;
    }

    QImage image;
    if(!image.loadFromData(img.bytes, format.constData()) || image.isNull()) {
        setError(error, QStringLiteral("%1 data could not be decoded").arg(img.extension));
        return std::nullopt;
    }
    img.nativeSize = image.size();
    if(img.nativeSize.width() <= 0 || img.nativeSize.height() <= 0) {
        setError(error, QStringLiteral("image has no pixels"));
        return std::nullopt;
    }
    return img;
}

}} // namespace DocxFill::engine
