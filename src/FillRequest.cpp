#include "DocxFill/FillRequest.hpp"
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>
#include <cmath>

namespace DocxFill {

namespace {

void setError(QString *error, const QString &msg) { if(error) *error = msg; }

// Placeholder values arrive as whatever JSON the caller had; scalars become their text form.
std::optional<QString> scalarText(const QJsonValue &v) {
    switch(v.type()) {
    case QJsonValue::String: return v.toString();
    case QJsonValue::Bool: return v.toBool() ? QStringLiteral("true") : QStringLiteral("false");
    case QJsonValue::Double: {
        const double d = v.toDouble();
        // Whole numbers print without a fraction while the integer cast is exact (|d| < 2^53).
        if(std::abs(d) < 9007199254740992.0 && d == std::trunc(d)) return QString::number(static_cast<qint64>(d));
        return QString::number(d, 'g', 15);
    }
    case QJsonValue::Null: return QString();
    default: return std::nullopt;
    }
}

} // namespace

std::optional<FillRequest> FillRequest::fromJson(const QByteArray &json, QString *error) {
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
    if(parseError.error != QJsonParseError::NoError) {
        setError(error, QStringLiteral("invalid JSON at offset %1: %2").arg(parseError.offset).arg(parseError.errorString()));
        return std::nullopt;
    }
    if(!doc.isObject()) { setError(error, QStringLiteral("request must be a JSON object")); return std::nullopt; }
    const QJsonObject root = doc.object();

    FillRequest req;
    const QJsonValue placeholders = root.value(QLatin1String("placeholders"));
    if(!placeholders.isUndefined() && !placeholders.isNull()) {
        if(!placeholders.isObject()) { setError(error, QStringLiteral("\"placeholders\" must be an object")); return std::nullopt; }
        const QJsonObject obj = placeholders.toObject();
        for(auto it = obj.constBegin(); it != obj.constEnd(); ++it) {
            auto text = scalarText(it.value());
            if(!text) { setError(error, QStringLiteral("placeholder %1 is not a scalar").arg(it.key())); return std::nullopt; }
            req.placeholders.insert(it.key(), *text);
        }
    }
    const QJsonValue images = root.value(QLatin1String("images"));
    if(!images.isUndefined() && !images.isNull()) {
        if(!images.isObject()) { setError(error, QStringLiteral("\"images\" must be an object")); return std::nullopt; }
        const QJsonObject obj = images.toObject();
        for(auto it = obj.constBegin(); it != obj.constEnd(); ++it) {
            if(!it.value().isString()) { setError(error, QStringLiteral("image %1 must be a base64 string").arg(it.key())); return std::nullopt; }
            req.images.insert(it.key(), it.value().toString().toLatin1());
        }
    }
    if(root.contains(QLatin1String("template_key"))) req.templatePath = root.value(QLatin1String("template_key")).toString();
    // output_filename is the historic name, output_key the storage one; either names the result.
    for(const auto *key : {"output_filename", "output_key"}) {
        const QString out = root.value(QLatin1String(key)).toString();
        if(!out.isEmpty()) { req.outputPath = out; break; }
    }
    return req;
}

} // namespace DocxFill
