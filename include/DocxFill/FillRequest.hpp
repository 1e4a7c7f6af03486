/** \file FillRequest.hpp
 *  JSON fill request, same body the template service accepted:
 *  { "placeholders": {..}, "images": {..}, "template_key": "...", "output_filename": "..." }
 */
#pragma once
#include "DocxFill/Export.hpp"
#include "DocxFill/Variables.hpp"
#include <QByteArray>
#include <QMap>
#include <QString>
#include <optional>

namespace DocxFill {

struct DOCXFILL_EXPORT FillRequest {
    QMap<QString, QString> placeholders;
    QMap<QString, QByteArray> images;   ///< base64 payloads
    QString templatePath;
    QString outputPath{QStringLiteral("IDS_Generated.docx")};

    /** Parse a request document. Returns std::nullopt and sets *error on malformed input. */
    static std::optional<FillRequest> fromJson(const QByteArray &json, QString *error = nullptr);
    Variables toVariables() const { return Variables::fromMaps(placeholders, images); }
};

} // namespace DocxFill
