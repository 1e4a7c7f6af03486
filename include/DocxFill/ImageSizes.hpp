/** \file ImageSizes.hpp
 *  Fixed target widths for image tokens. Heights are derived from the image's aspect ratio.
 */
#pragma once
#include "DocxFill/Export.hpp"
#include <QMap>
#include <QString>
#include <optional>
#include <utility>

namespace DocxFill {

/** Immutable-by-convention table of IMAGE_* token name -> width in inches. */
class DOCXFILL_EXPORT ImageSizeTable {
public:
    ImageSizeTable() = default;
    explicit ImageSizeTable(QMap<QString, double> widths) : m_widths(std::move(widths)) {}

    /** The table used by the IDS templates. */
    static const ImageSizeTable & defaults();

    /** Width for an image token name, std::nullopt if the name is not an image token. */
    std::optional<double> widthInches(const QString &name) const;
    bool contains(const QString &name) const { return m_widths.contains(name); }
    /** Copy with one entry added or replaced. */
    ImageSizeTable with(const QString &name, double widthInches) const;
    const QMap<QString, double> & entries() const { return m_widths; }

    /** Image tokens are the names starting with this prefix. */
    static QString tokenPrefix() { return QStringLiteral("IMAGE_"); }

private:
    QMap<QString, double> m_widths;
};

} // namespace DocxFill
