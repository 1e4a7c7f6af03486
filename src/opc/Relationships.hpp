/** \file Relationships.hpp
 *  In-memory model of one .rels part.
 */
#pragma once
#include <QByteArray>
#include <QString>
#include <optional>
#include <vector>

namespace DocxFill { namespace opc {

namespace RelType {
inline const QString OfficeDocument = QStringLiteral("http://schemas.openxmlformats.org/officeDocument/2006/relationships/officeDocument");
inline const QString Image = QStringLiteral("http://schemas.openxmlformats.org/officeDocument/2006/relationships/image");
inline const QString Header = QStringLiteral("http://schemas.openxmlformats.org/officeDocument/2006/relationships/header");
inline const QString Footer = QStringLiteral("http://schemas.openxmlformats.org/officeDocument/2006/relationships/footer");
inline const QString Footnotes = QStringLiteral("http://schemas.openxmlformats.org/officeDocument/2006/relationships/footnotes");
inline const QString Endnotes = QStringLiteral("http://schemas.openxmlformats.org/officeDocument/2006/relationships/endnotes");
}

struct Relationship {
    QString id;
    QString type;
    QString target;
    QString targetMode; // empty (Internal) or "External"

    bool isExternal() const { return targetMode.compare(QLatin1String("External"), Qt::CaseInsensitive) == 0; }
};

class Relationships {
public:
    bool load(const QByteArray &xml);
    QByteArray save() const;

    const std::vector<Relationship> & entries() const { return m_entries; }
    std::vector<Relationship> byType(const QString &type) const;
    std::optional<Relationship> byId(const QString &id) const;

    /** Append with a fresh id (rId<max+1>) and return it. */
    QString add(const QString &type, const QString &target);
    /** Smallest rIdN not used in the list, N greater than every existing rId number. */
    QString nextId() const;

private:
    std::vector<Relationship> m_entries;
};

}} // namespace DocxFill::opc
