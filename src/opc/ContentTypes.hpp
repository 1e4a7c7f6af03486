/** \file ContentTypes.hpp
 *  In-memory model of [Content_Types].xml.
 */
#pragma once
#include <QByteArray>
#include <QString>
#include <optional>
#include <vector>

namespace DocxFill { namespace opc {

class ContentTypes {
public:
    bool load(const QByteArray &xml);
    QByteArray save() const;

    /** Extension match is case-insensitive. */
    bool hasDefault(const QString &extension) const;
    void addDefault(const QString &extension, const QString &contentType);
    /** Override for the part name, else Default for its extension. partPath has no leading slash. */
    std::optional<QString> contentTypeFor(const QString &partPath) const;

private:
    struct DefaultType { QString extension; QString contentType; };
    struct OverrideType { QString partName; QString contentType; };
    std::vector<DefaultType> m_defaults;
    std::vector<OverrideType> m_overrides;
};

}} // namespace DocxFill::opc
