/** \file XmlPart.hpp
 *  One XML part of the package loaded into a pugixml DOM.
 */
#pragma once
#include <QByteArray>
#include <QString>
#include <pugixml.hpp>
#include <vector>

namespace DocxFill { namespace xml {

/** Loads with full fidelity (whitespace-only text, declaration, PIs, comments) and saves raw, so
 *  unedited markup comes back unchanged apart from entity normalisation.
 */
class XmlPart {
public:
    bool load(const QByteArray &data);
    QByteArray save() const;
    /** Error text of the last failed load(). */
    const QString & errorString() const { return m_error; }

    pugi::xml_document & doc() { return m_doc; }
    const pugi::xml_document & doc() const { return m_doc; }
    std::vector<pugi::xml_node> selectAll(const char *xpath) const;

    /** Serialize a single node (and its subtree) without declaration or indentation. */
    static QByteArray nodeToBytes(pugi::xml_node node);

private:
    pugi::xml_document m_doc;
    QString m_error;
};

}} // namespace DocxFill::xml
