#include "opc/ContentTypes.hpp"
#include "xml/XmlPart.hpp"
#include <cstring>

namespace DocxFill { namespace opc {

bool ContentTypes::load(const QByteArray &data) {
    m_defaults.clear(); m_overrides.clear();
    xml::XmlPart part;
    if(!part.load(data)) return false;
    pugi::xml_node root = part.doc().child("Types");
    if(!root) return false;
    for(pugi::xml_node n : root.children()) {
        if(std::strcmp(n.name(), "Default") == 0) {
            m_defaults.push_back({QString::fromUtf8(n.attribute("Extension").value()), QString::fromUtf8(n.attribute("ContentType").value())});
        } else if(std::strcmp(n.name(), "Override") == 0) {
            m_overrides.push_back({QString::fromUtf8(n.attribute("PartName").value()), QString::fromUtf8(n.attribute("ContentType").value())});
        }
    }
    return true;
}

QByteArray ContentTypes::save() const {
    xml::XmlPart part;
    pugi::xml_document &doc = part.doc();
    auto decl = doc.append_child(pugi::node_declaration);
    decl.append_attribute("version") = "1.0";
    decl.append_attribute("encoding") = "UTF-8";
    decl.append_attribute("standalone") = "yes";
    auto root = doc.append_child("Types");
    root.append_attribute("xmlns") = "http://schemas.openxmlformats.org/package/2006/content-types";
    for(const auto &d : m_defaults) {
        auto n = root.append_child("Default");
        n.append_attribute("Extension") = d.extension.toUtf8().constData();
        n.append_attribute("ContentType") = d.contentType.toUtf8().constData();
    }
    for(const auto &o : m_overrides) {
        auto n = root.append_child("Override");
        n.append_attribute("PartName") = o.partName.toUtf8().constData();
        n.append_attribute("ContentType") = o.contentType.toUtf8().constData();
    }
    return part.save();
}

bool ContentTypes::hasDefault(const QString &extension) const {
    for(const auto &d : m_defaults) if(d.extension.compare(extension, Qt::CaseInsensitive) == 0) return true;
    return false;
}

void ContentTypes::addDefault(const QString &extension, const QString &contentType) {
    if(hasDefault(extension)) return;
    m_defaults.push_back({extension, contentType});
}

std::optional<QString> ContentTypes::contentTypeFor(const QString &partPath) const {
    QString name = partPath.startsWith('/') ? partPath : QLatin1Char('/') + partPath;
    for(const auto &o : m_overrides) if(o.partName.compare(name, Qt::CaseInsensitive) == 0) return o.contentType;
    int dot = name.lastIndexOf('.');
    if(dot < 0 || dot < name.lastIndexOf('/')) return std::nullopt;
    QString ext = name.mid(dot + 1);
    for(const auto &d : m_defaults) if(d.extension.compare(ext, Qt::CaseInsensitive) == 0) return d.contentType;
    return std::nullopt;
}

}} // namespace DocxFill::opc
