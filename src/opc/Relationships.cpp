#include "opc/Relationships.hpp"
#include "xml/XmlPart.hpp"

namespace DocxFill { namespace opc {

namespace {
const char *kRelsNs = "http://schemas.openxmlformats.org/package/2006/relationships";
}

bool Relationships::load(const QByteArray &data) {
    m_entries.clear();
    xml::XmlPart part;
    if(!part.load(data)) return false;
    pugi::xml_node root = part.doc().child("Relationships");
    if(!root) return false;
    for(pugi::xml_node r : root.children("Relationship")) {
        Relationship rel;
        rel.id = QString::fromUtf8(r.attribute("Id").value());
        rel.type = QString::fromUtf8(r.attribute("Type").value());
        rel.target = QString::fromUtf8(r.attribute("Target").value());
        rel.targetMode = QString::fromUtf8(r.attribute("TargetMode").value());
        m_entries.push_back(rel);
    }
    return true;
}

QByteArray Relationships::save() const {
    xml::XmlPart part;
    pugi::xml_document &doc = part.doc();
    auto decl = doc.append_child(pugi::node_declaration);
    decl.append_attribute("version") = "1.0";
    decl.append_attribute("encoding") = "UTF-8";
    decl.append_attribute("standalone") = "yes";
    auto root = doc.append_child("Relationships");
    root.append_attribute("xmlns") = kRelsNs;
    for(const auto &rel : m_entries) {
        auto r = root.append_child("Relationship");
        r.append_attribute("Id") = rel.id.toUtf8().constData();
        r.append_attribute("Type") = rel.type.toUtf8().constData();
        r.append_attribute("Target") = rel.target.toUtf8().constData();
        if(!rel.targetMode.isEmpty()) r.append_attribute("TargetMode") = rel.targetMode.toUtf8().constData();
    }
    return part.save();
}

std::vector<Relationship> Relationships::byType(const QString &type) const {
    std::vector<Relationship> out;
    for(const auto &rel : m_entries) if(rel.type == type) out.push_back(rel);
    return out;
}

std::optional<Relationship> Relationships::byId(const QString &id) const {
    for(const auto &rel : m_entries) if(rel.id == id) return rel;
    return std::nullopt;
}

QString Relationships::nextId() const {
    int maxId = 0;
    for(const auto &rel : m_entries) {
        if(!rel.id.startsWith(QLatin1String("rId"))) continue;
        bool ok = false; int num = rel.id.mid(3).toInt(&ok);
        if(ok && num > maxId) maxId = num;
    }
    return QStringLiteral("rId%1").arg(maxId + 1);
}

QString Relationships::add(const QString &type, const QString &target) {
    Relationship rel;
    rel.id = nextId();
    rel.type = type;
    rel.target = target;
    m_entries.push_back(rel);
    return rel.id;
}

}} // namespace DocxFill::opc
