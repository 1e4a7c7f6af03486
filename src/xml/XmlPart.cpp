#include "xml/XmlPart.hpp"
#include <sstream>

namespace DocxFill { namespace xml {

namespace {
constexpr unsigned int kParseFlags = pugi::parse_full;
constexpr unsigned int kSaveFlags = pugi::format_raw | pugi::format_no_declaration;
}

bool XmlPart::load(const QByteArray &data) {
    m_error.clear();
    pugi::xml_parse_result res = m_doc.load_buffer(data.constData(), static_cast<size_t>(data.size()), kParseFlags, pugi::encoding_utf8);
    if(!res) {
        m_error = QStringLiteral("%1 at offset %2").arg(QString::fromUtf8(res.description())).arg(static_cast<qint64>(res.offset));
        return false;
    }
    if(!m_doc.document_element()) {
        m_error = QStringLiteral("no root element");
        return false;
    }
    return true;
}

QByteArray XmlPart::save() const {
    std::ostringstream ss;
    m_doc.save(ss, "", kSaveFlags, pugi::encoding_utf8);
    const std::string s = ss.str();
    return QByteArray(s.data(), static_cast<int>(s.size()));
}

std::vector<pugi::xml_node> XmlPart::selectAll(const char *xpath) const {
    std::vector<pugi::xml_node> out;
    pugi::xpath_query q(xpath);
    for(const auto &n : q.evaluate_node_set(m_doc)) out.push_back(n.node());
    return out;
}

QByteArray XmlPart::nodeToBytes(pugi::xml_node node) {
    std::ostringstream ss;
    node.print(ss, "", pugi::format_raw, pugi::encoding_utf8);
    const std::string s = ss.str();
    return QByteArray(s.data(), static_cast<int>(s.size()));
}

}} // namespace DocxFill::xml
