#include "DocxFill/Variables.hpp"
#include "DocxFill/TextVariable.hpp"
#include "DocxFill/ImageVariable.hpp"

namespace DocxFill {

void Variables::add(const VariablePtr &v) { m_vars.push_back(v); }

VariablePtr Variables::addText(const QString &key, const QString &value) {
    auto v = std::make_shared<TextVariable>(key, value);
    add(v); return v;
}

VariablePtr Variables::addImage(const QString &key, const QByteArray &base64Payload) {
    auto v = std::make_shared<ImageVariable>(key, base64Payload);
    add(v); return v;
}

Variables Variables::fromMaps(const QMap<QString, QString> &placeholders,
                              const QMap<QString, QByteArray> &images) {
    Variables vars;
    for(auto it = placeholders.cbegin(); it != placeholders.cend(); ++it) vars.addText(it.key(), it.value());
    for(auto it = images.cbegin(); it != images.cend(); ++it) vars.addImage(it.key(), it.value());
    return vars;
}

} // namespace DocxFill
