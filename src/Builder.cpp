#include "DocxFill/Builder.hpp"
#include <QBuffer>
#include <QDebug>
#include <utility>

namespace DocxFill {

std::shared_ptr<TextVariable> makeTextVar(const QString &keyOrName, const QString &value, const VariablePattern &pat){
    return std::make_shared<TextVariable>(ensureWrapped(keyOrName, pat), value);
}

std::shared_ptr<ImageVariable> makeImageVar(const QString &keyOrName, const QByteArray &base64Payload, const VariablePattern &pat){
    return std::make_shared<ImageVariable>(ensureWrapped(keyOrName, pat), base64Payload);
}

std::shared_ptr<ImageVariable> makeImageVar(const QString &keyOrName, const QImage &img, const VariablePattern &pat){
    if(img.isNull()) {
        qWarning() << "makeImageVar: null image for" << keyOrName;
        return nullptr;
    }
    QByteArray png;
    QBuffer buffer(&png);
    buffer.open(QIODevice::WriteOnly);
    if(!img.save(&buffer, "PNG")) {
        qWarning() << "makeImageVar: PNG encoding failed for" << keyOrName;
        return nullptr;
    }
    return ImageVariable::fromRawBytes(ensureWrapped(keyOrName, pat), png);
}

} // namespace DocxFill
