/** \file ImageVariable.hpp
 *  Image replacement for an {{IMAGE_*}} token. The payload is kept base64 encoded
 *  and only decoded when a matching token is actually injected.
 */
#pragma once
#include "DocxFill/Variable.hpp"
#include <QByteArray>

namespace DocxFill {

class DOCXFILL_EXPORT ImageVariable : public Variable {
public:
    ImageVariable(QString key, QByteArray base64Payload)
        : Variable(std::move(key), VariableType::Image), m_payload(std::move(base64Payload)) {}

    /** Build from raw image file bytes (PNG, JPEG, ...). */
    static std::shared_ptr<ImageVariable> fromRawBytes(QString key, const QByteArray &raw) {
        return std::make_shared<ImageVariable>(std::move(key), raw.toBase64());
    }

    const QByteArray & payload() const { return m_payload; }

private:
    QByteArray m_payload;
};

} // namespace DocxFill
