/** \file TextVariable.hpp
 *  Plain text replacement for a {{NAME}} token.
 */
#pragma once
#include "DocxFill/Variable.hpp"

namespace DocxFill {

class DOCXFILL_EXPORT TextVariable : public Variable {
public:
    TextVariable(QString key, QString value)
        : Variable(std::move(key), VariableType::Text), m_value(std::move(value)) {}

    const QString & value() const { return m_value; }

private:
    QString m_value;
};

} // namespace DocxFill
