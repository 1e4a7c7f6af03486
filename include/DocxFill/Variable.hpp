/** \file Variable.hpp
 *  Base class of everything that can be supplied to Docx::fillTemplate.
 */
#pragma once
#include "DocxFill/Export.hpp"
#include <QString>
#include <memory>

namespace DocxFill {

enum class VariableType {
    Text,
    Image
};

/** A named replacement. The key is stored as given (bare NAME or wrapped {{NAME}}). */
class DOCXFILL_EXPORT Variable {
public:
    Variable(QString key, VariableType type) : m_key(std::move(key)), m_type(type) {}
    virtual ~Variable() = default;

    const QString & key() const { return m_key; }
    VariableType type() const { return m_type; }

private:
    QString m_key;
    VariableType m_type;
};

using VariablePtr = std::shared_ptr<Variable>;

} // namespace DocxFill
