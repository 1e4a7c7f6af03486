/** \file Variables.hpp
 *  Container of variable objects supplied to Docx::fillTemplate.
 */
#pragma once
#include "DocxFill/Variable.hpp"
#include <QByteArray>
#include <QMap>
#include <vector>

namespace DocxFill {

/** Simple aggregate of shared_ptr<Variable>. Order preserved; a later key overrides an earlier one at fill time. */
class DOCXFILL_EXPORT Variables {
public:
    /** Append a variable (no deduplication performed). */
    void add(const VariablePtr &v);
    /** Convenience: create and add a TextVariable. Returns added variable. */
    VariablePtr addText(const QString &key, const QString &value);
    /** Convenience: create and add an ImageVariable from a base64 payload. */
    VariablePtr addImage(const QString &key, const QByteArray &base64Payload);
    /** Access underlying ordered collection. */
    const std::vector<VariablePtr> & all() const { return m_vars; }
    bool isEmpty() const { return m_vars.empty(); }

    /** Build from the two request mappings (placeholder name -> text, image name -> base64). */
    static Variables fromMaps(const QMap<QString, QString> &placeholders,
                              const QMap<QString, QByteArray> &images);
private:
    std::vector<VariablePtr> m_vars;
};

} // namespace DocxFill
