/** \file RunModel.hpp
 *  A paragraph seen as an ordered sequence of runs: text plus an opaque formatting blob.
 *
 *  Word splits one logical string over many w:r elements whenever formatting, spell-check
 *  state or revision marks change. The model flattens those into Run values the engines can
 *  edit without touching XML, then commit() writes back only the runs that changed.
 */
#pragma once
#include <QByteArray>
#include <QString>
#include <pugixml.hpp>
#include <optional>
#include <vector>

namespace DocxFill { namespace engine {

/** One unit of a container. formatting is never inspected by the engines, only copied. */
struct Run {
    QString text;          ///< visible text; "\t" / "\n" stand-ins for tabs and breaks
    QByteArray formatting; ///< serialized w:r shell: attributes, w:rPr and one content child (w:t emptied)
    int id{0};             ///< index of the source w:r in the container; orders write-back
    bool textual{true};    ///< text lives in the shell's w:t; false for tabs, breaks, drawings, ...

    bool operator==(const Run &o) const {
        return text == o.text && formatting == o.formatting && id == o.id && textual == o.textual;
    }
    bool operator!=(const Run &o) const { return !(*this == o); }
};

struct FormattedContainer {
    std::vector<Run> runs;

    /** Concatenated text of all runs. */
    QString text() const;
};

class RunModel {
public:
    /** Parse the runs of a w:p (runs of nested paragraphs excluded). */
    void build(pugi::xml_node paragraph);

    pugi::xml_node node() const { return m_paragraph; }
    FormattedContainer & container() { return m_container; }
    const FormattedContainer & container() const { return m_container; }
    QString text() const { return m_container.text(); }

    /** Write edited runs back into the DOM. Source runs whose model runs are unchanged stay untouched
     *  unless force is set. Returns true if the DOM was modified; the model is then rebuilt from it.
     */
    bool commit(bool force = false);

    /** New non-textual run: style's attributes and w:rPr around the given payload markup (e.g. a w:drawing). */
    static std::optional<Run> makePayloadRun(const Run &style, const QByteArray &payloadXml);

private:
    pugi::xml_node m_paragraph;
    std::vector<pugi::xml_node> m_sources; // source w:r by Run::id
    std::vector<Run> m_snapshot;           // runs as parsed
    FormattedContainer m_container;
};

}} // namespace DocxFill::engine
