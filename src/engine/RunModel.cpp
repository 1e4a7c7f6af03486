#include "engine/RunModel.hpp"
#include "xml/XmlPart.hpp"
#include <QDebug>
#include <cstring>

namespace DocxFill { namespace engine {

namespace {

bool isNamed(pugi::xml_node n, const char *name) { return std::strcmp(n.name(), name) == 0; }

// Runs belonging to this paragraph, in document order. Nested paragraphs (text boxes) are their own containers.
void collectRuns(pugi::xml_node node, std::vector<pugi::xml_node> &out) {
    for(pugi::xml_node child : node.children()) {
        if(child.type() != pugi::node_element) continue;
        if(isNamed(child, "w:p")) continue;
        if(isNamed(child, "w:r")) { out.push_back(child); continue; }
        collectRuns(child, out);
    }
}

QString standInText(pugi::xml_node child) {
    if(isNamed(child, "w:tab")) return QStringLiteral("\t");
    if(isNamed(child, "w:br") || isNamed(child, "w:cr")) return QStringLiteral("\n");
    return {};
}

QByteArray makeShell(pugi::xml_node r, pugi::xml_node content, bool textual) {
    pugi::xml_document tmp;
    pugi::xml_node shell = tmp.append_child(r.name());
    for(pugi::xml_attribute a : r.attributes()) shell.append_copy(a);
    if(pugi::xml_node rPr = r.child("w:rPr")) shell.append_copy(rPr);
    if(content) {
        pugi::xml_node c = shell.append_copy(content);
        if(textual) while(c.first_child()) c.remove_child(c.first_child());
    }
    return xml::XmlPart::nodeToBytes(shell);
}

void setPieceText(pugi::xml_node t, const QString &piece) {
    QByteArray utf8 = piece.toUtf8();
    t.text().set(utf8.constData());
    bool edgeSpace = !piece.isEmpty() && (piece.front().isSpace() || piece.back().isSpace());
    if(edgeSpace && !t.attribute("xml:space")) t.append_attribute("xml:space") = "preserve";
}

// Inverse of standInText: tabs become w:tab, line breaks w:br, the rest w:t pieces shaped like the shell's w:t.
// Other C0 controls are dropped; XML 1.0 cannot carry them.
void setRunText(pugi::xml_node r, const QString &text) {
    pugi::xml_node shellT = r.child("w:t");
    if(!shellT) shellT = r.append_child("w:t");
    bool split = false;
    QString piece;
    auto flush = [&]() {
        if(piece.isEmpty()) return;
        setPieceText(r.insert_copy_before(shellT, shellT), piece);
        piece.clear();
    };
    for(int i = 0; i < text.size(); ++i) {
        const QChar c = text[i];
        if(c == QLatin1Char('\t')) {
            flush(); r.insert_child_before("w:tab", shellT); split = true;
        } else if(c == QLatin1Char('\n') || c == QLatin1Char('\r')) {
            if(c == QLatin1Char('\r') && i + 1 < text.size() && text[i + 1] == QLatin1Char('\n')) ++i;
            flush(); r.insert_child_before("w:br", shellT); split = true;
        } else if(c.unicode() >= 0x20) {
            piece += c;
        }
    }
    if(!split) { setPieceText(shellT, piece); return; }
    flush();
    r.remove_child(shellT);
}

bool loadFragment(pugi::xml_document &doc, const QByteArray &xml) {
    return doc.load_buffer(xml.constData(), static_cast<size_t>(xml.size()), pugi::parse_full, pugi::encoding_utf8)
        && doc.document_element();
}

} // namespace

QString FormattedContainer::text() const {
    QString out;
    for(const auto &r : runs) out += r.text;
    return out;
}

void RunModel::build(pugi::xml_node paragraph) {
    m_paragraph = paragraph;
    m_sources.clear();
    m_container.runs.clear();
    collectRuns(paragraph, m_sources);
    for(size_t id = 0; id < m_sources.size(); ++id) {
        pugi::xml_node r = m_sources[id];
        bool any = false;
        for(pugi::xml_node child : r.children()) {
            if(child.type() != pugi::node_element || isNamed(child, "w:rPr")) continue;
            Run run;
            run.id = static_cast<int>(id);
            run.textual = isNamed(child, "w:t");
            run.text = run.textual ? QString::fromUtf8(child.text().get()) : standInText(child);
            run.formatting = makeShell(r, child, run.textual);
            m_container.runs.push_back(std::move(run));
            any = true;
        }
        if(!any) {
            // Property-only run; kept so write-back can reproduce it.
            Run run;
            run.id = static_cast<int>(id);
            run.textual = false;
            run.formatting = makeShell(r, pugi::xml_node(), false);
            m_container.runs.push_back(std::move(run));
        }
    }
    m_snapshot = m_container.runs;
}

bool RunModel::commit(bool force) {
    const size_t n = m_sources.size();
    std::vector<std::vector<const Run *>> current(n), original(n);
    for(const auto &r : m_container.runs) if(r.id >= 0 && static_cast<size_t>(r.id) < n) current[r.id].push_back(&r);
    for(const auto &r : m_snapshot) original[r.id].push_back(&r);

    bool changed = false;
    for(size_t id = 0; id < n; ++id) {
        if(!force) {
            bool same = current[id].size() == original[id].size();
            for(size_t i = 0; same && i < current[id].size(); ++i) same = *current[id][i] == *original[id][i];
            if(same) continue;
        }
        pugi::xml_node source = m_sources[id];
        pugi::xml_node parent = source.parent();
        for(const Run *run : current[id]) {
            pugi::xml_document frag;
            if(!loadFragment(frag, run->formatting)) {
                qWarning() << "RunModel: run formatting is not well-formed, run" << run->id << "dropped";
                continue;
            }
            pugi::xml_node inserted = parent.insert_copy_before(frag.document_element(), source);
            if(run->textual) setRunText(inserted, run->text);
        }
        parent.remove_child(source);
        changed = true;
    }
    if(changed) build(m_paragraph);
    return changed;
}

std::optional<Run> RunModel::makePayloadRun(const Run &style, const QByteArray &payloadXml) {
    pugi::xml_document shellDoc, payloadDoc;
    if(!loadFragment(shellDoc, style.formatting) || !loadFragment(payloadDoc, payloadXml)) return std::nullopt;
    Run run;
    run.id = style.id;
    run.textual = false;
    pugi::xml_node shell = shellDoc.document_element();
    for(pugi::xml_node c = shell.first_child(); c; ) {
        pugi::xml_node next = c.next_sibling();
        if(!isNamed(c, "w:rPr")) shell.remove_child(c);
        c = next;
    }
    shell.append_copy(payloadDoc.document_element());
    run.formatting = xml::XmlPart::nodeToBytes(shell);
    return run;
}

}} // namespace DocxFill::engine
