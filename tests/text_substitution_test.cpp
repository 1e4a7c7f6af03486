// Text substitution: neighbors keep their formatting, every split replaces cleanly, missing keys stay literal.
#include "DocxFill/Docx.hpp"
#include "DocxFill/Variables.hpp"
#include "engine/Replacers.hpp"
#include "engine/TokenScanner.hpp"
#include "TestDocx.hpp"
#include <cassert>
#include <cstring>
#include <iostream>

using namespace DocxFill; using namespace DocxFill::engine;

static Run run(const QString &text, int id, const char *fmt) {
    Run r; r.text = text; r.id = id; r.formatting = fmt; return r;
}

int main(){
    TokenScanner scanner;
    // "X{{A}}Y" with X and Y carrying their own formatting.
    {
        FormattedContainer c;
        c.runs = { run("X{{", 0, "<w:r><w:rPr><w:b/></w:rPr><w:t/></w:r>"),
                   run("A", 1, "<w:r><w:rPr><w:u/></w:rPr><w:t/></w:r>"),
                   run("}}Y", 2, "<w:r><w:rPr><w:i/></w:rPr><w:t/></w:r>") };
        auto spans = scanner.scan(c); assert(spans.size() == 1);
        Replacers::replaceText(c, spans[0], "VALUE");
        assert(c.text() == "XVALUEY");
        assert(c.runs.size() == 3);
        assert(c.runs[0].text == "X" && c.runs[0].formatting.contains("w:b"));
        assert(c.runs[1].text == "VALUE" && c.runs[1].formatting.contains("w:b") && c.runs[1].id == 0);
        assert(c.runs[2].text == "Y" && c.runs[2].formatting.contains("w:i") && c.runs[2].id == 2);
    }
    // All splits of a token surrounded by text.
    {
        const QString text = QStringLiteral("ab{{K}}cd");
        const int cuts = text.size() - 1;
        for(int mask = 0; mask < (1 << cuts); ++mask) {
            FormattedContainer c; QString cur; int id = 0;
            for(int i = 0; i < text.size(); ++i) {
                cur += text[i];
                if(i == cuts || (mask & (1 << i))) { c.runs.push_back(run(cur, id, "<w:r><w:t/></w:r>")); cur.clear(); ++id; }
            }
            const size_t before = c.runs.size();
            auto spans = scanner.scan(c); assert(spans.size() == 1);
            const int untouched = spans[0].startRun + static_cast<int>(before) - 1 - spans[0].endRun;
            Replacers::replaceText(c, spans[0], "#");
            assert(c.text() == "ab#cd");
            assert(static_cast<int>(c.runs.size()) <= untouched + 3);
            for(const auto &r : c.runs) assert(!r.text.isEmpty());
        }
    }
    // Right to left application of several spans in one paragraph.
    {
        FormattedContainer c;
        c.runs = { run("{{A}}-{{B}}-{{A}}", 0, "<w:r><w:t/></w:r>") };
        auto spans = scanner.scan(c); assert(spans.size() == 3);
        for(auto it = spans.rbegin(); it != spans.rend(); ++it) Replacers::replaceText(c, *it, it->name == "A" ? "1" : "22");
        assert(c.text() == "1-22-1");
    }
    // Through the facade: present keys are replaced, absent ones left literal and reported.
    {
        QByteArray body = testdocx::para({"Dear ", "{{BORROWER", "_NAME}}, see {{MISSING}} and {{DATE}}."})
                        + "<w:p><w:r><w:rPr><w:b/></w:rPr><w:t>{{DATE}}</w:t></w:r></w:p>";
        const QByteArray input = testdocx::build(body);
        Docx d = Docx::fromBytes(input);
        Variables vars;
        vars.addText("BORROWER_NAME", "Acme & Sons <LLC>");
        vars.addText("{{DATE}}", "June 1, 2024");
        assert(d.fillTemplate(vars));
        assert(!d.lastError().has_value());
        assert(d.unresolvedVariables() == QStringList({"{{MISSING}}"}));
        const QString text = d.readTextContent();
        assert(text.contains("Dear Acme & Sons <LLC>, see {{MISSING}} and June 1, 2024."));
        auto out = d.toBytes(); assert(out.has_value());
        const QString xml = testdocx::partText(*out, "word/document.xml");
        assert(xml.contains("Acme &amp; Sons &lt;LLC&gt;"));
        assert(xml.contains("<w:rPr><w:b"));
        assert(!xml.contains("{{DATE}}"));
        // Unchanged parts are carried over.
        assert(testdocx::partText(*out, "word/styles.xml") == testdocx::partText(input, "word/styles.xml"));
    }
    // A value that looks like a token is not expanded again.
    {
        Docx d = Docx::fromBytes(testdocx::build(testdocx::para({"{{A}}{{B}}"})));
        Variables vars; vars.addText("A", "{{B}}"); vars.addText("B", "b");
        assert(d.fillTemplate(vars));
        assert(d.readTextContent() == "{{B}}b");
    }
    // Line breaks and tabs in a value become w:br and w:tab; other control characters are dropped.
    {
        QByteArray body = testdocx::para({"Addr: {{ADDR}}."}) + testdocx::para({"{{TABBED}}"})
                        + testdocx::para({"{{CRLF}}"}) + testdocx::para({"{{CTRL}}"});
        Docx d = Docx::fromBytes(testdocx::build(body));
        Variables vars;
        vars.addText("ADDR", "89 Montauk Hwy\nHampton Bays");
        vars.addText("TABBED", "Unit\t12");
        vars.addText("CRLF", "Suite 4\r\nFloor 2");
        vars.addText("CTRL", QString("A") + QChar(0x01) + "B" + QChar(0x0b) + "C");
        assert(d.fillTemplate(vars));
        const QString text = d.readTextContent();
        assert(text.contains("Addr: 89 Montauk Hwy\nHampton Bays."));
        assert(text.contains("Unit\t12"));
        assert(text.contains("Suite 4\nFloor 2"));
        assert(text.contains("ABC"));

        auto out = d.toBytes(); assert(out.has_value());
        const QString xmlText = testdocx::partText(*out, "word/document.xml");
        assert(!xmlText.contains("&#"));
        xml::XmlPart part;
        assert(part.load(xmlText.toUtf8()));
        const auto breaks = part.selectAll("//w:br");
        assert(breaks.size() == 2);
        pugi::xml_node before = breaks[0].previous_sibling();
        pugi::xml_node after = breaks[0].next_sibling();
        assert(std::strcmp(before.name(), "w:t") == 0 && std::strcmp(before.child_value(), "89 Montauk Hwy") == 0);
        assert(std::strcmp(after.name(), "w:t") == 0 && std::strcmp(after.child_value(), "Hampton Bays") == 0);
        assert(std::strcmp(breaks[0].parent().name(), "w:r") == 0);
        const auto tabs = part.selectAll("//w:tab");
        assert(tabs.size() == 1);
        assert(std::strcmp(tabs[0].previous_sibling().child_value(), "Unit") == 0);
        assert(std::strcmp(tabs[0].next_sibling().child_value(), "12") == 0);
        for(const auto &t : part.selectAll("//w:t")) {
            const char *value = t.child_value();
            assert(std::strchr(value, '\n') == nullptr && std::strchr(value, '\t') == nullptr && std::strchr(value, '\r') == nullptr);
            for(const char *c = value; *c; ++c) assert(static_cast<unsigned char>(*c) >= 0x20);
        }
    }
    std::cout << "text_substitution_test passed" << std::endl; return 0;
}
