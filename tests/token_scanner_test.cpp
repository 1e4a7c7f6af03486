// Token scanner: split robustness, ordering and the literal cases.
#include "engine/TokenScanner.hpp"
#include <cassert>
#include <iostream>

using namespace DocxFill; using namespace DocxFill::engine;

static FormattedContainer containerOf(const QStringList &texts) {
    FormattedContainer c;
    int id = 0;
    for(const auto &t : texts) {
        Run r; r.text = t; r.id = id; r.formatting = QByteArray("<w:r id=\"") + QByteArray::number(id) + "\"><w:t/></w:r>";
        c.runs.push_back(r); ++id;
    }
    return c;
}

// Text between two positions of the container, following the span's run/offset coordinates.
static QString spanText(const FormattedContainer &c, const Span &s) {
    if(s.startRun == s.endRun) return c.runs[s.startRun].text.mid(s.startOffset, s.endOffset - s.startOffset);
    QString out = c.runs[s.startRun].text.mid(s.startOffset);
    for(int i = s.startRun + 1; i < s.endRun; ++i) out += c.runs[i].text;
    return out + c.runs[s.endRun].text.left(s.endOffset);
}

int main(){
    TokenScanner scanner;
    // Every way of cutting "a {{LOAN_1}} b" into runs yields one span covering exactly the token.
    {
        const QString text = QStringLiteral("a {{LOAN_1}} b");
        const int cuts = text.size() - 1;
        for(int mask = 0; mask < (1 << cuts); ++mask) {
            QStringList pieces; QString cur;
            for(int i = 0; i < text.size(); ++i) {
                cur += text[i];
                if(i < cuts && (mask & (1 << i))) { pieces << cur; cur.clear(); }
            }
            pieces << cur;
            FormattedContainer c = containerOf(pieces);
            auto spans = scanner.scan(c);
            assert(spans.size() == 1);
            assert(spans[0].name == "LOAN_1");
            assert(spans[0].startRun <= spans[0].endRun);
            if(spans[0].startRun == spans[0].endRun) assert(spans[0].startOffset < spans[0].endOffset);
            assert(spanText(c, spans[0]) == "{{LOAN_1}}");
            assert(spans[0].logicalStart == 2 && spans[0].logicalEnd == 12);
        }
    }
    // Several tokens: ordered, non overlapping.
    {
        auto c = containerOf({"{{A}}{{B", "}} and {{", "C_2}}"});
        auto spans = scanner.scan(c);
        assert(spans.size() == 3);
        assert(spans[0].name == "A" && spans[1].name == "B" && spans[2].name == "C_2");
        for(size_t i = 1; i < spans.size(); ++i) assert(spans[i - 1].logicalEnd <= spans[i].logicalStart);
        assert(spans[1].startRun == 0 && spans[1].endRun == 1 && spans[1].endOffset == 2);
    }
    // Literal cases.
    {
        assert(scanner.scan(containerOf({"{{LOAN"})).empty());              // unclosed
        assert(scanner.scan(containerOf({"{{loan}}"})).empty());            // lowercase is not a name
        assert(scanner.scan(containerOf({"{{}}"})).empty());                // empty name
        assert(scanner.scan(containerOf({"{{A B}}"})).empty());
        auto spans = scanner.scan(containerOf({"{{{{A}}"}));
        assert(spans.size() == 1 && spans[0].name == "A" && spans[0].startOffset == 2);
        spans = scanner.scan(containerOf({"{{A}}}}"}));
        assert(spans.size() == 1 && spans[0].endOffset == 5);
        spans = scanner.scan(containerOf({"{{A", "\t", "}} {{B}}"}));
        assert(spans.size() == 1 && spans[0].name == "B");
        assert(scanner.scan(FormattedContainer{}).empty());
    }
    // Configurable delimiters.
    {
        VariablePattern pat; pat.prefix = "${"; pat.suffix = "}"; pat.namePattern = "[a-zA-Z]+";
        TokenScanner dollar(pat);
        auto spans = dollar.scan(containerOf({"Dear $", "{name}, {{NAME}}"}));
        assert(spans.size() == 1 && spans[0].name == "name");
        assert(dollar.names("${a} ${b} ${a}") == QStringList({"a", "b", "a"}));
    }
    std::cout << "token_scanner_test passed" << std::endl; return 0;
}
