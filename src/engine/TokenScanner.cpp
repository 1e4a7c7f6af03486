#include "engine/TokenScanner.hpp"
#include <QDebug>
#include <utility>

namespace DocxFill { namespace engine {

TokenScanner::TokenScanner(const VariablePattern &pattern)
    : m_pattern(pattern)
    , m_re(QRegularExpression::escape(pattern.prefix) + QStringLiteral("(") + pattern.namePattern + QStringLiteral(")")
           + QRegularExpression::escape(pattern.suffix)) {
    if(!m_re.isValid()) qWarning() << "TokenScanner: invalid name pattern" << pattern.namePattern << m_re.errorString();
}

std::vector<Span> TokenScanner::scan(const FormattedContainer &container) const {
    // Logical string plus, for every character, the (run, offset) it came from.
    QString logical;
    std::vector<std::pair<int, int>> origin;
    for(int ri = 0; ri < static_cast<int>(container.runs.size()); ++ri) {
        const QString &t = container.runs[ri].text;
        logical += t;
        for(int off = 0; off < t.size(); ++off) origin.emplace_back(ri, off);
    }
    std::vector<Span> spans;
    if(logical.isEmpty() || !m_re.isValid()) return spans;

    auto it = m_re.globalMatch(logical);
    while(it.hasNext()) {
        auto m = it.next();
        const int s = static_cast<int>(m.capturedStart(0));
        const int e = static_cast<int>(m.capturedEnd(0));
        if(e <= s) continue;
        Span span;
        span.startRun = origin[s].first;
        span.startOffset = origin[s].second;
        span.endRun = origin[e - 1].first;
        span.endOffset = origin[e - 1].second + 1;
        span.name = m.captured(1);
        span.logicalStart = s;
        span.logicalEnd = e;
        spans.push_back(span);
    }
    return spans;
}

QStringList TokenScanner::names(const QString &text) const {
    QStringList out;
    if(!m_re.isValid()) return out;
    auto it = m_re.globalMatch(text);
    while(it.hasNext()) out << it.next().captured(1);
    return out;
}

}} // namespace DocxFill::engine
