/** \file TokenScanner.hpp
 *  Finds delimited tokens in a FormattedContainer even when their characters are spread over several runs.
 */
#pragma once
#include "DocxFill/VariablePattern.hpp"
#include "engine/RunModel.hpp"
#include <QRegularExpression>
#include <vector>

namespace DocxFill { namespace engine {

/** Half-open range [(startRun,startOffset), (endRun,endOffset)) covering one complete token. */
struct Span {
    int startRun{0};
    int startOffset{0};
    int endRun{0};
    int endOffset{0};   ///< one past the token's last character within endRun
    QString name;       ///< token name without delimiters
    int logicalStart{0};
    int logicalEnd{0};  ///< positions in the container's concatenated text
};

class TokenScanner {
public:
    explicit TokenScanner(const VariablePattern &pattern = {});

    /** Spans ordered by position, never overlapping. An opening delimiter without a valid close stays literal. */
    std::vector<Span> scan(const FormattedContainer &container) const;
    /** Same matching over plain text; returns token names in order. */
    QStringList names(const QString &text) const;

    const VariablePattern & pattern() const { return m_pattern; }

private:
    VariablePattern m_pattern;
    QRegularExpression m_re;
};

}} // namespace DocxFill::engine
