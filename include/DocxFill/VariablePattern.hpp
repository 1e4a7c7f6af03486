/** \file VariablePattern.hpp
 *  Placeholder delimiters and the character class allowed for token names.
 */
#pragma once
#include <QString>

namespace DocxFill {

/** Token syntax: prefix + NAME + suffix, NAME matching namePattern. Default {{NAME}} with NAME in [A-Z0-9_]+. */
struct VariablePattern {
    QString prefix{QStringLiteral("{{")};
    QString suffix{QStringLiteral("}}")};
    QString namePattern{QStringLiteral("[A-Z0-9_]+")};

    /** Wrap a bare name with the delimiters. */
    QString wrap(const QString &name) const { return prefix + name + suffix; }
};

} // namespace DocxFill
