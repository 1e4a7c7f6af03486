/** \file Replacers.hpp
 *  Text substitution and image injection over a FormattedContainer.
 */
#pragma once
#include "engine/RunModel.hpp"
#include "engine/TokenScanner.hpp"
#include <QByteArray>
#include <QString>
#include <cstdint>

namespace DocxFill { namespace engine {

/** What the drawing markup of an injected picture needs to know. */
struct PictureRef {
    QString relationshipId;
    std::int64_t cx{0};   ///< EMU
    std::int64_t cy{0};   ///< EMU
    unsigned docPrId{1};  ///< unique among wp:docPr ids of the document
    QString name;         ///< picture name, e.g. media file name
    QString description;  ///< alt text
};

class Replacers {
public:
    /** Replace the span by one run holding value, formatted like the span's first run.
     *  Text before the span keeps the first run's formatting, text after it the last run's;
     *  runs strictly inside the span are dropped and runs outside it are not touched.
     */
    static void replaceText(FormattedContainer &container, const Span &span, const QString &value);

    /** Replace the whole run sequence of the container by a single drawing run styled like the span's first run.
     *  Returns false if the drawing run could not be built (the container is then unchanged).
     */
    static bool injectImage(FormattedContainer &container, const Span &span, const PictureRef &picture);

    /** w:drawing/wp:inline markup for an embedded picture. */
    static QByteArray buildDrawingXml(const PictureRef &picture);
};

}} // namespace DocxFill::engine
