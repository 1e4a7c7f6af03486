/** \file TemplateFiller.hpp
 *  Walks every paragraph of the processed parts and applies the scanner and replacers.
 */
#pragma once
#include "DocxFill/Docx.hpp"
#include "DocxFill/FillOptions.hpp"
#include "DocxFill/Variables.hpp"
#include "engine/ImagePayload.hpp"
#include "engine/RunModel.hpp"
#include "engine/TokenScanner.hpp"
#include <QString>
#include <QStringList>
#include <optional>
#include <unordered_map>
#include <vector>

namespace DocxFill {
namespace opc { class Package; }
namespace engine {

/** One fill over a package. The package is edited in place, so callers hand in a working copy
 *  and discard it when fill() returns false.
 */
class TemplateFiller {
public:
    TemplateFiller(opc::Package &package, const FillOptions &options);

    bool fill(const Variables &variables);

    std::optional<Docx::ErrorCode> error() const { return m_error; }
    const QString & errorMessage() const { return m_errorMessage; }
    /** Wrapped tokens left literal, in document order (main document first). */
    const QStringList & unresolved() const { return m_unresolved; }
    int textReplacements() const { return m_textReplacements; }
    int imagesInjected() const { return m_imagesInjected; }

    /** Main document followed by the header, footer, footnote and endnote parts it references. */
    static QStringList targetParts(const opc::Package &package);

private:
    struct Miss { int part; int paragraph; int position; QString token; };

    bool processContainer(pugi::xml_node paragraph, const QString &partPath, int partIndex, int paragraphIndex, bool &changed);
    bool injectImage(RunModel &model, const Span &span, const QString &partPath, const QByteArray &payload);
    bool isImageToken(const QString &name) const;
    bool setError(Docx::ErrorCode code, const QString &message);

    opc::Package &m_package;
    FillOptions m_options;
    TokenScanner m_scanner;
    std::unordered_map<QString, QString> m_text;
    std::unordered_map<QString, QByteArray> m_images;
    std::unordered_map<QString, DecodedImage> m_decoded;
    unsigned m_lastDocPrId{0};
    std::vector<Miss> m_misses;
    QStringList m_unresolved;
    int m_textReplacements{0};
    int m_imagesInjected{0};
    std::optional<Docx::ErrorCode> m_error;
    QString m_errorMessage;
};

}} // namespace DocxFill::engine
