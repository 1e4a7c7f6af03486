/** \file Docx.hpp
 *  Public façade for loading a DOCX template and filling its {{NAME}} placeholders.
 *  Processing scope: main document part plus the headers, footers, footnotes and endnotes it references.
 *  Unknown placeholders are left untouched and reported through unresolvedVariables().
 */
#pragma once
#include "DocxFill/Export.hpp"
#include "DocxFill/FillOptions.hpp"
#include "DocxFill/Variables.hpp"
#include <QByteArray>
#include <QString>
#include <QStringList>
#include <memory>
#include <optional>

namespace DocxFill {

namespace opc { class Package; }

/** Main API entry. Load a template, configure pattern, fill variables, and save.
 *  Thread-safety: instances are not thread-safe. One instance per document; separate instances share nothing.
 */
class DOCXFILL_EXPORT Docx {
public:
    /** Error codes for the last operation. A failed operation never leaves a partially filled package behind. */
    enum class ErrorCode {
        OpenFailed,          ///< template bytes could not be obtained (missing file, unreadable source)
        CorruptArchive,     ///< not a zip, or mandatory parts ([Content_Types].xml, main document, w:body) missing
        XmlParseFailed,      ///< a processed part is not well-formed XML
        InvalidImagePayload, ///< an image payload could not be decoded
        PartWriteFailed      ///< media/relationship registration or repacking failed
    };

    /** Construct with path to an existing .docx template. No I/O until first operation. */
    explicit Docx(QString templatePath);
    /** Construct from template bytes already in memory. */
    static Docx fromBytes(QByteArray templateBytes);
    ~Docx();
    Docx(Docx &&) noexcept;
    Docx & operator=(Docx &&) noexcept;

    /** Override variable pattern (default {{ .. }} with NAME in [A-Z0-9_]+). */
    void setVariablePattern(const VariablePattern &pattern) { m_options.pattern = pattern; }
    const VariablePattern & variablePattern() const { return m_options.pattern; }
    /** Override the image width table. */
    void setImageSizes(const ImageSizeTable &sizes) { m_options.imageSizes = sizes; }
    const ImageSizeTable & imageSizes() const { return m_options.imageSizes; }
    const FillOptions & options() const { return m_options; }

    /** Return paragraph-joined plain text of the main document (paragraphs separated by \n). */
    QString readTextContent() const;
    /** Scan for well-formed placeholders across run boundaries in all processed parts. Wrapped form, deduplicated, order of first appearance. */
    QStringList findVariables() const;
    /** Substitute text and inject images. All or nothing: on failure the loaded template stays as it was. */
    bool fillTemplate(const Variables &variables);
    /** Wrapped tokens left literal by the last fillTemplate() because no variable matched them. */
    const QStringList & unresolvedVariables() const { return m_unresolved; }

    /** Serialized archive in its current state (template bytes if nothing was filled). */
    std::optional<QByteArray> toBytes() const;
    /** Write resulting package to disk (zip). */
    bool save(const QString &outputPath) const;

    /** Last error code set during an operation; std::nullopt if none since construction or after clearError(). */
    std::optional<ErrorCode> lastError() const { return m_lastError; }
    /** Human readable detail for lastError(). */
    const QString & lastErrorMessage() const { return m_lastErrorMessage; }
    void clearError() { m_lastError.reset(); m_lastErrorMessage.clear(); }

private:
    Docx() = default;

    QString m_templatePath;
    QByteArray m_templateBytes;
    FillOptions m_options;
    mutable std::shared_ptr<opc::Package> m_package; // OPC container (shared_ptr works with incomplete type)
    QStringList m_unresolved;
    mutable std::optional<ErrorCode> m_lastError;
    mutable QString m_lastErrorMessage;

    bool ensureOpened() const; // lazy open helper
    void setError(ErrorCode ec, const QString &message) const;
};

/** Readable name for an error code ("CorruptArchive", ...). */
DOCXFILL_EXPORT QString errorCodeName(Docx::ErrorCode ec);

} // namespace DocxFill
