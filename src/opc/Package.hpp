/** \file Package.hpp
 *  OPC package (zip container) held in memory as part path -> bytes.
 *  Untouched entries are repacked with their original compressed data; only dirty parts are rewritten.
 */
#pragma once
#include "opc/ContentTypes.hpp"
#include "opc/Relationships.hpp"
#include <QByteArray>
#include <QHash>
#include <QSet>
#include <QString>
#include <QStringList>
#include <map>
#include <optional>

namespace DocxFill { namespace opc {

/** Value type: copying a Package gives an independent working copy (Qt containers share until written). */
class Package {
public:
    /** Open archive bytes. Fails if not a zip, if [Content_Types].xml is missing or if the main document part is missing. */
    bool open(const QByteArray &bytes);
    /** Read a file and open it. */
    bool open(const QString &path);
    /** Reason for the last failed open/serialize. */
    const QString & errorString() const { return m_error; }

    QStringList partNames() const { return m_order; }
    bool hasPart(const QString &name) const { return m_parts.contains(name); }
    /** Current bytes of a part; relationship and content-type parts reflect their in-memory models. */
    std::optional<QByteArray> readPart(const QString &name) const;
    /** Replace or add a part and mark it dirty. */
    void writePart(const QString &name, const QByteArray &data);
    bool isDirty(const QString &name) const { return m_dirty.contains(name); }
    /** Parts that serialize() would write instead of copying. */
    QStringList dirtyParts() const;

    /** Store media bytes under word/media/imageN.<ext> (lowest free N) and make sure the extension has a content type. */
    QString addMedia(const QByteArray &data, const QString &extension, const QString &mimeType);
    /** Append a relationship from fromPart to targetPart (both package paths). Returns the new id, empty if targetPart does not exist. */
    QString addRelationship(const QString &fromPart, const QString &targetPart, const QString &type);
    /** Relationships whose source is partPath ("" for the package root). */
    Relationships relationships(const QString &partPath) const;

    /** Main document part resolved through _rels/.rels, word/document.xml if unresolvable. */
    QString mainDocumentPath() const;
    std::optional<QString> contentTypeOf(const QString &partPath) const { return m_types.contentTypeFor(partPath); }

    /** Repacked archive; std::nullopt (see errorString()) if libzip fails. Returns the opened bytes verbatim when nothing is dirty. */
    std::optional<QByteArray> serialize() const;
    /** Write serialize() to disk. */
    bool saveAs(const QString &path) const;

    /** "word/document.xml" -> "word/_rels/document.xml.rels"; "" -> "_rels/.rels". */
    static QString relsPathFor(const QString &partPath);
    /** Resolve a relationship target relative to the source part's directory into a package path. */
    static QString resolveTarget(const QString &fromPart, const QString &target);
    /** Express targetPart relative to the directory of fromPart. */
    static QString relativeTarget(const QString &fromPart, const QString &targetPart);

    static QString contentTypesPath() { return QStringLiteral("[Content_Types].xml"); }

private:
    QByteArray m_original;                 // bytes given to open(); repack source
    QHash<QString, QByteArray> m_parts;
    QStringList m_order;                   // entry order as found / added
    QSet<QString> m_dirty;
    ContentTypes m_types;
    bool m_typesModified{false};
    mutable std::map<QString, Relationships> m_rels; // by rels part path, loaded lazily
    QSet<QString> m_relsModified;
    mutable QString m_error;

    Relationships & relsFor(const QString &partPath) const;
};

}} // namespace DocxFill::opc
