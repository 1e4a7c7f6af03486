#include "opc/Package.hpp"
#include <QDebug>
#include <QFile>
#include <QSaveFile>
#include <zip.h>
#include <cstdio>
#include <limits>
#include <utility>
#include <vector>

namespace DocxFill { namespace opc {

namespace {

QString zipErrorText(zip_error_t *err) {
    return QString::fromUtf8(zip_error_strerror(err));
}

QString dirOf(const QString &partPath) {
    int slash = partPath.lastIndexOf('/');
    return slash < 0 ? QString() : partPath.left(slash);
}

// Collapse "." and ".." segments of a slash separated path.
QString normalizePath(const QString &path) {
    QStringList out;
    for(const auto &seg : path.split('/', Qt::SkipEmptyParts)) {
        if(seg == QLatin1String(".")) continue;
        if(seg == QLatin1String("..")) { if(!out.isEmpty()) out.removeLast(); continue; }
        out << seg;
    }
    return out.join('/');
}

} // namespace

bool Package::open(const QString &path) {
    QFile f(path);
    if(!f.open(QIODevice::ReadOnly)) {
        m_error = QStringLiteral("cannot read %1: %2").arg(path, f.errorString());
        return false;
    }
    return open(f.readAll());
}

bool Package::open(const QByteArray &bytes) {
    *this = Package();
    m_original = bytes;
    if(m_original.isEmpty()) { m_error = QStringLiteral("empty input"); return false; }

    zip_error_t err; zip_error_init(&err);
    zip_source_t *src = zip_source_buffer_create(m_original.constData(), static_cast<zip_uint64_t>(m_original.size()), 0, &err);
    if(!src) { m_error = zipErrorText(&err); zip_error_fini(&err); return false; }
    zip_t *za = zip_open_from_source(src, ZIP_RDONLY, &err);
    if(!za) {
        m_error = QStringLiteral("not a zip archive: %1").arg(zipErrorText(&err));
        zip_source_free(src); zip_error_fini(&err);
        return false;
    }
    zip_error_fini(&err);

    bool ok = true;
    zip_int64_t n = zip_get_num_entries(za, 0);
    for(zip_int64_t i = 0; i < n && ok; ++i) {
        const char *rawName = zip_get_name(za, static_cast<zip_uint64_t>(i), ZIP_FL_ENC_GUESS);
        if(!rawName) continue;
        QString name = QString::fromUtf8(rawName);
        if(name.endsWith('/')) continue; // directory entry, copied as is on repack
        zip_stat_t st; zip_stat_init(&st);
        if(zip_stat_index(za, static_cast<zip_uint64_t>(i), 0, &st) != 0 || !(st.valid & ZIP_STAT_SIZE)) {
            m_error = QStringLiteral("cannot stat entry %1").arg(name); ok = false; break;
        }
        if(st.size > static_cast<zip_uint64_t>(std::numeric_limits<int>::max())) {
            m_error = QStringLiteral("entry %1 too large (%2 bytes)").arg(name).arg(static_cast<qulonglong>(st.size)); ok = false; break;
        }
        zip_file_t *zf = zip_fopen_index(za, static_cast<zip_uint64_t>(i), 0);
        if(!zf) { m_error = QStringLiteral("cannot open entry %1: %2").arg(name, QString::fromUtf8(zip_strerror(za))); ok = false; break; }
        QByteArray data(static_cast<int>(st.size), Qt::Uninitialized);
        zip_int64_t got = zip_fread(zf, data.data(), st.size);
        zip_fclose(zf);
        if(got < 0 || static_cast<zip_uint64_t>(got) != st.size) {
            m_error = QStringLiteral("truncated entry %1").arg(name); ok = false; break;
        }
        m_parts.insert(name, data);
        m_order << name;
    }
    zip_discard(za); // also frees src
    if(!ok) return false;

    if(!m_parts.contains(contentTypesPath())) { m_error = QStringLiteral("missing [Content_Types].xml"); return false; }
    if(!m_types.load(m_parts.value(contentTypesPath()))) { m_error = QStringLiteral("[Content_Types].xml is not valid"); return false; }
    QString mainPart = mainDocumentPath();
    if(!m_parts.contains(mainPart)) { m_error = QStringLiteral("missing main document part %1").arg(mainPart); return false; }
    return true;
}

std::optional<QByteArray> Package::readPart(const QString &name) const {
    if(name == contentTypesPath() && m_typesModified) return m_types.save();
    if(m_relsModified.contains(name)) return m_rels.at(name).save();
    auto it = m_parts.constFind(name);
    if(it == m_parts.constEnd()) return std::nullopt;
    return *it;
}

void Package::writePart(const QString &name, const QByteArray &data) {
    if(!m_parts.contains(name)) m_order << name;
    m_parts.insert(name, data);
    m_dirty.insert(name);
    // An explicit write wins over a model loaded earlier.
    if(name == contentTypesPath()) { m_types.load(data); m_typesModified = false; }
    if(m_rels.count(name)) { m_rels.erase(name); m_relsModified.remove(name); }
}

QStringList Package::dirtyParts() const {
    QStringList out;
    for(const auto &name : m_order) if(m_dirty.contains(name)) out << name;
    if(m_typesModified && !out.contains(contentTypesPath())) out << contentTypesPath();
    for(const auto &name : m_relsModified) if(!out.contains(name)) out << name;
    return out;
}

Relationships & Package::relsFor(const QString &partPath) const {
    QString relsPath = relsPathFor(partPath);
    auto it = m_rels.find(relsPath);
    if(it != m_rels.end()) return it->second;
    Relationships rels;
    auto data = m_parts.constFind(relsPath);
    if(data != m_parts.constEnd() && !rels.load(*data)) {
        qWarning() << "Package: unreadable relationships part" << relsPath << "- starting empty";
    }
    return m_rels.emplace(relsPath, std::move(rels)).first->second;
}

Relationships Package::relationships(const QString &partPath) const {
    return relsFor(partPath);
}

QString Package::addMedia(const QByteArray &data, const QString &extension, const QString &mimeType) {
    QString ext = extension.toLower();
    QString path;
    for(int n = 1; ; ++n) {
        path = QStringLiteral("word/media/image%1.%2").arg(n).arg(ext);
        if(!m_parts.contains(path)) break;
    }
    writePart(path, data);
    if(!m_types.contentTypeFor(path)) {
        m_types.addDefault(ext, mimeType);
        m_typesModified = true;
    }
    return path;
}

QString Package::addRelationship(const QString &fromPart, const QString &targetPart, const QString &type) {
    if(!m_parts.contains(targetPart)) {
        qWarning() << "Package: relationship target does not exist:" << targetPart;
        return {};
    }
    QString id = relsFor(fromPart).add(type, relativeTarget(fromPart, targetPart));
    m_relsModified.insert(relsPathFor(fromPart));
    return id;
}

QString Package::mainDocumentPath() const {
    Relationships root = relationships(QString());
    for(const auto &rel : root.byType(RelType::OfficeDocument)) {
        if(rel.isExternal()) continue;
        return resolveTarget(QString(), rel.target);
    }
    return QStringLiteral("word/document.xml");
}

QString Package::relsPathFor(const QString &partPath) {
    if(partPath.isEmpty()) return QStringLiteral("_rels/.rels");
    QString dir = dirOf(partPath);
    QString file = partPath.mid(dir.isEmpty() ? 0 : dir.size() + 1);
    return (dir.isEmpty() ? QString() : dir + '/') + QStringLiteral("_rels/") + file + QStringLiteral(".rels");
}

QString Package::resolveTarget(const QString &fromPart, const QString &target) {
    if(target.startsWith('/')) return normalizePath(target);
    QString dir = dirOf(fromPart);
    return normalizePath(dir.isEmpty() ? target : dir + '/' + target);
}

QString Package::relativeTarget(const QString &fromPart, const QString &targetPart) {
    QStringList from = dirOf(fromPart).split('/', Qt::SkipEmptyParts);
    QStringList to = targetPart.split('/', Qt::SkipEmptyParts);
    int common = 0;
    while(common < from.size() && common < to.size() - 1 && from[common] == to[common]) ++common;
    QStringList out;
    for(int i = common; i < from.size(); ++i) out << QStringLiteral("..");
    for(int i = common; i < to.size(); ++i) out << to[i];
    return out.join('/');
}

std::optional<QByteArray> Package::serialize() const {
    // Collect everything that must be written fresh; the buffers stay alive until zip_close().
    std::vector<std::pair<QString, QByteArray>> pending;
    for(const auto &name : dirtyParts()) {
        auto data = readPart(name);
        if(data) pending.emplace_back(name, *data);
    }
    if(pending.empty() && !m_original.isEmpty()) return m_original;

    zip_error_t err; zip_error_init(&err);
    zip_source_t *src = zip_source_buffer_create(m_original.isEmpty() ? nullptr : m_original.constData(),
                                                 static_cast<zip_uint64_t>(m_original.size()), 0, &err);
    if(!src) { m_error = zipErrorText(&err); zip_error_fini(&err); return std::nullopt; }
    zip_t *za = zip_open_from_source(src, m_original.isEmpty() ? (ZIP_CREATE | ZIP_TRUNCATE) : 0, &err);
    if(!za) {
        m_error = QStringLiteral("cannot reopen archive: %1").arg(zipErrorText(&err));
        zip_source_free(src); zip_error_fini(&err);
        return std::nullopt;
    }
    zip_error_fini(&err);
    zip_source_keep(src); // read the result back after zip_close()

    auto fail = [&](const QString &msg) -> std::optional<QByteArray> {
        m_error = msg;
        zip_discard(za);
        zip_source_free(src);
        return std::nullopt;
    };

    for(const auto &entry : pending) {
        const QByteArray &data = entry.second;
        zip_source_t *s = zip_source_buffer(za, data.constData(), static_cast<zip_uint64_t>(data.size()), 0);
        if(!s) return fail(QStringLiteral("cannot buffer %1: %2").arg(entry.first, QString::fromUtf8(zip_strerror(za))));
        zip_int64_t idx = zip_file_add(za, entry.first.toUtf8().constData(), s, ZIP_FL_OVERWRITE | ZIP_FL_ENC_UTF_8);
        if(idx < 0) {
            zip_source_free(s);
            return fail(QStringLiteral("cannot write %1: %2").arg(entry.first, QString::fromUtf8(zip_strerror(za))));
        }
        zip_set_file_compression(za, static_cast<zip_uint64_t>(idx), ZIP_CM_DEFLATE, 0);
    }

    if(zip_close(za) != 0) {
        QString msg = QString::fromUtf8(zip_strerror(za));
        zip_discard(za);
        zip_source_free(src);
        m_error = QStringLiteral("cannot finalize archive: %1").arg(msg);
        return std::nullopt;
    }

    if(zip_source_open(src) < 0) {
        m_error = QStringLiteral("cannot read repacked archive");
        zip_source_free(src);
        return std::nullopt;
    }
    zip_source_seek(src, 0, SEEK_END);
    zip_int64_t size = zip_source_tell(src);
    zip_source_seek(src, 0, SEEK_SET);
    QByteArray out(static_cast<int>(size < 0 ? 0 : size), Qt::Uninitialized);
    zip_int64_t got = size > 0 ? zip_source_read(src, out.data(), static_cast<zip_uint64_t>(size)) : 0;
    zip_source_close(src);
    zip_source_free(src);
    if(size < 0 || got != size) {
        m_error = QStringLiteral("short read of repacked archive");
        return std::nullopt;
    }
    return out;
}

bool Package::saveAs(const QString &path) const {
    auto bytes = serialize();
    if(!bytes) { qWarning() << "Package: serialize failed:" << m_error; return false; }
    QSaveFile f(path);
    if(!f.open(QIODevice::WriteOnly)) { m_error = f.errorString(); return false; }
    if(f.write(*bytes) != bytes->size()) { m_error = f.errorString(); f.cancelWriting(); return false; }
    if(!f.commit()) { m_error = f.errorString(); return false; }
    return true;
}

}} // namespace DocxFill::opc
