#include "DocxFill/Docx.hpp"
#include "opc/Package.hpp"
#include "xml/XmlPart.hpp"
#include "engine/RunModel.hpp"
#include "engine/TemplateFiller.hpp"
#include "engine/TokenScanner.hpp"
#include <QDebug>
#include <QFile>

namespace DocxFill {

QString errorCodeName(Docx::ErrorCode ec) {
    switch(ec) {
    case Docx::ErrorCode::OpenFailed: return QStringLiteral("OpenFailed");
    case Docx::ErrorCode::CorruptArchive: return QStringLiteral("CorruptArchive");
    case Docx::ErrorCode::XmlParseFailed: return QStringLiteral("XmlParseFailed");
    case Docx::ErrorCode::InvalidImagePayload: return QStringLiteral("InvalidImagePayload");
    case Docx::ErrorCode::PartWriteFailed: return QStringLiteral("PartWriteFailed");
    }
    return QStringLiteral("Unknown");
}

Docx::Docx(QString templatePath)
    : m_templatePath(std::move(templatePath)) {}

Docx Docx::fromBytes(QByteArray templateBytes) {
    Docx d;
    d.m_templateBytes = std::move(templateBytes);
    return d;
}

Docx::~Docx() = default;
Docx::Docx(Docx &&) noexcept = default;
Docx & Docx::operator=(Docx &&) noexcept = default;

void Docx::setError(ErrorCode ec, const QString &message) const {
    m_lastError = ec;
    m_lastErrorMessage = message;
    qWarning().noquote() << "Docx:" << errorCodeName(ec) << "-" << message;
}

bool Docx::ensureOpened() const {
    // A failed open is retried, so every operation reports it again.
    if(m_package) return true;
    QByteArray bytes = m_templateBytes;
    if(!m_templatePath.isEmpty()) {
        QFile f(m_templatePath);
        if(!f.open(QIODevice::ReadOnly)) {
            setError(ErrorCode::OpenFailed, QStringLiteral("cannot read %1: %2").arg(m_templatePath, f.errorString()));
            return false;
        }
        bytes = f.readAll();
    }
    auto pkg = std::make_shared<opc::Package>();
    if(!pkg->open(bytes)) {
        setError(ErrorCode::CorruptArchive, pkg->errorString());
        return false;
    }
    qDebug() << "Docx: opened" << (m_templatePath.isEmpty() ? QStringLiteral("<memory>") : m_templatePath)
             << pkg->partNames().size() << "parts";
    m_package = std::move(pkg);
    return true;
}

QString Docx::readTextContent() const {
    if(!ensureOpened()) return {};
    const QString mainPath = m_package->mainDocumentPath();
    auto data = m_package->readPart(mainPath);
    if(!data) { setError(ErrorCode::CorruptArchive, QStringLiteral("missing %1").arg(mainPath)); return {}; }
    xml::XmlPart part;
    if(!part.load(*data)) { setError(ErrorCode::XmlParseFailed, QStringLiteral("%1: %2").arg(mainPath, part.errorString())); return {}; }
    if(part.selectAll("//w:body").empty()) { setError(ErrorCode::CorruptArchive, QStringLiteral("%1 has no w:body").arg(mainPath)); return {}; }
    QStringList lines;
    for(const auto &p : part.selectAll("//w:p")) {
        engine::RunModel model;
        model.build(p);
        lines << model.text();
    }
    return lines.join('\n');
}

QStringList Docx::findVariables() const {
    if(!ensureOpened()) return {};
    engine::TokenScanner scanner(m_options.pattern);
    QStringList found;
    for(const auto &path : engine::TemplateFiller::targetParts(*m_package)) {
        auto data = m_package->readPart(path);
        if(!data) continue;
        xml::XmlPart part;
        if(!part.load(*data)) {
            setError(ErrorCode::XmlParseFailed, QStringLiteral("%1: %2").arg(path, part.errorString()));
            return {};
        }
        for(const auto &p : part.selectAll("//w:p")) {
            engine::RunModel model;
            model.build(p);
            for(const auto &name : scanner.names(model.text())) {
                const QString token = m_options.pattern.wrap(name);
                if(!found.contains(token)) found << token;
            }
        }
    }
    return found;
}

bool Docx::fillTemplate(const Variables &variables) {
    clearError();
    m_unresolved.clear();
    if(!ensureOpened()) return false;
    // Work on a copy so a failed fill leaves the loaded template as it was.
    auto working = std::make_shared<opc::Package>(*m_package);
    engine::TemplateFiller filler(*working, m_options);
    if(!filler.fill(variables)) {
        setError(filler.error().value_or(ErrorCode::PartWriteFailed), filler.errorMessage());
        return false;
    }
    m_unresolved = filler.unresolved();
    m_package = std::move(working);
    return true;
}

std::optional<QByteArray> Docx::toBytes() const {
    if(!ensureOpened()) return std::nullopt;
    auto bytes = m_package->serialize();
    if(!bytes) setError(ErrorCode::PartWriteFailed, m_package->errorString());
    return bytes;
}

bool Docx::save(const QString &outputPath) const {
    if(!ensureOpened()) return false;
    if(!m_package->saveAs(outputPath)) {
        setError(ErrorCode::PartWriteFailed, QStringLiteral("cannot write %1: %2").arg(outputPath, m_package->errorString()));
        return false;
    }
    qInfo() << "Docx: saved" << outputPath;
    return true;
}

} // namespace DocxFill
