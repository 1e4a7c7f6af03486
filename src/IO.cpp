#include "DocxFill/IO.hpp"
#include <QDebug>
#include <QFile>
#include <QSaveFile>

namespace DocxFill {

std::optional<QByteArray> FileByteSource::readAll() {
    QFile f(m_path);
    if(!f.open(QIODevice::ReadOnly)) {
        qWarning() << "FileByteSource: cannot read" << m_path << f.errorString();
        return std::nullopt;
    }
    return f.readAll();
}

bool FileByteSink::write(const QByteArray &bytes) {
    QSaveFile f(m_path);
    if(!f.open(QIODevice::WriteOnly)) {
        qWarning() << "FileByteSink: cannot open" << m_path << f.errorString();
        return false;
    }
    if(f.write(bytes) != bytes.size()) {
        qWarning() << "FileByteSink: short write to" << m_path << f.errorString();
        f.cancelWriting();
        return false;
    }
    if(!f.commit()) {
        qWarning() << "FileByteSink: cannot commit" << m_path << f.errorString();
        return false;
    }
    return true;
}

FillReport fillTemplate(ByteSource &source, const Variables &variables, ByteSink &sink, const FillOptions &options) {
    FillReport report;
    auto fail = [&report](Docx::ErrorCode ec, const QString &message) {
        report.ok = false;
        report.error = ec;
        report.message = message;
        return report;
    };

    auto bytes = source.readAll();
    if(!bytes) return fail(Docx::ErrorCode::OpenFailed, QStringLiteral("cannot read template from %1").arg(source.describe()));

    Docx doc = Docx::fromBytes(*bytes);
    doc.setVariablePattern(options.pattern);
    doc.setImageSizes(options.imageSizes);
    if(!doc.fillTemplate(variables)) return fail(*doc.lastError(), doc.lastErrorMessage());
    report.unresolved = doc.unresolvedVariables();

    auto out = doc.toBytes();
    if(!out) return fail(Docx::ErrorCode::PartWriteFailed, doc.lastErrorMessage());
    if(!sink.write(*out)) return fail(Docx::ErrorCode::PartWriteFailed, QStringLiteral("cannot write result to %1").arg(sink.describe()));
    qInfo().noquote() << "fillTemplate:" << source.describe() << "->" << sink.describe()
                      << QStringLiteral("(%1 bytes)").arg(out->size());
    report.ok = true;
    return report;
}

} // namespace DocxFill
