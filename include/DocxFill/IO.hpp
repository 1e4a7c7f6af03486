/** \file IO.hpp
 *  Byte source / byte sink seams between the fill engine and whatever transport delivers templates
 *  and consumes results (files here; HTTP or object storage elsewhere).
 */
#pragma once
#include "DocxFill/Export.hpp"
#include "DocxFill/Docx.hpp"
#include <QByteArray>
#include <QString>
#include <QStringList>
#include <optional>

namespace DocxFill {

class DOCXFILL_EXPORT ByteSource {
public:
    virtual ~ByteSource() = default;
    /** Entire template archive, std::nullopt if unavailable. */
    virtual std::optional<QByteArray> readAll() = 0;
    /** Description used in log and error messages. */
    virtual QString describe() const = 0;
};

class DOCXFILL_EXPORT ByteSink {
public:
    virtual ~ByteSink() = default;
    virtual bool write(const QByteArray &bytes) = 0;
    virtual QString describe() const = 0;
};

class DOCXFILL_EXPORT FileByteSource : public ByteSource {
public:
    explicit FileByteSource(QString path) : m_path(std::move(path)) {}
    std::optional<QByteArray> readAll() override;
    QString describe() const override { return m_path; }
private:
    QString m_path;
};

class DOCXFILL_EXPORT FileByteSink : public ByteSink {
public:
    explicit FileByteSink(QString path) : m_path(std::move(path)) {}
    /** Writes through a QSaveFile so a failed write never leaves a truncated output. */
    bool write(const QByteArray &bytes) override;
    QString describe() const override { return m_path; }
private:
    QString m_path;
};

class DOCXFILL_EXPORT BufferByteSource : public ByteSource {
public:
    explicit BufferByteSource(QByteArray bytes) : m_bytes(std::move(bytes)) {}
    std::optional<QByteArray> readAll() override { return m_bytes; }
    QString describe() const override { return QStringLiteral("<memory>"); }
private:
    QByteArray m_bytes;
};

class DOCXFILL_EXPORT BufferByteSink : public ByteSink {
public:
    bool write(const QByteArray &bytes) override { m_bytes = bytes; m_written = true; return true; }
    QString describe() const override { return QStringLiteral("<memory>"); }
    const QByteArray & bytes() const { return m_bytes; }
    bool written() const { return m_written; }
private:
    QByteArray m_bytes;
    bool m_written{false};
};

/** Outcome of fillTemplate(ByteSource&, ...). The sink is only written when ok is true. */
struct FillReport {
    bool ok{false};
    std::optional<Docx::ErrorCode> error;
    QString message;
    QStringList unresolved;
};

/** Read the template, fill it, hand the result to the sink. Nothing reaches the sink on failure. */
DOCXFILL_EXPORT FillReport fillTemplate(ByteSource &source, const Variables &variables, ByteSink &sink,
                                        const FillOptions &options = {});

} // namespace DocxFill
