#include "Cli.hpp"
#include "DocxFill/Docx.hpp"
#include "DocxFill/FillRequest.hpp"
#include "DocxFill/IO.hpp"
#include "DocxFill/Variables.hpp"
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <QLoggingCategory>

namespace DocxFill { namespace cli {

namespace {

bool splitAssignment(const QString &arg, QString &name, QString &value) {
    const int eq = arg.indexOf('=');
    if(eq <= 0) return false;
    name = arg.left(eq);
    value = arg.mid(eq + 1);
    return true;
}

} // namespace

int run(const QStringList &arguments, QTextStream &out, QTextStream &err) {
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Fill {{NAME}} placeholders of a .docx template with text and images."));
    const QCommandLineOption helpOpt = parser.addHelpOption();
    const QCommandLineOption versionOpt = parser.addVersionOption();
    QCommandLineOption requestOpt(QStringLiteral("request"), QStringLiteral("JSON fill request."), QStringLiteral("file"));
    QCommandLineOption templateOpt(QStringLiteral("template"), QStringLiteral("Template .docx (overrides template_key)."), QStringLiteral("file"));
    QCommandLineOption outputOpt(QStringLiteral("output"), QStringLiteral("Output .docx (overrides output_filename)."), QStringLiteral("file"));
    QCommandLineOption setOpt(QStringLiteral("set"), QStringLiteral("Text value for a placeholder."), QStringLiteral("NAME=VALUE"));
    QCommandLineOption imageOpt(QStringLiteral("image"), QStringLiteral("Image file for an IMAGE_* placeholder."), QStringLiteral("NAME=file"));
    QCommandLineOption listOpt(QStringLiteral("list"), QStringLiteral("Print the template's placeholders and exit."));
    QCommandLineOption verboseOpt(QStringLiteral("verbose"), QStringLiteral("Enable debug output."));
    parser.addOptions({requestOpt, templateOpt, outputOpt, setOpt, imageOpt, listOpt, verboseOpt});

    if(!parser.parse(arguments)) {
        err << "docxfill: " << parser.errorText() << Qt::endl;
        return ExitUsage;
    }
    if(parser.isSet(helpOpt)) { out << parser.helpText(); return ExitOk; }
    if(parser.isSet(versionOpt)) { out << QCoreApplication::applicationName() << ' ' << QCoreApplication::applicationVersion() << Qt::endl; return ExitOk; }
    if(!parser.positionalArguments().isEmpty()) {
        err << "docxfill: unexpected argument " << parser.positionalArguments().front() << Qt::endl;
        return ExitUsage;
    }
    QLoggingCategory::setFilterRules(parser.isSet(verboseOpt) ? QStringLiteral("*.debug=true") : QStringLiteral("*.debug=false"));

    FillRequest request;
    if(parser.isSet(requestOpt)) {
        QFile f(parser.value(requestOpt));
        if(!f.open(QIODevice::ReadOnly)) {
            err << "docxfill: cannot read " << f.fileName() << ": " << f.errorString() << Qt::endl;
            return ExitUsage;
        }
        QString why;
        auto parsed = FillRequest::fromJson(f.readAll(), &why);
        if(!parsed) { err << "docxfill: " << f.fileName() << ": " << why << Qt::endl; return ExitUsage; }
        request = *parsed;
    }
    if(parser.isSet(templateOpt)) request.templatePath = parser.value(templateOpt);
    if(parser.isSet(outputOpt)) request.outputPath = parser.value(outputOpt);
    if(request.templatePath.isEmpty()) {
        err << "docxfill: no template given (--template or template_key)" << Qt::endl;
        return ExitUsage;
    }

    for(const auto &arg : parser.values(setOpt)) {
        QString name, value;
        if(!splitAssignment(arg, name, value)) { err << "docxfill: --set expects NAME=VALUE, got " << arg << Qt::endl; return ExitUsage; }
        request.placeholders.insert(name, value);
    }
    for(const auto &arg : parser.values(imageOpt)) {
        QString name, path;
        if(!splitAssignment(arg, name, path)) { err << "docxfill: --image expects NAME=file, got " << arg << Qt::endl; return ExitUsage; }
        QFile f(path);
        if(!f.open(QIODevice::ReadOnly)) { err << "docxfill: cannot read " << path << ": " << f.errorString() << Qt::endl; return ExitUsage; }
        request.images.insert(name, f.readAll().toBase64());
    }

    if(parser.isSet(listOpt)) {
        Docx doc(request.templatePath);
        const QStringList tokens = doc.findVariables();
        if(doc.lastError()) { err << "docxfill: " << errorCodeName(*doc.lastError()) << ": " << doc.lastErrorMessage() << Qt::endl; return ExitFill; }
        for(const auto &t : tokens) out << t << Qt::endl;
        return ExitOk;
    }

    FileByteSource source(request.templatePath);
    FileByteSink sink(request.outputPath);
    const FillReport report = fillTemplate(source, request.toVariables(), sink);
    if(!report.ok) {
        err << "docxfill: " << (report.error ? errorCodeName(*report.error) : QStringLiteral("Error"))
            << ": " << report.message << Qt::endl;
        return ExitFill;
    }
    for(const auto &token : report.unresolved) err << "docxfill: unresolved " << token << Qt::endl;
    out << request.outputPath << Qt::endl;
    return ExitOk;
}

}} // namespace DocxFill::cli
