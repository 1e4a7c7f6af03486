// docxfill: fill a .docx template from a JSON request and/or command line values.
#include "Cli.hpp"
#include <QCoreApplication>

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("docxfill"));
    QCoreApplication::setApplicationVersion(QStringLiteral("1.0.0"));
    QTextStream out(stdout);
    QTextStream err(stderr);
    return DocxFill::cli::run(QCoreApplication::arguments(), out, err);
}
