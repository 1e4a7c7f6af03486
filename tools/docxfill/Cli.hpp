/** \file Cli.hpp
 *  Command line front end of docxfill, callable without a process boundary.
 */
#pragma once
#include <QStringList>
#include <QTextStream>

namespace DocxFill { namespace cli {

enum ExitCode { ExitOk = 0, ExitUsage = 1, ExitFill = 2 };

/** Run with argv-style arguments (arguments[0] is the program name). Needs a QCoreApplication. */
int run(const QStringList &arguments, QTextStream &out, QTextStream &err);

}} // namespace DocxFill::cli
