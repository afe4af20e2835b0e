#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QJsonDocument>
#include <QLoggingCategory>
#include <QTextStream>

#include "core/api/cut_session.h"
#include "core/config/run_config.h"

Q_LOGGING_CATEGORY(jlcMain, "jlc.main")

namespace {

enum ExitCode {
    ExitOk = 0,
    ExitFatal = 1,
    ExitNothingApplied = 2,
    ExitSuspect = 3
};

bool parseFrames(const QString& text, qint64* frames)
{
    bool ok = false;
    const qint64 value = text.trimmed().toLongLong(&ok);
    if (ok) {
        *frames = value;
    }
    return ok;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    // Application metadata
    app.setApplicationName("jlcut");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("JLCut Project");

    QCommandLineParser parser;
    parser.setApplicationDescription("Add J-cuts or L-cuts to DaVinci Resolve project archives (.drp) "
                                     "and sequence container XML files.");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("input", "Project archive (.drp) or sequence container (.xml).");

    const QCommandLineOption modeOption({"m", "mode"}, "Cut mode: J (audio leads) or L (audio trails).", "J|L");
    const QCommandLineOption offsetOption({"o", "offset"}, "Audio offset in frames.", "frames");
    const QCommandLineOption dryRunOption({"n", "dry-run"}, "Report what would change without writing output.");
    const QCommandLineOption configOption({"c", "config"}, "INI file with [cuts] and [archive] settings.", "ini");
    const QCommandLineOption outputDirOption("output-dir", "Directory for the output file (default: beside the input).", "dir");
    const QCommandLineOption journalOption("journal", "Write applied edits as a JSONL journal.", "file");
    const QCommandLineOption jsonOption("json", "Print the session report as JSON.");
    const QCommandLineOption tailHandleOption("assume-tail-handle",
                                              "Frames of media assumed to exist past the furthest use of each source.",
                                              "frames");
    const QCommandLineOption verboseOption({"v", "verbose"}, "Enable debug logging.");
    parser.addOptions({modeOption, offsetOption, dryRunOption, configOption, outputDirOption,
                       journalOption, jsonOption, tailHandleOption, verboseOption});
    parser.process(app);

    // Initialize logging
    if (parser.isSet(verboseOption) || qEnvironmentVariableIsSet("JLC_DEBUG")) {
        QLoggingCategory::setFilterRules("jlc.*.debug=true");
    } else {
        QLoggingCategory::setFilterRules("jlc.*.debug=false\njlc.*.info=false");
    }

    QTextStream out(stdout);
    QTextStream err(stderr);

    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 1) {
        err << "jlcut: expected exactly one input file\n\n" << parser.helpText();
        return ExitFatal;
    }

    JLC::RunConfig config;
    if (parser.isSet(configOption)) {
        JLC::Result<JLC::RunConfig> loaded = JLC::RunConfig::fromSettings(parser.value(configOption));
        if (loaded.is_error()) {
            err << "jlcut: " << loaded.error().message << "\n";
            return ExitFatal;
        }
        config = loaded.value();
    }

    // Command line overrides the settings file
    if (parser.isSet(modeOption) && !JLC::parseCutMode(parser.value(modeOption), &config.mode)) {
        err << "jlcut: --mode must be J or L, got " << parser.value(modeOption) << "\n";
        return ExitFatal;
    }
    if (parser.isSet(offsetOption) && !parseFrames(parser.value(offsetOption), &config.offsetFrames)) {
        err << "jlcut: --offset must be an integer number of frames\n";
        return ExitFatal;
    }
    if (parser.isSet(tailHandleOption) && !parseFrames(parser.value(tailHandleOption), &config.assumedTailHandle)) {
        err << "jlcut: --assume-tail-handle must be an integer number of frames\n";
        return ExitFatal;
    }
    if (parser.isSet(dryRunOption)) {
        config.dryRun = true;
    }
    if (parser.isSet(outputDirOption)) {
        config.outputDirectory = QFileInfo(parser.value(outputDirOption)).absoluteFilePath();
        if (!QDir().mkpath(config.outputDirectory)) {
            err << "jlcut: cannot create output directory " << config.outputDirectory << "\n";
            return ExitFatal;
        }
    }
    if (parser.isSet(journalOption)) {
        config.journalPath = parser.value(journalOption);
    }

    JLC::Result<void> valid = config.validate();
    if (valid.is_error()) {
        err << "jlcut: " << valid.error().message << "\n";
        return ExitFatal;
    }

    qCDebug(jlcMain, "Processing %s: %s-cuts, offset %lld%s", qPrintable(positional.first()),
            JLC::cutModeName(config.mode), config.offsetFrames, config.dryRun ? " (dry run)" : "");

    const JLC::CutSession session(config);
    JLC::Result<JLC::SessionReport> result = session.process(positional.first());
    if (result.is_error()) {
        qCCritical(jlcMain, "%s", qPrintable(result.error().describe()));
        err << "jlcut: " << result.error().message << "\n";
        return ExitFatal;
    }

    const JLC::SessionReport& report = result.value();
    if (parser.isSet(jsonOption)) {
        out << QJsonDocument(report.toJson()).toJson(QJsonDocument::Indented);
    } else {
        for (const QString& line : report.messages()) {
            out << line << "\n";
        }
    }
    out.flush();

    // Markup records no media past the furthest out-point, so L-cuts need an assumed tail
    if (config.mode == JLC::CutMode::L && report.isHandleLimited()) {
        err << "jlcut: hint: every L-cut lacked tail handle (assumed " << config.assumedTailHandle
            << " frame(s) past each clip's out-point); pass --assume-tail-handle N or set "
               "[cuts] assumed_tail_handle when the source media runs longer\n";
    }

    if (report.isSuspect()) {
        return ExitSuspect;
    }
    if (report.appliedCount() == 0) {
        return ExitNothingApplied;
    }
    return ExitOk;
}
