#include <QtCore/QCommandLineParser>
#include <QtCore/QCoreApplication>
#include <QtCore/QDir>
#include <QtCore/QEventLoop>
#include <QtCore/QTextStream>
#include <QtCore/QTimer>

#include "core/common/Config.hpp"
#include "core/common/Logger.hpp"
#include "core/session/SessionErrors.hpp"
#include "ui/controllers/DictationController.hpp"

namespace {

constexpr int kExitLoadFailed = 2;
constexpr int kExitTranscriptionFailed = 3;
constexpr int kExitUsage = 64;

// Runs the event loop until the controller reports a transcript or a failure.
int awaitTranscript(Scribe::DictationController& controller, QTextStream& out, QTextStream& err) {
    QEventLoop loop;
    int exitCode = 0;

    QObject::connect(&controller, &Scribe::DictationController::transcribed, &loop,
                     [&](const QString& text) {
        out << text.trimmed() << Qt::endl;
        loop.quit();
    });
    QObject::connect(&controller, &Scribe::DictationController::transcriptionFailed, &loop,
                     [&](const Scribe::OperationError& error) {
        err << error.message() << Qt::endl;
        exitCode = kExitTranscriptionFailed;
        loop.quit();
    });
    QObject::connect(&controller, &Scribe::DictationController::recordingFailed, &loop,
                     [&](const Scribe::OperationError& error) {
        err << error.message() << Qt::endl;
        exitCode = kExitTranscriptionFailed;
        loop.quit();
    });

    loop.exec();
    return exitCode;
}

} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("ScribeDictation");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("Scribe");

    QCommandLineParser parser;
    parser.setApplicationDescription("On-device speech to text with whisper.cpp");
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption modelOption("model", "Model file to load.", "path");
    const QCommandLineOption assetOption("asset", "Bundled model to load from the asset root.", "name");
    const QCommandLineOption fileOption("file", "Audio file to transcribe.", "audio");
    const QCommandLineOption recordOption("record", "Record from the microphone for N seconds.", "seconds");
    const QCommandLineOption timestampsOption("timestamps", "Prefix each segment with its time span.");
    const QCommandLineOption benchOption("bench", "Benchmark the loaded model.");
    const QCommandLineOption systemInfoOption("system-info", "Print engine system information.");
    const QCommandLineOption playbackOption("playback", "Play audio back while transcribing.");
    const QCommandLineOption configOption("config", "Settings file.", "ini");
    const QCommandLineOption logFileOption("log-file", "Log file path.", "path");
    const QCommandLineOption verboseOption("verbose", "Debug logging and message log output.");
    parser.addOptions({modelOption, assetOption, fileOption, recordOption, timestampsOption, benchOption,
                       systemInfoOption, playbackOption, configOption, logFileOption, verboseOption});
    parser.process(app);

    QTextStream out(stdout);
    QTextStream err(stderr);

    const bool verbose = parser.isSet(verboseOption);
    const Scribe::Logger::Level level = verbose ? Scribe::Logger::Level::Debug : Scribe::Logger::Level::Warn;
    if (parser.isSet(logFileOption)) {
        Scribe::Logger::instance().initialize(parser.value(logFileOption).toStdString(), level);
    } else {
        Scribe::Logger::instance().setLevel(level);
    }

    if (parser.isSet(configOption)) {
        Scribe::Config::instance().initializeFromFile(parser.value(configOption));
    } else {
        Scribe::Config::instance().initialize();
    }

    if (!parser.isSet(modelOption) && !parser.isSet(assetOption) && !parser.isSet(systemInfoOption)) {
        err << "Either --model, --asset or --system-info is required." << Qt::endl;
        parser.showHelp(kExitUsage);
    }

    Scribe::Logger::instance().info("Starting Scribe v{}", app.applicationVersion().toStdString());

    Scribe::DictationController controller;
    controller.enablePlayback(parser.isSet(playbackOption));

    if (parser.isSet(systemInfoOption)) {
        out << controller.getSystemInfo() << Qt::endl;
        if (!parser.isSet(modelOption) && !parser.isSet(assetOption)) {
            return 0;
        }
    }

    {
        QEventLoop loop;
        bool loaded = false;
        QString failure;
        QObject::connect(&controller, &Scribe::DictationController::modelLoadFinished, &loop,
                         [&](bool ok, const QString& message) {
            loaded = ok;
            failure = message;
            loop.quit();
        });
        if (parser.isSet(modelOption)) {
            controller.initializeModel(parser.value(modelOption), verbose);
        } else {
            controller.initializeModelFromAsset(parser.value(assetOption), verbose);
        }
        loop.exec();

        if (!loaded) {
            err << failure << Qt::endl;
            return kExitLoadFailed;
        }
    }

    int exitCode = 0;
    if (parser.isSet(benchOption)) {
        controller.session()->benchmarkCurrentModel().waitForFinished();
        out << controller.getMessageLogs() << Qt::endl;
    }

    if (parser.isSet(fileOption)) {
        const QString file = QDir::current().absoluteFilePath(parser.value(fileOption));
        QTimer::singleShot(0, &controller, [&]() {
            controller.transcribeAudioFile(file, verbose, parser.isSet(timestampsOption));
        });
        exitCode = awaitTranscript(controller, out, err);
    } else if (parser.isSet(recordOption)) {
        bool ok = false;
        const int seconds = parser.value(recordOption).toInt(&ok);
        if (!ok || seconds <= 0) {
            err << "--record expects a positive number of seconds." << Qt::endl;
            return kExitUsage;
        }

        QObject::connect(&controller, &Scribe::DictationController::permissionRequestNeeded, &controller,
                         [&]() { err << "Microphone access is not available." << Qt::endl; });
        controller.callRequestRecordPermission();
        if (!controller.isMicPermissionGranted()) {
            return kExitTranscriptionFailed;
        }

        QObject::connect(&controller, &Scribe::DictationController::recordingStarted, &controller, [&]() {
            err << "Recording for " << seconds << " s..." << Qt::endl;
            QTimer::singleShot(seconds * 1000, &controller, [&]() { controller.stopRecording(); });
        });
        QTimer::singleShot(0, &controller, [&]() { controller.startRecording(); });
        exitCode = awaitTranscript(controller, out, err);
    }

    if (verbose) {
        err << controller.getMessageLogs() << Qt::endl;
    }
    controller.cleanup();
    return exitCode;
}
