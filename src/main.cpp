#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDateTime>
#include <QDir>

#include "pilapse/frame_capture.hpp"
#include "pilapse/interrupt_handler.hpp"
#include "pilapse/session.hpp"
#include "pilapse/session_lock.hpp"
#include "pilapse/session_log.hpp"
#include "pilapse/timelapse_controller.hpp"
#include "pilapse/video_encoder.hpp"

namespace {

bool parseCount(const QStringList& positional, int index, int fallback, int minimum, int* out) {
    if (positional.size() <= index) {
        *out = fallback;
        return true;
    }
    bool ok = false;
    const int value = positional.at(index).toInt(&ok);
    if (!ok || value < minimum) {
        return false;
    }
    *out = value;
    return true;
}

}  // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("pilapse");
    QCoreApplication::setApplicationVersion("1.0.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Captures a fixed number of frames at a fixed interval and renders them into a video.");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("interval", "Seconds between frames (default 5).", "[interval]");
    parser.addPositionalArgument("frames", "Number of frames to capture (default 10).", "[frames]");
    const QCommandLineOption baseDirOption(
        {"b", "base-dir"},
        "Directory that receives the session folder and the status file. Defaults to $BASE_DIR, "
        "then /mnt/share when writable, then the executable's directory.",
        "dir");
    parser.addOption(baseDirOption);
    parser.process(app);

    const QStringList positional = parser.positionalArguments();
    pilapse::SessionOptions options;
    if (positional.size() > 2
        || !parseCount(positional, 0, 5, 0, &options.intervalSeconds)
        || !parseCount(positional, 1, 10, 1, &options.totalFrames)) {
        qCCritical(lcApp).noquote() << "Interval must be an integer >= 0 and frames an integer >= 1.";
        return 1;
    }
    options.baseDirOverride = parser.isSet(baseDirOption)
        ? parser.value(baseDirOption)
        : qEnvironmentVariable("BASE_DIR");
    options.applicationDir = QCoreApplication::applicationDirPath();
    options.startedAt = QDateTime::currentDateTime();

    const QString baseDir = pilapse::SessionInitializer::resolveBaseDirectory(options);
    if (!QDir().mkpath(baseDir)) {
        qCCritical(lcApp).noquote() << "Cannot create base directory" << baseDir;
        return 1;
    }

    pilapse::SessionLock lock(baseDir);
    QString error;
    if (!lock.tryAcquire(&error)) {
        qCCritical(lcApp).noquote() << error;
        return 1;
    }

    pilapse::Session session;
    if (!pilapse::SessionInitializer::create(options, &session, &error)) {
        qCCritical(lcApp).noquote() << error;
        return 1;
    }

    pilapse::CancellationToken cancel;
    pilapse::InterruptHandler interrupts(&cancel);
    if (!interrupts.installed()) {
        qCWarning(lcApp) << "Could not install SIGINT/SIGTERM handlers";
    }

    pilapse::TimelapseController controller(
        session,
        pilapse::makeCaptureBackend(),
        pilapse::makeVideoEncoder(),
        cancel);
    return controller.run();
}
