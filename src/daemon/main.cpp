// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "daemon.h"
#include "../core/constants.h"
#include "../core/logging.h"
#include <QGuiApplication>
#include <QCommandLineParser>
#include <KAboutData>
#include <KLocalizedString>
#include <KDBusService>
#include <signal.h>

using namespace XNotid;

static Daemon* g_daemon = nullptr;

void signalHandler(int /*signal*/)
{
    if (g_daemon) {
        g_daemon->stop();
    }
    QCoreApplication::quit();
}

int main(int argc, char* argv[])
{
    QGuiApplication app(argc, argv);

    // Popup windows come and go; the daemon must outlive all of them
    app.setQuitOnLastWindowClosed(false);

    // Set translation domain BEFORE any i18n() calls
    KLocalizedString::setApplicationDomain("xnotid");

    // Set up application metadata
    KAboutData aboutData(QStringLiteral("xnotid"), i18n("xnotid"), QString(ServerInfo::Version),
                         i18n("Desktop notification daemon with interactive cards"), KAboutLicense::GPL_V3,
                         i18n("© 2026 fuddlesworth"));
    aboutData.addAuthor(i18n("fuddlesworth"));
    aboutData.setDesktopFileName(QStringLiteral("org.xnotid.daemon"));

    KAboutData::setApplicationData(aboutData);

    // Command line options
    QCommandLineParser parser;
    aboutData.setupCommandLine(&parser);

    QCommandLineOption replaceOption(QStringList{QStringLiteral("r"), QStringLiteral("replace")},
                                     i18n("Replace the running notification daemon"));
    parser.addOption(replaceOption);

    parser.process(app);
    aboutData.processCommandLine(&parser);

    // Ensure single instance
    KDBusService::StartupOptions options = KDBusService::Unique;
    if (parser.isSet(replaceOption)) {
        options |= KDBusService::Replace;
    }

    KDBusService service(options);

    // Set up signal handling for clean shutdown
    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);
    signal(SIGHUP, signalHandler);

    // Create and start daemon
    Daemon daemon;
    daemon.setReplaceExisting(parser.isSet(replaceOption));
    g_daemon = &daemon;

    if (!daemon.init()) {
        qCCritical(XNotid::lcDaemon) << "Failed to initialize daemon";
        g_daemon = nullptr;
        return 1;
    }

    qCInfo(XNotid::lcDaemon) << "Started successfully";
    daemon.start();

    // Launching xnotid again while it runs toggles the notification center
    QObject::connect(&service, &KDBusService::activateRequested, &daemon, [&daemon]() {
        qCDebug(XNotid::lcDaemon) << "Already running - toggling notification center";
        daemon.engine()->toggleCenter();
    });

    int result = app.exec();

    daemon.stop();
    g_daemon = nullptr;

    return result;
}
