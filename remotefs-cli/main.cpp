// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QSettings>
#include <QTimer>
#include <KAboutData>
#include <iostream>
#include "ApiClient.h"
#include "ApiEndpoints.h"
#include "CliRunner.h"
#include "ClientConfig.h"
#include "FsTypes.h"
#include "NetworkTransport.h"
#include "Version.h"

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("remotefs"));
    QCoreApplication::setOrganizationDomain(QStringLiteral("reikooters.net"));

    qRegisterMetaType<JobProgress>();
    qRegisterMetaType<ChannelEvent>();

    KAboutData aboutData(
        QStringLiteral("remotefs"),
        QStringLiteral("remotefs"),
        QString::fromUtf8(Version::VERSION.data(), static_cast<qsizetype>(Version::VERSION.size())),
        QStringLiteral("Command-line client for a remote file-management API."),
        KAboutLicense::GPL_V3,
        QStringLiteral("(c) 2026 Reikooters <https://github.com/Reikooters>")
    );
    aboutData.addAuthor(QStringLiteral("Reikooters"), QStringLiteral("Developer"), QStringLiteral("https://github.com/Reikooters"));
    KAboutData::setApplicationData(aboutData);

    QCommandLineParser parser;
    parser.setApplicationDescription(aboutData.shortDescription() + QStringLiteral("\n\n") + CliRunner::usage());

    const QCommandLineOption baseUrlOpt(QStringLiteral("base-url"), QStringLiteral("API base URL."), QStringLiteral("url"));
    const QCommandLineOption serverOpt(QStringLiteral("server"), QStringLiteral("Server id to address."), QStringLiteral("id"));
    const QCommandLineOption legacyOpt(QStringLiteral("legacy"), QStringLiteral("Use the single-server /api/filesystem API."));
    const QCommandLineOption timeoutOpt(QStringLiteral("timeout"), QStringLiteral("Request timeout in milliseconds (0 disables)."), QStringLiteral("ms"));
    const QCommandLineOption saveOpt(QStringLiteral("save"), QStringLiteral("Store the connection options as defaults."));
    const QCommandLineOption filenameOnlyOpt(QStringLiteral("filename-only"), QStringLiteral("search: match file names only."));

    parser.addOptions({baseUrlOpt, serverOpt, legacyOpt, timeoutOpt, saveOpt, filenameOnlyOpt});
    parser.addPositionalArgument(QStringLiteral("command"), QStringLiteral("Command to run."));
    parser.addPositionalArgument(QStringLiteral("args"), QStringLiteral("Command arguments."), QStringLiteral("[args...]"));

    aboutData.setupCommandLine(&parser);
    parser.process(app);
    aboutData.processCommandLine(&parser);

    QSettings settings;
    ClientConfig config = ClientConfig::load(settings);

    if (parser.isSet(baseUrlOpt)) config.baseUrl = QUrl::fromUserInput(parser.value(baseUrlOpt));
    if (parser.isSet(serverOpt)) config.serverId = parser.value(serverOpt);
    if (parser.isSet(legacyOpt)) config.legacyApi = true;
    if (parser.isSet(timeoutOpt)) {
        bool ok = false;
        config.requestTimeoutMs = parser.value(timeoutOpt).toInt(&ok);
        if (!ok) {
            std::cerr << "Invalid --timeout value: " << parser.value(timeoutOpt).toStdString() << std::endl;
            return CliRunner::ExitUsage;
        }
    }

    QString err;
    if (!config.validate(&err)) {
        std::cerr << err.toStdString() << std::endl;
        return CliRunner::ExitUsage;
    }

    if (parser.isSet(saveOpt)) {
        config.save(settings);
        settings.sync();
    }

    const QStringList positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        if (parser.isSet(saveOpt)) return CliRunner::ExitOk;
        std::cerr << parser.helpText().toStdString();
        return CliRunner::ExitUsage;
    }

    NetworkTransport transport;
    transport.setRequestTimeout(config.requestTimeoutMs);
    transport.setUserAgent(config.userAgent.isEmpty()
                               ? QStringLiteral("remotefs/%1").arg(aboutData.version())
                               : config.userAgent);

    ApiClient client(&transport, ApiEndpoints(config));
    CliRunner runner(&client);

    if (!runner.installInterruptHandler(&err)) {
        qWarning().noquote() << "Ctrl+C will not cancel jobs:" << err;
    }

    QObject::connect(&runner, &CliRunner::finished, &app, [](int exitCode) {
        QCoreApplication::exit(exitCode);
    }, Qt::QueuedConnection);

    CliRunner::Options options;
    options.filenameOnly = parser.isSet(filenameOnlyOpt);

    QTimer::singleShot(0, &runner, [&runner, &positional, options]() {
        runner.run(positional.first(), positional.mid(1), options);
    });

    return app.exec();
}
