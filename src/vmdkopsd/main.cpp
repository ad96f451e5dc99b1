/*
 * Copyright (c) 2025, Petr Bena <petr@bena.rocks>
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 * 1. Redistributions of source code must retain the above copyright notice,
 *    this list of conditions and the following disclaimer.
 *
 * 2. Redistributions in binary form must reproduce the above copyright notice,
 *    this list of conditions and the following disclaimer in the documentation
 *    and/or other materials provided with the distribution.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
 * AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
 * IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE
 * ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE
 * LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
 * CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF
 * SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
 * INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN
 * CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE)
 * ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE
 * POSSIBILITY OF SUCH DAMAGE.
 */

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QTextStream>
#include <QTimer>
#include "globals.h"
#include "host/hostintrospection.h"
#include "host/identityresolver.h"
#include "server/requestdispatcher.h"
#include "server/serverloop.h"
#include "server/vmcichannel.h"
#include "utils/logging.h"
#include "utils/serviceconfig.h"
#include "vim/failure.h"
#include "vim/network/connection.h"
#include "vim/rpchypervisorclient.h"
#include "vim/sessionmanager.h"
#include "volumes/diskattacher.h"
#include "volumes/metadatastore.h"
#include "volumes/operationerror.h"
#include "volumes/toolrunner.h"
#include "volumes/vmdkmanager.h"

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(VMDKOPS_APP_NAME);
    QCoreApplication::setApplicationVersion(VMDKOPS_VERSION);
    QCoreApplication::setOrganizationName(VMDKOPS_ORG_NAME);

    QCommandLineParser parser;
    parser.setApplicationDescription("Docker volume service for the hypervisor host");

    QCommandLineOption confOption(QStringList() << "c" << "conf", "Use alternative configuration file.", "file",
                                  Vmdk::ServiceConfig::DEFAULT_CONFIG_FILE);
    QCommandLineOption versionOption(QStringList() << "V" << "version", "Print version and exit.");
    parser.addOption(confOption);
    parser.addOption(versionOption);
    parser.addHelpOption();

    parser.process(app);

    if (parser.isSet(versionOption))
    {
        QTextStream(stdout) << app.applicationName() << " " << app.applicationVersion() << "\n";
        return 0;
    }

    Vmdk::ServiceConfig config = Vmdk::ServiceConfig::Load(parser.value(confOption));

    if (!Vmdk::Logging::Install(config.logFile, Vmdk::Logging::LevelFromString(config.logLevel)))
        qWarning() << "Failed to open log file" << config.logFile << "- logging to stderr only";

    qInfo() << "=== Starting vmdkops service ===";

    Vim::Connection connection;
    if (!connection.ConnectToHost(config.hypervisorHost, config.hypervisorPort, config.hypervisorTls))
    {
        qCritical() << "Failed to connect to" << config.hypervisorHost << ":" << connection.GetLastError();
        Vmdk::Logging::Uninstall();
        return 1;
    }

    Vim::RpcHypervisorClient hypervisor(&connection);
    Vim::SessionManager sessionManager(&hypervisor, config.hypervisorUser, config.realUser);
    try
    {
        sessionManager.Connect();
    } catch (const Failure& failure)
    {
        qCritical() << QString("Failed to connect to %1 as '%2':").arg(config.hypervisorHost, config.hypervisorUser) << failure.what();
        Vmdk::Logging::Uninstall();
        return 1;
    }

    QObject::connect(&app, &QCoreApplication::aboutToQuit, &sessionManager, &Vim::SessionManager::Disconnect);

    Vmdk::QProcessToolRunner toolRunner;
    Vmdk::SidecarMetadataStore metadata;
    Vmdk::VmdkManager volumes(&toolRunner, &metadata, config);
    Vmdk::DiskAttacher attacher(&sessionManager, &metadata);
    Vmdk::RequestDispatcher dispatcher(&volumes, &attacher, &toolRunner, config);

    Vmdk::RpcHostIntrospection introspection(&connection);
    Vmdk::IdentityResolver identity(&introspection);
    Vmdk::VmciChannel channel(config.channelLibrary, config.maxRequestSize);
    Vmdk::ServerLoop serverLoop(&channel, &identity, &dispatcher, config.maxSkipCount);

    if (!Vmdk::ServerLoop::InstallStopSignals(&serverLoop))
        qWarning() << "Clean shutdown on SIGINT/SIGTERM is not available";

    // The loop blocks, run it from inside the event loop so aboutToQuit fires on the way out
    QTimer::singleShot(0, &app, [&serverLoop]()
    {
        int exitCode = 0;
        try
        {
            serverLoop.Run();
            qWarning() << "Received stop signal, exiting";
        } catch (const Vmdk::FatalChannelError& error)
        {
            qCritical() << "Fatal:" << error.what();
            exitCode = 1;
        }
        QCoreApplication::exit(exitCode);
    });

    int result = app.exec();

    Vmdk::ServerLoop::RemoveStopSignals();
    qInfo() << "=== vmdkops service stopped ===";
    Vmdk::Logging::Uninstall();
    return result;
}
