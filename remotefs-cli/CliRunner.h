// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef REMOTEFS_CLIRUNNER_H
#define REMOTEFS_CLIRUNNER_H

#include <QFuture>
#include <QObject>
#include <QString>
#include <QStringList>
#include <optional>
#include "FileListingService.h"
#include "FileOperations.h"
#include "JobController.h"

class ApiClient;
class QSocketNotifier;

/**
 * Runs one subcommand of the command-line front end and reports its exit code.
 */
class CliRunner final : public QObject {
    Q_OBJECT

public:
    enum ExitCode : int { ExitOk = 0, ExitFailure = 1, ExitUsage = 2, ExitCancelled = 3 };

    struct Options {
        bool filenameOnly = false;
    };

    explicit CliRunner(ApiClient* client, QObject* parent = nullptr);
    ~CliRunner() override;

    [[nodiscard]] static QString usage();

    /**
     * Routes SIGINT into the event loop: the first Ctrl+C asks the server to
     * cancel the running job, a second one gives up waiting.
     *
     * @param errorOut Receives the reason when the handler cannot be installed.
     * @return true on success.
     */
    bool installInterruptHandler(QString* errorOut = nullptr);

    // Starts the command; finished() is emitted exactly once.
    void run(const QString& command, const QStringList& args, const Options& options);

signals:
    void finished(int exitCode);

private:
    template <typename T, typename OnResult>
    void await(QFuture<T> future, OnResult onResult, bool reportErrors = true);

    void finishWith(int exitCode);
    void usageError(const QString& message);

    void runList(const QString& path);
    void runSearch(const QString& query, bool filenameOnly);
    void runCat(const QString& path);
    void runWrite(const QString& path, const QString& localSource);
    void runJob(JobHandle handle, const QString& label);

    [[nodiscard]] JobCallbacks jobCallbacks(const QString& label);

    void onInterrupt();

    ApiClient* m_client = nullptr;
    FileListingService m_listing;
    FileOperations m_operations;
    JobController m_jobs;

    std::optional<QString> m_activeJobId;
    bool m_cancelRequested = false;
    bool m_finished = false;

    QSocketNotifier* m_interruptNotifier = nullptr;
};

#endif //REMOTEFS_CLIRUNNER_H
