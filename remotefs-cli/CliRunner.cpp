// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <QFile>
#include <QSocketNotifier>
#include <csignal>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <sys/socket.h>
#include <type_traits>
#include <unistd.h>
#include "CliRunner.h"
#include "ApiClient.h"
#include "FormatUtils.h"
#include "RemoteFsError.h"

namespace {
    // [0] is written from the signal handler, [1] is watched by the event loop.
    int g_interruptFds[2] = {-1, -1};

    void onSigint(int) {
        const char byte = 1;
        [[maybe_unused]] const ssize_t n = ::write(g_interruptFds[0], &byte, 1);
    }

    std::string formatProgress(const QString& label, const JobProgress& p) {
        QString line = QStringLiteral("[%1] %2%").arg(label).arg(p.percent, 5, 'f', 1);
        if (p.bytesTransferred) {
            line += QStringLiteral("  %1").arg(FormatUtils::formatSize(*p.bytesTransferred));
            if (p.totalBytes && *p.totalBytes > 0) {
                line += QStringLiteral(" / %1").arg(FormatUtils::formatSize(*p.totalBytes));
            }
        }
        if (p.filesProcessed && p.totalFiles) {
            line += QStringLiteral("  %1/%2 files").arg(*p.filesProcessed).arg(*p.totalFiles);
        }
        return line.toStdString();
    }
}

CliRunner::CliRunner(ApiClient* client, QObject* parent)
    : QObject(parent)
    , m_client(client)
    , m_listing(client)
    , m_operations(client)
    , m_jobs(client) {
    connect(&m_listing, &FileListingService::notify, this, [](const QString& title, const QString& message) {
        std::cerr << title.toStdString() << ": " << message.toStdString() << std::endl;
    });
}

CliRunner::~CliRunner() {
    if (m_interruptNotifier) {
        std::signal(SIGINT, SIG_DFL);
        ::close(g_interruptFds[0]);
        ::close(g_interruptFds[1]);
        g_interruptFds[0] = g_interruptFds[1] = -1;
    }
}

QString CliRunner::usage() {
    return QStringLiteral(
        "Commands:\n"
        "  ls <dir>                        List a directory\n"
        "  search <query>                  Search file contents (--filename-only for names)\n"
        "  cat <file>                      Print a file\n"
        "  write <file> [<local>|-]        Replace a file with a local file or stdin\n"
        "  cp <dest> <src>...              Copy entries into a directory\n"
        "  mv <dest> <src>...              Move entries into a directory\n"
        "  rename <src> <dst>              Rename an entry\n"
        "  rm <path>...                    Delete entries\n"
        "  mkdir <path>                    Create a directory\n"
        "  touch <path>                    Create an empty file\n"
        "  upload <local> <dir>            Upload a local file\n"
        "  fetch <url> <file>              Have the server download a URL\n"
        "  archive <cwd> <name> <entry>... Pack entries of cwd into an archive\n"
        "  extract <archive> <dir>         Extract an archive\n"
        "  download <cwd> <out> <item>...  Download items of cwd into a local file\n"
        "  download-url <cwd> <item>...    Print the download URL of items\n");
}

bool CliRunner::installInterruptHandler(QString* errorOut) {
    if (m_interruptNotifier) return true;

    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, g_interruptFds) != 0) {
        if (errorOut) *errorOut = QStringLiteral("socketpair() failed: %1").arg(QString::fromLocal8Bit(std::strerror(errno)));
        return false;
    }

    m_interruptNotifier = new QSocketNotifier(g_interruptFds[1], QSocketNotifier::Read, this);
    connect(m_interruptNotifier, &QSocketNotifier::activated, this, &CliRunner::onInterrupt);

    struct sigaction sa {};
    sa.sa_handler = onSigint;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    if (::sigaction(SIGINT, &sa, nullptr) != 0) {
        if (errorOut) *errorOut = QStringLiteral("sigaction() failed: %1").arg(QString::fromLocal8Bit(std::strerror(errno)));
        return false;
    }
    return true;
}

void CliRunner::onInterrupt() {
    char byte = 0;
    [[maybe_unused]] const ssize_t n = ::read(g_interruptFds[1], &byte, 1);

    if (!m_activeJobId || m_cancelRequested) {
        std::cerr << "\nInterrupted" << std::endl;
        finishWith(ExitCancelled);
        return;
    }

    m_cancelRequested = true;
    std::cerr << "\nCancelling (press Ctrl+C again to stop waiting)..." << std::endl;

    m_jobs.cancel(*m_activeJobId).then(this, [](bool acknowledged) {
        if (!acknowledged) {
            std::cerr << "The server did not accept the cancel request" << std::endl;
        }
    });
}

template <typename T, typename OnResult>
void CliRunner::await(QFuture<T> future, OnResult onResult, bool reportErrors) {
    future.then(this, [this, onResult, reportErrors](QFuture<T> f) {
        try {
            if constexpr (std::is_void_v<T>) {
                f.waitForFinished();
                onResult();
            } else {
                onResult(f.result());
            }
        } catch (const RemoteFsError& e) {
            if (reportErrors) std::cerr << "Error: " << e.message().toStdString() << std::endl;
            finishWith(ExitFailure);
        }
    }).onCanceled(this, [this]() {
        finishWith(ExitCancelled);
    });
}

void CliRunner::finishWith(int exitCode) {
    if (m_finished) return;
    m_finished = true;
    Q_EMIT finished(exitCode);
}

void CliRunner::usageError(const QString& message) {
    std::cerr << message.toStdString() << "\n\n" << usage().toStdString();
    finishWith(ExitUsage);
}

void CliRunner::run(const QString& command, const QStringList& args, const Options& options) {
    const auto need = [&](qsizetype min, const QString& synopsis) {
        if (args.size() >= min) return true;
        usageError(QStringLiteral("Usage: remotefs %1").arg(synopsis));
        return false;
    };
    const auto done = [this]() { finishWith(ExitOk); };

    if (command == QStringLiteral("ls")) {
        runList(args.value(0, QStringLiteral("/")));
    } else if (command == QStringLiteral("search")) {
        if (need(1, QStringLiteral("search <query> [--filename-only]"))) runSearch(args.join(u' '), options.filenameOnly);
    } else if (command == QStringLiteral("cat")) {
        if (need(1, QStringLiteral("cat <file>"))) runCat(args[0]);
    } else if (command == QStringLiteral("write")) {
        if (need(1, QStringLiteral("write <file> [<local>|-]"))) runWrite(args[0], args.value(1, QStringLiteral("-")));
    } else if (command == QStringLiteral("cp")) {
        if (need(2, QStringLiteral("cp <dest> <src>..."))) await(m_operations.copy(args.mid(1), args[0]), done);
    } else if (command == QStringLiteral("mv")) {
        if (need(2, QStringLiteral("mv <dest> <src>..."))) await(m_operations.move(args.mid(1), args[0]), done);
    } else if (command == QStringLiteral("rename")) {
        if (need(2, QStringLiteral("rename <src> <dst>"))) await(m_operations.rename(args[0], args[1]), done);
    } else if (command == QStringLiteral("rm")) {
        if (need(1, QStringLiteral("rm <path>..."))) await(m_operations.remove(args), done);
    } else if (command == QStringLiteral("mkdir")) {
        if (need(1, QStringLiteral("mkdir <path>"))) await(m_operations.createEntry(args[0], true), done);
    } else if (command == QStringLiteral("touch")) {
        if (need(1, QStringLiteral("touch <path>"))) await(m_operations.createEntry(args[0], false), done);
    } else if (command == QStringLiteral("upload")) {
        if (!need(2, QStringLiteral("upload <local> <dir>"))) return;
        if (!QFile::exists(args[0])) {
            std::cerr << "Error: " << args[0].toStdString() << " does not exist" << std::endl;
            finishWith(ExitFailure);
            return;
        }
        runJob(m_jobs.upload(args[0], args[1], jobCallbacks(QStringLiteral("upload"))), QStringLiteral("upload"));
    } else if (command == QStringLiteral("fetch")) {
        if (need(2, QStringLiteral("fetch <url> <file>"))) {
            runJob(m_jobs.uploadFromUrl(args[0], args[1], jobCallbacks(QStringLiteral("fetch"))), QStringLiteral("fetch"));
        }
    } else if (command == QStringLiteral("archive")) {
        if (need(3, QStringLiteral("archive <cwd> <name> <entry>..."))) {
            runJob(m_jobs.archive(args[1], args.mid(2), args[0], jobCallbacks(QStringLiteral("archive"))), QStringLiteral("archive"));
        }
    } else if (command == QStringLiteral("extract")) {
        if (need(2, QStringLiteral("extract <archive> <dir>"))) {
            runJob(m_jobs.extract(args[0], args[1], jobCallbacks(QStringLiteral("extract"))), QStringLiteral("extract"));
        }
    } else if (command == QStringLiteral("download")) {
        if (need(3, QStringLiteral("download <cwd> <out> <item>..."))) {
            await(m_operations.download(args.mid(2), args[0], args[1]), done);
        }
    } else if (command == QStringLiteral("download-url")) {
        if (need(2, QStringLiteral("download-url <cwd> <item>..."))) {
            std::cout << m_operations.downloadUrl(args.mid(1), args[0]).toString(QUrl::FullyEncoded).toStdString() << std::endl;
            finishWith(ExitOk);
        }
    } else if (command.isEmpty()) {
        usageError(QStringLiteral("No command given"));
    } else {
        usageError(QStringLiteral("Unknown command: %1").arg(command));
    }
}

void CliRunner::runList(const QString& path) {
    // Failures are already reported through notify().
    await(m_listing.list(path), [this](const Listing& listing) {
        std::cout << (listing.currentPath.isEmpty() ? "/" : listing.currentPath.toStdString()) << "\n";
        for (const Entry& e : listing.entries) {
            const QString size = e.isDirectory ? QStringLiteral("-") : FormatUtils::formatSize(e.size);
            std::cout << (e.isDirectory ? 'd' : '-') << "  "
                      << size.rightJustified(10).toStdString() << "  "
                      << FormatUtils::formatTimestamp(e.modifiedAt) << "  "
                      << e.typeLabel.leftJustified(18).toStdString() << "  "
                      << e.name.toStdString() << (e.isDirectory ? "/" : "") << "\n";
        }
        std::cout.flush();
        finishWith(ExitOk);
    }, false);
}

void CliRunner::runSearch(const QString& query, bool filenameOnly) {
    await(m_listing.search(query, filenameOnly), [this](const QList<Entry>& results) {
        for (const Entry& e : results) {
            std::cout << e.path.toStdString() << "  (" << FormatUtils::formatSize(e.size).toStdString() << ")\n";
        }
        std::cerr << results.size() << " result(s)" << std::endl;
        finishWith(ExitOk);
    });
}

void CliRunner::runCat(const QString& path) {
    await(m_operations.readContents(path), [this](const QString& text) {
        std::cout << text.toStdString();
        std::cout.flush();
        finishWith(ExitOk);
    });
}

void CliRunner::runWrite(const QString& path, const QString& localSource) {
    QFile in;
    bool opened = false;
    if (localSource == QStringLiteral("-")) {
        opened = in.open(stdin, QIODevice::ReadOnly);
    } else {
        in.setFileName(localSource);
        opened = in.open(QIODevice::ReadOnly);
    }
    if (!opened) {
        std::cerr << "Error: cannot read " << localSource.toStdString() << ": " << in.errorString().toStdString() << std::endl;
        finishWith(ExitFailure);
        return;
    }

    const QString text = QString::fromUtf8(in.readAll());
    await(m_operations.writeContents(path, text), [this]() { finishWith(ExitOk); });
}

JobCallbacks CliRunner::jobCallbacks(const QString& label) {
    JobCallbacks cb;
    cb.onProgress = [label](const JobProgress& p) {
        std::cerr << '\r' << formatProgress(label, p) << std::flush;
    };
    cb.onSuccess = [this, label]() {
        std::cerr << "\n" << label.toStdString() << " complete" << std::endl;
        finishWith(ExitOk);
    };
    cb.onError = [this, label](const QString& message) {
        std::cerr << "\n" << label.toStdString() << " failed: " << message.toStdString() << std::endl;
        finishWith(ExitFailure);
    };
    cb.onCancelled = [this, label]() {
        std::cerr << "\n" << label.toStdString() << " cancelled" << std::endl;
        finishWith(ExitCancelled);
    };
    return cb;
}

void CliRunner::runJob(JobHandle handle, const QString& label) {
    m_activeJobId = handle.jobId;
    std::cerr << label.toStdString() << " started as " << handle.jobId.toStdString() << std::endl;
}
