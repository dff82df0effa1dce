// Command-line entry point: config -> enumeration -> scheduling -> summary.
#include "logcollect/CollectorConfig.hpp"
#include "logcollect/FileEnumerator.hpp"
#include "logcollect/Libssh2RemoteSession.hpp"
#include "logcollect/LogCategories.hpp"
#include "logcollect/Logger.hpp"
#include "logcollect/TimeUtils.hpp"
#include "logcollect/TransferRegistry.hpp"
#include "logcollect/TransferScheduler.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDateTime>
#include <QTextStream>
#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <thread>

using namespace logcollect;

namespace {

volatile std::sig_atomic_t g_stopSignal = 0;

extern "C" void onStopSignal(int) {
    g_stopSignal = 1;
}

QTextStream& out() {
    static QTextStream s(stdout);
    return s;
}

QTextStream& errOut() {
    static QTextStream s(stderr);
    return s;
}

enum ExitCode { ExitOk = 0, ExitFailures = 1, ExitUsage = 2 };

bool buildTimeRange(const QCommandLineParser& p, const QCommandLineOption& since,
                    const QCommandLineOption& last, const QCommandLineOption& until,
                    TimeRange& range, QString& err) {
    if (p.isSet(since) && p.isSet(last)) {
        err = QStringLiteral("--since and --last are mutually exclusive");
        return false;
    }
    if (p.isSet(last)) {
        const auto r = presetRange(p.value(last), QDateTime::currentDateTime());
        if (!r) {
            err = QStringLiteral("unknown preset '%1' (use one of %2)")
                      .arg(p.value(last), timePresetNames().join(QStringLiteral(", ")));
            return false;
        }
        range = *r;
    }
    if (p.isSet(since)) {
        const auto t = parseTimeString(p.value(since));
        if (!t) {
            err = QStringLiteral("cannot parse --since '%1'").arg(p.value(since));
            return false;
        }
        range.start = *t;
    }
    if (p.isSet(until)) {
        const auto t = parseTimeString(p.value(until));
        if (!t) {
            err = QStringLiteral("cannot parse --until '%1'").arg(p.value(until));
            return false;
        }
        range.end = *t;
    }
    return validateTimeRange(range, err);
}

std::unique_ptr<RemoteSession> newSession(const HostDescriptor&) {
    return std::make_unique<Libssh2RemoteSession>();
}

void printProgress(const TransferRegistry& registry, std::uint64_t total) {
    const auto c = registry.counts();
    const std::uint64_t done = registry.transferredBytes();
    const int pct = total ? int((done * 100) / total) : 100;
    out() << "\r[" << (c.completed + c.failed) << "/" << registry.size() << " files] "
          << formatBytes(done) << " / " << formatBytes(total) << " (" << pct << "%)   ";
    out().flush();
}

} // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("logcollect"));
    QCoreApplication::setApplicationVersion(QStringLiteral("1.0.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Collects log files from several SFTP hosts with resumable transfers."));
    parser.addHelpOption();
    parser.addVersionOption();
    const QCommandLineOption configOpt({QStringLiteral("c"), QStringLiteral("config")},
                                       QStringLiteral("Configuration file."), QStringLiteral("file"),
                                       QStringLiteral("logcollect.ini"));
    const QCommandLineOption outputOpt({QStringLiteral("o"), QStringLiteral("output")},
                                       QStringLiteral("Download directory (overrides config)."),
                                       QStringLiteral("dir"));
    const QCommandLineOption serverOpt({QStringLiteral("s"), QStringLiteral("server")},
                                       QStringLiteral("Only this server (repeatable)."),
                                       QStringLiteral("name"));
    const QCommandLineOption sinceOpt(QStringLiteral("since"),
                                      QStringLiteral("Only files modified at or after TIME."),
                                      QStringLiteral("time"));
    const QCommandLineOption lastOpt(QStringLiteral("last"),
                                     QStringLiteral("Preset window: 1h, 6h, 12h, 24h, 3d, 7d, 30d."),
                                     QStringLiteral("preset"));
    const QCommandLineOption untilOpt(QStringLiteral("until"),
                                      QStringLiteral("Only files modified at or before TIME."),
                                      QStringLiteral("time"));
    const QCommandLineOption concOpt({QStringLiteral("j"), QStringLiteral("max-concurrent")},
                                     QStringLiteral("Parallel transfers (overrides config)."),
                                     QStringLiteral("n"));
    const QCommandLineOption logOpt(QStringLiteral("log-file"), QStringLiteral("Log file path."),
                                    QStringLiteral("file"), QStringLiteral("logcollect.log"));
    const QCommandLineOption verboseOpt({QStringLiteral("v"), QStringLiteral("verbose")},
                                        QStringLiteral("Debug logging."));
    const QCommandLineOption dryRunOpt(QStringLiteral("dry-run"),
                                       QStringLiteral("List matching files without downloading."));
    const QCommandLineOption initOpt(QStringLiteral("init-config"),
                                     QStringLiteral("Write an example configuration and exit."));
    parser.addOptions({configOpt, outputOpt, serverOpt, sinceOpt, lastOpt, untilOpt, concOpt,
                       logOpt, verboseOpt, dryRunOpt, initOpt});
    parser.process(app);

    const QString configPath = parser.value(configOpt);
    QString err;
    if (parser.isSet(initOpt)) {
        if (!CollectorConfig::writeTemplate(configPath, err)) {
            errOut() << "error: " << err << "\n";
            return ExitUsage;
        }
        out() << "Wrote " << configPath << "\n";
        return ExitOk;
    }

    Logger::setLogLevel(parser.isSet(verboseOpt) ? 2 : 1);
    Logger::install(parser.value(logOpt));

    CollectorConfig config;
    if (!config.load(configPath, err)) {
        errOut() << "error: " << err << "\n";
        if (err.startsWith(QStringLiteral("configuration file not found")))
            errOut() << "hint: run with --init-config to create one\n";
        return ExitUsage;
    }
    if (parser.isSet(outputOpt))
        config.settings().downloadPath = expandHome(parser.value(outputOpt));
    if (parser.isSet(concOpt)) {
        bool ok = false;
        const int n = parser.value(concOpt).toInt(&ok);
        if (!ok || n < 1) {
            errOut() << "error: --max-concurrent expects a positive number\n";
            return ExitUsage;
        }
        config.settings().maxConcurrentTransfers = n;
    }

    TimeRange range;
    if (!buildTimeRange(parser, sinceOpt, lastOpt, untilOpt, range, err)) {
        errOut() << "error: " << err << "\n";
        return ExitUsage;
    }

    std::vector<HostDescriptor> selected;
    if (parser.isSet(serverOpt)) {
        for (const QString& name : parser.values(serverOpt)) {
            const HostDescriptor* h = config.server(name.toStdString());
            if (!h) {
                errOut() << "error: unknown server '" << name << "'\n";
                return ExitUsage;
            }
            selected.push_back(*h);
        }
    } else {
        selected = config.servers();
    }

    std::signal(SIGINT, onStopSignal);
    std::signal(SIGTERM, onStopSignal);

    // Discovery: one session per server, closed before transfers start.
    const std::string base = config.settings().downloadPath.toStdString();
    TransferRegistry registry;
    int discoveryFailures = 0;
    for (const auto& host : selected) {
        if (g_stopSignal)
            break;
        const auto dirs = config.directoriesFor(host.name);
        if (dirs.empty())
            continue;
        auto session = newSession(host);
        SessionError serr;
        if (!session->connect(host, serr)) {
            ++discoveryFailures;
            errOut() << "error: " << QString::fromStdString(host.name) << ": "
                     << QString::fromStdString(serr.message) << "\n";
            continue;
        }
        for (const auto& dir : dirs) {
            std::vector<FileEntry> files;
            if (!enumerateFiles(*session, dir, range, files, serr)) {
                ++discoveryFailures;
                errOut() << "error: " << QString::fromStdString(host.name) << ": "
                         << QString::fromStdString(dir.path) << ": "
                         << QString::fromStdString(serr.message) << "\n";
                break;
            }
            for (const auto& f : files)
                registry.addTask(host.name, f.remotePath, base, f);
        }
        session->close();
    }

    out() << "Found " << registry.size() << " files (" << formatBytes(registry.totalSize())
          << ")\n";

    if (parser.isSet(dryRunOpt)) {
        for (const auto& t : registry.snapshot()) {
            out() << "  " << QString::fromStdString(t.hostName) << ":"
                  << QString::fromStdString(t.remotePath) << "  "
                  << formatBytes(t.expectedSize) << "  " << localShortTime((quint64)t.remoteMtime)
                  << "  -> " << QString::fromStdString(t.localPath) << "\n";
        }
        return discoveryFailures ? ExitFailures : ExitOk;
    }
    if (registry.size() == 0)
        return discoveryFailures ? ExitFailures : ExitOk;

    TransferScheduler scheduler(selected, newSession, config.schedulerOptions());
    BatchResult result;
    std::atomic<bool> finished{false};
    std::thread runner([&]() {
        result = scheduler.execute(registry);
        finished.store(true);
    });

    const std::uint64_t total = registry.totalSize();
    while (!finished.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
        if (g_stopSignal && !scheduler.stopRequested()) {
            scheduler.requestStop();
            errOut() << "\nStopping after in-flight transfers finish...\n";
            qCWarning(lcXfer) << "Stop requested by signal";
        }
        printProgress(registry, total);
    }
    runner.join();
    out() << "\n";

    out() << "Completed: " << result.completed << "  Failed: " << result.failed
          << "  Not started: " << result.notStarted << "  Transferred: "
          << formatBytes(result.transferredBytes) << " in " << (result.elapsedMs / 1000.0)
          << " s\n";
    for (const auto& e : result.errors)
        out() << "  error: " << QString::fromStdString(e) << "\n";
    if (result.notStarted > 0)
        out() << "Run again to resume the remaining files.\n";
    out().flush();

    return (result.success && discoveryFailures == 0) ? ExitOk : ExitFailures;
}
