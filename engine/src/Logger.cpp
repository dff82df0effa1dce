// File logger behind qInstallMessageHandler with size-based rotation.
#include "logcollect/Logger.hpp"

#include <QAtomicInt>
#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QMutexLocker>
#include <QStringConverter>
#include <QTextStream>

#include <cstdio>
#include <cstdlib>

namespace {

QFile*     g_file = nullptr; // guarded by g_mutex
QMutex     g_mutex;
QString    g_path;
QAtomicInt g_level(1);

// Qt logging from inside the handler must not re-enter it.
thread_local bool g_inHandler = false;

constexpr qint64 kRotateBytes = 2 * 1024 * 1024;
constexpr int    kKeepGenerations = 3;

QString levelToString(QtMsgType t) {
    switch (t) {
    case QtDebugMsg:
        return QStringLiteral("DEBUG");
    case QtInfoMsg:
        return QStringLiteral("INFO");
    case QtWarningMsg:
        return QStringLiteral("WARN");
    case QtCriticalMsg:
        return QStringLiteral("ERROR");
    case QtFatalMsg:
        return QStringLiteral("FATAL");
    }
    return QStringLiteral("LOG");
}

// 0 = WARN/ERROR/FATAL, 1 = adds INFO, 2 = everything
bool allowMessage(QtMsgType type) {
    const int lvl = g_level.loadAcquire();
    if (lvl <= 0)
        return type == QtWarningMsg || type == QtCriticalMsg || type == QtFatalMsg;
    if (lvl == 1)
        return type != QtDebugMsg;
    return true;
}

// One record per physical line.
QString normalizeMessage(QString s) {
    s.replace(QStringLiteral("\r\n"), QStringLiteral("\n"));
    s.replace(QLatin1Char('\r'), QLatin1Char('\n'));
    s.replace(QLatin1Char('\n'), QLatin1Char(' '));
    s.replace(QLatin1Char('\t'), QLatin1Char(' '));
    return s.simplified();
}

void handler(QtMsgType type, const QMessageLogContext& ctx, const QString& msg) {
    if (!allowMessage(type) || g_inHandler) {
        if (type == QtFatalMsg)
            std::abort();
        return;
    }
    g_inHandler = true;
    {
        QMutexLocker lock(&g_mutex);

        const QString ts =
            QDateTime::currentDateTime().toString(QStringLiteral("yyyy-MM-dd HH:mm:ss.zzz"));
        const QString lvl = levelToString(type);
        const QString where =
            (ctx.file && ctx.function)
                ? QStringLiteral("%1:%2 %3")
                      .arg(QFileInfo(QString::fromUtf8(ctx.file)).fileName())
                      .arg(ctx.line)
                      .arg(QString::fromUtf8(ctx.function))
                : QString();
        const QString clean = normalizeMessage(msg);
        const QString line = where.isEmpty()
                                 ? QStringLiteral("%1 [%2] %3").arg(ts, lvl, clean)
                                 : QStringLiteral("%1 [%2] %3 - %4").arg(ts, lvl, where, clean);

        const bool toFile = g_file && g_file->isOpen();
        if (toFile) {
            QTextStream out(g_file);
            out.setEncoding(QStringConverter::Utf8);
            out << line << "\n";
            out.flush();
        }
        if (!toFile || type == QtWarningMsg || type == QtCriticalMsg || type == QtFatalMsg) {
            // Console gets the short form; the file keeps the call site.
            const QByteArray utf8 =
                (toFile ? QStringLiteral("[%1] %2").arg(lvl, clean) : line).toUtf8();
            std::fprintf(stderr, "%s\n", utf8.constData());
            std::fflush(stderr);
        }
        if (type == QtFatalMsg)
            std::abort();
    }
    g_inHandler = false;
}

void rotateIfNeeded(const QString& path) {
    QFileInfo fi(path);
    if (!fi.exists() || fi.size() < kRotateBytes)
        return;
    // .2 -> .3, .1 -> .2, log -> .1; the oldest generation is dropped.
    const QString oldest = path + "." + QString::number(kKeepGenerations);
    if (QFileInfo::exists(oldest))
        QFile::remove(oldest);
    for (int i = kKeepGenerations - 1; i >= 1; --i) {
        const QString older = path + "." + QString::number(i);
        if (QFileInfo::exists(older))
            QFile::rename(older, path + "." + QString::number(i + 1));
    }
    QFile::rename(path, path + ".1");
}

} // namespace

namespace logcollect {
namespace Logger {

void install(const QString& filePath) {
    const QString chosen = filePath.trimmed().isEmpty()
                               ? QDir::current().absoluteFilePath(QStringLiteral("logcollect.log"))
                               : QDir::cleanPath(QFileInfo(filePath.trimmed()).absoluteFilePath());
    QDir().mkpath(QFileInfo(chosen).absolutePath());
    rotateIfNeeded(chosen);

    {
        QMutexLocker lock(&g_mutex);
        if (g_file) {
            g_file->close();
            delete g_file;
            g_file = nullptr;
        }
        g_path = chosen;
        g_file = new QFile(g_path);
        if (!g_file->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
            std::fprintf(stderr, "Logger: failed to open log file: %s\n",
                         g_path.toUtf8().constData());
            std::fflush(stderr);
        }
    }

    qInstallMessageHandler(handler);
    qInfo().noquote() << QStringLiteral("Logger initialized: %1").arg(g_path);
}

void shutdown() {
    qInstallMessageHandler(nullptr);
    QMutexLocker lock(&g_mutex);
    if (g_file) {
        g_file->close();
        delete g_file;
        g_file = nullptr;
    }
}

void setLogLevel(int level) {
    if (level < 0)
        level = 0;
    if (level > 2)
        level = 2;
    g_level.storeRelease(level);
}

int logLevel() {
    return g_level.loadAcquire();
}

QString logFilePath() {
    QMutexLocker lock(&g_mutex);
    return g_path;
}

} // namespace Logger
} // namespace logcollect
