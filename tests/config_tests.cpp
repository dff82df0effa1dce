// Configuration loader and time helper tests (run via CTest).
#include "logcollect/CollectorConfig.hpp"
#include "logcollect/Logger.hpp"
#include "logcollect/TimeUtils.hpp"

#include <QDate>
#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QTemporaryDir>
#include <QTime>

#include <cstdlib>
#include <iostream>
#include <string>

using namespace logcollect;

namespace {

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }

    void checkContains(const QString &haystack, const QString &needle, const std::string &msg) {
        check(haystack.contains(needle), msg + " (got: " + haystack.toStdString() + ")");
    }
};

QString writeIni(const QTemporaryDir &dir, const QString &name, const QByteArray &body) {
    const QString path = QDir(dir.path()).filePath(name);
    QFile f(path);
    if (f.open(QIODevice::WriteOnly | QIODevice::Truncate))
        f.write(body);
    return path;
}

const QByteArray kServersAndDirs =
    "[servers]\n"
    "size=2\n"
    "1\\name=web\n"
    "1\\host=10.0.0.5\n"
    "1\\username=ops\n"
    "1\\password=\"s3cret, with comma \"\n"
    "2\\name=db\n"
    "2\\host=db.internal\n"
    "2\\port=2222\n"
    "2\\username=backup\n"
    "2\\keyFile=~/.ssh/id_ed25519\n"
    "2\\passphrase=pp\n"
    "2\\timeout=5\n"
    "\n"
    "[directories]\n"
    "size=3\n"
    "1\\name=Nginx\n"
    "1\\path=/var/log/nginx\n"
    "1\\server=web\n"
    "1\\filePattern=*.log*\n"
    "2\\name=Postgres\n"
    "2\\path=/var/log/postgresql\n"
    "2\\server=db\n"
    "2\\recursive=true\n"
    "3\\name=Orphan\n"
    "3\\path=/tmp\n"
    "3\\server=nowhere\n";

void test_valid_config(TestContext &t) {
    QTemporaryDir tmp;
    const QString path = writeIni(tmp, "ok.ini",
                                  QByteArray("[settings]\n"
                                             "downloadPath=~/collected\n"
                                             "maxConcurrentTransfers=8\n"
                                             "retryAttempts=4\n"
                                             "knownHostsPolicy=Strict\n\n") +
                                      kServersAndDirs);
    CollectorConfig cfg;
    QString err;
    t.check(cfg.load(path, err), "valid config should load: " + err.toStdString());

    const CollectorSettings &st = cfg.settings();
    t.check(st.downloadPath == QDir::homePath() + "/collected", "downloadPath should expand ~");
    t.check(st.maxConcurrentTransfers == 8, "maxConcurrentTransfers override");
    t.check(st.retryAttempts == 4, "retryAttempts override");
    t.check(st.maxInnerErrors == 5, "maxInnerErrors default");
    t.check(st.connectionTimeout == 30, "connectionTimeout default");
    t.check(st.chunkSize == 32768, "chunkSize default");
    t.check(st.knownHostsPolicy == KnownHostsPolicy::Strict, "policy parsed case-insensitively");

    t.check(cfg.servers().size() == 2, "two servers");
    const HostDescriptor *web = cfg.server("web");
    t.check(web != nullptr, "server lookup by name");
    if (web) {
        t.check(web->host == "10.0.0.5" && web->port == 22 && web->username == "ops",
                "web fields and default port");
        t.check(web->password && *web->password == "s3cret, with comma ",
                "a quoted password keeps commas and spaces");
        t.check(!web->private_key_path, "web has no key");
        t.check(web->timeout_sec == 30, "server timeout should default to connectionTimeout");
        t.check(web->known_hosts_policy == KnownHostsPolicy::Strict,
                "the global policy applies to every server");
    }
    const HostDescriptor *db = cfg.server("db");
    t.check(db != nullptr, "db server should exist");
    if (db) {
        t.check(db->port == 2222 && db->timeout_sec == 5, "db port and timeout");
        t.check(db->private_key_path &&
                    *db->private_key_path == (QDir::homePath() + "/.ssh/id_ed25519").toStdString(),
                "keyFile should expand ~");
        t.check(db->private_key_passphrase && *db->private_key_passphrase == "pp", "passphrase");
        t.check(!db->password, "db has no password");
    }

    t.check(cfg.directories().size() == 2, "a directory for an unknown server is dropped");
    const auto webDirs = cfg.directoriesFor("web");
    t.check(webDirs.size() == 1 && webDirs[0].filePattern == "*.log*" && !webDirs[0].recursive,
            "web directory pattern and recursion default");
    const auto dbDirs = cfg.directoriesFor("db");
    t.check(dbDirs.size() == 1 && dbDirs[0].recursive && dbDirs[0].filePattern == "*",
            "db directory recursion and pattern default");

    const SchedulerOptions so = cfg.schedulerOptions();
    t.check(so.maxConcurrent == 8 && so.maxOuterRetries == 4 && so.copy.maxInnerErrors == 5 &&
                so.copy.chunkSize == 32768,
            "scheduler options should follow [settings]");
}

void test_invalid_configs(TestContext &t) {
    QTemporaryDir tmp;
    CollectorConfig cfg;
    QString err;

    t.check(!cfg.load(QDir(tmp.path()).filePath("absent.ini"), err), "missing file fails");
    t.checkContains(err, "not found", "missing file message");

    const QString noHost = writeIni(tmp, "nohost.ini",
                                    "[servers]\nsize=1\n1\\name=a\n1\\username=u\n1\\password=p\n"
                                    "[directories]\nsize=1\n1\\name=d\n1\\path=/\n1\\server=a\n");
    t.check(!cfg.load(noHost, err), "a server without host fails");
    t.checkContains(err, "missing required field 'host'", "missing field is named");

    const QString dup = writeIni(tmp, "dup.ini",
                                 "[servers]\nsize=2\n"
                                 "1\\name=a\n1\\host=h\n1\\username=u\n1\\password=p\n"
                                 "2\\name=a\n2\\host=h2\n2\\username=u\n2\\password=p\n"
                                 "[directories]\nsize=1\n1\\name=d\n1\\path=/\n1\\server=a\n");
    t.check(!cfg.load(dup, err), "duplicate server names fail");
    t.checkContains(err, "duplicate server name", "duplicate is reported");

    const QString badPort = writeIni(tmp, "port.ini",
                                     "[servers]\nsize=1\n"
                                     "1\\name=a\n1\\host=h\n1\\port=70000\n1\\username=u\n"
                                     "1\\password=p\n"
                                     "[directories]\nsize=1\n1\\name=d\n1\\path=/\n1\\server=a\n");
    t.check(!cfg.load(badPort, err), "an out of range port fails");
    t.checkContains(err, "invalid port", "invalid port is reported");

    const QString badNumber = writeIni(tmp, "num.ini",
                                       "[settings]\nmaxConcurrentTransfers=lots\n"
                                       "[servers]\nsize=1\n"
                                       "1\\name=a\n1\\host=h\n1\\username=u\n1\\password=p\n"
                                       "[directories]\nsize=1\n1\\name=d\n1\\path=/\n1\\server=a\n");
    t.check(!cfg.load(badNumber, err), "a non-numeric setting fails");
    t.checkContains(err, "maxConcurrentTransfers", "the bad setting is named");

    const QString both = writeIni(tmp, "both.ini",
                                  "[servers]\nsize=1\n"
                                  "1\\name=a\n1\\host=h\n1\\username=u\n1\\password=p\n"
                                  "1\\keyFile=/k\n"
                                  "[directories]\nsize=1\n1\\name=d\n1\\path=/\n1\\server=a\n");
    t.check(!cfg.load(both, err), "password and keyFile together fail");
    t.checkContains(err, "exactly one of password or keyFile", "auth conflict message");

    const QString neither = writeIni(tmp, "neither.ini",
                                     "[servers]\nsize=1\n1\\name=a\n1\\host=h\n1\\username=u\n"
                                     "[directories]\nsize=1\n1\\name=d\n1\\path=/\n1\\server=a\n");
    t.check(!cfg.load(neither, err), "a server without credentials fails");

    const QString noServers = writeIni(tmp, "noservers.ini",
                                       "[directories]\nsize=1\n1\\name=d\n1\\path=/\n"
                                       "1\\server=a\n");
    t.check(!cfg.load(noServers, err), "missing servers section fails");
    t.checkContains(err, "'servers'", "missing section is named");

    const QString noDirs = writeIni(tmp, "nodirs.ini",
                                    "[servers]\nsize=1\n"
                                    "1\\name=a\n1\\host=h\n1\\username=u\n1\\password=p\n");
    t.check(!cfg.load(noDirs, err), "missing directories section fails");
    t.checkContains(err, "'directories'", "missing section is named");

    const QString badPolicy = writeIni(tmp, "policy.ini",
                                       "[settings]\nknownHostsPolicy=maybe\n"
                                       "[servers]\nsize=1\n"
                                       "1\\name=a\n1\\host=h\n1\\username=u\n1\\password=p\n"
                                       "[directories]\nsize=1\n1\\name=d\n1\\path=/\n"
                                       "1\\server=a\n");
    t.check(!cfg.load(badPolicy, err), "an unknown host key policy fails");

    t.check(cfg.servers().empty(), "failed loads leave the config untouched");
}

void test_template_round_trip(TestContext &t) {
    QTemporaryDir tmp;
    const QString path = QDir(tmp.path()).filePath("nested/logcollect.ini");
    QString err;
    t.check(CollectorConfig::writeTemplate(path, err), "template should be written");

    CollectorConfig cfg;
    t.check(cfg.load(path, err), "the template should load: " + err.toStdString());
    t.check(cfg.servers().size() == 1 && cfg.servers()[0].name == "my-linux-server",
            "template server");
    t.check(cfg.directories().size() == 3, "template directories");
    const auto dirs = cfg.directoriesFor("my-linux-server");
    t.check(dirs.size() == 3 && dirs[1].recursive && dirs[2].filePattern == "*.log*",
            "template directory details");

    t.check(!CollectorConfig::writeTemplate(path, err), "template must not overwrite");
    t.checkContains(err, "refusing to overwrite", "overwrite refusal message");
}

void test_known_hosts_policy_and_home(TestContext &t) {
    KnownHostsPolicy p = KnownHostsPolicy::Strict;
    t.check(parseKnownHostsPolicy(" OFF ", p) && p == KnownHostsPolicy::Off, "off");
    t.check(parseKnownHostsPolicy("accept-new", p) && p == KnownHostsPolicy::AcceptNew,
            "accept-new");
    t.check(!parseKnownHostsPolicy("yes", p), "unknown policy rejected");

    t.check(expandHome("~") == QDir::homePath(), "bare ~");
    t.check(expandHome("~/x") == QDir::homePath() + "/x", "~/ prefix");
    t.check(expandHome("/abs/~/x") == "/abs/~/x", "~ elsewhere is kept");
}

void test_time_parsing(TestContext &t) {
    const qint64 expected =
        QDateTime(QDate(2024, 3, 5), QTime(14, 30, 0)).toSecsSinceEpoch();
    const qint64 midnight = QDate(2024, 3, 5).startOfDay().toSecsSinceEpoch();

    auto parsed = parseTimeString("2024-03-05 14:30:00");
    t.check(parsed && *parsed == expected, "ISO date time with seconds");
    parsed = parseTimeString("2024-03-05 14:30");
    t.check(parsed && *parsed == expected, "ISO date time without seconds");
    parsed = parseTimeString("05/03/2024 14:30");
    t.check(parsed && *parsed == expected, "day first wins for ambiguous dates");
    parsed = parseTimeString("03/25/2024");
    t.check(parsed && *parsed == QDate(2024, 3, 25).startOfDay().toSecsSinceEpoch(),
            "month first when day first is impossible");
    parsed = parseTimeString("20240305");
    t.check(parsed && *parsed == midnight, "compact date means midnight");
    parsed = parseTimeString(" 2024-03-05 ");
    t.check(parsed && *parsed == midnight, "surrounding spaces are ignored");
    t.check(!parseTimeString("yesterday"), "free text is rejected");
    t.check(!parseTimeString(""), "empty input is rejected");
}

void test_presets_and_ranges(TestContext &t) {
    const QDateTime now = QDateTime::fromSecsSinceEpoch(1700000000);
    auto r = presetRange("24h", now);
    t.check(r && r->start && *r->start == 1700000000 - 86400 && !r->end,
            "24h starts a day ago and stays open");
    r = presetRange("7D", now);
    t.check(r && r->start && *r->start == 1700000000 - 7 * 86400, "presets are case-insensitive");
    t.check(!presetRange("2h", now), "unknown presets are rejected");
    t.check(timePresetNames().size() == 7, "seven presets");

    TimeRange ok;
    ok.start = 10;
    ok.end = 20;
    QString err;
    t.check(validateTimeRange(ok, err), "start before end is valid");
    TimeRange bad;
    bad.start = 20;
    bad.end = 20;
    t.check(!validateTimeRange(bad, err) && !err.isEmpty(), "start equal to end is rejected");
    TimeRange open;
    open.start = 5;
    t.check(validateTimeRange(open, err), "an open range is valid");
}

void test_format_bytes(TestContext &t) {
    t.check(formatBytes(0) == "0 B", "zero");
    t.check(formatBytes(512) == "512 B", "bytes");
    t.check(formatBytes(1536) == "1.5 KB", "kilobytes");
    t.check(formatBytes(50ull * 1024 * 1024) == "50.0 MB", "megabytes");
    t.check(formatBytes(3ull * 1024 * 1024 * 1024 * 1024) == "3.0 TB", "terabytes");
    t.check(localShortTime(0) == "-", "zero time renders as a dash");
}

void test_logger_file_and_rotation(TestContext &t) {
    QTemporaryDir tmp;
    const QString path = QDir(tmp.path()).filePath("logs/run.log");
    QDir().mkpath(QFileInfo(path).absolutePath());
    {
        QFile big(path);
        if (big.open(QIODevice::WriteOnly))
            big.write(QByteArray(3 * 1024 * 1024, 'x'));
    }

    Logger::setLogLevel(1);
    Logger::install(path);
    t.check(Logger::logFilePath() == QFileInfo(path).absoluteFilePath(), "log path is absolute");
    qInfo() << "collector started";
    qDebug() << "hidden detail";
    Logger::setLogLevel(2);
    qDebug() << "visible detail";
    Logger::shutdown();
    Logger::setLogLevel(1);

    t.check(QFileInfo::exists(path + ".1"), "an oversized log should be rotated to .1");
    t.check(QFileInfo(path + ".1").size() == 3 * 1024 * 1024, "the rotated file is the old log");
    QFile f(path);
    QString text;
    if (f.open(QIODevice::ReadOnly | QIODevice::Text))
        text = QString::fromUtf8(f.readAll());
    t.checkContains(text, "[INFO]", "info records carry their level");
    t.checkContains(text, "collector started", "info records are written");
    t.check(!text.contains("hidden detail"), "debug records are dropped at level 1");
    t.checkContains(text, "visible detail", "debug records are written at level 2");
}

} // namespace

int main() {
    QLoggingCategory::setFilterRules(QStringLiteral("logcollect.config.info=false"));

    TestContext t;
    test_valid_config(t);
    test_invalid_configs(t);
    test_template_round_trip(t);
    test_known_hosts_policy_and_home(t);
    test_time_parsing(t);
    test_presets_and_ranges(t);
    test_format_bytes(t);
    test_logger_file_and_rotation(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] logcollect_config_tests\n";
    return EXIT_SUCCESS;
}
