#include "logcollect/CollectorConfig.hpp"
#include "logcollect/LogCategories.hpp"
#include "logcollect/RuntimeLogging.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSettings>
#include <QStringList>
#include <QTextStream>
#include <unordered_set>

namespace logcollect {

namespace {

// QSettings splits unquoted values on commas; glue them back together.
QString readString(const QSettings& s, const QString& key) {
    const QVariant v = s.value(key);
    if (v.metaType().id() == QMetaType::QStringList)
        return v.toStringList().join(QLatin1Char(',')).trimmed();
    return v.toString().trimmed();
}

// Secrets are taken verbatim (no trimming).
QString readSecret(const QSettings& s, const QString& key) {
    const QVariant v = s.value(key);
    if (v.metaType().id() == QMetaType::QStringList)
        return v.toStringList().join(QLatin1Char(','));
    return v.toString();
}

bool readInt(const QSettings& s, const QString& key, int def, int min, int max,
             int& out, const QString& where, QString& err) {
    const QString raw = readString(s, key);
    if (raw.isEmpty()) {
        out = def;
        return true;
    }
    bool ok = false;
    const int v = raw.toInt(&ok);
    if (!ok || v < min || v > max) {
        err = QStringLiteral("%1: invalid %2 '%3' (expected %4..%5)")
                  .arg(where, key, raw)
                  .arg(min)
                  .arg(max);
        return false;
    }
    out = v;
    return true;
}

bool readBool(const QSettings& s, const QString& key, bool def, bool& out,
              const QString& where, QString& err) {
    const QString raw = readString(s, key).toLower();
    if (raw.isEmpty()) {
        out = def;
        return true;
    }
    if (raw == "true" || raw == "yes" || raw == "on" || raw == "1") {
        out = true;
        return true;
    }
    if (raw == "false" || raw == "no" || raw == "off" || raw == "0") {
        out = false;
        return true;
    }
    err = QStringLiteral("%1: invalid %2 '%3'").arg(where, key, raw);
    return false;
}

bool require(const QSettings& s, const QString& key, QString& out, const QString& where,
             QString& err) {
    out = readString(s, key);
    if (out.isEmpty()) {
        err = QStringLiteral("%1: missing required field '%2'").arg(where, key);
        return false;
    }
    return true;
}

const char* kTemplate =
    "; logcollect configuration\n"
    "; Edit the servers and directories below, then run logcollect --config <this file>.\n"
    "\n"
    "[settings]\n"
    "downloadPath=./downloads\n"
    "maxConcurrentTransfers=5\n"
    "; reconnect attempts per file after a lost connection\n"
    "retryAttempts=3\n"
    "; in-place stream retries per file\n"
    "maxInnerErrors=5\n"
    "connectionTimeout=30\n"
    "chunkSize=32768\n"
    "; strict | accept-new | off\n"
    "knownHostsPolicy=accept-new\n"
    "\n"
    "; One entry per host. Set either password or keyFile (+ optional passphrase).\n"
    "[servers]\n"
    "size=1\n"
    "1\\name=my-linux-server\n"
    "1\\host=192.168.1.100\n"
    "1\\port=22\n"
    "1\\username=your_username\n"
    "1\\password=your_password\n"
    ";1\\keyFile=~/.ssh/id_ed25519\n"
    ";1\\passphrase=\n"
    "1\\timeout=30\n"
    "\n"
    "; Remote directories to collect; server must match a server name above.\n"
    "[directories]\n"
    "size=3\n"
    "1\\name=System Logs\n"
    "1\\path=/var/log\n"
    "1\\server=my-linux-server\n"
    "1\\filePattern=*.log\n"
    "1\\recursive=false\n"
    "2\\name=Application Logs\n"
    "2\\path=/var/log/myapp\n"
    "2\\server=my-linux-server\n"
    "2\\filePattern=*.log\n"
    "2\\recursive=true\n"
    "3\\name=Nginx Logs\n"
    "3\\path=/var/log/nginx\n"
    "3\\server=my-linux-server\n"
    "3\\filePattern=*.log*\n"
    "3\\recursive=false\n";

} // namespace

QString expandHome(const QString& path) {
    if (path == QLatin1String("~"))
        return QDir::homePath();
    if (path.startsWith(QLatin1String("~/")))
        return QDir::homePath() + path.mid(1);
    return path;
}

bool parseKnownHostsPolicy(const QString& text, KnownHostsPolicy& out) {
    const QString t = text.trimmed().toLower();
    if (t == QLatin1String("strict"))
        out = KnownHostsPolicy::Strict;
    else if (t == QLatin1String("accept-new"))
        out = KnownHostsPolicy::AcceptNew;
    else if (t == QLatin1String("off"))
        out = KnownHostsPolicy::Off;
    else
        return false;
    return true;
}

bool CollectorConfig::load(const QString& path, QString& err) {
    if (!QFileInfo::exists(path)) {
        err = QStringLiteral("configuration file not found: %1").arg(path);
        return false;
    }
    QSettings s(path, QSettings::IniFormat);
    if (s.status() != QSettings::NoError) {
        err = QStringLiteral("cannot parse configuration file: %1").arg(path);
        return false;
    }

    CollectorSettings st;
    s.beginGroup(QStringLiteral("settings"));
    {
        const QString where = QStringLiteral("settings");
        const QString dl = readString(s, QStringLiteral("downloadPath"));
        if (!dl.isEmpty())
            st.downloadPath = expandHome(dl);
        if (!readInt(s, QStringLiteral("maxConcurrentTransfers"), st.maxConcurrentTransfers, 1, 64,
                     st.maxConcurrentTransfers, where, err) ||
            !readInt(s, QStringLiteral("retryAttempts"), st.retryAttempts, 0, 100, st.retryAttempts,
                     where, err) ||
            !readInt(s, QStringLiteral("maxInnerErrors"), st.maxInnerErrors, 0, 100,
                     st.maxInnerErrors, where, err) ||
            !readInt(s, QStringLiteral("connectionTimeout"), st.connectionTimeout, 1, 3600,
                     st.connectionTimeout, where, err) ||
            !readInt(s, QStringLiteral("chunkSize"), st.chunkSize, 1024, 4 * 1024 * 1024,
                     st.chunkSize, where, err)) {
            s.endGroup();
            return false;
        }
        const QString kh = readString(s, QStringLiteral("knownHostsPolicy"));
        if (!kh.isEmpty() && !parseKnownHostsPolicy(kh, st.knownHostsPolicy)) {
            err = QStringLiteral("settings: invalid knownHostsPolicy '%1'").arg(kh);
            s.endGroup();
            return false;
        }
    }
    s.endGroup();

    std::vector<HostDescriptor> servers;
    std::unordered_set<std::string> names;
    const int nServers = s.beginReadArray(QStringLiteral("servers"));
    for (int i = 0; i < nServers; ++i) {
        s.setArrayIndex(i);
        const QString where = QStringLiteral("server %1").arg(i + 1);
        QString name, host, user;
        if (!require(s, QStringLiteral("name"), name, where, err) ||
            !require(s, QStringLiteral("host"), host, where, err) ||
            !require(s, QStringLiteral("username"), user, where, err)) {
            s.endArray();
            return false;
        }
        HostDescriptor h;
        h.name = name.toStdString();
        h.host = host.toStdString();
        h.username = user.toStdString();
        const QString at = QStringLiteral("server '%1'").arg(name);
        if (!names.insert(h.name).second) {
            err = QStringLiteral("%1: duplicate server name").arg(at);
            s.endArray();
            return false;
        }
        int port = 22;
        if (!readInt(s, QStringLiteral("port"), 22, 1, 65535, port, at, err) ||
            !readInt(s, QStringLiteral("timeout"), st.connectionTimeout, 1, 3600, h.timeout_sec,
                     at, err)) {
            s.endArray();
            return false;
        }
        h.port = static_cast<std::uint16_t>(port);

        const QString pw = readSecret(s, QStringLiteral("password"));
        const QString kp = readString(s, QStringLiteral("keyFile"));
        if (pw.isEmpty() == kp.isEmpty()) {
            err = QStringLiteral("%1: set exactly one of password or keyFile").arg(at);
            s.endArray();
            return false;
        }
        if (!pw.isEmpty())
            h.password = pw.toStdString();
        if (!kp.isEmpty()) {
            h.private_key_path = expandHome(kp).toStdString();
            const QString pp = readSecret(s, QStringLiteral("passphrase"));
            if (!pp.isEmpty())
                h.private_key_passphrase = pp.toStdString();
        }
        const QString kh = readString(s, QStringLiteral("knownHosts"));
        if (!kh.isEmpty())
            h.known_hosts_path = expandHome(kh).toStdString();
        h.known_hosts_policy = st.knownHostsPolicy;
        servers.push_back(std::move(h));
    }
    s.endArray();
    if (servers.empty()) {
        err = QStringLiteral("missing required section 'servers'");
        return false;
    }

    std::vector<DirectorySpec> dirs;
    const int nDirs = s.beginReadArray(QStringLiteral("directories"));
    for (int i = 0; i < nDirs; ++i) {
        s.setArrayIndex(i);
        const QString where = QStringLiteral("directory %1").arg(i + 1);
        QString name, dpath, server;
        if (!require(s, QStringLiteral("name"), name, where, err) ||
            !require(s, QStringLiteral("path"), dpath, where, err) ||
            !require(s, QStringLiteral("server"), server, where, err)) {
            s.endArray();
            return false;
        }
        DirectorySpec d;
        d.name = name.toStdString();
        d.path = dpath.toStdString();
        d.hostName = server.toStdString();
        const QString pattern = readString(s, QStringLiteral("filePattern"));
        if (!pattern.isEmpty())
            d.filePattern = pattern.toStdString();
        if (!readBool(s, QStringLiteral("recursive"), false, d.recursive,
                      QStringLiteral("directory '%1'").arg(name), err)) {
            s.endArray();
            return false;
        }
        if (!names.count(d.hostName)) {
            qCWarning(lcConfig) << "Directory" << name << "references unknown server" << server
                                << "- ignored";
            continue;
        }
        dirs.push_back(std::move(d));
    }
    s.endArray();
    if (nDirs == 0) {
        err = QStringLiteral("missing required section 'directories'");
        return false;
    }

    settings_ = st;
    servers_ = std::move(servers);
    directories_ = std::move(dirs);
    qCInfo(lcConfig) << "Loaded" << path << ":" << servers_.size() << "servers,"
                     << directories_.size() << "directories";
    for (const auto& h : servers_)
        qCDebug(lcConfig) << "server" << QString::fromStdString(hostLogLabel(h)) << "auth"
                          << authMethodName(h);
    return true;
}

bool CollectorConfig::writeTemplate(const QString& path, QString& err) {
    if (QFileInfo::exists(path)) {
        err = QStringLiteral("refusing to overwrite existing file: %1").arg(path);
        return false;
    }
    const QString dir = QFileInfo(path).absolutePath();
    if (!QDir().mkpath(dir)) {
        err = QStringLiteral("cannot create directory %1").arg(dir);
        return false;
    }
    QFile f(path);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Text)) {
        err = QStringLiteral("cannot write %1: %2").arg(path, f.errorString());
        return false;
    }
    QTextStream out(&f);
    out << kTemplate;
    out.flush();
    if (out.status() != QTextStream::Ok) {
        err = QStringLiteral("cannot write %1").arg(path);
        return false;
    }
    qCInfo(lcConfig) << "Wrote configuration template" << path;
    return true;
}

const HostDescriptor* CollectorConfig::server(const std::string& name) const {
    for (const auto& h : servers_) {
        if (h.name == name)
            return &h;
    }
    return nullptr;
}

std::vector<DirectorySpec> CollectorConfig::directoriesFor(const std::string& serverName) const {
    std::vector<DirectorySpec> out;
    for (const auto& d : directories_) {
        if (d.hostName == serverName)
            out.push_back(d);
    }
    return out;
}

SchedulerOptions CollectorConfig::schedulerOptions() const {
    SchedulerOptions o;
    o.maxConcurrent = settings_.maxConcurrentTransfers;
    o.maxOuterRetries = settings_.retryAttempts;
    o.copy.chunkSize = (std::size_t)settings_.chunkSize;
    o.copy.maxInnerErrors = settings_.maxInnerErrors;
    return o;
}

} // namespace logcollect
