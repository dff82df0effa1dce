// Typed configuration loaded from an INI file through QSettings.
#pragma once
#include "logcollect/FileEnumerator.hpp"
#include "logcollect/TransferScheduler.hpp"
#include <QString>
#include <string>
#include <vector>

namespace logcollect {

struct CollectorSettings {
    QString downloadPath = QStringLiteral("./downloads");
    int maxConcurrentTransfers = 5;
    int retryAttempts = 3;      // connection-tier budget
    int maxInnerErrors = 5;     // stream-tier budget
    int connectionTimeout = 30; // seconds, for servers without their own
    int chunkSize = 32768;
    KnownHostsPolicy knownHostsPolicy = KnownHostsPolicy::AcceptNew;
};

class CollectorConfig {
public:
    // Reads and validates `path`. On failure `err` names the offending entry
    // and the object keeps its previous content.
    bool load(const QString& path, QString& err);

    // Writes an example configuration to `path` (which must not exist).
    static bool writeTemplate(const QString& path, QString& err);

    const CollectorSettings& settings() const { return settings_; }
    CollectorSettings& settings() { return settings_; }
    const std::vector<HostDescriptor>& servers() const { return servers_; }
    const std::vector<DirectorySpec>& directories() const { return directories_; }

    const HostDescriptor* server(const std::string& name) const;
    std::vector<DirectorySpec> directoriesFor(const std::string& serverName) const;

    // Engine options derived from [settings].
    SchedulerOptions schedulerOptions() const;

private:
    CollectorSettings settings_;
    std::vector<HostDescriptor> servers_;
    std::vector<DirectorySpec> directories_;
};

// "strict", "accept-new" or "off" (case-insensitive).
bool parseKnownHostsPolicy(const QString& text, KnownHostsPolicy& out);

// Expands a leading "~" to the home directory.
QString expandHome(const QString& path);

} // namespace logcollect
