#include "CpuConfig.hpp"
#include "../common/Logger.hpp"

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QRegularExpression>
#include <QtCore/QThread>

#include <algorithm>

namespace Scribe {

namespace {

constexpr int kMinimumThreads = 2;
constexpr int kFallbackReservedCores = 4;
constexpr int kMaxBenchmarkThreads = 4;

} // namespace

int CpuConfig::preferredThreadCount() {
    const int cores = QThread::idealThreadCount();
    const int threads = preferredThreadCount(readMaxFrequencies(), cores);
    Logger::instance().debug("CpuConfig: {} threads selected ({} cores available)", threads, cores);
    return threads;
}

int CpuConfig::benchmarkThreadCount() {
    return benchmarkThreadCount(QThread::idealThreadCount());
}

int CpuConfig::preferredThreadCount(const QList<qint64>& maxFrequencies, int availableCores) {
    int highPerf = 0;
    if (maxFrequencies.isEmpty()) {
        highPerf = std::max(availableCores - kFallbackReservedCores, 0);
    } else {
        highPerf = highPerformanceCoreCount(maxFrequencies);
    }
    return std::max(highPerf, kMinimumThreads);
}

int CpuConfig::benchmarkThreadCount(int availableCores) {
    return std::max(1, std::min(kMaxBenchmarkThreads, availableCores));
}

int CpuConfig::highPerformanceCoreCount(const QList<qint64>& maxFrequencies) {
    if (maxFrequencies.isEmpty()) {
        return 0;
    }
    const qint64 slowest = *std::min_element(maxFrequencies.cbegin(), maxFrequencies.cend());
    const auto faster = std::count_if(maxFrequencies.cbegin(), maxFrequencies.cend(),
                                      [slowest](qint64 f) { return f > slowest; });
    if (faster == 0) {
        return static_cast<int>(maxFrequencies.size());
    }
    return static_cast<int>(faster);
}

QList<qint64> CpuConfig::readMaxFrequencies(const QString& sysCpuRoot) {
    QList<qint64> frequencies;
    QDir root(sysCpuRoot);
    if (!root.exists()) {
        return frequencies;
    }

    static const QRegularExpression cpuDir(QStringLiteral("^cpu\\d+$"));
    const QStringList entries = root.entryList(QDir::Dirs | QDir::NoDotAndDotDot, QDir::Name);
    for (const QString& entry : entries) {
        if (!cpuDir.match(entry).hasMatch()) {
            continue;
        }
        QFile file(root.filePath(entry + "/cpufreq/cpuinfo_max_freq"));
        if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
            // One unreadable core makes the whole topology unreliable.
            return {};
        }
        bool ok = false;
        const qint64 value = file.readAll().trimmed().toLongLong(&ok);
        if (!ok) {
            return {};
        }
        frequencies.append(value);
    }
    return frequencies;
}

} // namespace Scribe
