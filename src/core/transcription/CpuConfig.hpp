#pragma once

#include <QtCore/QList>
#include <QtCore/QString>

namespace Scribe {

// Thread-count policy for the engine.
class CpuConfig {
public:
    // Threads for transcription: high-performance core count, at least 2.
    static int preferredThreadCount();
    // Threads for benchmarks: available cores clamped to [1, 4].
    static int benchmarkThreadCount();

    // maxFrequencies holds one entry per core; empty when the topology is unknown.
    static int preferredThreadCount(const QList<qint64>& maxFrequencies, int availableCores);
    static int benchmarkThreadCount(int availableCores);

    // Cores whose max frequency is above the slowest core's. A uniform CPU counts every core.
    static int highPerformanceCoreCount(const QList<qint64>& maxFrequencies);

    static QList<qint64> readMaxFrequencies(const QString& sysCpuRoot = "/sys/devices/system/cpu");
};

} // namespace Scribe
