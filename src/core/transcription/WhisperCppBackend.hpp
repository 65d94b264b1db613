#pragma once

#include "WhisperBackend.hpp"

namespace Scribe {

// WhisperBackend over the whisper.cpp C API. ContextId carries a whisper_context*.
class WhisperCppBackend : public WhisperBackend {
public:
    explicit WhisperCppBackend(bool useGpu = true);
    ~WhisperCppBackend() override = default;

    WhisperCppBackend(const WhisperCppBackend&) = delete;
    WhisperCppBackend& operator=(const WhisperCppBackend&) = delete;

    ContextId initFromFile(const QString& modelPath) override;
    ContextId initFromBuffer(const QByteArray& modelData) override;
    void free(ContextId context) override;

    int fullTranscribe(ContextId context,
                       const std::vector<float>& samples,
                       const WhisperRunParams& params) override;
    int segmentCount(ContextId context) override;
    QString segmentText(ContextId context, int index) override;
    qint64 segmentT0(ContextId context, int index) override;
    qint64 segmentT1(ContextId context, int index) override;

    QString systemInfo() override;
    QString benchMemcpy(int threads) override;
    QString benchMulMat(int threads) override;

    // Routes ggml/whisper diagnostics into Logger.
    static void installLogHook();

private:
    bool useGpu_;
};

} // namespace Scribe
