#include "WhisperCppBackend.hpp"
#include "../common/Logger.hpp"

#include <whisper.h>

#include <string>

namespace Scribe {

namespace {

whisper_context* toNative(ContextId context) {
    return reinterpret_cast<whisper_context*>(context);
}

ContextId fromNative(whisper_context* context) {
    return reinterpret_cast<ContextId>(context);
}

} // namespace

WhisperCppBackend::WhisperCppBackend(bool useGpu)
    : useGpu_(useGpu) {
}

void WhisperCppBackend::installLogHook() {
    whisper_log_set([](enum ggml_log_level level, const char* text, void* userData) {
        Q_UNUSED(userData)
        const std::string message = QString::fromUtf8(text).trimmed().toStdString();
        if (message.empty()) {
            return;
        }

        Logger::Level target = Logger::Level::Trace;
        switch (level) {
            case GGML_LOG_LEVEL_ERROR:
                target = Logger::Level::Error;
                break;
            case GGML_LOG_LEVEL_WARN:
                target = Logger::Level::Warn;
                break;
            case GGML_LOG_LEVEL_INFO:
                target = Logger::Level::Debug;
                break;
            default:
                break;
        }
        Logger::instance().log(target, "whisper: " + message);
    }, nullptr);
    Logger::instance().info("WhisperCppBackend: log routing installed");
}

ContextId WhisperCppBackend::initFromFile(const QString& modelPath) {
    whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = useGpu_;

    const std::string path = modelPath.toStdString();
    whisper_context* ctx = whisper_init_from_file_with_params(path.c_str(), cparams);
    if (!ctx) {
        Logger::instance().error("WhisperCppBackend: failed to initialize context from {}", path);
    }
    return fromNative(ctx);
}

ContextId WhisperCppBackend::initFromBuffer(const QByteArray& modelData) {
    if (modelData.isEmpty()) {
        Logger::instance().error("WhisperCppBackend: empty model buffer");
        return 0;
    }

    whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = useGpu_;

    // whisper.cpp copies the weights out of the buffer during init.
    QByteArray buffer = modelData;
    whisper_context* ctx = whisper_init_from_buffer_with_params(
        buffer.data(), static_cast<size_t>(buffer.size()), cparams);
    if (!ctx) {
        Logger::instance().error("WhisperCppBackend: failed to initialize context from {} byte buffer",
                                 modelData.size());
    }
    return fromNative(ctx);
}

void WhisperCppBackend::free(ContextId context) {
    if (context != 0) {
        whisper_free(toNative(context));
    }
}

int WhisperCppBackend::fullTranscribe(ContextId context,
                                      const std::vector<float>& samples,
                                      const WhisperRunParams& params) {
    whisper_full_params wparams = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);

    const std::string language = params.language.toStdString();
    wparams.print_realtime = false;
    wparams.print_progress = false;
    wparams.print_timestamps = true;
    wparams.print_special = false;
    wparams.translate = false;
    wparams.language = language.c_str();
    wparams.n_threads = params.threads;
    wparams.offset_ms = 0;
    wparams.no_context = true;
    wparams.single_segment = false;

    whisper_context* ctx = toNative(context);
    whisper_reset_timings(ctx);

    Logger::instance().debug("WhisperCppBackend: running full transcription on {} samples with {} threads",
                             samples.size(), params.threads);
    const int rc = whisper_full(ctx, wparams, samples.data(), static_cast<int>(samples.size()));
    if (rc == 0) {
        whisper_print_timings(ctx);
    }
    return rc;
}

int WhisperCppBackend::segmentCount(ContextId context) {
    return whisper_full_n_segments(toNative(context));
}

QString WhisperCppBackend::segmentText(ContextId context, int index) {
    return QString::fromUtf8(whisper_full_get_segment_text(toNative(context), index));
}

qint64 WhisperCppBackend::segmentT0(ContextId context, int index) {
    return static_cast<qint64>(whisper_full_get_segment_t0(toNative(context), index));
}

qint64 WhisperCppBackend::segmentT1(ContextId context, int index) {
    return static_cast<qint64>(whisper_full_get_segment_t1(toNative(context), index));
}

QString WhisperCppBackend::systemInfo() {
    return QString::fromUtf8(whisper_print_system_info());
}

QString WhisperCppBackend::benchMemcpy(int threads) {
    return QString::fromUtf8(whisper_bench_memcpy_str(threads));
}

QString WhisperCppBackend::benchMulMat(int threads) {
    return QString::fromUtf8(whisper_bench_ggml_mul_mat_str(threads));
}

} // namespace Scribe
