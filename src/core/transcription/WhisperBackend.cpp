#include "WhisperBackend.hpp"
#include "WhisperCppBackend.hpp"
#include "../common/Config.hpp"

#include <mutex>

namespace Scribe {

std::shared_ptr<WhisperBackend> WhisperBackend::createDefault() {
    static std::once_flag initFlag;
    std::call_once(initFlag, [] { WhisperCppBackend::installLogHook(); });
    return std::make_shared<WhisperCppBackend>(Config::instance().getTranscriptionSettings().useGpu);
}

} // namespace Scribe
