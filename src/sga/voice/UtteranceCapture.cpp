#include "sga/voice/UtteranceCapture.h"

#include "sga/voice/ErrorHandler.h"
#include "sga/voice/utils/AudioProcessor.h"

#include <algorithm>
#include <cctype>
#include <deque>

namespace sga::voice {

namespace {

std::string trim(const std::string& s) {
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    auto b = std::find_if(s.begin(), s.end(), notSpace);
    auto e = std::find_if(s.rbegin(), s.rend(), notSpace).base();
    if (b >= e) return {};
    return std::string(b, e);
}

double frameMs(const types::AudioFrame& f) {
    return f.durationMs();
}

} // namespace

UtteranceCapture::UtteranceCapture(SpeechToText& stt, uint32_t frameSize, std::chrono::milliseconds frameReadTimeout)
    : m_stt(stt)
    , m_frameSize(frameSize == 0 ? 512 : frameSize)
    , m_readTimeout(frameReadTimeout)
{
}

std::optional<std::vector<int16_t>> UtteranceCapture::record(AudioInput& mic,
                                                             const CaptureLimits& limits,
                                                             const AbortPredicate& shouldAbort) {
    const double listenMs = static_cast<double>(limits.listenTimeout.count());
    const double phraseMs = static_cast<double>(limits.phraseLimit.count());
    const double startHoldMs = static_cast<double>(limits.vad.startHold.count());
    const double stopHoldMs = static_cast<double>(limits.vad.stopHold.count());
    const double keepMs = std::max(static_cast<double>(limits.vad.preRoll.count()), startHoldMs);

    // 等待开口阶段
    std::deque<types::AudioFrame> preRoll;
    double preRollMs = 0.0;
    double waitedMs = 0.0;
    double loudMs = 0.0;
    bool started = false;

    while (!started) {
        if (shouldAbort && shouldAbort()) return std::nullopt;
        if (waitedMs >= listenMs) return std::nullopt;

        auto frame = mic.readFrame(m_frameSize, m_readTimeout);
        if (!frame || frame->empty()) {
            waitedMs += static_cast<double>(m_readTimeout.count());
            loudMs = 0.0;
            continue;
        }

        const double ms = frameMs(*frame);
        waitedMs += ms;
        const float db = utils::AudioProcessor::dbfsOf(frame->samples.data(), frame->size());
        loudMs = (db >= limits.vad.startThresholdDb) ? loudMs + ms : 0.0;

        preRoll.push_back(std::move(*frame));
        preRollMs += ms;
        while (preRoll.size() > 1 && preRollMs - frameMs(preRoll.front()) >= keepMs) {
            preRollMs -= frameMs(preRoll.front());
            preRoll.pop_front();
        }

        if (loudMs > 0.0 && loudMs >= startHoldMs) started = true;
    }

    std::vector<int16_t> pcm;
    double speechMs = 0.0;
    for (const auto& f : preRoll) {
        pcm.insert(pcm.end(), f.samples.begin(), f.samples.end());
        speechMs += frameMs(f);
    }

    // 说话阶段：不再检查 shouldAbort，一句话说完才返回
    double quietMs = 0.0;
    while (speechMs < phraseMs) {
        auto frame = mic.readFrame(m_frameSize, m_readTimeout);
        if (!frame || frame->empty()) {
            ErrorHandler::shared().log(ErrorHandler::LogLevel::Debug,
                                       "UtteranceCapture: microphone read timed out mid-phrase");
            break;
        }
        const double ms = frameMs(*frame);
        const float db = utils::AudioProcessor::dbfsOf(frame->samples.data(), frame->size());
        pcm.insert(pcm.end(), frame->samples.begin(), frame->samples.end());
        speechMs += ms;

        quietMs = (db < limits.vad.stopThresholdDb) ? quietMs + ms : 0.0;
        if (quietMs >= stopHoldMs) break;
    }

    if (pcm.empty()) return std::nullopt;
    return pcm;
}

std::optional<std::string> UtteranceCapture::capture(AudioInput& mic,
                                                     const CaptureLimits& limits,
                                                     const AbortPredicate& shouldAbort) {
    auto pcm = record(mic, limits, shouldAbort);
    if (!pcm) return std::nullopt;

    auto text = m_stt.transcribe(*pcm, mic.sampleRate(), limits.transcribeTimeout);
    if (!text) {
        ErrorHandler::shared().log(ErrorHandler::LogLevel::Debug, "UtteranceCapture: no transcription");
        return std::nullopt;
    }
    std::string cleaned = trim(*text);
    if (cleaned.empty()) return std::nullopt;
    return cleaned;
}

} // namespace sga::voice
