#include "rtvoice/audio/engine.hpp"

#include "rtvoice/logging.hpp"

namespace rtvoice::audio {

AudioEngine::AudioEngine(const Config& config)
    : config_(config),
      mixer_(config.audio_sample_rate, config.stream_sample_rate) {}

AudioEngine::~AudioEngine() {
    stop();
}

void AudioEngine::start() {
    if (endpoint_) {
        return;
    }
    try {
        init_endpoint();
        attach_port();
    } catch (const pj::Error& ex) {
        logging::error(
            "Audio engine start failed",
            {kv("reason", ex.reason),
             kv("status", ex.status)});
        stop();
        throw PlaybackError("Audio engine start failed: " + ex.info());
    }
    logging::info(
        "Audio engine started",
        {kv("sample_rate", config_.audio_sample_rate),
         kv("frame_usec", config_.frame_time_usec),
         kv("null_device", config_.audio_null_device)});
}

void AudioEngine::init_endpoint() {
    endpoint_ = std::make_unique<pj::Endpoint>();
    endpoint_->libCreate();

    pj::EpConfig ep_cfg;
    ep_cfg.uaConfig.threadCnt = 1;
    ep_cfg.uaConfig.mainThreadOnly = false;
    ep_cfg.medConfig.clockRate = static_cast<unsigned>(config_.audio_sample_rate);
    ep_cfg.medConfig.sndClockRate = static_cast<unsigned>(config_.audio_sample_rate);
    ep_cfg.medConfig.channelCount = 1;
    ep_cfg.medConfig.audioFramePtime =
        static_cast<unsigned>(config_.frame_time_usec / 1000);
    ep_cfg.medConfig.sndAutoCloseTime = -1;
    ep_cfg.logConfig.level = static_cast<unsigned>(config_.audio_log_level);
    ep_cfg.logConfig.consoleLevel = static_cast<unsigned>(config_.audio_log_level);
    endpoint_->libInit(ep_cfg);

    if (config_.audio_null_device) {
        endpoint_->audDevManager().setNullDev();
    }
    endpoint_->libStart();
}

void AudioEngine::attach_port() {
    pj::MediaFormatAudio format;
    format.type = PJMEDIA_TYPE_AUDIO;
    format.clockRate = static_cast<unsigned>(config_.audio_sample_rate);
    format.channelCount = 1;
    format.bitsPerSample = 16;
    format.frameTimeUsec = static_cast<unsigned>(config_.frame_time_usec);

    port_ = std::make_unique<AudioMediaPort>();
    port_->createPort("rtvoice/playback", format);
    port_->set_on_frame_requested(
        [this](size_t samples) { return mixer_.render(samples); });
    port_->startTransmit(endpoint_->audDevManager().getPlaybackDevMedia());
    transmitting_ = true;
}

void AudioEngine::stop() {
    if (!endpoint_) {
        return;
    }
    if (port_) {
        port_->set_on_frame_requested(nullptr);
        if (transmitting_) {
            try {
                port_->stopTransmit(endpoint_->audDevManager().getPlaybackDevMedia());
            } catch (const pj::Error& ex) {
                logging::debug(
                    "Playback port detach failed",
                    {kv("reason", ex.reason)});
            }
            transmitting_ = false;
        }
        port_.reset();
    }
    try {
        endpoint_->libDestroy();
    } catch (const pj::Error& ex) {
        logging::warn(
            "Audio engine shutdown failed",
            {kv("reason", ex.reason),
             kv("status", ex.status)});
    }
    endpoint_.reset();
}

VoiceMixer& AudioEngine::mixer() {
    return mixer_;
}

}
