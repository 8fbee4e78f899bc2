/**
 * AudioOutput.cpp - PortAudio output stream implementation
 *
 * The stream runs only while there is something to play: the callback
 * returns paComplete once the buffer is drained, and queuePlayback()
 * restarts it.
 */

#include "ttsr/audio/AudioOutput.hpp"

#include <portaudio.h>

#include <algorithm>
#include <atomic>
#include <cstring>
#include <iostream>
#include <mutex>
#include <vector>

namespace ttsr::audio {

struct AudioOutputImpl {
    PaStream* stream = nullptr;
    int channels = 1;

    mutable std::mutex bufferMutex;
    std::vector<float> buffer;
    size_t readPos = 0;
    bool idle = true;
    std::atomic<bool> aborted{false};

    std::mutex callbackMutex;
    std::function<void()> drainedCallback;

    mutable std::mutex errorMutex;
    std::string lastError;

    void clearPlayback() {
        std::lock_guard<std::mutex> lock(bufferMutex);
        buffer.clear();
        readPos = 0;
        idle = true;
    }

    void setError(const std::string& err) {
        std::lock_guard<std::mutex> lock(errorMutex);
        lastError = err;
        std::cerr << "[AudioOutput] " << err << std::endl;
    }
};

struct AudioOutput::Impl : public AudioOutputImpl {};

/**
 * PortAudio callback for the output stream
 */
static int outputCallback(
    const void* input,
    void* output,
    unsigned long frameCount,
    const PaStreamCallbackTimeInfo* timeInfo,
    PaStreamCallbackFlags statusFlags,
    void* userData
) {
    (void)input;
    (void)timeInfo;
    (void)statusFlags;

    auto* impl = static_cast<AudioOutputImpl*>(userData);
    float* out = static_cast<float*>(output);
    const size_t wanted = frameCount * static_cast<size_t>(impl->channels);

    std::lock_guard<std::mutex> lock(impl->bufferMutex);

    size_t available = impl->buffer.size() - impl->readPos;
    size_t n = std::min(wanted, available);
    if (n > 0) {
        std::memcpy(out, impl->buffer.data() + impl->readPos, n * sizeof(float));
        impl->readPos += n;
    }

    // Zero-fill if not enough data
    if (n < wanted) {
        std::memset(out + n, 0, (wanted - n) * sizeof(float));
    }

    if (impl->readPos >= impl->buffer.size()) {
        impl->buffer.clear();
        impl->readPos = 0;
        impl->idle = true;
        return paComplete;
    }
    return paContinue;
}

static void streamFinished(void* userData) {
    auto* impl = static_cast<AudioOutputImpl*>(userData);
    if (impl->aborted) {
        return;
    }
    std::lock_guard<std::mutex> lock(impl->callbackMutex);
    if (impl->drainedCallback) {
        impl->drainedCallback();
    }
}

AudioOutput::AudioOutput(const OutputConfig& config)
    : pImpl_(std::make_unique<Impl>())
    , config_(config)
{
    pImpl_->channels = config.channels;
}

AudioOutput::~AudioOutput() {
    abort();
}

bool AudioOutput::open() {
    if (pImpl_->stream) {
        return true;
    }

    PaStreamParameters outputParams;
    outputParams.device = (config_.output_device >= 0)
        ? config_.output_device
        : Pa_GetDefaultOutputDevice();

    if (outputParams.device == paNoDevice) {
        pImpl_->setError("No output device available");
        return false;
    }

    const PaDeviceInfo* info = Pa_GetDeviceInfo(outputParams.device);
    if (!info) {
        pImpl_->setError("Invalid output device " + std::to_string(outputParams.device));
        return false;
    }

    outputParams.channelCount = config_.channels;
    outputParams.sampleFormat = paFloat32;
    outputParams.suggestedLatency = info->defaultLowOutputLatency;
    outputParams.hostApiSpecificStreamInfo = nullptr;

    PaError err = Pa_OpenStream(
        &pImpl_->stream,
        nullptr,  // No input
        &outputParams,
        config_.sample_rate,
        config_.frames_per_buffer,
        paClipOff,
        outputCallback,
        static_cast<AudioOutputImpl*>(pImpl_.get())
    );

    if (err != paNoError) {
        pImpl_->stream = nullptr;
        pImpl_->setError(std::string("Pa_OpenStream (output) failed: ") + Pa_GetErrorText(err));
        return false;
    }

    err = Pa_SetStreamFinishedCallback(pImpl_->stream, streamFinished);
    if (err != paNoError) {
        pImpl_->setError(std::string("Pa_SetStreamFinishedCallback failed: ") + Pa_GetErrorText(err));
        Pa_CloseStream(pImpl_->stream);
        pImpl_->stream = nullptr;
        return false;
    }

    std::cout << "[AudioOutput] Opened " << info->name << " (sample_rate="
              << config_.sample_rate << "Hz, buffer=" << config_.frames_per_buffer
              << " frames)" << std::endl;
    return true;
}

void AudioOutput::abort() {
    if (!pImpl_->stream) {
        return;
    }

    pImpl_->aborted = true;
    if (Pa_IsStreamStopped(pImpl_->stream) == 0) {
        Pa_AbortStream(pImpl_->stream);
    }
    Pa_CloseStream(pImpl_->stream);
    pImpl_->stream = nullptr;
    pImpl_->clearPlayback();
}

bool AudioOutput::queuePlayback(const float* samples, size_t count) {
    if (!pImpl_->stream) {
        pImpl_->setError("Stream not open");
        return false;
    }
    if (count == 0) {
        return true;
    }

    bool restart = false;
    {
        std::lock_guard<std::mutex> lock(pImpl_->bufferMutex);
        pImpl_->buffer.insert(pImpl_->buffer.end(), samples, samples + count);
        restart = pImpl_->idle;
        pImpl_->idle = false;
    }

    if (!restart) {
        return true;
    }

    // A completed stream still has to be stopped before it can start again
    if (Pa_IsStreamStopped(pImpl_->stream) == 0) {
        Pa_StopStream(pImpl_->stream);
    }

    PaError err = Pa_StartStream(pImpl_->stream);
    if (err != paNoError) {
        pImpl_->setError(std::string("Pa_StartStream (output) failed: ") + Pa_GetErrorText(err));
        pImpl_->clearPlayback();
        return false;
    }
    return true;
}

bool AudioOutput::isPlaying() const {
    std::lock_guard<std::mutex> lock(pImpl_->bufferMutex);
    return !pImpl_->idle;
}

void AudioOutput::setDrainedCallback(std::function<void()> callback) {
    std::lock_guard<std::mutex> lock(pImpl_->callbackMutex);
    pImpl_->drainedCallback = std::move(callback);
}

std::string AudioOutput::lastError() const {
    std::lock_guard<std::mutex> lock(pImpl_->errorMutex);
    return pImpl_->lastError;
}

} // namespace ttsr::audio
