/**
 * AudioOutput.hpp - PortAudio playback stream
 *
 * One output-only stream fed from an in-memory playback buffer. The stream
 * completes when the buffer drains and restarts when more samples arrive.
 * PortAudio itself must already be initialized by the caller.
 */

#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace ttsr::audio {

struct OutputConfig {
    int sample_rate = 22050;
    int channels = 1;
    int frames_per_buffer = 512;
    int output_device = -1;  // -1 = default
};

class AudioOutput {
public:
    explicit AudioOutput(const OutputConfig& config = {});
    ~AudioOutput();

    AudioOutput(const AudioOutput&) = delete;
    AudioOutput& operator=(const AudioOutput&) = delete;

    /**
     * Open the output stream. Playback starts on the first queued samples.
     */
    bool open();

    /**
     * Stop immediately and close, discarding anything not yet played.
     * The drained callback does not fire for an aborted stream.
     */
    void abort();

    /**
     * Append samples and (re)start the stream if it is idle.
     */
    bool queuePlayback(const float* samples, size_t count);

    bool isPlaying() const;

    /**
     * Called from PortAudio's thread whenever the queued samples have
     * played out.
     */
    void setDrainedCallback(std::function<void()> callback);

    std::string lastError() const;

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl_;
    OutputConfig config_;
};

} // namespace ttsr::audio
