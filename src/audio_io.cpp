#include "audio_io.h"
#include "logger.h"
#include <portaudio.h>
#include <algorithm>
#include <atomic>
#include <cstring>
#include <deque>
#include <mutex>
#include <sstream>
#include <vector>

namespace calcvox {

namespace {

std::string pa_error(PaError err) {
    return std::string(Pa_GetErrorText(err));
}

/// Resolve "default", a numeric index or an exact device name. Requires Pa_Initialize().
int find_device(const std::string& name, bool is_input) {
    int num_devices = Pa_GetDeviceCount();

    if (name == "default" || name.empty()) {
        int default_idx = is_input ? Pa_GetDefaultInputDevice() : Pa_GetDefaultOutputDevice();
        if (default_idx != paNoDevice) {
            const PaDeviceInfo* info = Pa_GetDeviceInfo(default_idx);
            std::ostringstream oss;
            oss << "Using default " << (is_input ? "input" : "output")
                << " device: [" << default_idx << "] " << (info ? info->name : "?");
            LOG_AUDIO(oss.str());
        }
        return default_idx == paNoDevice ? -1 : default_idx;
    }

    try {
        size_t consumed = 0;
        int device_idx = std::stoi(name, &consumed);
        if (consumed == name.size() && device_idx >= 0 && device_idx < num_devices) {
            return device_idx;
        }
    } catch (const std::exception&) {
        // Not a number, continue to name matching
    }

    for (int i = 0; i < num_devices; i++) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (!info || name != info->name) {
            continue;
        }
        int channels = is_input ? info->maxInputChannels : info->maxOutputChannels;
        if (channels > 0) {
            return i;
        }
    }
    return -1;
}

/// Opens a mono float32 stream on the named device. Terminates PortAudio on failure.
Result<PaStream*> open_stream(const std::string& device, bool is_input, int sample_rate,
                              unsigned long frames_per_buffer, PaStreamCallback* callback,
                              void* user_data) {
    PaError err = Pa_Initialize();
    if (err != paNoError) {
        return make_device_error("PortAudio init error: " + pa_error(err));
    }

    int idx = find_device(device, is_input);
    const PaDeviceInfo* info = idx >= 0 ? Pa_GetDeviceInfo(idx) : nullptr;
    if (!info) {
        Pa_Terminate();
        return make_device_error(std::string(is_input ? "Input" : "Output") + " device not found: " + device);
    }
    if ((is_input ? info->maxInputChannels : info->maxOutputChannels) < 1) {
        Pa_Terminate();
        return make_device_error("Device '" + std::string(info->name) + "' has no " +
                                 (is_input ? "input" : "output") + " channels");
    }

    PaStreamParameters params;
    params.device = idx;
    params.channelCount = AUDIO_CHANNELS;
    params.sampleFormat = paFloat32;
    params.suggestedLatency = is_input ? info->defaultLowInputLatency : info->defaultLowOutputLatency;
    params.hostApiSpecificStreamInfo = nullptr;

    PaStream* stream = nullptr;
    err = Pa_OpenStream(&stream,
                        is_input ? &params : nullptr,
                        is_input ? nullptr : &params,
                        sample_rate, frames_per_buffer, paClipOff, callback, user_data);
    if (err != paNoError) {
        Pa_Terminate();
        return make_device_error("Failed to open " + std::string(is_input ? "input" : "output") +
                                 " stream: " + pa_error(err));
    }

    err = Pa_StartStream(stream);
    if (err != paNoError) {
        std::ostringstream oss;
        oss << "Failed to start " << (is_input ? "input" : "output") << " stream: " << pa_error(err);
        if (is_input && err == paUnanticipatedHostError) {
            oss << " (check microphone permission)";
        }
        Pa_CloseStream(stream);
        Pa_Terminate();
        return make_device_error(oss.str());
    }

    std::ostringstream oss;
    oss << "Opened " << (is_input ? "input" : "output") << " device [" << idx << "] "
        << info->name << " @ " << sample_rate << " Hz";
    Logger::info(oss.str());
    return stream;
}

// =============================================================================
// Input
// =============================================================================

class PortAudioInput : public AudioInput {
public:
    explicit PortAudioInput(int sample_rate)
        : stream_(nullptr), sample_rate_(sample_rate), tracks_live_(false), dropped_frames_(0) {}

    ~PortAudioInput() override {
        close();
    }

    VoidResult open(const AudioConfig& config) {
        auto stream = open_stream(config.input_device, true, config.input_sample_rate,
                                  static_cast<unsigned long>(config.capture_frame_samples),
                                  &PortAudioInput::input_callback, this);
        if (!stream) {
            return stream.error();
        }
        stream_ = stream.value();
        tracks_live_ = true;
        return {};
    }

    bool read_frame(FloatFrame& frame) override {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (queue_.empty()) {
            return false;
        }
        frame = std::move(queue_.front());
        queue_.pop_front();
        return true;
    }

    void stop_tracks() override {
        if (!stream_ || !tracks_live_) {
            return;
        }
        tracks_live_ = false;
        PaError err = Pa_StopStream(stream_);
        if (err != paNoError) {
            Logger::warn("Failed to stop input stream: " + pa_error(err));
        }
        if (dropped_frames_ > 0) {
            LOG_CAPTURE("Input queue overflowed " + std::to_string(dropped_frames_.load()) + " times");
        }
    }

    void close() override {
        stop_tracks();
        if (stream_) {
            PaError err = Pa_CloseStream(stream_);
            if (err != paNoError) {
                Logger::warn("Failed to close input stream: " + pa_error(err));
            }
            stream_ = nullptr;
            Pa_Terminate();
        }
        std::lock_guard<std::mutex> lock(queue_mutex_);
        queue_.clear();
    }

    int sample_rate() const override { return sample_rate_; }

private:
    static int input_callback(const void* input, void* output,
                              unsigned long frame_count,
                              const PaStreamCallbackTimeInfo* time_info,
                              PaStreamCallbackFlags status_flags,
                              void* user_data) {
        (void)output;
        (void)time_info;
        (void)status_flags;
        auto* self = static_cast<PortAudioInput*>(user_data);
        if (!input || !self->tracks_live_) {
            return paContinue;
        }

        const float* in = static_cast<const float*>(input);
        FloatFrame frame(in, in + frame_count);

        std::lock_guard<std::mutex> lock(self->queue_mutex_);
        if (self->queue_.size() >= INPUT_QUEUE_MAX_FRAMES) {
            self->queue_.pop_front();
            self->dropped_frames_++;
        }
        self->queue_.push_back(std::move(frame));
        return paContinue;
    }

    PaStream* stream_;
    int sample_rate_;
    std::atomic<bool> tracks_live_;
    std::atomic<size_t> dropped_frames_;

    std::mutex queue_mutex_;
    std::deque<FloatFrame> queue_;
};

// =============================================================================
// Output
// =============================================================================

class PortAudioOutput : public AudioOutput {
public:
    explicit PortAudioOutput(int sample_rate)
        : stream_(nullptr), sample_rate_(sample_rate), rendered_frames_(0), next_voice_id_(1) {}

    ~PortAudioOutput() override {
        close();
    }

    VoidResult open(const AudioConfig& config) {
        auto stream = open_stream(config.output_device, false, config.output_sample_rate,
                                  paFramesPerBufferUnspecified,
                                  &PortAudioOutput::output_callback, this);
        if (!stream) {
            return stream.error();
        }
        stream_ = stream.value();
        return {};
    }

    double current_time() const override {
        return static_cast<double>(rendered_frames_.load()) / static_cast<double>(sample_rate_);
    }

    int sample_rate() const override { return sample_rate_; }

    Result<PlaybackVoiceId> schedule(FloatBuffer samples, double start_at,
                                     EndedCallback on_ended) override {
        if (!stream_) {
            return make_error(ErrorType::InvalidArgument, "output device is closed");
        }
        Voice voice;
        voice.id = next_voice_id_++;
        voice.start_frame = static_cast<int64_t>(start_at * sample_rate_ + 0.5);
        voice.samples = std::move(samples);
        voice.position = 0;

        PlaybackVoiceId id = voice.id;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            voices_.push_back(std::move(voice));
        }
        callbacks_.emplace_back(id, std::move(on_ended));
        return id;
    }

    void stop(PlaybackVoiceId voice) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            voices_.erase(std::remove_if(voices_.begin(), voices_.end(),
                                         [voice](const Voice& v) { return v.id == voice; }),
                          voices_.end());
            finished_.erase(std::remove(finished_.begin(), finished_.end(), voice), finished_.end());
        }
        drop_callback(voice);
    }

    void dispatch_completions() override {
        std::vector<PlaybackVoiceId> done;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            done.swap(finished_);
        }
        for (PlaybackVoiceId id : done) {
            auto it = std::find_if(callbacks_.begin(), callbacks_.end(),
                                   [id](const auto& entry) { return entry.first == id; });
            if (it == callbacks_.end()) {
                continue;
            }
            EndedCallback cb = std::move(it->second);
            callbacks_.erase(it);
            if (cb) {
                cb();
            }
        }
    }

    void close() override {
        if (stream_) {
            PaError err = Pa_StopStream(stream_);
            if (err != paNoError) {
                Logger::warn("Failed to stop output stream: " + pa_error(err));
            }
            err = Pa_CloseStream(stream_);
            if (err != paNoError) {
                Logger::warn("Failed to close output stream: " + pa_error(err));
            }
            stream_ = nullptr;
            Pa_Terminate();
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            voices_.clear();
            finished_.clear();
        }
        callbacks_.clear();
    }

private:
    struct Voice {
        PlaybackVoiceId id = 0;
        int64_t start_frame = 0;
        FloatBuffer samples;
        size_t position = 0;
    };

    void drop_callback(PlaybackVoiceId id) {
        callbacks_.erase(std::remove_if(callbacks_.begin(), callbacks_.end(),
                                        [id](const auto& entry) { return entry.first == id; }),
                         callbacks_.end());
    }

    static int output_callback(const void* input, void* output,
                               unsigned long frame_count,
                               const PaStreamCallbackTimeInfo* time_info,
                               PaStreamCallbackFlags status_flags,
                               void* user_data) {
        (void)input;
        (void)time_info;
        (void)status_flags;
        auto* self = static_cast<PortAudioOutput*>(user_data);
        float* out = static_cast<float*>(output);
        std::memset(out, 0, frame_count * sizeof(float));

        const int64_t block_start = self->rendered_frames_.load();
        const int64_t block_end = block_start + static_cast<int64_t>(frame_count);

        {
            std::lock_guard<std::mutex> lock(self->mutex_);
            for (auto it = self->voices_.begin(); it != self->voices_.end();) {
                Voice& v = *it;
                // A voice scheduled in the past starts at the head of this block
                int64_t from = std::max(block_start, v.start_frame);
                if (from < block_end) {
                    size_t offset = static_cast<size_t>(from - block_start);
                    size_t count = std::min(static_cast<size_t>(block_end - from),
                                            v.samples.size() - v.position);
                    for (size_t i = 0; i < count; ++i) {
                        out[offset + i] += v.samples[v.position + i];
                    }
                    v.position += count;
                }
                if (v.position >= v.samples.size()) {
                    self->finished_.push_back(v.id);
                    it = self->voices_.erase(it);
                } else {
                    ++it;
                }
            }
        }

        self->rendered_frames_.store(block_end);
        return paContinue;
    }

    PaStream* stream_;
    int sample_rate_;
    std::atomic<int64_t> rendered_frames_;
    PlaybackVoiceId next_voice_id_;

    // Shared with the audio thread
    std::mutex mutex_;
    std::vector<Voice> voices_;
    std::vector<PlaybackVoiceId> finished_;

    // Event loop only
    std::vector<std::pair<PlaybackVoiceId, EndedCallback>> callbacks_;
};

} // namespace

Result<std::unique_ptr<AudioInput>> PortAudioDeviceFactory::open_input(const AudioConfig& config) {
    auto input = std::make_unique<PortAudioInput>(config.input_sample_rate);
    auto opened = input->open(config);
    if (!opened) {
        return opened.error();
    }
    return std::unique_ptr<AudioInput>(std::move(input));
}

Result<std::unique_ptr<AudioOutput>> PortAudioDeviceFactory::open_output(const AudioConfig& config) {
    auto output = std::make_unique<PortAudioOutput>(config.output_sample_rate);
    auto opened = output->open(config);
    if (!opened) {
        return opened.error();
    }
    return std::unique_ptr<AudioOutput>(std::move(output));
}

void PortAudioDeviceFactory::list_devices() {
    PaError err = Pa_Initialize();
    if (err != paNoError) {
        Logger::error("PortAudio init error: " + pa_error(err));
        return;
    }

    int num_devices = Pa_GetDeviceCount();
    Logger::info("Available audio devices:");

    for (int i = 0; i < num_devices; i++) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (!info) continue;
        std::ostringstream oss;
        oss << "  [" << i << "] " << info->name;
        if (info->maxInputChannels > 0) oss << " (IN:" << info->maxInputChannels << ")";
        if (info->maxOutputChannels > 0) oss << " (OUT:" << info->maxOutputChannels << ")";
        oss << " default rate " << info->defaultSampleRate;
        Logger::info(oss.str());
    }

    Pa_Terminate();
}

} // namespace calcvox
