/**
 * @file AlsaDriver.cpp
 * @brief Linux ALSA implementation of the AudioDriver interface.
 */

#include "AlsaDriver.hpp"
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <iostream>
#include <memory>
#include <span>
#include <utility>
#include <pthread.h>

namespace voicegraph::hal {

namespace {

using HwParamsPtr = std::unique_ptr<snd_pcm_hw_params_t, decltype(&snd_pcm_hw_params_free)>;

constexpr double S32_SCALE = 2147483647.0;

} // namespace

AlsaDriver::AlsaDriver(int sample_rate, int block_size, int num_channels, const std::string& device,
                       AudioLogger* telemetry)
    : pcm_handle_(nullptr)
    , device_name_(device)
    , sample_rate_(sample_rate)
    , block_size_(block_size)
    , num_channels_(num_channels)
    , telemetry_(telemetry)
    , running_(false)
{
    // Buffers are sized after PCM setup
}

AlsaDriver::~AlsaDriver() {
    stop();
}

void AlsaDriver::set_callback(AudioCallback callback) {
    callback_ = std::move(callback);
}

bool AlsaDriver::start() {
    if (running_) return true;

    if (!callback_) {
        std::cerr << "ALSA: No callback set before start()" << std::endl;
        return false;
    }

    if (!setup_pcm()) {
        close_pcm();
        return false;
    }

    running_ = true;
    processing_thread_ = std::thread(&AlsaDriver::thread_loop, this);

    return true;
}

void AlsaDriver::stop() {
    running_ = false;
    if (processing_thread_.joinable()) {
        processing_thread_.join();
    }
    close_pcm();
}

void AlsaDriver::close_pcm() {
    if (pcm_handle_) {
        snd_pcm_drop(pcm_handle_);
        snd_pcm_close(pcm_handle_);
        pcm_handle_ = nullptr;
    }
}

bool AlsaDriver::setup_pcm() {
    int err;

    if ((err = snd_pcm_open(&pcm_handle_, device_name_.c_str(), SND_PCM_STREAM_PLAYBACK, 0)) < 0) {
        std::cerr << "ALSA: Cannot open audio device " << device_name_ << " (" << snd_strerror(err) << ")" << std::endl;
        pcm_handle_ = nullptr;
        return false;
    }

    snd_pcm_hw_params_t* raw_params = nullptr;
    if ((err = snd_pcm_hw_params_malloc(&raw_params)) < 0) {
        std::cerr << "ALSA: Cannot allocate hardware parameter structure (" << snd_strerror(err) << ")" << std::endl;
        return false;
    }
    HwParamsPtr hw_params(raw_params, &snd_pcm_hw_params_free);

    if ((err = snd_pcm_hw_params_any(pcm_handle_, hw_params.get())) < 0) {
        std::cerr << "ALSA: Cannot initialize hardware parameter structure (" << snd_strerror(err) << ")" << std::endl;
        return false;
    }

    if ((err = snd_pcm_hw_params_set_access(pcm_handle_, hw_params.get(), SND_PCM_ACCESS_RW_INTERLEAVED)) < 0) {
        std::cerr << "ALSA: Cannot set access type (" << snd_strerror(err) << ")" << std::endl;
        return false;
    }

    if ((err = snd_pcm_hw_params_set_format(pcm_handle_, hw_params.get(), SND_PCM_FORMAT_S32_LE)) < 0) {
        std::cerr << "ALSA: Cannot set sample format S32_LE (" << snd_strerror(err) << ")" << std::endl;
        return false;
    }

    unsigned int rate = static_cast<unsigned int>(sample_rate_);
    if ((err = snd_pcm_hw_params_set_rate_near(pcm_handle_, hw_params.get(), &rate, nullptr)) < 0) {
        std::cerr << "ALSA: Cannot set sample rate (" << snd_strerror(err) << ")" << std::endl;
        return false;
    }
    sample_rate_ = static_cast<int>(rate);

    unsigned int channels = static_cast<unsigned int>(num_channels_);
    if ((err = snd_pcm_hw_params_set_channels_near(pcm_handle_, hw_params.get(), &channels)) < 0) {
        std::cerr << "ALSA: Cannot set channel count (" << snd_strerror(err) << ")" << std::endl;
        return false;
    }
    num_channels_ = static_cast<int>(channels);

    snd_pcm_uframes_t frames = static_cast<snd_pcm_uframes_t>(block_size_);
    if ((err = snd_pcm_hw_params_set_period_size_near(pcm_handle_, hw_params.get(), &frames, nullptr)) < 0) {
        std::cerr << "ALSA: Cannot set period size (" << snd_strerror(err) << ")" << std::endl;
        return false;
    }
    block_size_ = static_cast<int>(frames);

    unsigned int periods = 4;
    if ((err = snd_pcm_hw_params_set_periods_near(pcm_handle_, hw_params.get(), &periods, nullptr)) < 0) {
        std::cerr << "ALSA: Cannot set period count, using device default (" << snd_strerror(err) << ")" << std::endl;
    }

    if ((err = snd_pcm_hw_params(pcm_handle_, hw_params.get())) < 0) {
        std::cerr << "ALSA: Cannot set parameters (" << snd_strerror(err) << ")" << std::endl;
        return false;
    }

    mono_buffer_.assign(static_cast<size_t>(block_size_), 0.0f);
    interleaved_buffer_.assign(static_cast<size_t>(block_size_ * num_channels_), 0);

    if ((err = snd_pcm_prepare(pcm_handle_)) < 0) {
        std::cerr << "ALSA: Cannot prepare audio interface for use (" << snd_strerror(err) << ")" << std::endl;
        return false;
    }

    std::cout << "ALSA: " << device_name_ << " @ " << sample_rate_ << " Hz, "
              << block_size_ << " frames, " << num_channels_ << " ch" << std::endl;
    return true;
}

void AlsaDriver::thread_loop() {
    // Set Real-Time Priority (SCHED_FIFO, Priority 80)
    struct sched_param param;
    param.sched_priority = 80;
    const int res = pthread_setschedparam(pthread_self(), SCHED_FIFO, &param);
    if (telemetry_) {
        if (res == 0) {
            telemetry_->log_message("ALSA", "Real-Time Priority Set (SCHED_FIFO, 80)");
        } else if (res == EPERM) {
            telemetry_->log_message("ALSA", "Priority Failed: EPERM (Need ulimit -r 80+)");
        } else {
            telemetry_->log_message("ALSA", "Priority Failed: Unknown Error");
        }
    }

    const size_t channels = static_cast<size_t>(num_channels_);

    while (running_) {
        const auto start_time = std::chrono::steady_clock::now();

        callback_(std::span<float>(mono_buffer_));

        const auto end_time = std::chrono::steady_clock::now();
        if (telemetry_) {
            const auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end_time - start_time).count();
            telemetry_->log_event("PROC_US", static_cast<float>(duration));
        }

        // Interleave and convert to S32_LE
        for (size_t i = 0; i < mono_buffer_.size(); ++i) {
            const float sample = std::clamp(mono_buffer_[i], -1.0f, 1.0f);
            const auto s32 = static_cast<int32_t>(static_cast<double>(sample) * S32_SCALE);
            for (size_t ch = 0; ch < channels; ++ch) {
                interleaved_buffer_[i * channels + ch] = s32;
            }
        }

        const snd_pcm_sframes_t written = snd_pcm_writei(pcm_handle_, interleaved_buffer_.data(),
                                                         static_cast<snd_pcm_uframes_t>(block_size_));
        if (written < 0) {
            recover_pcm(static_cast<int>(written));
        }
    }
}

void AlsaDriver::recover_pcm(int err) {
    if (telemetry_) {
        telemetry_->log_event("XRUN", static_cast<float>(err));
    }
    if (err == -EPIPE) {
        snd_pcm_prepare(pcm_handle_);
    } else if (err == -ESTRPIPE) {
        while ((err = snd_pcm_resume(pcm_handle_)) == -EAGAIN)
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        if (err < 0) {
            snd_pcm_prepare(pcm_handle_);
        }
    }
}

} // namespace voicegraph::hal
