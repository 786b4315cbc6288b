/**
 * @file AlsaDriver.hpp
 * @brief Linux ALSA implementation of the AudioDriver interface.
 */

#ifndef VOICEGRAPH_HAL_ALSA_DRIVER_HPP
#define VOICEGRAPH_HAL_ALSA_DRIVER_HPP

#include <alsa/asoundlib.h>
#include <atomic>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>
#include "AudioDriver.hpp"
#include "Logger.hpp"

namespace voicegraph::hal {

/**
 * @brief ALSA playback driver.
 *
 * Writes interleaved S32_LE frames. The mono callback output is duplicated
 * to every hardware channel. The processing thread asks for SCHED_FIFO
 * priority and recovers from underruns (EPIPE) and suspends (ESTRPIPE).
 */
class AlsaDriver : public AudioDriver {
public:
    /**
     * @param sample_rate Requested sample rate.
     * @param block_size Requested period size (frames per interrupt).
     * @param num_channels Requested hardware channels (1 for mono, 2 for stereo).
     * @param device ALSA device name.
     * @param telemetry Optional sink for thread and timing events. Not owned.
     */
    AlsaDriver(int sample_rate = 48000, int block_size = 512, int num_channels = 2,
               const std::string& device = "default", AudioLogger* telemetry = nullptr);
    ~AlsaDriver() override;

    AlsaDriver(const AlsaDriver&) = delete;
    AlsaDriver& operator=(const AlsaDriver&) = delete;

    bool start() override;
    void stop() override;
    void set_callback(AudioCallback callback) override;
    int sample_rate() const override { return sample_rate_; }
    int block_size() const override { return block_size_; }
    int channels() const { return num_channels_; }

private:
    void thread_loop();
    bool setup_pcm();
    void recover_pcm(int err);
    void close_pcm();

    snd_pcm_t* pcm_handle_;
    std::string device_name_;
    int sample_rate_;
    int block_size_;
    int num_channels_;
    AudioCallback callback_;
    AudioLogger* telemetry_;
    std::atomic<bool> running_;
    std::thread processing_thread_;

    // Sized in setup_pcm(), reused by the processing thread.
    std::vector<float> mono_buffer_;
    std::vector<int32_t> interleaved_buffer_;
};

} // namespace voicegraph::hal

#endif // VOICEGRAPH_HAL_ALSA_DRIVER_HPP
