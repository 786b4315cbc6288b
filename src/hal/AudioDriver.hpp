/**
 * @file AudioDriver.hpp
 * @brief Abstract base class for platform audio output drivers.
 *
 * Hardware code lives here and in the platform subdirectories only; the
 * voicegraph core never includes it.
 */

#ifndef VOICEGRAPH_HAL_AUDIO_DRIVER_HPP
#define VOICEGRAPH_HAL_AUDIO_DRIVER_HPP

#include <functional>
#include <span>

namespace voicegraph::hal {

/**
 * @brief Callback-driven audio output.
 *
 * The driver owns the real-time thread and asks the callback for one mono
 * block per hardware period, then fans it out to the device channels.
 */
class AudioDriver {
public:
    /**
     * @brief Mono render callback, invoked on the driver's real-time thread.
     */
    using AudioCallback = std::function<void(std::span<float> output)>;

    virtual ~AudioDriver() = default;

    /**
     * @brief Open the device and start the real-time thread.
     *
     * @return true if successfully started, false otherwise.
     */
    virtual bool start() = 0;

    /**
     * @brief Stop the thread and close the device.
     */
    virtual void stop() = 0;

    /**
     * @brief Set the render callback. Call before start().
     */
    virtual void set_callback(AudioCallback callback) = 0;

    /**
     * @brief Sample rate actually granted by the device (valid after start()).
     */
    virtual int sample_rate() const = 0;

    /**
     * @brief Frames per period actually granted by the device.
     */
    virtual int block_size() const = 0;
};

} // namespace voicegraph::hal

#endif // VOICEGRAPH_HAL_AUDIO_DRIVER_HPP
