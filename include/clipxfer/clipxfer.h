/**
 * @file clipxfer.h
 * @brief Main header for the clipxfer library
 * @version 0.1.0
 *
 * Include this header to access all clipboard transfer functionality.
 *
 * @code
 * #include <clipxfer/clipxfer.h>
 *
 * using namespace clipxfer;
 *
 * auto channel = channel_factory::create(channel_config{});
 *
 * auto sender = sender_engine::builder()
 *     .with_chunk_size(512 * 1024)
 *     .build(*channel.value());
 *
 * auto receiver = receiver_engine::builder()
 *     .with_output_directory("/path/to/incoming")
 *     .build(*channel.value());
 * @endcode
 */

#ifndef CLIPXFER_CLIPXFER_H
#define CLIPXFER_CLIPXFER_H

#include <string>

// Core types
#include <clipxfer/core/cancellation.h>
#include <clipxfer/core/checksum.h>
#include <clipxfer/core/types.h>

// Wire format
#include <clipxfer/codec/codec.h>

// Channels
#include <clipxfer/channel/channel_factory.h>
#include <clipxfer/channel/channel_interface.h>

// Engines
#include <clipxfer/receiver/receiver_engine.h>
#include <clipxfer/sender/sender_engine.h>

namespace clipxfer {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace clipxfer

#endif  // CLIPXFER_CLIPXFER_H
