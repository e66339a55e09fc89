/**
 * @file chunked_upload.h
 * @brief Main header for the chunked_upload library
 * @version 0.1.0
 *
 * This is the primary include file for the chunked_upload library.
 * Include this header to access all upload functionality.
 *
 * @code
 * #include <kcenon/chunked_upload/chunked_upload.h>
 *
 * using namespace kcenon::chunked_upload;
 *
 * auto uploader = chunked_uploader::builder()
 *     .with_resource_key("PROJ-123")
 *     .with_credentials(user, token)
 *     .build();
 *
 * auto summary = uploader.value().upload("/path/to/file.bin");
 * @endcode
 */

#ifndef KCENON_CHUNKED_UPLOAD_CHUNKED_UPLOAD_H
#define KCENON_CHUNKED_UPLOAD_CHUNKED_UPLOAD_H

#include <cstdint>
#include <string>

// Core types
#include "kcenon/chunked_upload/core/types.h"
#include "kcenon/chunked_upload/core/chunk_planner.h"
#include "kcenon/chunked_upload/core/content_address.h"
#include "kcenon/chunked_upload/core/logging.h"

// Transport
#include "kcenon/chunked_upload/transport/retry_policy.h"
#include "kcenon/chunked_upload/transport/transport_client.h"

// Upload
#include "kcenon/chunked_upload/upload/upload_session.h"
#include "kcenon/chunked_upload/upload/chunk_dispatcher.h"
#include "kcenon/chunked_upload/upload/chunked_uploader.h"

// Adapters
#include "kcenon/chunked_upload/adapters/thread_pool_adapter.h"

namespace kcenon::chunked_upload {

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

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_CHUNKED_UPLOAD_H
