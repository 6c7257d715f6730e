/**
 * @file backdrop_sdk.h
 * @brief BackdropSDK - Main header file
 *
 * Real-time depth matting, background replacement and hue substitution SDK
 *
 * @version 0.1.0
 * @copyright 2026
 */

#ifndef BACKDROP_SDK_H
#define BACKDROP_SDK_H

// Version info
#define BACKDROP_SDK_VERSION_MAJOR 0
#define BACKDROP_SDK_VERSION_MINOR 1
#define BACKDROP_SDK_VERSION_PATCH 0
#define BACKDROP_SDK_VERSION_STRING "0.1.0"

#include "backdrop_sdk/types.h"
#include "backdrop_sdk/pipeline_state.h"
#include "backdrop_sdk/frame_processor.h"
#include "backdrop_sdk/frame_worker.h"
#include "backdrop_sdk/background_loader.h"

namespace backdrop_sdk {

/**
 * @brief Get SDK version string
 * @return Version string (e.g., "0.1.0")
 */
const char* get_version();

} // namespace backdrop_sdk

#endif // BACKDROP_SDK_H
