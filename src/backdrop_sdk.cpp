/**
 * @file backdrop_sdk.cpp
 * @brief SDK 버전 정보
 */

#include "backdrop_sdk.h"

namespace backdrop_sdk {

const char* get_version() {
    return BACKDROP_SDK_VERSION_STRING;
}

} // namespace backdrop_sdk
