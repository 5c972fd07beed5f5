// ProctorSFU - Exam Proctoring Media Server
// Main header file

#ifndef PROCTORSFU_PROCTORSFU_HPP
#define PROCTORSFU_PROCTORSFU_HPP

/**
 * @file proctorsfu.hpp
 * @brief Main header file for the ProctorSFU library
 *
 * ProctorSFU is the session-orchestration core of an exam-proctoring
 * selective forwarding unit. Students publish screen, webcam and microphone
 * tracks; invigilators and admins consume them according to the role
 * hierarchy; student tracks are recorded to disk through an external
 * encoder process.
 */

// Version information
#define PROCTORSFU_VERSION_MAJOR 0
#define PROCTORSFU_VERSION_MINOR 1
#define PROCTORSFU_VERSION_PATCH 0
#define PROCTORSFU_VERSION_STRING "0.1.0"

// Core types
#include "proctorsfu/core/result.hpp"
#include "proctorsfu/core/error_codes.hpp"
#include "proctorsfu/core/types.hpp"

// Server
#include "proctorsfu/api/proctor_server.hpp"

namespace proctorsfu {

/**
 * @brief Library version in "major.minor.patch" form.
 */
inline const char* version() {
    return PROCTORSFU_VERSION_STRING;
}

inline int versionMajor() {
    return PROCTORSFU_VERSION_MAJOR;
}

inline int versionMinor() {
    return PROCTORSFU_VERSION_MINOR;
}

inline int versionPatch() {
    return PROCTORSFU_VERSION_PATCH;
}

} // namespace proctorsfu

#endif // PROCTORSFU_PROCTORSFU_HPP
