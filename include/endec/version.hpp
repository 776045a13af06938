/**
 * @file version.hpp
 * @brief Build identity reported in heartbeats and startup logs.
 */
#ifndef ENDEC_VERSION_HPP
#define ENDEC_VERSION_HPP

#define ENDEC_VERSION_MAJOR 1
#define ENDEC_VERSION_MINOR 0
#define ENDEC_VERSION_PATCH 0
#define ENDEC_VERSION_STRING "1.0.0"

namespace endec {

static constexpr const char* APP_NAME = "endec-relay";
static constexpr const char* APP_VERSION = ENDEC_VERSION_STRING;

} // namespace endec

#endif // ENDEC_VERSION_HPP
