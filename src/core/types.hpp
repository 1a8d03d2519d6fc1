#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>

#include <cstdint>

namespace meridian
{
    // Precision aliases
    using f32 = float;
    using f64 = double;
    using u8  = uint8_t;
    using u16 = uint16_t;
    using u32 = uint32_t;
    using u64 = uint64_t;
    using i32 = int32_t;
    using i64 = int64_t;

    // Vector types (double precision for geodesy)
    using Vec2d = glm::dvec2;
    using Vec3d = glm::dvec3;

    // Geodetic constants
    namespace geo_constants
    {
        constexpr f64 kPi             = glm::pi<f64>();
        constexpr f64 kDegToRad       = kPi / 180.0;
        constexpr f64 kRadToDeg       = 180.0 / kPi;
        constexpr f64 kEarthRadiusKm  = 6371.0088;   // IUGG mean Earth radius
    }

    // Civil time constants
    namespace time_constants
    {
        constexpr i32 kSecondsPerHour   = 3600;
        constexpr i32 kSecondsPerDay    = 86400;
        constexpr i32 kMaxOffsetSeconds = 18 * kSecondsPerHour;
        constexpr f64 kUnixEpochJd      = 2440587.5;  // 1970-01-01 00:00 UTC
    }
}
