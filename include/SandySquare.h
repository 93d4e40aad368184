#pragma once

#include <algorithm>
#include <cmath>
#include <limits>

// Safe operating rectangle in (Z, Sigma) space.
struct SandySquare {
    static constexpr double kDefaultZMin = 0.30;
    static constexpr double kDefaultZMax = 0.90;
    static constexpr double kDefaultSigmaMin = 0.15;
    static constexpr double kDefaultSigmaMax = 0.85;

    double zMin = kDefaultZMin;
    double zMax = kDefaultZMax;
    double sigmaMin = kDefaultSigmaMin;
    double sigmaMax = kDefaultSigmaMax;

    /**
     * @brief Signed distance to the nearest wall.
     * @post Negative when (z, sigma) lies outside the rectangle on either axis.
     */
    double distanceToWall(double z, double sigma) const {
        if (std::isnan(z) || std::isnan(sigma)) return std::numeric_limits<double>::quiet_NaN();
        return std::min({z - zMin, zMax - z, sigma - sigmaMin, sigmaMax - sigma});
    }

    bool contains(double z, double sigma) const {
        return z >= zMin && z <= zMax && sigma >= sigmaMin && sigma <= sigmaMax;
    }
};
