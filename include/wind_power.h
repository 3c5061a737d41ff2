#ifndef WIND_POWER_H
#define WIND_POWER_H

#include <optional>

// standard sea-level air density, kg/m3
constexpr double kAirDensity    =   1.225;

// horizontal wind speed from u and v components, nullopt if either is missing
std :: optional<double> windSpeed                   ( double u, double v );

/*!
    Wind power density in W/m2: 0.5 * rho * |v|^3.
    Missing, NaN or infinite input yields nullopt, never an exception; callers
    store it as NULL and every average skips it.
*/
std :: optional<double> windPowerDensity            ( double u, double v, double airDensity = kAirDensity );

std :: optional<double> windPowerDensityFromSpeed   ( double speed, double airDensity = kAirDensity );

#endif
