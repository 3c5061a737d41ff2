#include "wind_power.h"

#include <cmath>

std :: optional<double> windSpeed( double u, double v )
{
    if( !std :: isfinite( u ) || !std :: isfinite( v ) )
        return std :: nullopt;

    return std :: sqrt( u * u + v * v );
}

std :: optional<double> windPowerDensity( double u, double v, double airDensity )
{
    auto speed = windSpeed( u, v );
    if( !speed )
        return std :: nullopt;

    return windPowerDensityFromSpeed( *speed, airDensity );
}

std :: optional<double> windPowerDensityFromSpeed( double speed, double airDensity )
{
    if( !std :: isfinite( speed ) || !std :: isfinite( airDensity ) || speed < 0.0 )
        return std :: nullopt;

    return 0.5 * airDensity * speed * speed * speed;
}
