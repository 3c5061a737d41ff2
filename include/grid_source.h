#ifndef GRID_SOURCE_H
#define GRID_SOURCE_H

#include "forecast_cycle.h"
#include "pipeline_config.h"

#include <cstddef>
#include <string>
#include <vector>

/*!
    Wind components for one forecast hour on a lat/lon lattice. u and v are
    row-major, lats.size() rows by lons.size() columns; NaN marks a missing
    value.
*/
struct GridFrame
{
    int                     forecastHour    =   0;
    std :: vector<double>   lats;
    std :: vector<double>   lons;
    std :: vector<double>   u;
    std :: vector<double>   v;

    std :: size_t cellCount() const
    {
        return lats.size() * lons.size();
    }
};

/*!
    Opaque source of raw forecast grids. fetchGrid throws SourceUnavailable
    when it cannot supply the requested cycle; it never retries.
*/
class GridSource
{
    public:
        virtual ~GridSource() = default;

        virtual std :: vector<GridFrame> fetchGrid( const ForecastCycle& cycle ) = 0;
};

/*!
    Reads one NetCDF file per cycle, <rawDataDir>/gfs_<date>_<cycle>.nc,
    laid out as

        dimensions: time, lat, lon
        int    forecast_hour( time )
        double lat( lat ), lon( lon )
        float  u100( time, lat, lon ), v100( time, lat, lon )   [ m/s, 100 m ]

    Only the configured forecast hours and the cells inside the configured
    bounds are returned. Values equal to _FillValue come back as NaN.
*/
class NetCDFGridSource : public GridSource
{
    public:
        NetCDFGridSource( const std :: string& rawDataDir,
                          const GeoBounds& bounds,
                          const std :: vector<int>& forecastHours );

        std :: vector<GridFrame> fetchGrid( const ForecastCycle& cycle ) override;

        std :: string pathFor( const ForecastCycle& cycle ) const;

    private:
        const std :: string         rawDataDir_;
        const GeoBounds             bounds_;
        const std :: vector<int>    forecastHours_;
};

#endif
