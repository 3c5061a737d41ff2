#ifndef RASTER_SNAPSHOT_H
#define RASTER_SNAPSHOT_H

#include "forecast_store.h"

#include <cmath>
#include <cstddef>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// cell size assumed along an axis that has a single coordinate ( GFS 0.25 deg )
constexpr double kDefaultGridResolution     =   0.25;

/*!
    Running arithmetic mean that skips nulls. A group that only ever saw
    nulls has no mean at all, which is different from a mean of zero.
*/
struct MeanAccumulator
{
    double          sum     =   0.0;
    std :: size_t   count   =   0;

    void add( const std :: optional<double>& value )
    {
        if( value && std :: isfinite( *value ) )
        {
            sum += *value;
            ++count;
        }
    }

    std :: optional<double> mean() const
    {
        if( count == 0 )
            return std :: nullopt;
        return sum / static_cast<double>( count );
    }
};

/*!
    Group samples by keyFn( sample ) and fold every group's
    wind_power_density into a MeanAccumulator. std :: map keeps the groups
    ordered by key, which is the order every caller wants them in.
*/
template <typename Key, typename KeyFn>
std :: map<Key, MeanAccumulator> groupMeans( const std :: vector<ForecastSample>& samples, KeyFn keyFn )
{
    std :: map<Key, MeanAccumulator> groups;
    for( const auto& sample : samples )
    {
        groups[ keyFn( sample ) ].add( sample.windPowerDensity );
    }
    return groups;
}

/*!
    Regular lat/lon lattice of averaged wind power density. Rows run south to
    north ( ascending lat ), columns west to east ( ascending lon ). Cells
    without a single non-null contribution hold NaN and count as undefined.
*/
class RasterSnapshot
{
    public:
        RasterSnapshot() = default;
        RasterSnapshot( std :: vector<double> lats, std :: vector<double> lons );

        // per-cell mean over every forecast hour of the samples
        static RasterSnapshot                           fromSamples     ( const std :: vector<ForecastSample>& samples );

        // one raster per UTC forecast day, keyed YYYYMMDD
        static std :: map<std :: string, RasterSnapshot> dailyFromSamples( const std :: vector<ForecastSample>& samples,
                                                                          const std :: string& runDate );

        const std :: vector<double>&    lats() const { return lats_; }
        const std :: vector<double>&    lons() const { return lons_; }

        std :: size_t   rows() const { return lats_.size(); }
        std :: size_t   cols() const { return lons_.size(); }
        bool            empty() const { return values_.empty(); }

        double          value       ( std :: size_t row, std :: size_t col ) const;
        bool            isDefined   ( std :: size_t row, std :: size_t col ) const;
        void            setValue    ( std :: size_t row, std :: size_t col, double value );

        std :: size_t   definedCellCount() const;

        // smallest / largest defined value, NaN when nothing is defined
        double          minValue() const;
        double          maxValue() const;

        // cell size in degrees along each axis
        double          latResolution() const;
        double          lonResolution() const;

        // row-major copy as rows of values, what the renderer consumes
        std :: vector<std :: vector<double>> toGrid() const;

    private:
        std :: vector<double>   lats_;
        std :: vector<double>   lons_;
        std :: vector<double>   values_;

        static RasterSnapshot   fromCellMeans( const std :: map<std :: pair<double, double>, MeanAccumulator>& cells );
};

#endif
