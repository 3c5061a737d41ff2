#ifndef AGGREGATION_STAGE_H
#define AGGREGATION_STAGE_H

#include "country_boundaries.h"
#include "forecast_store.h"
#include "map_renderer.h"
#include "spatial_extract.h"

#include <cstddef>
#include <string>
#include <vector>

// deterministic artifact paths of one cycle
struct AggregationArtifacts
{
    std :: string   mapPath;
    std :: string   facetedMapPath;
    std :: string   rankingCsvPath;
};

/*!
    Turns the stored samples of one cycle into rasters, maps and a country
    ranking:

        samples -> full-window raster ( + one raster per forecast day )
                -> maps under plotsDir
                -> overlap-weighted country means -> ranks 1..N
                -> country_rankings ( replaced as a whole ) + CSV export
*/
class AggregationStage
{
    public:
        AggregationStage( ForecastStore& store,
                          PolygonSource& polygons,
                          MapRenderer& renderer,
                          const std :: string& plotsDir );

        // number of ranked countries; NoDataFound when the cycle has no samples
        std :: size_t   aggregate( const std :: string& date, const std :: string& cycle );

        static AggregationArtifacts artifactPaths   ( const std :: string& plotsDir,
                                                      const ForecastCycle& cycle );

        // country,avg_wind_power_density,rank
        static void                 writeRankingCsv ( const std :: vector<CountryRanking>& rankings,
                                                      const std :: string& path );

    private:
        ForecastStore&          store_;
        PolygonSource&          polygons_;
        MapRenderer&            renderer_;
        const std :: string     plotsDir_;
};

#endif
