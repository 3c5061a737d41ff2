#include "aggregation_stage.h"
#include "raster_snapshot.h"
#include "wpd_errors.h"

#include "crow/logging.h"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <limits>

AggregationStage :: AggregationStage( ForecastStore& store,
                                      PolygonSource& polygons,
                                      MapRenderer& renderer,
                                      const std :: string& plotsDir ) : store_( store ),
                                                                        polygons_( polygons ),
                                                                        renderer_( renderer ),
                                                                        plotsDir_( plotsDir )
{
}

AggregationArtifacts AggregationStage :: artifactPaths( const std :: string& plotsDir,
                                                        const ForecastCycle& cycle )
{
    const std :: filesystem :: path dir( plotsDir );
    const std :: string suffix = cycle.date + "_" + cycle.cycle;

    return AggregationArtifacts
    {
        ( dir / ( "wpd_map_" + suffix + ".png" ) ).string(),
        ( dir / ( "wpd_map_faceted_" + suffix + ".png" ) ).string(),
        ( dir / ( "country_rankings_" + suffix + ".csv" ) ).string()
    };
}

std :: size_t AggregationStage :: aggregate( const std :: string& date, const std :: string& cycle )
{
    ForecastCycle target = parseForecastCycle( date, cycle );

    /*----------------*
    | load the cycle  |
    *----------------*/
    auto samples = store_.loadSamples( target );
    if( samples.empty() )
        throw NoDataFound( Errors :: NO_SAMPLES + target.label() );

    CROW_LOG_INFO << "Aggregating " << samples.size() << " samples for " << target.label();

    /*---------------*
    | build rasters  |
    *---------------*/
    auto raster = RasterSnapshot :: fromSamples( samples );
    auto daily  = RasterSnapshot :: dailyFromSamples( samples, target.date );

    CROW_LOG_DEBUG << "Raster " << raster.rows() << "x" << raster.cols() << " with "
                   << raster.definedCellCount() << " defined cells, " << daily.size() << " forecast days";

    auto boundaries = polygons_.loadCountryPolygons();
    if( !isGeographicWgs84( boundaries.crs ) )
        throw PipelineError( Errors :: BAD_CRS + boundaries.crs );

    /*--------*
    | render  |
    *--------*/
    auto artifacts = artifactPaths( plotsDir_, target );

    // an all-null cycle has nothing to draw, it still gets its ( empty ) ranking
    if( raster.definedCellCount() == 0 )
    {
        CROW_LOG_WARNING << "No defined cells for " << target.label() << ", skipping maps";
    }
    else
    {
        renderer_.render( raster, boundaries.countries,
                          "Average Wind Power Density - " + target.date + " Cycle " + target.cycle,
                          artifacts.mapPath );
        renderer_.renderFaceted( daily, boundaries.countries,
                                 "Daily Average Wind Power Density (GFS Run: " + target.date + " Cycle " + target.cycle + ")",
                                 artifacts.facetedMapPath );
    }

    /*------------------------*
    | spatial join and rank   |
    *------------------------*/
    auto rankings = rankCountries( extractCountryMeans( raster, boundaries.countries ), target );

    store_.replaceRankings( target, rankings );
    writeRankingCsv( rankings, artifacts.rankingCsvPath );

    if( rankings.empty() )
    {
        CROW_LOG_WARNING << "No country overlaps a defined cell for " << target.label();
    }
    else
    {
        CROW_LOG_INFO << "Ranked " << rankings.size() << " countries for " << target.label()
                      << ", top: " << rankings.front().country;
    }

    return rankings.size();
}

void AggregationStage :: writeRankingCsv( const std :: vector<CountryRanking>& rankings,
                                          const std :: string& path )
{
    std :: ofstream file( path, std :: ios :: trunc );
    if( !file )
        throw WriteFailure( Errors :: FAIL_W_CSV + path );

    file << "country,avg_wind_power_density,rank\n";
    file << std :: setprecision( std :: numeric_limits<double> :: max_digits10 );

    for( const auto& ranking : rankings )
    {
        // quote names, doubling any embedded quote
        std :: string quoted = "\"";
        for( char c : ranking.country )
        {
            if( c == '"' )
                quoted += '"';
            quoted += c;
        }
        quoted += "\"";

        file << quoted << "," << ranking.avgWindPowerDensity << "," << ranking.rank << "\n";
    }

    if( !file )
        throw WriteFailure( Errors :: FAIL_W_CSV + path );
}
