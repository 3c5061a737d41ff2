#include "map_renderer.h"
#include "wpd_errors.h"

#include "crow/logging.h"

#include <matplot/matplot.h>

#include <cmath>
#include <cstdlib>

using namespace matplot;

namespace
{
    const std :: string UNITS   =   " [W/m^2]";

    // raster extent padded by half a cell so cells sit centred on their coordinates
    struct Extent
    {
        double  west;
        double  east;
        double  south;
        double  north;
    };

    Extent extentOf( const RasterSnapshot& raster )
    {
        const double halfLat = raster.latResolution() / 2.0;
        const double halfLon = raster.lonResolution() / 2.0;

        return Extent { raster.lons().front() - halfLon, raster.lons().back() + halfLon,
                        raster.lats().front() - halfLat, raster.lats().back() + halfLat };
    }

    void drawOutlines( axes_handle ax, const std :: vector<CountryPolygon>& countries )
    {
        for( const auto& country : countries )
        {
            for( const auto& part : country.parts )
            {
                std :: vector<double> xs;
                std :: vector<double> ys;
                for( const auto& p : part.exterior )
                {
                    xs.push_back( p.lon );
                    ys.push_back( p.lat );
                }

                auto line = ax->plot( xs, ys, "k-" );
                line->line_width( 0.5 );
            }
        }
    }

    // draw one raster panel into ax
    void drawPanel( axes_handle ax,
                    const RasterSnapshot& raster,
                    const std :: vector<CountryPolygon>& countries,
                    const std :: string& title )
    {
        const Extent extent = extentOf( raster );

        ax->imagesc( extent.west, extent.east, extent.south, extent.north, raster.toGrid() );

        // rows are stored south to north, keep north up
        ax->y_axis().reverse( false );

        ax->hold( true );
        drawOutlines( ax, countries );
        ax->hold( false );

        ax->xlim( { extent.west, extent.east } );
        ax->ylim( { extent.south, extent.north } );
        ax->xlabel( "Longitude" );
        ax->ylabel( "Latitude" );
        ax->title( title );
    }

    void saveFigure( figure_handle f, const std :: string& outputPath )
    {
        bool saved = false;

        try
        {
            saved = f->save( outputPath );
        }
        catch( const std :: exception& e )
        {
            throw PipelineError( Errors :: FAIL_S_IMG + outputPath + ": " + e.what() );
        }

        if( !saved )
            throw PipelineError( Errors :: FAIL_S_IMG + outputPath );
    }
}

MatplotMapRenderer :: MatplotMapRenderer()
{
    // force matplot++ to not open a gnuplot window
    setenv( "QT_QPA_PLATFORM", "offscreen", 1 );
}

void MatplotMapRenderer :: render( const RasterSnapshot& raster,
                                   const std :: vector<CountryPolygon>& countries,
                                   const std :: string& title,
                                   const std :: string& outputPath )
{
    // check for grid data before attempting heatmap generation
    if( raster.empty() || raster.definedCellCount() == 0 )
        throw PipelineError( Errors :: GRID_EMPTY + outputPath );

    auto f = figure( true );
    f->size( 1000, 1000 );

    auto ax = f->current_axes();
    drawPanel( ax, raster, countries, title + UNITS );
    colorbar( ax );

    saveFigure( f, outputPath );
    CROW_LOG_INFO << "Saved map " << outputPath;
}

void MatplotMapRenderer :: renderFaceted( const std :: map<std :: string, RasterSnapshot>& days,
                                          const std :: vector<CountryPolygon>& countries,
                                          const std :: string& title,
                                          const std :: string& outputPath )
{
    if( days.empty() )
        throw PipelineError( Errors :: GRID_EMPTY + outputPath );

    auto f = figure( true );
    f->size( static_cast<unsigned int>( 500 * days.size() ), 600 );
    f->title( title + UNITS );

    std :: size_t panel = 0;
    for( const auto& day : days )
    {
        if( day.second.empty() || day.second.definedCellCount() == 0 )
        {
            CROW_LOG_WARNING << "Skipping forecast day " << day.first << " with no defined cells";
            ++panel;
            continue;
        }

        auto ax = subplot( f, 1, days.size(), panel++ );
        drawPanel( ax, day.second, countries, "Forecast Day: " + day.first );
        colorbar( ax );
    }

    saveFigure( f, outputPath );
    CROW_LOG_INFO << "Saved faceted map " << outputPath;
}
