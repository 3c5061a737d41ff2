#include "spatial_extract.h"

#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <limits>

namespace
{
    enum class Edge
    {
        West,
        East,
        South,
        North
    };

    bool inside( const GeoPoint& p, Edge edge, const CellBox& box )
    {
        switch( edge )
        {
            case Edge :: West:  return p.lon >= box.west;
            case Edge :: East:  return p.lon <= box.east;
            case Edge :: South: return p.lat >= box.south;
            case Edge :: North: return p.lat <= box.north;
        }
        return false;
    }

    // crossing of segment a-b with the edge line
    GeoPoint intersect( const GeoPoint& a, const GeoPoint& b, Edge edge, const CellBox& box )
    {
        if( edge == Edge :: West || edge == Edge :: East )
        {
            double x = edge == Edge :: West ? box.west : box.east;
            double t = ( x - a.lon ) / ( b.lon - a.lon );
            return GeoPoint { x, a.lat + t * ( b.lat - a.lat ) };
        }

        double y = edge == Edge :: South ? box.south : box.north;
        double t = ( y - a.lat ) / ( b.lat - a.lat );
        return GeoPoint { a.lon + t * ( b.lon - a.lon ), y };
    }

    Ring clipAgainst( const Ring& ring, Edge edge, const CellBox& box )
    {
        Ring output;
        if( ring.empty() )
            return output;

        GeoPoint previous = ring.back();
        for( const auto& current : ring )
        {
            bool currentIn  =   inside( current, edge, box );
            bool previousIn =   inside( previous, edge, box );

            if( currentIn )
            {
                if( !previousIn )
                    output.push_back( intersect( previous, current, edge, box ) );
                output.push_back( current );
            }
            else if( previousIn )
            {
                output.push_back( intersect( previous, current, edge, box ) );
            }
            previous = current;
        }
        return output;
    }

    CellBox boundingBox( const CountryPolygon& country )
    {
        CellBox box { std :: numeric_limits<double> :: max(), std :: numeric_limits<double> :: max(),
                      std :: numeric_limits<double> :: lowest(), std :: numeric_limits<double> :: lowest() };

        for( const auto& part : country.parts )
        {
            for( const auto& p : part.exterior )
            {
                box.west    =   std :: min( box.west, p.lon );
                box.east    =   std :: max( box.east, p.lon );
                box.south   =   std :: min( box.south, p.lat );
                box.north   =   std :: max( box.north, p.lat );
            }
        }
        return box;
    }

    bool overlaps( const CellBox& a, const CellBox& b )
    {
        return a.west < b.east && b.west < a.east && a.south < b.north && b.south < a.north;
    }
}

double ringArea( const Ring& ring )
{
    if( ring.size() < 3 )
        return 0.0;

    double twice = 0.0;
    for( std :: size_t i = 0, j = ring.size() - 1; i < ring.size(); j = i++ )
    {
        twice += ring[ j ].lon * ring[ i ].lat - ring[ i ].lon * ring[ j ].lat;
    }
    return std :: abs( twice ) / 2.0;
}

double clippedRingArea( const Ring& ring, const CellBox& box )
{
    Ring clipped = ring;
    for( Edge edge : { Edge :: West, Edge :: East, Edge :: South, Edge :: North } )
    {
        clipped = clipAgainst( clipped, edge, box );
        if( clipped.empty() )
            return 0.0;
    }
    return ringArea( clipped );
}

double coverageFraction( const CountryPolygon& country, const CellBox& box )
{
    double cellArea = box.area();
    if( cellArea <= 0.0 )
        return 0.0;

    double covered = 0.0;
    for( const auto& part : country.parts )
    {
        covered += clippedRingArea( part.exterior, box );
        for( const auto& hole : part.holes )
        {
            covered -= clippedRingArea( hole, box );
        }
    }

    return std :: clamp( covered / cellArea, 0.0, 1.0 );
}

std :: vector<CountryMean> extractCountryMeans( const RasterSnapshot& raster,
                                                const std :: vector<CountryPolygon>& countries )
{
    std :: vector<CountryMean> means;
    if( raster.empty() )
        return means;

    const double halfLat    =   raster.latResolution() / 2.0;
    const double halfLon    =   raster.lonResolution() / 2.0;
    const auto& lats        =   raster.lats();
    const auto& lons        =   raster.lons();

    for( const auto& country : countries )
    {
        const CellBox extent = boundingBox( country );

        double weightedSum  =   0.0;
        double totalWeight  =   0.0;

        for( std :: size_t i = 0; i < raster.rows(); i++ )
        {
            for( std :: size_t j = 0; j < raster.cols(); j++ )
            {
                if( !raster.isDefined( i, j ) )
                    continue;

                CellBox cell { lons[ j ] - halfLon, lats[ i ] - halfLat,
                               lons[ j ] + halfLon, lats[ i ] + halfLat };

                if( !overlaps( cell, extent ) )
                    continue;

                double weight = coverageFraction( country, cell );
                if( weight <= 0.0 )
                    continue;

                weightedSum += weight * raster.value( i, j );
                totalWeight += weight;
            }
        }

        if( totalWeight <= 0.0 )
            continue;

        means.push_back( CountryMean { country.name, country.isoCode, weightedSum / totalWeight, totalWeight } );
    }

    return means;
}

std :: vector<CountryRanking> rankCountries( std :: vector<CountryMean> means,
                                             const ForecastCycle& cycle )
{
    std :: stable_sort( means.begin(), means.end(),
                        []( const CountryMean& a, const CountryMean& b ) { return a.mean > b.mean; } );

    std :: vector<CountryRanking> rankings;
    rankings.reserve( means.size() );

    int rank = 1;
    for( const auto& mean : means )
    {
        rankings.push_back( CountryRanking { cycle.date, cycle.cycle, mean.country, mean.mean, rank++ } );
    }
    return rankings;
}
