#include "country_boundaries.h"
#include "wpd_errors.h"

#include "crow/json.h"
#include "crow/logging.h"

#include <fstream>
#include <initializer_list>
#include <sstream>

namespace
{
    using JSONNode = crow :: json :: rvalue;

    // repeated keys
    constexpr char kFeatures[]      =   "features";
    constexpr char kProperties[]    =   "properties";
    constexpr char kGeometry[]      =   "geometry";
    constexpr char kCoordinates[]   =   "coordinates";
    constexpr char kType[]          =   "type";

    bool isObject( const JSONNode& node )
    {
        return node.t() == crow :: json :: type :: Object;
    }

    bool isList( const JSONNode& node )
    {
        return node.t() == crow :: json :: type :: List;
    }

    // first string property found among the given spellings
    std :: string stringProperty( const JSONNode& properties, std :: initializer_list<const char*> keys )
    {
        for( const char* key : keys )
        {
            if( properties.has( key ) && properties[ key ].t() == crow :: json :: type :: String )
                return std :: string( properties[ key ].s() );
        }
        return std :: string();
    }

    Ring parseRing( const JSONNode& coordinates )
    {
        Ring ring;
        ring.reserve( coordinates.size() );
        for( const auto& position : coordinates )
        {
            if( !isList( position ) || position.size() < 2 ||
                position[ 0 ].t() != crow :: json :: type :: Number || position[ 1 ].t() != crow :: json :: type :: Number )
                throw PipelineError( Errors :: BAD_GEOMETRY + "position is not [ lon, lat ]" );

            ring.push_back( GeoPoint { position[ 0 ].d(), position[ 1 ].d() } );
        }
        return ring;
    }

    Ring parseRingList( const JSONNode& coordinates )
    {
        if( !isList( coordinates ) )
            throw PipelineError( Errors :: BAD_GEOMETRY + "ring is not a list" );
        return parseRing( coordinates );
    }

    PolygonPart parsePolygon( const JSONNode& rings )
    {
        if( !isList( rings ) )
            throw PipelineError( Errors :: BAD_GEOMETRY + "polygon is not a list of rings" );

        PolygonPart part;
        std :: size_t index = 0;
        for( const auto& ring : rings )
        {
            if( index++ == 0 )
                part.exterior = parseRingList( ring );
            else
                part.holes.push_back( parseRingList( ring ) );
        }
        return part;
    }
}

bool isGeographicWgs84( const std :: string& crs )
{
    return crs == "EPSG:4326"
        || crs == "urn:ogc:def:crs:EPSG::4326"
        || crs == "CRS84"
        || crs == "OGC:CRS84"
        || crs == "urn:ogc:def:crs:OGC:1.3:CRS84";
}

GeoJSONPolygonSource :: GeoJSONPolygonSource( const std :: string& path,
                                              const std :: string& continent ) : path_( path ),
                                                                                 continent_( continent )
{
}

CountryBoundaries GeoJSONPolygonSource :: loadCountryPolygons()
{
    std :: ifstream file( path_ );
    if( !file )
        throw PipelineError( Errors :: FAIL_R_BOUNDS + path_ );

    std :: ostringstream buffer;
    buffer << file.rdbuf();

    auto boundaries = parse( buffer.str(), continent_ );

    CROW_LOG_INFO << "Loaded " << boundaries.countries.size() << " country polygons from " << path_;
    return boundaries;
}

CountryBoundaries GeoJSONPolygonSource :: parse( const std :: string& document,
                                                 const std :: string& continent )
{
    auto doc = crow :: json :: load( document );
    if( !doc || !isObject( doc ) || !doc.has( kFeatures ) || !isList( doc[ kFeatures ] ) )
        throw PipelineError( Errors :: FAIL_R_BOUNDS + "not a GeoJSON FeatureCollection" );

    CountryBoundaries boundaries;

    // legacy named-CRS member, absent means RFC 7946 lon/lat WGS84
    if( doc.has( "crs" ) )
    {
        const auto& crs = doc[ "crs" ];
        if( !isObject( crs ) || !crs.has( kProperties ) || !isObject( crs[ kProperties ] ) ||
            !crs[ kProperties ].has( "name" ) || crs[ kProperties ][ "name" ].t() != crow :: json :: type :: String )
            throw PipelineError( Errors :: FAIL_R_BOUNDS + "crs member has no properties.name" );

        boundaries.crs = std :: string( crs[ kProperties ][ "name" ].s() );
    }

    for( const auto& feature : doc[ kFeatures ] )
    {
        if( !isObject( feature ) || !feature.has( kProperties ) || !feature.has( kGeometry ) )
            continue;

        if( !isObject( feature[ kProperties ] ) )
        {
            CROW_LOG_WARNING << "Skipping feature without properties";
            continue;
        }

        const auto& properties = feature[ kProperties ];

        if( !continent.empty() )
        {
            auto featureContinent = stringProperty( properties, { "CONTINENT", "continent" } );
            if( !featureContinent.empty() && featureContinent != continent )
                continue;
        }

        CountryPolygon country;
        country.name    =   stringProperty( properties, { "NAME", "name", "ADMIN", "admin" } );
        country.isoCode =   stringProperty( properties, { "ISO_A3", "iso_a3" } );

        const auto& geometry = feature[ kGeometry ];
        if( geometry.t() == crow :: json :: type :: Null )
        {
            CROW_LOG_WARNING << "Skipping feature without geometry: " << country.name;
            continue;
        }

        if( !isObject( geometry ) || !geometry.has( kType ) || geometry[ kType ].t() != crow :: json :: type :: String ||
            !geometry.has( kCoordinates ) )
            throw PipelineError( Errors :: BAD_GEOMETRY + country.name );

        std :: string type = std :: string( geometry[ kType ].s() );
        if( type == "Polygon" )
        {
            country.parts.push_back( parsePolygon( geometry[ kCoordinates ] ) );
        }
        else if( type == "MultiPolygon" )
        {
            if( !isList( geometry[ kCoordinates ] ) )
                throw PipelineError( Errors :: BAD_GEOMETRY + country.name );

            for( const auto& polygon : geometry[ kCoordinates ] )
            {
                country.parts.push_back( parsePolygon( polygon ) );
            }
        }
        else
        {
            throw PipelineError( Errors :: BAD_GEOMETRY + country.name + " (" + type + ")" );
        }

        boundaries.countries.push_back( std :: move( country ) );
    }

    return boundaries;
}
