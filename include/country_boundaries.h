#ifndef COUNTRY_BOUNDARIES_H
#define COUNTRY_BOUNDARIES_H

#include <string>
#include <vector>

// the CRS every boundary dataset is assumed to be in unless it says otherwise
const std :: string WGS84_CRS   =   "EPSG:4326";

struct GeoPoint
{
    double  lon     =   0.0;
    double  lat     =   0.0;
};

using Ring = std :: vector<GeoPoint>;

// one simple polygon: outer ring plus holes
struct PolygonPart
{
    Ring                    exterior;
    std :: vector<Ring>     holes;
};

// a country as a multipolygon, parts in dataset order
struct CountryPolygon
{
    std :: string                   name;
    std :: string                   isoCode;
    std :: vector<PolygonPart>      parts;
};

struct CountryBoundaries
{
    std :: string                   crs     =   WGS84_CRS;
    std :: vector<CountryPolygon>   countries;
};

// true for the names geographic lon/lat WGS84 goes by
bool isGeographicWgs84( const std :: string& crs );

/*!
    Opaque source of named country polygons. Iteration order of the returned
    countries is the tie-break order of the ranking, so implementations must
    return them in a stable order.
*/
class PolygonSource
{
    public:
        virtual ~PolygonSource() = default;

        virtual CountryBoundaries loadCountryPolygons() = 0;
};

/*!
    Reads a GeoJSON FeatureCollection ( Natural Earth admin-0 countries ).
    Country name comes from NAME / name, ISO code from ISO_A3 / iso_a3.
    When `continent` is non-empty, features carrying a CONTINENT / continent
    property are kept only if it matches.
*/
class GeoJSONPolygonSource : public PolygonSource
{
    public:
        explicit    GeoJSONPolygonSource( const std :: string& path,
                                          const std :: string& continent = "" );

        CountryBoundaries loadCountryPolygons() override;

        // parse a document already in memory
        static CountryBoundaries parse( const std :: string& document,
                                        const std :: string& continent );

    private:
        const std :: string     path_;
        const std :: string     continent_;
};

#endif
