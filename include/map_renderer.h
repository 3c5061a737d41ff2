#ifndef MAP_RENDERER_H
#define MAP_RENDERER_H

#include "country_boundaries.h"
#include "raster_snapshot.h"

#include <map>
#include <string>
#include <vector>

/*!
    Rendering backend: turns rasters plus country outlines into an image file.
    Implementations throw PipelineError when the image cannot be written.
*/
class MapRenderer
{
    public:
        virtual ~MapRenderer() = default;

        virtual void render         ( const RasterSnapshot& raster,
                                      const std :: vector<CountryPolygon>& countries,
                                      const std :: string& title,
                                      const std :: string& outputPath ) = 0;

        // one panel per day, panels in key order
        virtual void renderFaceted  ( const std :: map<std :: string, RasterSnapshot>& days,
                                      const std :: vector<CountryPolygon>& countries,
                                      const std :: string& title,
                                      const std :: string& outputPath ) = 0;
};

/*!
    matplot++ heatmap ( imagesc over the raster extent ) with country outlines
    drawn on top and a colorbar in W/m2. Rendering goes through an offscreen
    gnuplot, so each call builds its own figure.
*/
class MatplotMapRenderer : public MapRenderer
{
    public:
        MatplotMapRenderer();

        void render         ( const RasterSnapshot& raster,
                              const std :: vector<CountryPolygon>& countries,
                              const std :: string& title,
                              const std :: string& outputPath ) override;

        void renderFaceted  ( const std :: map<std :: string, RasterSnapshot>& days,
                              const std :: vector<CountryPolygon>& countries,
                              const std :: string& title,
                              const std :: string& outputPath ) override;
};

#endif
