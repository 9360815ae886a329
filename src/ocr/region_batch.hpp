#pragma once

#include <opencv2/opencv.hpp>
#include <string>
#include <vector>
#include "config/region.hpp"
#include "text_engine.hpp"

using namespace cv;
using namespace std;

namespace region_batch
{
    struct BatchParams
    {
        int padding = 20;          // Blank rows between tiles so words never merge
        int min_tile_width = 200;  // Narrow crops are upscaled to this width
        double clahe_clip = 2.0;   // CLAHE clip limit
        int clahe_grid = 8;        // CLAHE tile grid size
        bool denoise = true;       // fastNlMeansDenoising on each crop
    };

    struct Tile
    {
        string name;
        Region region; // Source rectangle in frame coordinates (clipped)
        Rect area;     // Where it sits in the mosaic
        double scale = 1.0;
    };

    // Several regions stacked into one image so the engine runs once per frame
    struct Batch
    {
        Mat mosaic;
        vector<Tile> tiles;

        bool empty() const { return tiles.empty(); }

        // Maps mosaic words back to frame coordinates; words whose center lies
        // in no tile (padding noise) are dropped
        vector<TextElement> toFrameCoordinates(const vector<TextElement> &mosaic_elements) const;
    };

    // Grayscale, CLAHE, optional denoise and upscale of one crop
    Mat preprocess(const Mat &crop, const BatchParams &params, double &scale);

    Batch build(const Mat &frame, const vector<pair<string, Region>> &regions, const BatchParams &params = BatchParams());

} // namespace region_batch
