#include "region_batch.hpp"
#include "utils.hpp"

#include <algorithm>

namespace region_batch
{
    Mat preprocess(const Mat &crop, const BatchParams &params, double &scale)
    {
        Mat gray;
        if (crop.channels() == 3)
            cvtColor(crop, gray, COLOR_BGR2GRAY);
        else if (crop.channels() == 4)
            cvtColor(crop, gray, COLOR_BGRA2GRAY);
        else
            gray = crop.clone();

        Ptr<CLAHE> clahe = createCLAHE(params.clahe_clip, Size(params.clahe_grid, params.clahe_grid));
        Mat enhanced;
        clahe->apply(gray, enhanced);

        if (params.denoise)
        {
            Mat denoised;
            fastNlMeansDenoising(enhanced, denoised);
            enhanced = denoised;
        }

        scale = 1.0;
        if (enhanced.cols < params.min_tile_width && enhanced.cols > 0)
        {
            scale = static_cast<double>(params.min_tile_width) / enhanced.cols;
            Mat resized;
            resize(enhanced, resized, Size(), scale, scale, INTER_CUBIC);
            enhanced = resized;
        }

        return enhanced;
    }

    Batch build(const Mat &frame, const vector<pair<string, Region>> &regions, const BatchParams &params)
    {
        Batch batch;
        if (frame.empty())
            return batch;

        vector<Mat> crops;
        int mosaic_width = 0;
        int mosaic_height = params.padding;

        for (const auto &[name, region] : regions)
        {
            Region clipped = region.clippedTo(frame.size());
            if (clipped.empty())
            {
                log_debug("Region " + name + " " + region.toString() + " is outside the frame");
                continue;
            }

            Tile tile;
            tile.name = name;
            tile.region = clipped;

            Mat processed = preprocess(frame(clipped.toRect()), params, tile.scale);
            tile.area = Rect(params.padding, mosaic_height, processed.cols, processed.rows);

            mosaic_width = max(mosaic_width, processed.cols + 2 * params.padding);
            mosaic_height += processed.rows + params.padding;

            crops.push_back(processed);
            batch.tiles.push_back(tile);
        }

        if (batch.tiles.empty())
            return batch;

        batch.mosaic = Mat(mosaic_height, mosaic_width, CV_8UC1, Scalar(0));
        for (size_t i = 0; i < crops.size(); i++)
            crops[i].copyTo(batch.mosaic(batch.tiles[i].area));

        return batch;
    }

    vector<TextElement> Batch::toFrameCoordinates(const vector<TextElement> &mosaic_elements) const
    {
        vector<TextElement> mapped;

        for (const auto &element : mosaic_elements)
        {
            Point2f c = element.center();

            for (const auto &tile : tiles)
            {
                if (!tile.area.contains(Point(cvFloor(c.x), cvFloor(c.y))))
                    continue;

                TextElement frame_element = element;
                double x = tile.region.x + (element.bbox.x - tile.area.x) / tile.scale;
                double y = tile.region.y + (element.bbox.y - tile.area.y) / tile.scale;
                frame_element.bbox = Rect(cvRound(x), cvRound(y),
                                          max(1, cvRound(element.bbox.width / tile.scale)),
                                          max(1, cvRound(element.bbox.height / tile.scale)));
                mapped.push_back(frame_element);
                break;
            }
        }

        return mapped;
    }

} // namespace region_batch
