#pragma once
#include "card_detection_stage.hpp"
#include "heuristic/heuristic_card_detector.hpp"
#include "yolo/yolo_card_detector.hpp"
#include "config/app_config.hpp"
#include "utils.hpp"
#include <memory>
#include <string>

enum class DetectorType
{
    YOLO,
    HEURISTIC
};

class DetectorFactory
{
public:
    static DetectorType stringToDetectorType(const std::string &detector_type)
    {
        if (detector_type == "heuristic" || detector_type == "fallback")
            return DetectorType::HEURISTIC;
        return DetectorType::YOLO;
    }

    static std::unique_ptr<CardDetectorInterface> createDetector(DetectorType type, const VisionConfig &config)
    {
        switch (type)
        {
        case DetectorType::YOLO:
        {
            yolo_processing::YoloParams params;
            params.input_size = config.input_size;
            params.confidence_threshold = config.confidence_threshold;
            params.nms_threshold = config.nms_threshold;
            return std::make_unique<YoloCardDetector>(config.model_path, config.labels_path, params);
        }
        case DetectorType::HEURISTIC:
        default:
            return std::make_unique<HeuristicCardDetector>();
        }
    }

    // Probes the model-backed detector once; when it cannot load, the stage runs on the heuristic alone
    static std::unique_ptr<CardDetectionStage> createStage(const VisionConfig &config)
    {
        std::unique_ptr<CardDetectorInterface> primary = createDetector(DetectorType::YOLO, config);
        std::unique_ptr<CardDetectorInterface> fallback = createDetector(DetectorType::HEURISTIC, config);
        fallback->initialize();

        if (primary->initialize())
        {
            log_info("Loading YOLO card detector");
        }
        else
        {
            log_warning("YOLO card detector unavailable, falling back to heuristic detector");
            primary.reset();
        }

        auto stage = std::make_unique<CardDetectionStage>(std::move(primary), std::move(fallback));
        log_info("Card detection: " + stage->describe());
        return stage;
    }
};
