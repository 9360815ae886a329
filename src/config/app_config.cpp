#include "app_config.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

RegionMap AppConfig::defaultRegions()
{
    return {
        {"community_cards", {530, 315, 270, 120}},
        {"pot_display", {810, 260, 100, 40}},
        {"timer", {1160, 60, 100, 40}},
        {"player_0", {475, 500, 350, 200}},
        {"player_1", {250, 200, 350, 200}},
        {"player_2", {900, 200, 350, 200}},
        {"action_buttons", {400, 600, 800, 200}},
        {"betting_area", {800, 550, 400, 150}}};
}

vector<string> AppConfig::playerRegionNames() const
{
    vector<pair<int, string>> seats;
    const string prefix = "player_";

    for (const auto &[name, region] : regions)
    {
        if (name.rfind(prefix, 0) != 0)
            continue;

        string index = name.substr(prefix.size());
        if (index.empty() || !all_of(index.begin(), index.end(), [](unsigned char c)
                                     { return isdigit(c) != 0; }))
            continue;

        seats.emplace_back(stoi(index), name);
    }

    sort(seats.begin(), seats.end());

    vector<string> names;
    for (const auto &seat : seats)
        names.push_back(seat.second);
    return names;
}

void AppConfig::validate() const
{
    if (capture.fps <= 0 || capture.fps > 240)
        throw invalid_argument("capture.fps must be in 1..240, got " + to_string(capture.fps));
    if (capture.join_timeout_ms <= 0)
        throw invalid_argument("capture.join_timeout_ms must be positive");
    if (vision.confidence_threshold < 0.0f || vision.confidence_threshold > 1.0f)
        throw invalid_argument("vision.confidence_threshold must be in [0,1]");
    if (vision.input_size <= 0 || vision.input_size % 32 != 0)
        throw invalid_argument("vision.input_size must be a positive multiple of 32");
    if (ocr.min_interval_ms < 0 || ocr.max_duration_ms <= 0)
        throw invalid_argument("ocr timing values must be non-negative");
    if (ocr.min_region_width <= 0 || ocr.min_region_height <= 0)
        throw invalid_argument("ocr minimum region size must be positive");

    for (double t : {thresholds.stack_size, thresholds.pot_size, thresholds.timer, thresholds.player_name})
    {
        if (t < 0.0 || t > 1.0)
            throw invalid_argument("thresholds must be in [0,1]");
    }

    for (const char *required : {"community_cards", "pot_display", "timer"})
    {
        auto it = regions.find(required);
        if (it == regions.end())
            throw invalid_argument(string("missing required region '") + required + "'");
        if (it->second.empty())
            throw invalid_argument(string("region '") + required + "' has no area");
    }

    if (playerRegionNames().empty())
        throw invalid_argument("at least one player_N region is required");

    for (const auto &[name, region] : regions)
    {
        if (region.x < 0 || region.y < 0 || region.width <= 0 || region.height <= 0)
            throw invalid_argument("region '" + name + "' is invalid " + region.toString());
    }

    if (dashboard.port <= 0 || dashboard.port > 65535)
        throw invalid_argument("dashboard.port out of range");
    if (performance.callback_warning_ms <= 0.0)
        throw invalid_argument("performance.callback_warning_ms must be positive");
}

namespace config
{
    static json regionToJson(const Region &region)
    {
        return {{"x", region.x}, {"y", region.y}, {"width", region.width}, {"height", region.height}};
    }

    static Region regionFromJson(const json &j)
    {
        Region region;
        region.x = j.at("x").get<int>();
        region.y = j.at("y").get<int>();
        // The calibration tool writes w/h, the settings file width/height
        region.width = j.contains("width") ? j.at("width").get<int>() : j.at("w").get<int>();
        region.height = j.contains("height") ? j.at("height").get<int>() : j.at("h").get<int>();
        return region;
    }

    json toJson(const AppConfig &c)
    {
        json j;
        j["capture"] = {{"source", c.capture.source},
                        {"width", c.capture.width},
                        {"height", c.capture.height},
                        {"fps", c.capture.fps},
                        {"crop", regionToJson(c.capture.crop)},
                        {"join_timeout_ms", c.capture.join_timeout_ms}};
        j["vision"] = {{"model_path", c.vision.model_path},
                       {"labels_path", c.vision.labels_path},
                       {"input_size", c.vision.input_size},
                       {"confidence_threshold", c.vision.confidence_threshold},
                       {"nms_threshold", c.vision.nms_threshold}};
        j["ocr"] = {{"language", c.ocr.language},
                    {"tessdata_path", c.ocr.tessdata_path},
                    {"min_interval_ms", c.ocr.min_interval_ms},
                    {"min_region_width", c.ocr.min_region_width},
                    {"min_region_height", c.ocr.min_region_height},
                    {"max_duration_ms", c.ocr.max_duration_ms},
                    {"fallback_ttl_ms", c.ocr.fallback_ttl_ms}};
        j["thresholds"] = {{"stack_size", c.thresholds.stack_size},
                           {"pot_size", c.thresholds.pot_size},
                           {"timer", c.thresholds.timer},
                           {"player_name", c.thresholds.player_name}};
        j["database"] = {{"path", c.database.path},
                         {"error_db_path", c.database.error_db_path},
                         {"retention_days", c.database.retention_days}};
        j["dashboard"] = {{"enabled", c.dashboard.enabled}, {"port", c.dashboard.port}};
        j["performance"] = {{"callback_warning_ms", c.performance.callback_warning_ms}};
        j["log_dir"] = c.log_dir;

        json regions = json::object();
        for (const auto &[name, region] : c.regions)
            regions[name] = regionToJson(region);
        j["regions"] = regions;

        return j;
    }

    AppConfig fromJson(const json &j)
    {
        AppConfig c;

        if (j.contains("capture"))
        {
            const json &s = j["capture"];
            c.capture.source = s.value("source", c.capture.source);
            c.capture.width = s.value("width", c.capture.width);
            c.capture.height = s.value("height", c.capture.height);
            c.capture.fps = s.value("fps", c.capture.fps);
            c.capture.join_timeout_ms = s.value("join_timeout_ms", c.capture.join_timeout_ms);
            if (s.contains("crop"))
                c.capture.crop = regionFromJson(s["crop"]);
        }

        if (j.contains("vision"))
        {
            const json &s = j["vision"];
            c.vision.model_path = s.value("model_path", c.vision.model_path);
            c.vision.labels_path = s.value("labels_path", c.vision.labels_path);
            c.vision.input_size = s.value("input_size", c.vision.input_size);
            c.vision.confidence_threshold = s.value("confidence_threshold", c.vision.confidence_threshold);
            c.vision.nms_threshold = s.value("nms_threshold", c.vision.nms_threshold);
        }

        if (j.contains("ocr"))
        {
            const json &s = j["ocr"];
            c.ocr.language = s.value("language", c.ocr.language);
            c.ocr.tessdata_path = s.value("tessdata_path", c.ocr.tessdata_path);
            c.ocr.min_interval_ms = s.value("min_interval_ms", c.ocr.min_interval_ms);
            c.ocr.min_region_width = s.value("min_region_width", c.ocr.min_region_width);
            c.ocr.min_region_height = s.value("min_region_height", c.ocr.min_region_height);
            c.ocr.max_duration_ms = s.value("max_duration_ms", c.ocr.max_duration_ms);
            c.ocr.fallback_ttl_ms = s.value("fallback_ttl_ms", c.ocr.fallback_ttl_ms);
        }

        if (j.contains("thresholds"))
        {
            const json &s = j["thresholds"];
            c.thresholds.stack_size = s.value("stack_size", c.thresholds.stack_size);
            c.thresholds.pot_size = s.value("pot_size", c.thresholds.pot_size);
            c.thresholds.timer = s.value("timer", c.thresholds.timer);
            c.thresholds.player_name = s.value("player_name", c.thresholds.player_name);
        }

        if (j.contains("database"))
        {
            const json &s = j["database"];
            c.database.path = s.value("path", c.database.path);
            c.database.error_db_path = s.value("error_db_path", c.database.error_db_path);
            c.database.retention_days = s.value("retention_days", c.database.retention_days);
        }

        if (j.contains("dashboard"))
        {
            const json &s = j["dashboard"];
            c.dashboard.enabled = s.value("enabled", c.dashboard.enabled);
            c.dashboard.port = s.value("port", c.dashboard.port);
        }

        if (j.contains("performance"))
        {
            c.performance.callback_warning_ms = j["performance"].value("callback_warning_ms", c.performance.callback_warning_ms);
        }

        c.log_dir = j.value("log_dir", c.log_dir);

        // A regions block replaces the defaults entirely
        if (j.contains("regions"))
        {
            c.regions.clear();
            for (const auto &[name, value] : j["regions"].items())
                c.regions[name] = regionFromJson(value);
        }

        return c;
    }

    AppConfig load(const string &path)
    {
        ifstream file(path);
        if (!file)
        {
            log_info("No settings file at " + path + ", using defaults");
            AppConfig defaults;
            defaults.validate();
            return defaults;
        }

        AppConfig c;
        try
        {
            c = fromJson(json::parse(file));
        }
        catch (const json::exception &e)
        {
            throw invalid_argument("Malformed settings file " + path + ": " + e.what());
        }

        c.validate();
        log_info("Loaded settings from " + path + " (" + log_string(c.regions.size()) + " regions)");
        return c;
    }

    void save(const AppConfig &c, const string &path)
    {
        error_code ec;
        filesystem::path parent = filesystem::path(path).parent_path();
        if (!parent.empty())
            filesystem::create_directories(parent, ec);

        ofstream file(path);
        if (!file)
            throw runtime_error("Cannot write settings file " + path);

        file << toJson(c).dump(2) << endl;
        log_info("Settings written to " + path);
    }
}
