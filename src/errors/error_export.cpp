#include "error_export.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>

using namespace std;
using json = nlohmann::json;

namespace error_export
{
    optional<ExportFormat> formatFromString(const string &name)
    {
        string lower = name;
        transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

        if (lower == "json")
            return ExportFormat::JSON;
        if (lower == "csv")
            return ExportFormat::CSV;
        return nullopt;
    }

    static void flattenInto(const json &value, const string &key, map<string, string> &out)
    {
        if (value.is_object())
        {
            for (const auto &[name, child] : value.items())
                flattenInto(child, key + "_" + name, out);
            return;
        }

        if (value.is_string())
            out[key] = value.get<string>();
        else if (value.is_null())
            out[key] = "";
        else
            out[key] = value.dump();
    }

    map<string, string> flattenContext(const json &context, const string &prefix)
    {
        map<string, string> flat;
        if (!context.is_object())
        {
            if (!context.is_null())
                flat[prefix + "value"] = context.dump();
            return flat;
        }

        for (const auto &[name, value] : context.items())
            flattenInto(value, prefix + name, flat);

        return flat;
    }

    json toJsonDocument(const vector<ErrorRecord> &records)
    {
        json document;
        document["exported_at"] = time_utils::toIsoString(time_utils::Clock::now());
        document["total_records"] = records.size();
        document["errors"] = json::array();

        for (const auto &r : records)
            document["errors"].push_back(r.toJson());

        return document;
    }

    static string csvField(const string &value)
    {
        if (value.find_first_of(",\"\n\r") == string::npos)
            return value;

        string quoted = "\"";
        for (char c : value)
        {
            if (c == '"')
                quoted += '"';
            quoted += c;
        }
        quoted += '"';
        return quoted;
    }

    string toCsv(const vector<ErrorRecord> &records)
    {
        static const vector<string> base_columns = {
            "id", "severity", "category", "component", "function", "message", "exception_type",
            "occurrence_count", "first_seen", "last_seen", "resolution_status", "resolution_notes"};

        vector<map<string, string>> contexts;
        set<string> context_columns;
        for (const auto &r : records)
        {
            contexts.push_back(flattenContext(r.context));
            for (const auto &entry : contexts.back())
                context_columns.insert(entry.first);
        }

        ostringstream csv;

        vector<string> header = base_columns;
        header.insert(header.end(), context_columns.begin(), context_columns.end());
        for (size_t i = 0; i < header.size(); i++)
            csv << (i ? "," : "") << csvField(header[i]);
        csv << "\n";

        for (size_t row = 0; row < records.size(); row++)
        {
            const ErrorRecord &r = records[row];
            vector<string> fields = {
                to_string(r.id), toString(r.severity), toString(r.category), r.component, r.function,
                r.message, r.exception_type, to_string(r.occurrence_count),
                time_utils::toIsoString(r.first_seen), time_utils::toIsoString(r.last_seen),
                r.resolution_status, r.resolution_notes};

            for (const auto &column : context_columns)
            {
                auto it = contexts[row].find(column);
                fields.push_back(it != contexts[row].end() ? it->second : "");
            }

            for (size_t i = 0; i < fields.size(); i++)
                csv << (i ? "," : "") << csvField(fields[i]);
            csv << "\n";
        }

        return csv.str();
    }

    string exportErrors(const vector<ErrorRecord> &records, ExportFormat format, const string &out_dir)
    {
        error_code ec;
        filesystem::create_directories(out_dir, ec);
        if (ec)
            throw runtime_error("Cannot create export directory " + out_dir + ": " + ec.message());

        string extension = format == ExportFormat::JSON ? ".json" : ".csv";
        string path = (filesystem::path(out_dir) / ("error_export_" + time_utils::fileStamp() + extension)).string();

        ofstream file(path);
        if (!file)
            throw runtime_error("Cannot write export file " + path);

        if (format == ExportFormat::JSON)
            file << toJsonDocument(records).dump(2) << "\n";
        else
            file << toCsv(records);

        if (!file)
            throw runtime_error("Write failed for " + path);

        log_info("Exported " + log_string(records.size()) + " errors to " + path);
        return path;
    }

} // namespace error_export
