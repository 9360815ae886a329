#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "error_types.hpp"

using namespace std;

namespace error_export
{
    enum class ExportFormat
    {
        JSON,
        CSV
    };

    optional<ExportFormat> formatFromString(const string &name);

    // Nested objects become "context_a_b" keys; arrays are kept as JSON text
    map<string, string> flattenContext(const nlohmann::json &context, const string &prefix = "context_");

    nlohmann::json toJsonDocument(const vector<ErrorRecord> &records);
    string toCsv(const vector<ErrorRecord> &records);

    // Writes <out_dir>/error_export_<stamp>.<ext> and returns its path. Throws runtime_error on I/O failure
    string exportErrors(const vector<ErrorRecord> &records, ExportFormat format, const string &out_dir = "logs");

} // namespace error_export
