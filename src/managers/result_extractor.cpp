#include "result_extractor.hpp"
#include <memory>
#include <stdexcept>

static void configure_strict(Json::CharReaderBuilder& builder) {
    builder["collectComments"] = false;
    builder["allowComments"] = false;
    builder["failIfExtra"] = true;      // trailing non-whitespace rejects the suffix
    builder["rejectDupKeys"] = false;
    builder["allowSpecialFloats"] = true;
}

static bool parse_range(Json::CharReader& reader, const char* begin, const char* end,
                        Json::Value& out) {
    std::string errs;
    // jsoncpp throws past its nesting limit; treat that like any bad suffix
    try {
        return reader.parse(begin, end, &out, &errs);
    } catch (const std::exception&) {
        return false;
    }
}

std::optional<Json::Value> parse_json(const std::string& text) {
    Json::CharReaderBuilder builder;
    configure_strict(builder);
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value value;
    const char* begin = text.data();
    if (!parse_range(*reader, begin, begin + text.size(), value)) {
        return std::nullopt;
    }
    return value;
}

std::optional<Json::Value> extract_last_json_object(const std::string& text) {
    Json::CharReaderBuilder builder;
    configure_strict(builder);
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    const char* begin = text.data();
    const char* end = begin + text.size();

    for (size_t i = text.size(); i-- > 0;) {
        if (text[i] != '{') continue;
        Json::Value value;
        if (parse_range(*reader, begin + i, end, value) && value.isObject()) {
            return value;
        }
    }
    return std::nullopt;
}

std::string serialize_record(const Json::Value& record) {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    writer["emitUTF8"] = true;
    return Json::writeString(writer, record);
}

std::optional<std::string> record_url(const Json::Value& record) {
    if (!record.isObject()) return std::nullopt;
    const Json::Value& url = record["url"];
    if (!url.isString() || url.asString().empty()) return std::nullopt;
    return url.asString();
}

Json::Value make_error_record(const std::string& message) {
    Json::Value record(Json::objectValue);
    record["type"] = "Error";
    record["message"] = message;
    return record;
}
