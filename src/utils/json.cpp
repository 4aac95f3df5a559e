#include "json.hpp"

#include <json/json.h>

#include <memory>
#include <stdexcept>


Json::Value parse_json(const std::string &text) {
    Json::Value root;
    Json::CharReaderBuilder readerBuilder;
    readerBuilder["failIfExtra"] = true;
    std::string errs;

    std::unique_ptr<Json::CharReader> reader(readerBuilder.newCharReader());

    const char *data = text.data();
    bool parsingSuccessful = reader->parse(data, data + text.size(), &root, &errs);

    if (!parsingSuccessful) {
        throw std::runtime_error("failed to parse JSON: " + errs);
    }

    return root;
}

bool is_unsigned_integer(const Json::Value &value) {
    const Json::ValueType type = value.type();
    return (type == Json::intValue || type == Json::uintValue) && value.isUInt64();
}

std::string to_compact_json(const Json::Value &root) {
    Json::StreamWriterBuilder writerBuilder;
    writerBuilder["indentation"] = "";
    return Json::writeString(writerBuilder, root);
}

std::string to_styled_json(const Json::Value &root) {
    Json::StreamWriterBuilder writerBuilder;
    writerBuilder["indentation"] = "    ";
    return Json::writeString(writerBuilder, root);
}
