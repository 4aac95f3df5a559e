#pragma once

#include <json/value.h>

#include <string>


// Throws std::runtime_error when the text is not a single JSON document.
Json::Value parse_json(const std::string &text);

// Integer literal in [0, UINT64_MAX]; rejects reals such as 7.0 or 1e3.
bool is_unsigned_integer(const Json::Value &value);

// Single line, no trailing newline.
std::string to_compact_json(const Json::Value &root);

std::string to_styled_json(const Json::Value &root);
