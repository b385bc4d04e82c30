#pragma once

#include "board/core/types.h"
#include "board/entity/object_store.h"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>

namespace board {

class SerializationError : public std::runtime_error {
public:
    explicit SerializationError(const std::string& what) : std::runtime_error(what) {}
};

nlohmann::json pointToJson(const Point& p);
nlohmann::json objectToJson(const BoardObject& obj);

// Throws SerializationError when `id` or `type` is missing or unknown.
// Optional fields fall back to the variant defaults.
BoardObject objectFromJson(const nlohmann::json& j);

// Clipboard text form: {"kind":"board-clipboard","objects":[...]}.
std::string clipboardToString(const ClipboardPayload& payload);
ClipboardPayload clipboardFromString(const std::string& text);

} // namespace board
