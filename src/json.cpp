/*
 * relayq - Image Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "relayq/json.hpp"
#include <fstream>
#include <memory>
#include <sstream>

namespace relayq {

bool parseJson(const std::string& text, Json::Value& out, std::string& error) noexcept {
    try {
        Json::CharReaderBuilder builder;
        builder["collectComments"] = false;
        std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
        std::string errs;
        if (!reader->parse(text.data(), text.data() + text.size(), &out, &errs)) {
            error = errs.empty() ? "invalid JSON" : errs;
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        error = e.what();
        return false;
    }
}

bool loadJsonFile(const std::filesystem::path& path, Json::Value& out, std::string& error) noexcept {
    try {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            error = "cannot open " + path.string();
            return false;
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        if (!parseJson(buffer.str(), out, error)) {
            error = path.string() + ": " + error;
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        error = e.what();
        return false;
    }
}

std::string toJson(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, value);
}

}
