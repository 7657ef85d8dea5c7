#include "Beacon.h"
#include "Constants.h"
#include <json/json.h>
#include <memory>

namespace NetLink {

std::string BeaconCodec::encode(const Beacon& beacon) {
    Json::Value root(Json::objectValue);
    root["service"] = nlk::config::BEACON_SERVICE;
    root["version"] = beacon.version;
    root["name"] = beacon.machineName;
    root["port"] = beacon.port;
    root["instance"] = beacon.instanceId;

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, root);
}

nlk::Result<Beacon> BeaconCodec::decode(const std::string& payload) {
    if (payload.empty() || payload.size() > nlk::config::MAX_BEACON_SIZE) {
        return nlk::Err<Beacon>(nlk::ErrorCode::MalformedBeacon, "Beacon size out of range");
    }

    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    builder["stackLimit"] = 16;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    try {
        if (!reader->parse(payload.data(), payload.data() + payload.size(), &root, &errors)) {
            return nlk::Err<Beacon>(nlk::ErrorCode::MalformedBeacon, "Beacon is not JSON: " + errors);
        }
    } catch (const Json::Exception& e) {
        return nlk::Err<Beacon>(nlk::ErrorCode::MalformedBeacon,
                                std::string("Unparsable beacon: ") + e.what());
    }
    if (!root.isObject()) {
        return nlk::Err<Beacon>(nlk::ErrorCode::MalformedBeacon, "Beacon is not a JSON object");
    }

    const Json::Value& service = root["service"];
    if (!service.isString() || service.asString() != nlk::config::BEACON_SERVICE) {
        return nlk::Err<Beacon>(nlk::ErrorCode::ForeignBeacon, "Beacon from another service");
    }

    const Json::Value& version = root["version"];
    const Json::Value& name = root["name"];
    const Json::Value& port = root["port"];
    const Json::Value& instance = root["instance"];
    if (!version.isInt() || !name.isString() || !port.isInt()) {
        return nlk::Err<Beacon>(nlk::ErrorCode::MalformedBeacon, "Beacon fields missing or mistyped");
    }
    if (!instance.isNull() && !instance.isString()) {
        return nlk::Err<Beacon>(nlk::ErrorCode::MalformedBeacon, "Beacon instance is not a string");
    }

    Beacon beacon;
    beacon.version = version.asInt();
    beacon.machineName = name.asString();
    beacon.port = port.asInt();
    beacon.instanceId = instance.isString() ? instance.asString() : std::string();

    if (beacon.version < 1) {
        return nlk::Err<Beacon>(nlk::ErrorCode::MalformedBeacon, "Unsupported beacon version");
    }
    if (beacon.machineName.empty() || beacon.machineName.size() > 255) {
        return nlk::Err<Beacon>(nlk::ErrorCode::MalformedBeacon, "Bad machine name");
    }
    if (beacon.port < 1 || beacon.port > 65535) {
        return nlk::Err<Beacon>(nlk::ErrorCode::MalformedBeacon, "Port out of range");
    }
    return nlk::Ok(std::move(beacon));
}

} // namespace NetLink
