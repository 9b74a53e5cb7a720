#include "app/messages/ControlMessages.hpp"

#include <nlohmann/json.hpp>


namespace Msg {

namespace {
constexpr const char* KindKey  = "kind";
constexpr const char* TypeKey  = "type";
constexpr const char* PathKey  = "path";

struct Encoder {
    nlohmann::json& out;

    void operator()(const Mode& m) const {
        out[KindKey] = toString(Kind::Mode);
        out[TypeKey] = toString(m.type);
    }

    void operator()(const Shoot& s) const {
        out[KindKey] = toString(Kind::Shoot);
        out[TypeKey] = toString(s.type);
    }

    void operator()(const ImagePath& p) const {
        out[KindKey] = toString(Kind::ImagePath);
        out[PathKey] = p.path;
    }
};

std::optional<std::string> stringField(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}
}  // namespace


Kind kindOf(const Message& msg) noexcept {
    switch (msg.index()) {
        case 0:  return Kind::Mode;
        case 1:  return Kind::Shoot;
        default: return Kind::ImagePath;
    }
}


const char* toString(Kind kind) noexcept {
    switch (kind) {
        case Kind::Mode:      return "mode";
        case Kind::Shoot:     return "shoot";
        case Kind::ImagePath: return "image_path";
    }
    return "unknown";
}


const char* toString(CameraMode mode) noexcept {
    switch (mode) {
        case CameraMode::Motion: return "motion";
        case CameraMode::Smart:  return "smart";
    }
    return "unknown";
}


const char* toString(ShotType type) noexcept {
    switch (type) {
        case ShotType::Single: return "single";
        case ShotType::Burst:  return "burst";
    }
    return "unknown";
}


std::optional<CameraMode> parseCameraMode(const std::string& text) {
    if (text == "motion") return CameraMode::Motion;
    if (text == "smart")  return CameraMode::Smart;
    return std::nullopt;
}


std::optional<ShotType> parseShotType(const std::string& text) {
    if (text == "single") return ShotType::Single;
    if (text == "burst")  return ShotType::Burst;
    return std::nullopt;
}


std::string encode(const Message& msg) {
    nlohmann::json out = nlohmann::json::object();
    std::visit(Encoder{out}, msg);
    return out.dump();
}


std::optional<Message> decode(const std::string& text) {
    nlohmann::json root = nlohmann::json::parse(text, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
        return std::nullopt;
    }

    const auto kind = stringField(root, KindKey);
    if (!kind) {
        return std::nullopt;
    }

    if (*kind == toString(Kind::ImagePath)) {
        const auto path = stringField(root, PathKey);
        if (!path) {
            return std::nullopt;
        }
        return Message{ImagePath{*path}};
    }

    const auto type = stringField(root, TypeKey);
    if (!type) {
        return std::nullopt;
    }

    if (*kind == toString(Kind::Mode)) {
        const auto mode = parseCameraMode(*type);
        if (!mode) {
            return std::nullopt;
        }
        return Message{Mode{*mode}};
    }

    if (*kind == toString(Kind::Shoot)) {
        const auto shot = parseShotType(*type);
        if (!shot) {
            return std::nullopt;
        }
        return Message{Shoot{*shot}};
    }

    return std::nullopt;
}


std::string encodeError(const std::string& reason) {
    nlohmann::json out;
    out[KindKey] = "error";
    out["reason"] = reason;
    return out.dump();
}

}  // namespace Msg
