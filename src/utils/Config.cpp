#include "utils/Config.hpp"
#include "utils/Errors.hpp"

#include <nlohmann/json.hpp>

#include <cctype>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>


namespace Config {

namespace {
int parsePositiveInt(const std::string& field, const std::string& whole) {
    if (field.empty() || field.size() > 9) {
        throw Errors::ConfigurationError("Invalid resolution value: \"" + whole + "\"");
    }
    for (char c : field) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw Errors::ConfigurationError("Invalid resolution value: \"" + whole + "\"");
        }
    }
    const int value = std::stoi(field);
    if (value <= 0) {
        throw Errors::ConfigurationError("Resolution must contain only positive integers: \"" + whole + "\"");
    }
    return value;
}

nlohmann::json parseDocument(const std::string& text) {
    try {
        // Comments are tolerated so hand-edited config files can be annotated.
        return nlohmann::json::parse(text, nullptr, true, true);
    } catch (const nlohmann::json::parse_error& e) {
        throw Errors::ConfigurationError(std::string("Config is not valid JSON: ") + e.what());
    }
}

template <typename T>
void readValue(const nlohmann::json& obj, const char* key, T& out) {
    if (!obj.contains(key)) {
        return;
    }
    try {
        out = obj.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw Errors::ConfigurationError(std::string("Config key \"") + key + "\" has the wrong type: " + e.what());
    }
}

// Integers are range checked against the destination instead of wrapping
template <typename T>
void readInteger(const nlohmann::json& obj, const char* key, T& out) {
    if (!obj.contains(key)) {
        return;
    }
    const nlohmann::json& value = obj.at(key);
    if (!value.is_number_integer()) {
        throw Errors::ConfigurationError(std::string("Config key \"") + key + "\" must be an integer");
    }

    const uint64_t max = static_cast<uint64_t>(std::numeric_limits<T>::max());
    const int64_t min = static_cast<int64_t>(std::numeric_limits<T>::min());
    if (value.is_number_unsigned()) {
        const uint64_t v = value.get<uint64_t>();
        if (v <= max) {
            out = static_cast<T>(v);
            return;
        }
    } else {
        const int64_t v = value.get<int64_t>();
        if (v >= min && (v < 0 || static_cast<uint64_t>(v) <= max)) {
            out = static_cast<T>(v);
            return;
        }
    }
    throw Errors::ConfigurationError(std::string("Config key \"") + key + "\" is out of range: " + value.dump());
}
}  // namespace


Resolution parseResolution(const std::string& text) {
    const auto comma = text.find(',');
    if (comma == std::string::npos || text.find(',', comma + 1) != std::string::npos) {
        throw Errors::ConfigurationError("\"" + text + "\" is an invalid resolution value, expected H,W");
    }

    Resolution res;
    res.height = parsePositiveInt(text.substr(0, comma), text);
    res.width  = parsePositiveInt(text.substr(comma + 1), text);
    return res;
}


SourceType parseSourceType(const std::string& text) {
    if (text == "directory") {
        return SourceType::Directory;
    }
    if (text == "synthetic") {
        return SourceType::Synthetic;
    }
    throw Errors::ConfigurationError("Unknown source type: \"" + text + "\"");
}


void applyJson(const std::string& jsonText, AppConfig& config) {
    const nlohmann::json root = parseDocument(jsonText);
    if (!root.is_object()) {
        throw Errors::ConfigurationError("Config root must be a JSON object");
    }

    readValue(root, "debug", config.debug);

    if (root.contains("camera") && root["camera"].is_object()) {
        const auto& cam = root["camera"];
        if (cam.contains("source")) {
            std::string source;
            readValue(cam, "source", source);
            config.camera.source = parseSourceType(source);
        }
        readInteger(cam, "rate", config.camera.rate);
        readValue(cam, "reference_prefix", config.camera.referencePrefix);
        readInteger(cam, "cpu_core", config.camera.cpuCore);
        readValue(cam, "realtime", config.camera.realtime);

        if (cam.contains("directory") && cam["directory"].is_object()) {
            const auto& dir = cam["directory"];
            readValue(dir, "path", config.camera.directory.path);
            readValue(dir, "format", config.camera.directory.format);
            readValue(dir, "cycle", config.camera.directory.cycle);
        }

        if (cam.contains("synthetic") && cam["synthetic"].is_object()) {
            const auto& syn = cam["synthetic"];
            if (syn.contains("resolution")) {
                std::string res;
                readValue(syn, "resolution", res);
                config.camera.synthetic.resolution = parseResolution(res);
            }
            readValue(syn, "save_path", config.camera.synthetic.savePath);
            readValue(syn, "extension", config.camera.synthetic.extension);
            readInteger(syn, "image_limit", config.camera.synthetic.imageLimit);
            readInteger(syn, "seed", config.camera.synthetic.seed);
        }
    }

    if (root.contains("server") && root["server"].is_object()) {
        const auto& srv = root["server"];
        readValue(srv, "address", config.server.address);
        readInteger(srv, "port", config.server.port);
        readInteger(srv, "threads", config.server.threads);
    }
}


void loadFile(const std::string& path, AppConfig& config) {
    std::ifstream in(path);
    if (!in) {
        throw Errors::ConfigurationError("Unable to open config file: " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    applyJson(buffer.str(), config);
}


void validate(const AppConfig& config) {
    namespace fs = std::filesystem;

    if (config.camera.rate <= 0) {
        throw Errors::ConfigurationError("Framerate must be specified as a positive integer: " + std::to_string(config.camera.rate));
    }

    switch (config.camera.source) {
        case SourceType::Directory:
            if (config.camera.directory.path.empty()) {
                throw Errors::ConfigurationError("A source directory is required for the directory source");
            }
            if (config.camera.directory.format.empty()) {
                throw Errors::ConfigurationError("File format filter must not be empty");
            }
            break;

        case SourceType::Synthetic: {
            const auto& syn = config.camera.synthetic;
            if (syn.resolution.width <= 0 || syn.resolution.height <= 0) {
                throw Errors::ConfigurationError("Resolution must contain only positive integers");
            }
            if (syn.savePath.empty()) {
                throw Errors::ConfigurationError("A save path is required for the synthetic source");
            }
            std::error_code ec;
            if (!fs::is_directory(syn.savePath, ec)) {
                throw Errors::ConfigurationError("Destination path must exist and be a directory: " + syn.savePath);
            }
            if (syn.imageLimit == 0) {
                throw Errors::ConfigurationError("Image limit must be at least 1");
            }
        } break;
    }

    if (config.server.threads <= 0) {
        throw Errors::ConfigurationError("Server needs at least one I/O thread");
    }
}


void validate(const ViewerConfig& config) {
    if (config.host.empty()) {
        throw Errors::ConfigurationError("Viewer host must not be empty");
    }
    if (config.port == 0) {
        throw Errors::ConfigurationError("Viewer port must be non-zero");
    }
}

}  // namespace Config
