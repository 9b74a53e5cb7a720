#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <string>


namespace Config {

enum class SourceType {
    Directory,
    Synthetic
};

struct Resolution {
    int width  = 1280;
    int height = 720;
};

struct DirectorySourceConfig {
    std::string path;
    std::string format = "*.jpg";
    bool cycle = false;
};

struct SyntheticSourceConfig {
    Resolution resolution;
    std::string savePath;
    std::string extension = ".png";
    std::size_t imageLimit = 100;
    uint64_t seed = 0x5EED;
};

struct CameraConfig {
    SourceType source = SourceType::Synthetic;
    DirectorySourceConfig directory;
    SyntheticSourceConfig synthetic;
    int rate = 20;                  // Frames per second
    std::string referencePrefix;    // Prefix replacing the directory part of published references
    int cpuCore = -1;
    bool realtime = false;
};

struct ServerConfig {
    std::string address = "0.0.0.0";
    unsigned short port = 8888;
    int threads = 2;
};

struct AppConfig {
    CameraConfig camera;
    ServerConfig server;
    bool debug = false;
};

struct ViewerConfig {
    std::string host = "127.0.0.1";
    unsigned short port = 8888;
    std::string baseAddress;
    bool headless = false;
    bool debug = false;
};

/**
 * @brief Parse a "H,W" resolution string.
 *
 * Exactly two comma separated positive decimal integers, height first.
 *
 * @param text Resolution string, e.g. "720,1280"
 * @return Resolution with width/height populated
 * @throws Errors::ConfigurationError on any other shape
 */
Resolution parseResolution(const std::string& text);

/**
 * @brief Parse a source type name ("directory" or "synthetic").
 * @throws Errors::ConfigurationError for unknown names
 */
SourceType parseSourceType(const std::string& text);

/**
 * @brief Overlay values found in a JSON document onto config.
 *
 * @param jsonText Document text
 * @param config Configuration to update
 * @throws Errors::ConfigurationError if the text is not a JSON object or a value has the wrong shape
 */
void applyJson(const std::string& jsonText, AppConfig& config);

/**
 * @brief Read a JSON configuration file and overlay it onto config.
 * @throws Errors::ConfigurationError if the file cannot be read or parsed
 */
void loadFile(const std::string& path, AppConfig& config);

/**
 * @brief Check the configuration before any streaming activity starts.
 * @throws Errors::ConfigurationError describing the first problem found
 */
void validate(const AppConfig& config);

void validate(const ViewerConfig& config);

}  // namespace Config

#endif
