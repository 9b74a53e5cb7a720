#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>


namespace Msg {

enum class CameraMode : uint8_t {
    Motion,
    Smart
};

enum class ShotType : uint8_t {
    Single,
    Burst
};

/**
 * @brief Camera operating mode changed.
 */
struct Mode {
    CameraMode type = CameraMode::Motion;
};

/**
 * @brief A shutter action occurred.
 */
struct Shoot {
    ShotType type = ShotType::Single;
};

/**
 * @brief Reference to a frame image, resolved by the consumer against its base address.
 */
struct ImagePath {
    std::string path;
};

using Message = std::variant<Mode, Shoot, ImagePath>;

enum class Kind : uint8_t {
    Mode,
    Shoot,
    ImagePath
};

Kind kindOf(const Message& msg) noexcept;

/**
 * @brief Frame references are refreshable state; a newer one supersedes an undelivered older one.
 */
inline bool isCoalescable(const Message& msg) noexcept {
    return std::holds_alternative<ImagePath>(msg);
}

const char* toString(Kind kind) noexcept;
const char* toString(CameraMode mode) noexcept;
const char* toString(ShotType type) noexcept;

std::optional<CameraMode> parseCameraMode(const std::string& text);
std::optional<ShotType> parseShotType(const std::string& text);

/**
 * @brief Serialize a message to a single line of JSON text (no trailing newline).
 */
std::string encode(const Message& msg);

/**
 * @brief Parse a line of JSON text into a message.
 *
 * @return std::nullopt if the text is malformed or names an unknown kind or value
 */
std::optional<Message> decode(const std::string& text);

/**
 * @brief Error line sent to a client before the server drops it.
 */
std::string encodeError(const std::string& reason);

}  // namespace Msg
