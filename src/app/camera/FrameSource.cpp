#include "app/camera/FrameSource.hpp"

#include "app/camera/DirectoryCycler.hpp"
#include "app/camera/SyntheticGenerator.hpp"


namespace Camera {

std::unique_ptr<IFrameSource> makeFrameSource(const Config::CameraConfig& config) {
    switch (config.source) {
        case Config::SourceType::Directory:
            return std::make_unique<DirectoryCycler>(config.directory.path,
                                                     config.directory.format,
                                                     config.directory.cycle,
                                                     config.referencePrefix);
        case Config::SourceType::Synthetic:
            return std::make_unique<SyntheticGenerator>(config.synthetic, config.referencePrefix);
    }
    return nullptr;
}

}  // namespace Camera
