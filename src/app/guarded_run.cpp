#include "app/guarded_run.h"
#include "core/errors.h"

#include <opencv2/core.hpp>
#include <filesystem>
#include <iostream>

namespace app {

int guarded_run(const std::function<int()>& body) {
    try {
        return body();
    } catch (const core::ConfigurationError &e) {
        std::cerr << "configuration error: " << e.what() << std::endl;
    } catch (const core::SourceReadError &e) {
        std::cerr << "source error: " << e.what() << std::endl;
    } catch (const std::filesystem::filesystem_error &e) {
        std::cerr << "filesystem error: " << e.what() << std::endl;
    } catch (const cv::Exception &e) {
        // VideoWriter / imwrite / кодеки
        std::cerr << "opencv error: " << e.what() << std::endl;
    }
    return kExitError;
}

} // namespace app
