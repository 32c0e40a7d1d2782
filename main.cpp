#include <string>
#include <vector>

#include "app/StableCopyApp.hpp"

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    stablecopy::app::StableCopyApp app;
    return app.Run(args);
}
