#include "DgramToolApplication.hpp"

#include <h3wire/core/ConfigLoader.hpp>
#include <h3wire/core/Logger.hpp>
#include <h3wire/core/LoggingConfig.hpp>

#include <iostream>
#include <string_view>
#include <vector>

int main(int argc, char **argv)
{
    try
    {
        auto cfg = h3wire::core::ConfigLoader::load(argc, argv);
        h3wire::core::applyLoggingConfig(cfg);

        // --config <path> 를 제외한 나머지가 명령
        std::vector<std::string_view> args;
        for (int i = 1; i < argc; ++i)
        {
            const std::string_view a = argv[i];
            if (a == "--config" || a == "-c")
            {
                ++i;
                continue;
            }
            args.push_back(a);
        }

        h3dgram::DgramToolApplication app(cfg);
        const int rc = app.run(args, std::cout);

        h3wire::core::shutdownLogger();
        return rc;
    }
    catch (const std::exception &e)
    {
        h3wire::core::shutdownLogger();
        std::cerr << "Fatal: " << e.what() << "\n";
        return 1;
    }
}
