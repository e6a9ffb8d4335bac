#include <iostream>

#include "app/DownloadApplication.hpp"
#include "app/EngineConfig.hpp"
#include "core/TransferError.hpp"

int main(int argc, char *argv[])
{
    EngineConfig config;
    try
    {
        config = parseCommandLine(argc, argv);
    }
    catch (const ConfigError &e)
    {
        std::cerr << "Error: " << e.what() << "\n\n"
                  << usage(argv[0]);
        return EXIT_ALL_FAILED;
    }

    if (config.showHelp)
    {
        std::cout << usage(argv[0]);
        return 0;
    }

    try
    {
        DownloadApplication app(config);
        return app.run();
    }
    catch (const ConfigError &e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_ALL_FAILED;
    }
}
