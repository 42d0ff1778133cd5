#include <getopt.h>
#include <iostream>

#include "core/DownloadApplication.hpp"
#include "util/nxm.hpp"

namespace
{
    void printUsage(const char *program)
    {
        std::cout << "Usage: " << program << " [-d] [-c <config>] [nxm://...]\n"
                  << "  -d, --daemon     Run without the terminal UI until SIGINT/SIGTERM\n"
                  << "  -c, --config     Path of the JSON config file\n"
                  << "  -h, --help       Show this help\n"
                  << "With a link, it is handed to the running instance if there is one.\n";
    }
}

int main(int argc, char **argv)
{
    static const option longOptions[] = {
        {"daemon", no_argument, nullptr, 'd'},
        {"config", required_argument, nullptr, 'c'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0}};

    AppOptions options;
    int opt;
    while ((opt = getopt_long(argc, argv, "dc:h", longOptions, nullptr)) != -1)
    {
        switch (opt)
        {
        case 'd':
            options.daemon = true;
            break;
        case 'c':
            options.configPath = optarg;
            break;
        case 'h':
            printUsage(argv[0]);
            return 0;
        default:
            printUsage(argv[0]);
            return 2;
        }
    }

    if (argc - optind > 1)
    {
        printUsage(argv[0]);
        return 2;
    }
    if (optind < argc)
    {
        if (!nxm::looksLikeLink(argv[optind]))
        {
            std::cerr << "mdm: not an nxm:// link: " << argv[optind] << std::endl;
            return 2;
        }
        options.link = argv[optind];
    }

    DownloadApplication app(std::move(options));
    return app.run();
}
