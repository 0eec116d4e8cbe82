#include "App.h"
#include <iostream>

// Usage: diffribbon [pairs.json] [theme.json]
int main(int argc, char** argv)
{
    std::string pairSetPath = argc > 1 ? argv[1] : "";
    std::string themePath   = argc > 2 ? argv[2] : "";

    if (argc > 3) {
        std::cerr << "usage: " << argv[0] << " [pairs.json] [theme.json]\n";
        return 2;
    }

    App app;

    if (!app.init(1280, 720, "DiffRibbon", pairSetPath, themePath))
    {
        std::cerr << "[Main] App init failed\n";
        return 1;
    }

    app.run();
    app.shutdown();

    return 0;
}
