#include <string>
#include <vector>

#include "app/NoteSyncApp.hpp"

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    notesync::app::NoteSyncApp app(notesync::app::CommandLine::Parse(args));
    return app.Run();
}
