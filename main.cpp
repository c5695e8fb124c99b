#include "app/LinkWalkerApp.hpp"

int main(int argc, char** argv) {
    linkwalker::app::LinkWalkerApp app;
    return app.Run(argc, argv);
}
