#include "app/DocIngestApp.hpp"

int main(int argc, char** argv) {
    docingest::app::DocIngestApp app;
    return app.Run(argc, argv);
}
