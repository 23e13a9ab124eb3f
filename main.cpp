#include "app/HemoFlowApp.hpp"

int main(int argc, char** argv) {
    hemoflow::app::HemoFlowApp app;
    return app.Run(argc, argv);
}
