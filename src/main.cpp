#include "gstree/app.h"

int main(int argc, char** argv) {
    gstree::App app;
    return app.run(argc, argv);
}
