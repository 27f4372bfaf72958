#include "core/Application.h"

int main(int argc, char** argv) {
    secret_guard::Application app;
    return app.run(argc, argv);
}
