#include "PsxPadApp.hpp"

static PsxPadApp app;

int main(void) {
    app.run();
    return 0;
}
