#include "xdgbase/cli/app.hpp"

int main(int argc, char** argv) {
    xdgbase::cli::App app;
    return app.run(argc, argv);
}
