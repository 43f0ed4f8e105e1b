#include "slackline/cli/app.hpp"

int main(int argc, char** argv) {
    slackline::cli::App app;
    return app.run(argc, argv);
}
