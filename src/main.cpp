#include "application.hpp"
#include "logging.hpp"

int main(int argc, char *argv[]) {
    whispertrigger::install_log_writer(whispertrigger::default_log_path());

    whispertrigger::Application app;
    return app.run(argc, argv);
}
