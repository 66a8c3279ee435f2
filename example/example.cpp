#include <applog/applog.hpp>

// Logs one message at INFO and one at ERROR through the default configuration.

int main() {
    applog::log_info("This is an info message.");
    applog::log_error("This is an error message.");
    return 0;
}
