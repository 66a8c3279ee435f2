#include <applog/applog.hpp>

// Standard logging facilities

namespace applog {

facility_manager& default_manager() {
    static facility_manager* mgr = []() {
        facility_manager* m = new facility_manager;
        basic_config(*m);
        return m;
    }();
    return *mgr;
}

facility& root() {
    static facility fac("root", default_manager());
    return fac;
}

// configure before main even if nothing logs during static initialization
struct std_log_init {
    std_log_init() {
        root();
    }
} Init;


} // namespace applog
