#include "skyrelay/common/environ.h"

#include <glog/logging.h>

#include <cerrno>
#include <climits>

namespace skyrelay {

Environ& Environ::Get() {
    static Environ instance;
    return instance;
}

int Environ::ReadInt(const char* name, int default_value) {
    const char* raw = std::getenv(name);
    if (raw == nullptr || *raw == '\0') return default_value;

    char* end = nullptr;
    errno = 0;
    long parsed = std::strtol(raw, &end, 10);
    if (errno != 0 || *end != '\0' || parsed < INT_MIN || parsed > INT_MAX) {
        LOG(WARNING) << "Environ: name=" << name << ", value=" << raw
                     << ", error=not_an_integer, using " << default_value;
        return default_value;
    }
    return static_cast<int>(parsed);
}

std::string Environ::ReadString(const char* name,
                                const std::string& default_value) {
    const char* raw = std::getenv(name);
    return raw == nullptr ? default_value : std::string(raw);
}

Environ::Environ()
    : log_level_(ReadString("SKYRELAY_LOG_LEVEL", "INFO")),
      log_dir_(ReadString("SKYRELAY_LOG_DIR", "")),
      planner_type_(ReadString("SKYRELAY_PLANNER", "")),
      num_instances_(ReadInt("SKYRELAY_N_INSTANCES", 0)),
      num_connections_(ReadInt("SKYRELAY_N_CONNECTIONS", 0)),
      cost_config_(ReadString("SKYRELAY_COST_CONFIG", "")) {}

}  // namespace skyrelay
