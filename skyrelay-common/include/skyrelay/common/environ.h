#pragma once

#include <cstdlib>
#include <string>

namespace skyrelay {

// SKYRELAY_* variables, read once on first use. Zero or empty means unset.
class Environ {
   public:
    static Environ& Get();

    const std::string& GetLogLevel() const { return log_level_; }
    const std::string& GetLogDir() const { return log_dir_; }
    const std::string& GetPlannerType() const { return planner_type_; }
    int GetNumInstances() const { return num_instances_; }
    int GetNumConnections() const { return num_connections_; }
    const std::string& GetCostConfig() const { return cost_config_; }

   private:
    Environ();

    // Falls back to default_value when the variable is not a base-10 int.
    static int ReadInt(const char* name, int default_value);
    static std::string ReadString(const char* name,
                                  const std::string& default_value);

    std::string log_level_;
    std::string log_dir_;
    std::string planner_type_;
    int num_instances_;
    int num_connections_;
    std::string cost_config_;
};

}  // namespace skyrelay
