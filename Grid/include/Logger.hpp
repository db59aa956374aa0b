#pragma once
#include <mutex>
#include <map>
#include <string>
#include <fstream>
#include <vector>

class Logger {
public:
    static Logger& instance();
    ~Logger();

    // Each node (MPI rank) writes its CSVs under its own sub-directory.
    // Must be called before the first log()/log_wide() to take effect.
    void setNodeTag(const std::string& tag);

    // Tall/long format: one row per key
    void log(const std::string& subsystem,
             int tick, double time,
             const std::map<std::string, double>& values);

    // Wide format: one row per call with multiple columns
    void log_wide(const std::string& subsystem,
                  int tick, double time,
                  const std::vector<std::string>& columns,
                  const std::vector<double>& values);

    // Debug channel: prefixed text lines ("[info] ...") mirrored to stderr
    // and to ng_debug_<RUN_ID>_<node>.log. "[debug]" lines are dropped
    // unless verbose is on.
    void message(const std::string& line);
    void setVerbose(bool v);
    void setEcho(bool v);

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::mutex mtx_;
    std::string node_tag_;
    bool verbose_ = false;
    bool echo_    = true;
    std::ofstream debug_;
    std::map<std::string, std::ofstream> per_node_;
};
