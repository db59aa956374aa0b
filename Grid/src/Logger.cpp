// Grid/src/Logger.cpp
#include "Logger.hpp"

#include <iostream>
#include <fstream>
#include <filesystem>
#include <cstdlib>
#include <system_error>
#include <mutex>
#include <string>
#include <vector>
#include <stdexcept>

namespace {
namespace fs = std::filesystem;

std::string env_or_empty(const char* name) {
    if (const char* v = std::getenv(name)) {
        if (*v) return v;
    }
    return {};
}

// Every file a node writes lands in one directory:
//   $NG_LOG_DIR (or <source>/data/raw) / [$RUN_ID] / [node tag]
// e.g. data/raw/outage_a/mg-2/StorageTiers.csv
fs::path node_dir(const std::string& node_tag) {
    const std::string override_dir = env_or_empty("NG_LOG_DIR");
#ifdef PROJECT_SOURCE_DIR
    fs::path dir = override_dir.empty() ? fs::path(PROJECT_SOURCE_DIR) / "data" / "raw"
                                        : fs::path(override_dir);
#else
    fs::path dir = override_dir.empty() ? fs::current_path() / "data" / "raw"
                                        : fs::path(override_dir);
#endif
    const std::string run = env_or_empty("RUN_ID");
    if (!run.empty()) dir /= run;
    if (!node_tag.empty()) dir /= node_tag;
    return dir;
}

bool ensure_dir(const fs::path& dir, std::string* why) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec && why) *why = ec.message();
    return !ec;
}

// Streams are opened on first use and keep the header they were opened
// with. A wide stream's columns are fixed by its first row.
std::ofstream& stream_for(std::map<std::string, std::ofstream>& streams,
                          const std::string& stream,
                          const std::string& node_tag,
                          const std::string& header) {
    auto it = streams.find(stream);
    if (it != streams.end()) return it->second;

    const fs::path dir = node_dir(node_tag);
    std::string why;
    if (!ensure_dir(dir, &why)) {
        throw std::runtime_error("Logger: cannot create " + dir.string() + " : " + why);
    }
    const fs::path csv = dir / (stream + ".csv");
    std::ofstream out(csv, std::ios::out | std::ios::trunc);
    if (!out) throw std::runtime_error("Logger: cannot open " + csv.string());

    out << header << '\n';
    out.flush();
    return streams.emplace(stream, std::move(out)).first->second;
}

std::string wide_header(const std::vector<std::string>& cols) {
    std::string h = "tick,time_s";
    for (const auto& c : cols) h += "," + c;
    return h;
}

} // anonymous namespace

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

Logger::~Logger() {
    std::lock_guard<std::mutex> lock(mtx_);
    if (debug_.is_open()) debug_.close();
    for (auto& kv : per_node_) {
        if (kv.second.is_open()) kv.second.close();
    }
}

void Logger::setNodeTag(const std::string& tag) {
    std::lock_guard<std::mutex> lock(mtx_);
    node_tag_ = tag;
}

void Logger::setVerbose(bool v) {
    std::lock_guard<std::mutex> lock(mtx_);
    verbose_ = v;
}

void Logger::setEcho(bool v) {
    std::lock_guard<std::mutex> lock(mtx_);
    echo_ = v;
}

// Tall rows: one per key, sorted by key since values is a std::map
void Logger::log(const std::string& subsystem,
                 int tick, double time,
                 const std::map<std::string, double>& values) {
    std::lock_guard<std::mutex> lock(mtx_);
    std::ofstream& out = stream_for(per_node_, subsystem, node_tag_, "tick,time_s,key,value");
    for (const auto& kv : values) {
        out << tick << ',' << time << ',' << kv.first << ',' << kv.second << '\n';
    }
    out.flush();
}

void Logger::log_wide(const std::string& subsystem,
                      int tick, double time,
                      const std::vector<std::string>& cols,
                      const std::vector<double>& vals) {
    std::lock_guard<std::mutex> lock(mtx_);
    std::ofstream& out = stream_for(per_node_, subsystem, node_tag_, wide_header(cols));
    out << tick << ',' << time;
    // short rows are padded with zeros
    for (std::size_t i = 0; i < cols.size(); ++i) out << ',' << (i < vals.size() ? vals[i] : 0.0);
    out << '\n';
    out.flush();
}

void Logger::message(const std::string& line) {
    std::lock_guard<std::mutex> lock(mtx_);

    if (!verbose_ && line.rfind("[debug]", 0) == 0) return;

    if (echo_) std::cerr << line;

    // Debug file sits next to the CSVs; opened lazily so the node tag and
    // RUN_ID are known by the time the first line arrives.
    if (!debug_.is_open()) {
        const fs::path dir = node_dir(node_tag_);
        if (!ensure_dir(dir, nullptr)) return;  // stderr already has the line

        std::string run = env_or_empty("RUN_ID");
        if (run.empty()) run = "norunid";
        const std::string tag = node_tag_.empty() ? "node" : node_tag_;
        debug_.open(dir / ("ng_debug_" + run + "_" + tag + ".log"),
                    std::ios::out | std::ios::app);
        if (!debug_) return;
    }
    debug_ << line;
    debug_.flush();
}
