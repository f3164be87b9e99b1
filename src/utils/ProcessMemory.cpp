#include "ProcessMemory.hpp"
#include "Logger.hpp"
#include <fstream>
#include <sstream>

namespace ClipRelay {

ProcessMemoryProbe::ProcessMemoryProbe(PidSource pid_source) : pid_source_(std::move(pid_source)) {}

std::optional<long> ProcessMemoryProbe::ResidentMegabytes() {
    std::string status_path = "/proc/self/status";
    if (pid_source_) {
        if (auto pid = pid_source_()) status_path = "/proc/" + std::to_string(*pid) + "/status";
    }

    std::ifstream f(status_path);
    if (!f.is_open()) {
        Logger::Log(LogLevel::Debug, "Memory sampling unavailable: cannot open " + status_path);
        return std::nullopt;
    }
    std::stringstream ss;
    ss << f.rdbuf();
    return ParseVmRssMegabytes(ss.str());
}

std::optional<long> ProcessMemoryProbe::ParseVmRssMegabytes(const std::string& status_text) {
    std::istringstream in(status_text);
    std::string line;
    while (std::getline(in, line)) {
        if (line.rfind("VmRSS:", 0) != 0) continue;
        std::istringstream fields(line.substr(6));
        long value = 0;
        std::string unit;
        if (!(fields >> value)) return std::nullopt;
        fields >> unit;
        if (unit == "kB" || unit.empty()) return value / 1024;
        if (unit == "mB" || unit == "MB") return value;
        return std::nullopt;
    }
    return std::nullopt;
}

}
