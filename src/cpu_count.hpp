// Copyright 2018 Chia Network Inc

// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at

//    http://www.apache.org/licenses/LICENSE-2.0

// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef SRC_CPP_CPU_COUNT_HPP_
#define SRC_CPP_CPU_COUNT_HPP_

#include <cstdint>
#include <fstream>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <windows.h>
#elif __APPLE__
#include <sys/sysctl.h>
#include <sys/types.h>
#endif

// Processor counts used to pick default thread budgets. Both queries always
// return at least 1.
namespace CpuCount {

    inline uint32_t Logical()
    {
        uint32_t const count = std::thread::hardware_concurrency();
        return count == 0 ? 1 : count;
    }

#ifdef _WIN32
    inline uint32_t Physical()
    {
        DWORD length = 0;
        GetLogicalProcessorInformation(nullptr, &length);
        if (length == 0) {
            return Logical();
        }
        std::vector<SYSTEM_LOGICAL_PROCESSOR_INFORMATION> info(
            length / sizeof(SYSTEM_LOGICAL_PROCESSOR_INFORMATION));
        if (!GetLogicalProcessorInformation(info.data(), &length)) {
            return Logical();
        }
        uint32_t cores = 0;
        for (const auto &entry : info) {
            if (entry.Relationship == RelationProcessorCore) {
                cores++;
            }
        }
        return cores == 0 ? Logical() : cores;
    }
#elif __APPLE__
    inline uint32_t Physical()
    {
        int32_t cores = 0;
        size_t size = sizeof(cores);
        if (sysctlbyname("hw.physicalcpu", &cores, &size, nullptr, 0) != 0 || cores <= 0) {
            return Logical();
        }
        return static_cast<uint32_t>(cores);
    }
#else
    // Counts distinct (physical id, core id) pairs. Hyperthreads of one core
    // share the pair.
    inline uint32_t PhysicalFromCpuInfo(std::istream &cpuinfo)
    {
        std::set<std::pair<std::string, std::string>> cores;
        std::string physical_id;
        std::string line;
        while (std::getline(cpuinfo, line)) {
            auto const colon = line.find(':');
            if (colon == std::string::npos) {
                continue;
            }
            std::string key = line.substr(0, colon);
            key.erase(key.find_last_not_of(" \t") + 1);
            std::string value = colon + 1 < line.size() ? line.substr(colon + 1) : "";
            value.erase(0, value.find_first_not_of(" \t"));

            if (key == "physical id") {
                physical_id = value;
            } else if (key == "core id") {
                cores.emplace(physical_id, value);
            }
        }
        return static_cast<uint32_t>(cores.size());
    }

    inline uint32_t Physical()
    {
        std::ifstream cpuinfo("/proc/cpuinfo");
        if (!cpuinfo.is_open()) {
            return Logical();
        }
        uint32_t const cores = PhysicalFromCpuInfo(cpuinfo);
        // Some platforms, most ARM kernels among them, do not report core ids.
        return cores == 0 ? Logical() : cores;
    }
#endif

}

#endif  // SRC_CPP_CPU_COUNT_HPP_
