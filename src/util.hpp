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

#ifndef SRC_CPP_UTIL_HPP_
#define SRC_CPP_UTIL_HPP_

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#ifdef _WIN32
#define NOMINMAX
#include <windows.h>
#include <processthreadsapi.h>
#endif

// Wall clock and process CPU time since construction.
class Timer {
public:
    Timer()
    {
        wall_clock_time_start_ = std::chrono::steady_clock::now();
#if _WIN32
        ::GetProcessTimes(::GetCurrentProcess(), &ft_[3], &ft_[2], &ft_[1], &ft_[0]);
#else
        cpu_time_start_ = clock();
#endif
    }

    static char *GetNow()
    {
        auto now = std::chrono::system_clock::now();
        auto tt = std::chrono::system_clock::to_time_t(now);
        return ctime(&tt);  // ctime includes newline
    }

    double ElapsedSeconds() const
    {
        auto end = std::chrono::steady_clock::now();
        return std::chrono::duration<double>(end - wall_clock_time_start_).count();
    }

    double CpuMilliseconds() const
    {
#if _WIN32
        FILETIME nowft_[6];
        nowft_[0] = ft_[0];
        nowft_[1] = ft_[1];

        ::GetProcessTimes(::GetCurrentProcess(), &nowft_[5], &nowft_[4], &nowft_[3], &nowft_[2]);
        ULARGE_INTEGER u[4];
        for (size_t i = 0; i < 4; ++i) {
            u[i].LowPart = nowft_[i].dwLowDateTime;
            u[i].HighPart = nowft_[i].dwHighDateTime;
        }
        double user = (u[2].QuadPart - u[0].QuadPart) / 10000.0;
        double kernel = (u[3].QuadPart - u[1].QuadPart) / 10000.0;
        return user + kernel;
#else
        return 1000.0 * (static_cast<double>(clock()) - this->cpu_time_start_) / CLOCKS_PER_SEC;
#endif
    }

    // A CPU ratio above 100% means more than one core was busy.
    void PrintElapsed(const std::string &name) const
    {
        double const wall_clock_ms = 1000.0 * ElapsedSeconds();
        double const cpu_time_ms = CpuMilliseconds();
        double cpu_ratio = 0;
        if (wall_clock_ms > 0) {
            cpu_ratio = static_cast<int>(10000 * (cpu_time_ms / wall_clock_ms)) / 100.0;
        }

        std::cout << name << " " << (wall_clock_ms / 1000.0) << "s. CPU (" << cpu_ratio << "%) "
                  << Timer::GetNow();
    }

private:
    std::chrono::time_point<std::chrono::steady_clock> wall_clock_time_start_;
#if _WIN32
    FILETIME ft_[4];
#else
    clock_t cpu_time_start_;
#endif
};

namespace Util {

    // Space separated, for printing sort results.
    template <typename T>
    inline std::string Join(const std::vector<T> &values)
    {
        std::stringstream s;
        for (size_t i = 0; i < values.size(); ++i) {
            if (i > 0) {
                s << " ";
            }
            s << values[i];
        }
        return s.str();
    }

    // Decimal digits only; no sign, no whitespace, no overflow.
    inline bool ParseUnsigned(const std::string &str, uint64_t &value)
    {
        if (str.empty() || str.size() > 20) {
            return false;
        }
        uint64_t result = 0;
        for (char c : str) {
            if (c < '0' || c > '9') {
                return false;
            }
            uint64_t const digit = static_cast<uint64_t>(c - '0');
            if (result > (UINT64_MAX - digit) / 10) {
                return false;
            }
            result = result * 10 + digit;
        }
        value = result;
        return true;
    }

    // True if no adjacent pair is out of order under the comparator.
    template <typename T, typename F>
    inline bool IsSorted(const std::vector<T> &values, F &compare)
    {
        for (size_t i = 1; i < values.size(); ++i) {
            if (compare(values[i - 1], values[i]) > 0) {
                return false;
            }
        }
        return true;
    }

}

#endif  // SRC_CPP_UTIL_HPP_
