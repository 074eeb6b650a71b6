#pragma once
#include <cstdint>
#include <string>
#include <limits>
#include <chrono>
#include <fmt/core.h>

namespace pt_api {

    class HighResolutionTimer {
    public:
        HighResolutionTimer() : m_start(0), m_end(0) {}

        void Start() { m_start = Now(); }
        void End()   { m_end = Now(); }

        [[nodiscard]] double GetElapsedSeconds() const {
            return static_cast<double>(m_end - m_start) * 1e-6; // micros → seconds
        }

        [[nodiscard]] double GetElapsedMilliseconds() const {
            return static_cast<double>(m_end - m_start) * 1e-3;
        }

    private:
        static uint64_t Now() {
            using namespace std::chrono;
            return duration_cast<microseconds>(steady_clock::now().time_since_epoch()).count();
        }

        uint64_t m_start;
        uint64_t m_end;
    };

    // ---------------------------
    // TimerSampler: coleta e processa samples
    // ---------------------------
    class TimerSampler {
    public:
        void AddSample(double milliseconds) {
            m_sampleCount++;

            if (milliseconds < m_min) m_min = milliseconds;
            if (milliseconds > m_max) m_max = milliseconds;

            // Atualiza média incrementalmente
            m_average = ((m_average * (m_sampleCount - 1)) + milliseconds) / m_sampleCount;
        }

        double GetAverage() const { return m_average; }
        double GetMin() const { return m_min; }
        double GetMax() const { return m_max; }
        size_t GetSampleCount() const { return m_sampleCount; }

        std::string Summary(const std::string& name) const {
            if (m_sampleCount == 0)
                return fmt::format("{} : no samples", name);
            return fmt::format("{} : {:.3f} ms (min {:.3f}, max {:.3f}, n {})",
                               name, m_average, m_min, m_max, m_sampleCount);
        }

    private:
        double m_average = 0.0;
        double m_min = std::numeric_limits<double>::max();
        double m_max = 0.0;
        size_t m_sampleCount = 0;
    };

} // namespace pt_api
