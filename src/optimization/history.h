/**
 * @file history.h
 * @brief Lassolab - Optimization Trace
 *
 * Append-only log of (elapsed seconds, objective value) pairs, one record
 * per iteration, taken before the iteration's update.
 */
#ifndef LASSOLAB_HISTORY_H
#define LASSOLAB_HISTORY_H

#include <chrono>
#include <cstddef>
#include <vector>

namespace lassolab {

struct TraceRecord {
    double time;                // seconds since the solver started
    double objective_function;  // F(alpha_t)
};

class History {
public:
    void record(double time, double objective_function) {
        records_.push_back({time, objective_function});
    }

    // Up-front allocation is capped; longer traces grow on demand
    static constexpr size_t kMaxReserve = size_t(1) << 16;

    void reserve(size_t n) { records_.reserve(n < kMaxReserve ? n : kMaxReserve); }
    size_t capacity() const { return records_.capacity(); }

    size_t size() const { return records_.size(); }
    bool empty() const { return records_.empty(); }

    const TraceRecord& operator[](size_t i) const { return records_[i]; }
    const TraceRecord& back() const { return records_.back(); }

    const std::vector<TraceRecord>& records() const { return records_; }

    std::vector<double> times() const {
        std::vector<double> out;
        out.reserve(records_.size());
        for (const auto& r : records_) out.push_back(r.time);
        return out;
    }

    std::vector<double> objective_values() const {
        std::vector<double> out;
        out.reserve(records_.size());
        for (const auto& r : records_) out.push_back(r.objective_function);
        return out;
    }

    /**
     * @brief True if every objective value is <= its predecessor + tol
     */
    bool is_non_increasing(double tol = 0.0) const {
        for (size_t i = 1; i < records_.size(); ++i) {
            if (records_[i].objective_function > records_[i - 1].objective_function + tol) {
                return false;
            }
        }
        return true;
    }

private:
    std::vector<TraceRecord> records_;
};

// Wall-clock timer for trace timestamps
class Stopwatch {
public:
    Stopwatch() : start_(std::chrono::steady_clock::now()) {}

    void reset() { start_ = std::chrono::steady_clock::now(); }

    double elapsed() const {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - start_).count();
    }

private:
    std::chrono::steady_clock::time_point start_;
};

} // namespace lassolab

#endif // LASSOLAB_HISTORY_H
