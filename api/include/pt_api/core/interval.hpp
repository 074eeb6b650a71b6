#pragma once

#include <algorithm>
#include <limits>

namespace pt_api::math {

    /**
     * @brief Intervalo [start, end] usado para t do raio e para os slabs da caixa.
     *
     * O construtor padrão cria um intervalo vazio (start = +inf, end = -inf).
     */
    struct Interval {
        double start = std::numeric_limits<double>::infinity();
        double end = -std::numeric_limits<double>::infinity();

        Interval() = default;
        Interval(double s, double e) : start(s), end(e) {}

        static Interval Enclose(const Interval& a, const Interval& b) {
            return Interval(std::min(a.start, b.start), std::max(a.end, b.end));
        }

        void Grow(const Interval& other) {
            start = std::min(start, other.start);
            end = std::max(end, other.end);
        }

        double Size() const { return end - start; }
        bool IsEmpty() const { return start >= end; }

        bool Contains(double x) const { return start <= x && x <= end; }
        bool Surrounds(double x) const { return start < x && x < end; }

        double Clamp(double x) const {
            if (x < start) return start;
            if (x > end) return end;
            return x;
        }

        // Pads delta/2 on each side
        void Expand(double delta) {
            const double padding = delta * 0.5;
            start -= padding;
            end += padding;
        }

        Interval operator+(double offset) const { return Interval(start + offset, end + offset); }

        static const Interval Empty;
        static const Interval Universe;
    };

    inline const Interval Interval::Empty = Interval();
    inline const Interval Interval::Universe = Interval(-std::numeric_limits<double>::infinity(),
                                                         std::numeric_limits<double>::infinity());
} // namespace pt_api::math
